#include "status_poller.hpp"

#include <boost/system/error_code.hpp>

#include <algorithm>
#include <iostream>

namespace openfan::controller
{

StatusPoller::StatusPoller(boost::asio::io_context& io,
                           FanController& controller,
                           std::chrono::seconds interval) :
    timer_(io), controller_(controller),
    interval_(std::max(interval, std::chrono::seconds(1))),
    running_(std::make_shared<std::atomic<bool>>(false)),
    inFlight_(std::make_shared<std::atomic<bool>>(false))
{}

StatusPoller::~StatusPoller()
{
    stop();
}

void StatusPoller::start()
{
    if (running_->exchange(true))
        return;
    std::cerr << "[openfan] status poll every " << interval_.count()
              << "s\n";
    tick();
}

void StatusPoller::stop()
{
    if (!running_->exchange(false))
        return;
    timer_.cancel();
}

void StatusPoller::arm()
{
    timer_.expires_after(interval_);
    // A completion already queued survives cancel(); it must not touch
    // `this` once stop() (or the destructor) has run.
    timer_.async_wait(
        [this, running = running_](const boost::system::error_code& ec) {
            if (ec || !running->load())
                return;
            tick();
        });
}

void StatusPoller::tick()
{
    if (!inFlight_->exchange(true))
    {
        controller_.pollAll(
            [flag = inFlight_, cb = onRound_](Failures f) {
                flag->store(false);
                if (cb)
                    cb(f);
            });
    }
    arm();
}

} // namespace openfan::controller

#pragma once

#include "fan_controller.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace openfan::controller
{

// Fixed-rate FanController::pollAll() on an io_context timer. A tick is
// skipped while the previous round is still in flight.
class StatusPoller
{
  public:
    using RoundHandler = std::function<void(const Failures&)>;

    StatusPoller(boost::asio::io_context& io, FanController& controller,
                 std::chrono::seconds interval);
    ~StatusPoller();

    StatusPoller(const StatusPoller&) = delete;
    StatusPoller& operator=(const StatusPoller&) = delete;

    // Both idempotent; call on the io_context thread.
    void start();
    void stop();

    bool running() const
    {
        return running_->load();
    }

    // Called after every completed round (on whichever thread finished it).
    void onRound(RoundHandler h)
    {
        onRound_ = std::move(h);
    }

  private:
    void arm();
    void tick();

    boost::asio::steady_timer timer_;
    FanController& controller_;
    std::chrono::seconds interval_;
    // Shared with queued timer handlers, which may outlive the poller.
    std::shared_ptr<std::atomic<bool>> running_;
    std::shared_ptr<std::atomic<bool>> inFlight_;
    RoundHandler onRound_;
};

} // namespace openfan::controller

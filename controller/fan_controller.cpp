#include "fan_controller.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace openfan::controller
{

namespace
{

// Fan-in for a batch of concurrent requests.
struct Join
{
    std::mutex m;
    std::size_t remaining{};
    Failures failures;
    std::function<void(Failures)> done;

    void complete(const std::string& name, std::exception_ptr err)
    {
        std::function<void(Failures)> fire;
        Failures out;
        {
            std::lock_guard<std::mutex> lk(m);
            if (err)
                failures.emplace(name, err);
            if (--remaining != 0)
                return;
            fire = std::move(done);
            out = std::move(failures);
        }
        if (fire)
            fire(std::move(out));
    }
};

int clampPercent(int percent)
{
    return std::clamp(percent, 0, 100);
}

} // namespace

FanController::FanController(api::FanApi api, int defaultSpeed) :
    api_(std::move(api)), defaultSpeed_(clampPercent(defaultSpeed)),
    shared_(std::make_shared<Shared>())
{
    if (defaultSpeed_ == 0)
        defaultSpeed_ = kDefaultSpeed;
}

void FanController::updateDevices(const discovery::Snapshot& snapshot)
{
    std::lock_guard<std::mutex> lk(shared_->mutex);

    std::map<std::string, Tracked> next;
    if (snapshot)
    {
        for (const auto& d : *snapshot)
        {
            Tracked t{};
            t.device = d;
            t.state.lastSpeed = defaultSpeed_;

            auto it = shared_->fans.find(d.name);
            if (it != shared_->fans.end())
                t.state = it->second.state;
            else
                std::cerr << "[openfan] tracking " << d.name << " at "
                          << d.baseUrl << "\n";
            next.emplace(d.name, std::move(t));
        }
    }

    for (const auto& [name, t] : shared_->fans)
    {
        if (!next.count(name))
            std::cerr << "[openfan] " << name << " gone\n";
    }

    shared_->fans = std::move(next);
}

std::vector<std::string> FanController::names() const
{
    std::lock_guard<std::mutex> lk(shared_->mutex);
    std::vector<std::string> out;
    out.reserve(shared_->fans.size());
    for (const auto& [name, t] : shared_->fans)
        out.push_back(name);
    return out;
}

std::optional<Device> FanController::device(const std::string& name) const
{
    std::lock_guard<std::mutex> lk(shared_->mutex);
    auto it = shared_->fans.find(name);
    if (it == shared_->fans.end())
        return std::nullopt;
    return it->second.device;
}

std::optional<FanState> FanController::state(const std::string& name) const
{
    std::lock_guard<std::mutex> lk(shared_->mutex);
    auto it = shared_->fans.find(name);
    if (it == shared_->fans.end())
        return std::nullopt;
    return it->second.state;
}

void FanController::setEventLog(std::string path)
{
    std::lock_guard<std::mutex> lk(shared_->mutex);
    shared_->eventLog = std::move(path);
}

void FanController::pollAll(std::function<void(Failures)> done)
{
    std::vector<Device> targets;
    {
        std::lock_guard<std::mutex> lk(shared_->mutex);
        for (const auto& [name, t] : shared_->fans)
            targets.push_back(t.device);
    }

    if (targets.empty())
    {
        if (done)
            done(Failures{});
        return;
    }

    auto join = std::make_shared<Join>();
    join->remaining = targets.size();
    join->done = std::move(done);

    for (const auto& d : targets)
    {
        api_.getStatus(d, [shared = shared_, join,
                           name = d.name](std::exception_ptr err,
                                          DeviceStatus s) {
            {
                std::lock_guard<std::mutex> lk(shared->mutex);
                auto it = shared->fans.find(name);
                if (it != shared->fans.end())
                {
                    auto& st = it->second.state;
                    st.reachable = !err;
                    if (!err)
                    {
                        st.rpm = s.rpmReading;
                        st.speed = s.dutyPercent;
                        st.isOn = st.speed > 0;
                        if (st.isOn)
                            st.lastSpeed = st.speed;
                    }
                }
            }
            if (err)
                std::cerr << "[openfan] status " << name << ": "
                          << describe(err) << "\n";
            join->complete(name, err);
        });
    }
}

std::future<Failures> FanController::pollAll()
{
    auto p = std::make_shared<std::promise<Failures>>();
    auto fut = p->get_future();
    pollAll([p](Failures f) { p->set_value(std::move(f)); });
    return fut;
}

void FanController::sendSpeed(const Device& device, int percent,
                              std::function<void(std::exception_ptr)> done)
{
    api_.setSpeed(
        device, percent,
        [shared = shared_, name = device.name, percent,
         done = std::move(done)](std::exception_ptr err) {
            std::string logPath;
            {
                std::lock_guard<std::mutex> lk(shared->mutex);
                logPath = shared->eventLog;
                auto it = shared->fans.find(name);
                if (!err && it != shared->fans.end())
                {
                    auto& st = it->second.state;
                    st.speed = percent;
                    st.isOn = percent > 0;
                    if (st.isOn)
                        st.lastSpeed = percent;
                }
            }

            const std::string why = err ? describe(err) : std::string();
            if (err)
                std::cerr << "[openfan] set " << name << "=" << percent
                          << " failed: " << why << "\n";
            log::appendLine(logPath, log::speedLine(name, percent, why));

            if (done)
                done(err);
        });
}

std::future<void> FanController::setSpeed(const std::string& name,
                                          int percent)
{
    auto d = device(name);
    if (!d)
        throw std::invalid_argument("unknown fan: " + name);

    auto p = std::make_shared<std::promise<void>>();
    auto fut = p->get_future();
    sendSpeed(*d, clampPercent(percent), [p](std::exception_ptr err) {
        if (err)
            p->set_exception(err);
        else
            p->set_value();
    });
    return fut;
}

std::future<void> FanController::setPower(const std::string& name, bool on)
{
    int target = 0;
    if (on)
    {
        auto st = state(name);
        if (!st)
            throw std::invalid_argument("unknown fan: " + name);
        target = st->lastSpeed > 0 ? st->lastSpeed : defaultSpeed_;
    }
    return setSpeed(name, target);
}

std::future<void> FanController::toggle(const std::string& name)
{
    auto st = state(name);
    if (!st)
        throw std::invalid_argument("unknown fan: " + name);
    return setPower(name, !st->isOn);
}

std::future<Failures> FanController::setAll(int percent)
{
    const int target = clampPercent(percent);

    std::vector<Device> targets;
    {
        std::lock_guard<std::mutex> lk(shared_->mutex);
        for (const auto& [name, t] : shared_->fans)
            targets.push_back(t.device);
    }

    auto p = std::make_shared<std::promise<Failures>>();
    auto fut = p->get_future();
    if (targets.empty())
    {
        p->set_value(Failures{});
        return fut;
    }

    auto join = std::make_shared<Join>();
    join->remaining = targets.size();
    join->done = [p](Failures f) { p->set_value(std::move(f)); };

    for (const auto& d : targets)
    {
        sendSpeed(d, target, [join, name = d.name](std::exception_ptr err) {
            join->complete(name, err);
        });
    }
    return fut;
}

} // namespace openfan::controller

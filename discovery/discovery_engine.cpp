#include "discovery_engine.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace openfan::discovery
{

const char* toString(BrowseState s)
{
    switch (s)
    {
        case BrowseState::idle:
            return "idle";
        case BrowseState::browsing:
            return "browsing";
        case BrowseState::ready:
            return "ready";
        case BrowseState::failed:
            return "failed";
    }
    return "unknown";
}

DiscoveryEngine::DiscoveryEngine(std::unique_ptr<ServiceBrowser> browser,
                                 std::string serviceType,
                                 std::string namePrefix) :
    browser_(std::move(browser)), serviceType_(std::move(serviceType)),
    namePrefix_(std::move(namePrefix)),
    snapshot_(std::make_shared<const DeviceList>())
{
    if (!browser_)
        throw std::invalid_argument("DiscoveryEngine: null browser");
}

DiscoveryEngine::~DiscoveryEngine()
{
    stop();
}

BrowseHandlers DiscoveryEngine::makeHandlers()
{
    BrowseHandlers h;
    h.added = [this](const ServiceEntry& e) { onAdded(e); };
    h.removed = [this](const ServiceEntry& e) { onRemoved(e); };
    h.ready = [this] { onReady(); };
    h.failed = [this](const std::string& err) { onFailed(err); };
    return h;
}

bool DiscoveryEngine::start()
{
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ == BrowseState::browsing || state_ == BrowseState::ready)
        return true;

    const bool restart = (state_ == BrowseState::failed);
    results_.clear();
    snapshot_ = std::make_shared<const DeviceList>();
    // Set before open(): the backend may deliver items synchronously.
    state_ = BrowseState::browsing;
    lk.unlock();

    if (restart)
        browser_->close();

    try
    {
        browser_->open(serviceType_, makeHandlers());
    }
    catch (const DiscoveryError& e)
    {
        std::cerr << "[openfan] discovery start failed: " << e.what() << "\n";
        lk.lock();
        setStateLocked(lk, BrowseState::failed, e.what());
        return false;
    }

    std::cerr << "[openfan] discovery started (" << serviceType_
              << ", prefix " << namePrefix_ << ")\n";
    lk.lock();
    if (state_ == BrowseState::browsing)
        setStateLocked(lk, BrowseState::browsing, {});
    return true;
}

void DiscoveryEngine::stop() noexcept
{
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ == BrowseState::idle)
        return;

    state_ = BrowseState::idle;
    results_.clear();
    snapshot_ = std::make_shared<const DeviceList>();
    lk.unlock();

    browser_->close();
    std::cerr << "[openfan] discovery stopped\n";

    lk.lock();
    setStateLocked(lk, BrowseState::idle, {});
}

BrowseState DiscoveryEngine::state() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

Snapshot DiscoveryEngine::devices() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_;
}

DiscoveryEngine::SubscriptionId
    DiscoveryEngine::subscribe(SnapshotHandler handler)
{
    std::lock_guard<std::mutex> lk(mutex_);
    const auto id = nextId_++;
    snapshotSubs_.emplace(id, std::move(handler));
    return id;
}

DiscoveryEngine::SubscriptionId
    DiscoveryEngine::subscribeState(StateHandler handler)
{
    std::lock_guard<std::mutex> lk(mutex_);
    const auto id = nextId_++;
    stateSubs_.emplace(id, std::move(handler));
    return id;
}

void DiscoveryEngine::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lk(mutex_);
    snapshotSubs_.erase(id);
    stateSubs_.erase(id);
}

void DiscoveryEngine::setEventLog(std::string path)
{
    std::lock_guard<std::mutex> lk(mutex_);
    eventLog_ = std::move(path);
}

void DiscoveryEngine::onAdded(const ServiceEntry& e)
{
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ == BrowseState::idle || !results_.add(e))
        return;
    publishLocked(lk);
}

void DiscoveryEngine::onRemoved(const ServiceEntry& e)
{
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ == BrowseState::idle || !results_.remove(e))
        return;
    publishLocked(lk);
}

void DiscoveryEngine::onReady()
{
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ != BrowseState::browsing)
        return;
    std::cerr << "[openfan] mDNS browser ready\n";
    setStateLocked(lk, BrowseState::ready, {});
}

void DiscoveryEngine::onFailed(const std::string& error)
{
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ == BrowseState::idle)
        return;
    std::cerr << "[openfan] mDNS browser failed: " << error << "\n";
    setStateLocked(lk, BrowseState::failed, error);
}

void DiscoveryEngine::publishLocked(std::unique_lock<std::mutex>& lk)
{
    auto snap = std::make_shared<const DeviceList>(
        buildDevices(results_.entries(), namePrefix_));
    snapshot_ = snap;

    std::vector<SnapshotHandler> subs;
    subs.reserve(snapshotSubs_.size());
    for (const auto& [id, h] : snapshotSubs_)
        subs.push_back(h);
    const std::string logPath = eventLog_;
    lk.unlock();

    if (!logPath.empty())
    {
        std::vector<std::string> names;
        names.reserve(snap->size());
        for (const auto& d : *snap)
            names.push_back(d.name);
        log::appendLine(logPath, log::devicesLine(names));
    }

    for (const auto& h : subs)
        h(snap);
}

void DiscoveryEngine::setStateLocked(std::unique_lock<std::mutex>& lk,
                                     BrowseState s, const std::string& error)
{
    state_ = s;

    std::vector<StateHandler> subs;
    subs.reserve(stateSubs_.size());
    for (const auto& [id, h] : stateSubs_)
        subs.push_back(h);
    const std::string logPath = eventLog_;
    lk.unlock();

    log::appendLine(logPath, log::stateLine(toString(s), error));

    for (const auto& h : subs)
        h(s, error);
}

} // namespace openfan::discovery

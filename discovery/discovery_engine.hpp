#pragma once

#include "../model/device.hpp"
#include "constants.hpp"
#include "result_set.hpp"
#include "service_browser.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace openfan::discovery
{

enum class BrowseState
{
    idle,
    browsing, // open, initial batch pending
    ready,    // backend reported the initial batch
    failed,   // backend failed; stop()/start() to retry
};

const char* toString(BrowseState s);

using DeviceList = std::vector<Device>;
// Immutable per-update snapshot; later updates never touch an old one.
using Snapshot = std::shared_ptr<const DeviceList>;

// Live view of the uOpenFan devices on the local network.
//
// Every result-set change rebuilds the device list from scratch and hands the
// new snapshot to all subscribers. start()/stop() and the backend's handlers
// are expected on the same thread (the io_context thread); devices() and the
// subscription calls may be used from any thread.
class DiscoveryEngine
{
  public:
    using SubscriptionId = std::size_t;
    using SnapshotHandler = std::function<void(const Snapshot&)>;
    using StateHandler =
        std::function<void(BrowseState, const std::string& error)>;

    explicit DiscoveryEngine(std::unique_ptr<ServiceBrowser> browser,
                             std::string serviceType = kServiceType,
                             std::string namePrefix = kNamePrefix);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    // No-op while browsing/ready. From failed, the old browse is closed
    // first. A backend error is reported through the state handlers and
    // leaves the engine failed; returns false in that case.
    bool start();

    // Idempotent. Releases the backend before returning and clears the
    // current list (without publishing).
    void stop() noexcept;

    BrowseState state() const;
    Snapshot devices() const;

    SubscriptionId subscribe(SnapshotHandler handler);
    SubscriptionId subscribeState(StateHandler handler);
    void unsubscribe(SubscriptionId id);

    // Append each published list to this file (empty disables).
    void setEventLog(std::string path);

  private:
    BrowseHandlers makeHandlers();
    void onAdded(const ServiceEntry& e);
    void onRemoved(const ServiceEntry& e);
    void onReady();
    void onFailed(const std::string& error);

    // Caller holds lk; it is released before subscribers run.
    void publishLocked(std::unique_lock<std::mutex>& lk);
    void setStateLocked(std::unique_lock<std::mutex>& lk, BrowseState s,
                        const std::string& error);

    std::unique_ptr<ServiceBrowser> browser_;
    const std::string serviceType_;
    const std::string namePrefix_;

    mutable std::mutex mutex_;
    BrowseState state_ = BrowseState::idle;
    ResultSet results_;
    Snapshot snapshot_;
    std::string eventLog_;

    SubscriptionId nextId_ = 1;
    std::map<SubscriptionId, SnapshotHandler> snapshotSubs_;
    std::map<SubscriptionId, StateHandler> stateSubs_;
};

} // namespace openfan::discovery

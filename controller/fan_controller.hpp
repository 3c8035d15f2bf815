#pragma once

#include "../api/fan_api.hpp"
#include "../discovery/discovery_engine.hpp"
#include "../model/device.hpp"

#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace openfan::controller
{

inline constexpr int kDefaultSpeed = 50;

// Last known view of one fan.
struct FanState
{
    int rpm{};
    int speed{};        // 0..100
    bool isOn{};        // speed > 0
    int lastSpeed{kDefaultSpeed}; // last non-zero speed, restored by power-on
    bool reachable{};   // last status poll succeeded
};

using Failures = std::map<std::string, std::exception_ptr>;

// Per-device cached state on top of FanApi. The tracked set follows the
// discovery snapshots; commands address devices by display name.
//
// Outstanding requests keep the internal state alive, so the controller may
// be destroyed with requests in flight.
class FanController
{
  public:
    explicit FanController(api::FanApi api, int defaultSpeed = kDefaultSpeed);

    // Keep states of devices still present, add new ones with defaults,
    // drop the rest.
    void updateDevices(const discovery::Snapshot& snapshot);

    std::vector<std::string> names() const;
    std::optional<Device> device(const std::string& name) const;
    std::optional<FanState> state(const std::string& name) const;

    // Status of every tracked device, concurrently. Failures are logged and
    // mark the device unreachable; done runs once all polls completed.
    void pollAll(std::function<void(Failures)> done);
    std::future<Failures> pollAll();

    // Unknown name -> std::invalid_argument (thrown here, not via future).
    // percent is clamped to [0,100].
    std::future<void> setSpeed(const std::string& name, int percent);
    // on -> last non-zero speed (default when none), off -> 0.
    std::future<void> setPower(const std::string& name, bool on);
    std::future<void> toggle(const std::string& name);

    // Same speed on every tracked device; map of per-device failures.
    std::future<Failures> setAll(int percent);

    void setEventLog(std::string path);

  private:
    struct Tracked
    {
        Device device;
        FanState state;
    };

    struct Shared
    {
        std::mutex mutex;
        std::map<std::string, Tracked> fans;
        std::string eventLog;
    };

    void sendSpeed(const Device& device, int percent,
                   std::function<void(std::exception_ptr)> done);

    api::FanApi api_;
    int defaultSpeed_;
    std::shared_ptr<Shared> shared_;
};

} // namespace openfan::controller

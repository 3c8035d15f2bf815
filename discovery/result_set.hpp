#pragma once

#include "../model/device.hpp"
#include "service_browser.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace openfan::discovery
{

// Current browse results, keyed by the full (interface, protocol, name, type,
// domain) tuple as reported by the backend.
class ResultSet
{
  public:
    // Return true when the set changed.
    bool add(const ServiceEntry& e);
    bool remove(const ServiceEntry& e);
    void clear();

    const std::set<ServiceEntry>& entries() const
    {
        return entries_;
    }

  private:
    std::set<ServiceEntry> entries_;
};

// "uOpenFan-Desk" -> Device{"Desk", "http://uOpenFan-Desk.local"}.
// nullopt when the name does not start with prefix.
std::optional<Device> deviceFromServiceName(const std::string& serviceName,
                                            const std::string& prefix);

// Rebuild the visible device list from scratch: prefix filter, one Device
// per name, sorted by name.
std::vector<Device> buildDevices(const std::set<ServiceEntry>& entries,
                                 const std::string& prefix);

} // namespace openfan::discovery

#include "result_set.hpp"

#include <map>

namespace openfan::discovery
{

bool ResultSet::add(const ServiceEntry& e)
{
    return entries_.insert(e).second;
}

bool ResultSet::remove(const ServiceEntry& e)
{
    return entries_.erase(e) > 0;
}

void ResultSet::clear()
{
    entries_.clear();
}

std::optional<Device> deviceFromServiceName(const std::string& serviceName,
                                            const std::string& prefix)
{
    if (serviceName.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;

    // Strip "<prefix>-" once, only at the start.
    const std::string token = prefix + "-";
    std::string display = serviceName;
    if (display.compare(0, token.size(), token) == 0)
        display.erase(0, token.size());

    Device d{};
    d.name = display;
    // Instance name used verbatim as the mDNS host label; no resolve step.
    d.baseUrl = "http://" + serviceName + ".local";
    return d;
}

std::vector<Device> buildDevices(const std::set<ServiceEntry>& entries,
                                 const std::string& prefix)
{
    std::map<std::string, Device> byName;
    for (const auto& e : entries)
    {
        auto d = deviceFromServiceName(e.name, prefix);
        if (!d)
            continue;
        byName.emplace(d->name, std::move(*d));
    }

    std::vector<Device> out;
    out.reserve(byName.size());
    for (auto& [name, d] : byName)
        out.push_back(std::move(d));
    return out;
}

} // namespace openfan::discovery

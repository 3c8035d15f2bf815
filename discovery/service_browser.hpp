#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace openfan::discovery
{

// One advertised service endpoint. The same instance shows up once per
// interface/protocol pair it is seen on.
struct ServiceEntry
{
    int32_t interface{};
    int32_t protocol{};
    std::string name;
    std::string type;
    std::string domain;

    bool operator<(const ServiceEntry& o) const
    {
        return std::tie(interface, protocol, name, type, domain) <
               std::tie(o.interface, o.protocol, o.name, o.type, o.domain);
    }
};

struct BrowseHandlers
{
    std::function<void(const ServiceEntry&)> added;
    std::function<void(const ServiceEntry&)> removed;
    std::function<void()> ready;                     // initial batch done
    std::function<void(const std::string&)> failed; // browse broke
};

// Platform browse backend. open() registers the handlers and starts the
// browse (throws DiscoveryError); close() must release every resource before
// returning and never throw. Handlers are not invoked after close().
class ServiceBrowser
{
  public:
    virtual ~ServiceBrowser() = default;

    virtual void open(const std::string& serviceType,
                      BrowseHandlers handlers) = 0;
    virtual void close() noexcept = 0;
};

} // namespace openfan::discovery

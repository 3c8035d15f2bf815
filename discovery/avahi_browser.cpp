#include "avahi_browser.hpp"

#include "../core/errors.hpp"
#include "constants.hpp"

#include <sdbusplus/exception.hpp>
#include <sdbusplus/message.hpp>

#include <cstdint>
#include <cstring>
#include <iostream>
#include <utility>

namespace openfan::discovery
{

AvahiServiceBrowser::AvahiServiceBrowser(sdbusplus::bus_t& bus) : bus_(bus) {}

AvahiServiceBrowser::~AvahiServiceBrowser()
{
    close();
}

void AvahiServiceBrowser::open(const std::string& serviceType,
                               BrowseHandlers handlers)
{
    close();
    handlers_ = std::move(handlers);

    // Subscribe before creating the browser: avahi starts emitting ItemNew as
    // soon as ServiceBrowserNew returns. Signals for other browsers are
    // filtered by path in onSignal().
    const std::string matchRule = "type='signal',"
                                  "sender='" +
                                  std::string(dbusconst::kAvahiService) +
                                  "',"
                                  "interface='" +
                                  std::string(dbusconst::kAvahiBrowserIface) +
                                  "'";
    try
    {
        matcher_ = std::make_unique<sdbusplus::bus::match_t>(
            bus_, matchRule.c_str(),
            [this](sdbusplus::message_t& msg) { onSignal(msg); });

        auto m = bus_.new_method_call(
            dbusconst::kAvahiService, dbusconst::kAvahiServerPath,
            dbusconst::kAvahiServerIface, "ServiceBrowserNew");
        // interface, protocol, type, domain ("" = default/no filter), flags
        m.append(dbusconst::kIfUnspec, dbusconst::kProtoUnspec, serviceType,
                 std::string{}, static_cast<uint32_t>(0));

        auto reply = bus_.call(m);
        sdbusplus::message::object_path path;
        reply.read(path);
        browserPath_ = path.str;
    }
    catch (const sdbusplus::exception_t& e)
    {
        matcher_.reset();
        handlers_ = BrowseHandlers{};
        throw DiscoveryError(std::string("Avahi ServiceBrowserNew failed: ") +
                             e.what());
    }

    std::cerr << "[openfan] avahi browser " << browserPath_ << " for "
              << serviceType << "\n";
}

void AvahiServiceBrowser::close() noexcept
{
    // Drop the match first so no handler runs while we tear down. Inside a
    // dispatch the match is still on the stack; retire it until onSignal()
    // unwinds.
    if (dispatching_ && matcher_)
        retired_.push_back(std::move(matcher_));
    matcher_.reset();

    if (!browserPath_.empty())
    {
        try
        {
            auto m = bus_.new_method_call(dbusconst::kAvahiService,
                                          browserPath_.c_str(),
                                          dbusconst::kAvahiBrowserIface, "Free");
            (void)bus_.call(m);
        }
        catch (const sdbusplus::exception_t& e)
        {
            // Daemon gone: the browser died with it.
            std::cerr << "[openfan] avahi browser Free failed for "
                      << browserPath_ << ": " << e.what() << "\n";
        }
        browserPath_.clear();
    }

    handlers_ = BrowseHandlers{};
}

void AvahiServiceBrowser::onSignal(sdbusplus::message_t& msg)
{
    const char* path = msg.get_path();
    const char* member = msg.get_member();
    if (browserPath_.empty() || path == nullptr || member == nullptr ||
        browserPath_ != path)
        return;

    // Handlers may stop or restart discovery; work on a copy.
    const BrowseHandlers h = handlers_;
    dispatching_ = true;

    try
    {
        const bool isNew = std::strcmp(member, "ItemNew") == 0;
        const bool isRemove = std::strcmp(member, "ItemRemove") == 0;

        if (isNew || isRemove)
        {
            ServiceEntry e{};
            uint32_t flags = 0;
            // Signature: iissu
            msg.read(e.interface, e.protocol, e.name, e.type, e.domain, flags);

            if (isNew && h.added)
                h.added(e);
            else if (isRemove && h.removed)
                h.removed(e);
        }
        else if (std::strcmp(member, "AllForNow") == 0)
        {
            if (h.ready)
                h.ready();
        }
        else if (std::strcmp(member, "Failure") == 0)
        {
            std::string error;
            msg.read(error);
            if (h.failed)
                h.failed(error);
        }
        // CacheExhausted: nothing to do.
    }
    catch (const sdbusplus::exception_t& e)
    {
        std::cerr << "[openfan] avahi signal read error (" << member
                  << "): " << e.what() << "\n";
    }

    dispatching_ = false;
    retired_.clear();
}

} // namespace openfan::discovery

#pragma once

#include "service_browser.hpp"

#include <sdbusplus/bus.hpp>
#include <sdbusplus/bus/match.hpp>

#include <memory>
#include <string>
#include <vector>

namespace openfan::discovery
{

// mDNS browse through avahi-daemon's D-Bus API.
// The bus must be dispatched (sdbusplus::asio::connection on a running
// io_context) for signals to arrive.
class AvahiServiceBrowser : public ServiceBrowser
{
  public:
    explicit AvahiServiceBrowser(sdbusplus::bus_t& bus);
    ~AvahiServiceBrowser() override;

    AvahiServiceBrowser(const AvahiServiceBrowser&) = delete;
    AvahiServiceBrowser& operator=(const AvahiServiceBrowser&) = delete;

    void open(const std::string& serviceType, BrowseHandlers handlers) override;
    void close() noexcept override;

  private:
    void onSignal(sdbusplus::message_t& msg);

    sdbusplus::bus_t& bus_;
    std::unique_ptr<sdbusplus::bus::match_t> matcher_;
    std::vector<std::unique_ptr<sdbusplus::bus::match_t>> retired_;
    bool dispatching_ = false;
    std::string browserPath_;
    BrowseHandlers handlers_;
};

} // namespace openfan::discovery

#pragma once

#include <cstdint>

namespace openfan::dbusconst
{

// Avahi daemon on the system bus.
inline constexpr const char* kAvahiService = "org.freedesktop.Avahi";
inline constexpr const char* kAvahiServerPath = "/";
inline constexpr const char* kAvahiServerIface =
    "org.freedesktop.Avahi.Server"; // ServiceBrowserNew(iissu) -> o
inline constexpr const char* kAvahiBrowserIface =
    "org.freedesktop.Avahi.ServiceBrowser"; // ItemNew/ItemRemove/Failure/...

// AVAHI_IF_UNSPEC / AVAHI_PROTO_UNSPEC: every interface, IPv4 and IPv6.
inline constexpr int32_t kIfUnspec = -1;
inline constexpr int32_t kProtoUnspec = -1;

} // namespace openfan::dbusconst

namespace openfan::discovery
{

inline constexpr const char* kServiceType = "_http._tcp";
inline constexpr const char* kNamePrefix = "uOpenFan";

} // namespace openfan::discovery

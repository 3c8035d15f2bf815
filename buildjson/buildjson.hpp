#pragma once

#include <string>

namespace openfan
{

struct DiscoverySettings
{
    std::string serviceType{"_http._tcp"}; // mDNS type browsed
    std::string namePrefix{"uOpenFan"};    // instance-name filter
    int waitSec{5}; // one-shot commands wait this long for the first batch
};

struct PollSettings
{
    int intervalSec{10}; // status poll period in watch mode
    int defaultSpeed{50}; // power-on speed when no previous speed is known
};

struct Config
{
    DiscoverySettings discovery;
    PollSettings poll;

    // Timestamped event log (device lists, command results). Empty -> off.
    std::string eventLog;
};

// Load from file (JSON). Absent keys keep their defaults. Throws
// std::runtime_error on an unreadable file, malformed JSON or invalid values.
Config loadConfigFromJsonFile(const std::string& jsonPath);

} // namespace openfan

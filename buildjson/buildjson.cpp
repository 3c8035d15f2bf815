#include "buildjson.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace j = nlohmann;

namespace openfan
{

static int read_int(const j::json& obj, const char* key, int def)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<int>();
}

static std::string read_string(const j::json& obj, const char* key,
                               const std::string& def)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<std::string>();
}

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    j::json root;
    try
    {
        root = j::json::parse(ifs);
    }
    catch (const j::json::parse_error& e)
    {
        throw std::runtime_error("Malformed config " + jsonPath + ": " +
                                 e.what());
    }
    if (!root.is_object())
    {
        throw std::runtime_error("Config root must be an object: " + jsonPath);
    }

    Config out{};

    try
    {
        // ===== discovery =====
        if (root.contains("discovery"))
        {
            const auto& d = root.at("discovery");
            out.discovery.serviceType =
                read_string(d, "serviceType", out.discovery.serviceType);
            out.discovery.namePrefix =
                read_string(d, "namePrefix", out.discovery.namePrefix);
            out.discovery.waitSec =
                read_int(d, "discoveryWait", out.discovery.waitSec);
        }

        // ===== poll =====
        if (root.contains("poll"))
        {
            const auto& p = root.at("poll");
            out.poll.intervalSec =
                read_int(p, "pollInterval", out.poll.intervalSec);
            out.poll.defaultSpeed =
                read_int(p, "defaultSpeed", out.poll.defaultSpeed);
        }

        out.eventLog = read_string(root, "eventLog", {});
    }
    catch (const j::json::type_error& e)
    {
        throw std::runtime_error("Bad value type in " + jsonPath + ": " +
                                 e.what());
    }

    // ===== validation =====
    if (out.discovery.serviceType.empty() || out.discovery.namePrefix.empty())
    {
        throw std::runtime_error(
            "Invalid discovery: serviceType and namePrefix must be non-empty");
    }
    if (out.discovery.waitSec < 0)
    {
        throw std::runtime_error("Invalid discovery: discoveryWait < 0");
    }
    if (out.poll.intervalSec < 1)
    {
        throw std::runtime_error("Invalid poll: pollInterval must be >= 1");
    }
    if (out.poll.defaultSpeed < 0 || out.poll.defaultSpeed > 100)
    {
        throw std::runtime_error("Invalid poll: defaultSpeed must be 0..100");
    }

    return out;
}

} // namespace openfan

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>

namespace openfan
{

inline constexpr const char* kStatusOk = "ok";

// One controllable unit as seen by discovery.
struct Device
{
    std::string name;    // advertised name minus "uOpenFan-"
    std::string baseUrl; // http://<advertised-name>.local

    bool operator==(const Device& o) const
    {
        return name == o.name && baseUrl == o.baseUrl;
    }
    bool operator!=(const Device& o) const
    {
        return !(*this == o);
    }
};

// GET /api/v0/fan/status -> {status, rpm, pwm_percent}
struct DeviceStatus
{
    std::string state;
    int rpmReading{};
    int dutyPercent{};
};

// GET /api/v0/fan/0/set -> {status, message?}
struct ControlResponse
{
    std::string state;
    std::optional<std::string> detailMessage;
};

// Strict decoders: a missing or wrongly-typed required field throws
// nlohmann::json::exception.
void from_json(const nlohmann::json& j, DeviceStatus& s);
void from_json(const nlohmann::json& j, ControlResponse& r);

} // namespace openfan

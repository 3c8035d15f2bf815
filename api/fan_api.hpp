#pragma once

#include "../http/transport_client.hpp"
#include "../model/device.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <future>
#include <string>

namespace openfan::api
{

inline constexpr const char* kStatusPath = "/api/v0/fan/status";
inline constexpr const char* kSetSpeedPath = "/api/v0/fan/0/set";
inline constexpr const char* kUnknownError = "Unknown error";

// Status and set-speed requests against one device. Failures surface as
// InvalidResponse (DecodeError for schema mismatch) or ApiError.
class FanApi
{
  public:
    using StatusHandler = std::function<void(std::exception_ptr, DeviceStatus)>;
    using DoneHandler = std::function<void(std::exception_ptr)>;

    explicit FanApi(http::TransportClient client);

    void getStatus(const Device& device, StatusHandler handler) const;
    std::future<DeviceStatus> getStatus(const Device& device) const;

    // percent is sent as-is; range is the caller's concern.
    void setSpeed(const Device& device, int percent, DoneHandler handler) const;
    std::future<void> setSpeed(const Device& device, int percent) const;

    static std::string statusUrl(const Device& device);
    static std::string setSpeedUrl(const Device& device, int percent);

    // Envelope checks, throwing DecodeError / ApiError.
    static DeviceStatus decodeStatus(const nlohmann::json& body);
    static void checkControl(const nlohmann::json& body);

  private:
    http::TransportClient client_;
};

} // namespace openfan::api

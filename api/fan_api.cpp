#include "fan_api.hpp"

#include "../core/errors.hpp"

#include <memory>
#include <utility>

namespace openfan::api
{

FanApi::FanApi(http::TransportClient client) : client_(std::move(client)) {}

std::string FanApi::statusUrl(const Device& device)
{
    return device.baseUrl + kStatusPath;
}

std::string FanApi::setSpeedUrl(const Device& device, int percent)
{
    return device.baseUrl + kSetSpeedPath + "?value=" + std::to_string(percent);
}

DeviceStatus FanApi::decodeStatus(const nlohmann::json& body)
{
    DeviceStatus s{};
    try
    {
        s = body.get<DeviceStatus>();
    }
    catch (const nlohmann::json::exception& e)
    {
        throw DecodeError(e.what());
    }

    if (s.state != kStatusOk)
        throw ApiError(s.state);
    return s;
}

void FanApi::checkControl(const nlohmann::json& body)
{
    ControlResponse r{};
    try
    {
        r = body.get<ControlResponse>();
    }
    catch (const nlohmann::json::exception& e)
    {
        throw DecodeError(e.what());
    }

    if (r.state != kStatusOk)
        throw ApiError(r.detailMessage.value_or(kUnknownError));
}

void FanApi::getStatus(const Device& device, StatusHandler handler) const
{
    client_.fetchJson(
        statusUrl(device),
        [h = std::move(handler)](std::exception_ptr err, nlohmann::json body) {
            if (err)
                return h(err, DeviceStatus{});

            DeviceStatus s{};
            try
            {
                s = decodeStatus(body);
            }
            catch (const FanError&)
            {
                return h(std::current_exception(), DeviceStatus{});
            }
            h(nullptr, std::move(s));
        });
}

std::future<DeviceStatus> FanApi::getStatus(const Device& device) const
{
    auto p = std::make_shared<std::promise<DeviceStatus>>();
    auto fut = p->get_future();
    getStatus(device, [p](std::exception_ptr err, DeviceStatus s) {
        if (err)
            p->set_exception(err);
        else
            p->set_value(std::move(s));
    });
    return fut;
}

void FanApi::setSpeed(const Device& device, int percent,
                      DoneHandler handler) const
{
    client_.fetchJson(
        setSpeedUrl(device, percent),
        [h = std::move(handler)](std::exception_ptr err, nlohmann::json body) {
            if (err)
                return h(err);

            try
            {
                checkControl(body);
            }
            catch (const FanError&)
            {
                return h(std::current_exception());
            }
            h(nullptr);
        });
}

std::future<void> FanApi::setSpeed(const Device& device, int percent) const
{
    auto p = std::make_shared<std::promise<void>>();
    auto fut = p->get_future();
    setSpeed(device, percent, [p](std::exception_ptr err) {
        if (err)
            p->set_exception(err);
        else
            p->set_value();
    });
    return fut;
}

} // namespace openfan::api

#include "device.hpp"

#include <nlohmann/json.hpp>

namespace openfan
{

void from_json(const nlohmann::json& j, DeviceStatus& s)
{
    j.at("status").get_to(s.state);

    // A non-ok payload usually carries only status (+message); the caller
    // reports that as an ApiError, so the readings are not decoded there.
    if (s.state != kStatusOk)
    {
        s.rpmReading = 0;
        s.dutyPercent = 0;
        return;
    }

    j.at("rpm").get_to(s.rpmReading);
    j.at("pwm_percent").get_to(s.dutyPercent);
}

void from_json(const nlohmann::json& j, ControlResponse& r)
{
    j.at("status").get_to(r.state);

    auto it = j.find("message");
    if (it != j.end() && !it->is_null())
        r.detailMessage = it->get<std::string>();
    else
        r.detailMessage.reset();
}

} // namespace openfan

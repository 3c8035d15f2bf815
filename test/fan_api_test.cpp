#include "../api/fan_api.hpp"
#include "../core/errors.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace openfan;
using openfan::test::FakeTransport;

namespace
{

const Device kDesk{"Desk", "http://uOpenFan-Desk.local"};
const std::string kStatusUrl = "http://uOpenFan-Desk.local/api/v0/fan/status";

class FanApiTest : public ::testing::Test
{
  protected:
    std::shared_ptr<FakeTransport> fake = std::make_shared<FakeTransport>();
    api::FanApi fan{http::TransportClient(fake)};

    std::string setUrl(int v) const
    {
        return "http://uOpenFan-Desk.local/api/v0/fan/0/set?value=" +
               std::to_string(v);
    }
};

} // namespace

TEST_F(FanApiTest, UrlsFollowDeviceApi)
{
    EXPECT_EQ(api::FanApi::statusUrl(kDesk), kStatusUrl);
    EXPECT_EQ(api::FanApi::setSpeedUrl(kDesk, 45), setUrl(45));
}

TEST_F(FanApiTest, StatusCopiedVerbatim)
{
    fake->respond(kStatusUrl, 200,
                  R"({"status":"ok","rpm":1200,"pwm_percent":45})");

    auto s = fan.getStatus(kDesk).get();
    EXPECT_EQ(s.state, "ok");
    EXPECT_EQ(s.rpmReading, 1200);
    EXPECT_EQ(s.dutyPercent, 45);
}

TEST_F(FanApiTest, StatusIgnoresExtraFields)
{
    fake->respond(kStatusUrl, 200,
                  R"({"status":"ok","rpm":0,"pwm_percent":0,"fw":"1.2"})");
    auto s = fan.getStatus(kDesk).get();
    EXPECT_EQ(s.rpmReading, 0);
    EXPECT_EQ(s.dutyPercent, 0);
}

TEST_F(FanApiTest, NonOkStatusIsApiErrorWithState)
{
    for (const std::string state : {"error", "stalled", "OK", ""})
    {
        fake->respond(kStatusUrl, 200,
                      R"({"status":")" + state + R"(","rpm":5})");
        try
        {
            fan.getStatus(kDesk).get();
            FAIL() << "accepted status '" << state << "'";
        }
        catch (const ApiError& e)
        {
            EXPECT_EQ(e.message(), state);
        }
    }
}

TEST_F(FanApiTest, StatusNon200IsInvalidResponse)
{
    fake->respond(kStatusUrl, 500,
                  R"({"status":"ok","rpm":1200,"pwm_percent":45})");
    EXPECT_THROW(fan.getStatus(kDesk).get(), InvalidResponse);
}

TEST_F(FanApiTest, StatusMissingFieldIsDecodeError)
{
    fake->respond(kStatusUrl, 200, R"({"status":"ok","rpm":1200})");
    EXPECT_THROW(fan.getStatus(kDesk).get(), DecodeError);

    fake->respond(kStatusUrl, 200,
                  R"({"status":"ok","rpm":"fast","pwm_percent":45})");
    EXPECT_THROW(fan.getStatus(kDesk).get(), DecodeError);

    fake->respond(kStatusUrl, 200, R"([1,2,3])");
    EXPECT_THROW(fan.getStatus(kDesk).get(), DecodeError);
}

TEST_F(FanApiTest, UnreachableDeviceIsInvalidResponse)
{
    Device gone{"Gone", "http://uOpenFan-Gone.local"};
    EXPECT_THROW(fan.getStatus(gone).get(), InvalidResponse);
    EXPECT_THROW(fan.setSpeed(gone, 10).get(), InvalidResponse);
}

TEST_F(FanApiTest, SetSpeedOk)
{
    fake->respond(setUrl(30), 200, R"({"status":"ok"})");
    EXPECT_NO_THROW(fan.setSpeed(kDesk, 30).get());
    ASSERT_EQ(fake->requests().size(), 1u);
    EXPECT_EQ(fake->requests().front(), setUrl(30));
}

TEST_F(FanApiTest, SetSpeedSendsValueUnclamped)
{
    fake->respond(setUrl(150), 200, R"({"status":"ok"})");
    fake->respond(setUrl(-5), 200, R"({"status":"ok"})");
    EXPECT_NO_THROW(fan.setSpeed(kDesk, 150).get());
    EXPECT_NO_THROW(fan.setSpeed(kDesk, -5).get());
}

TEST_F(FanApiTest, SetSpeedErrorCarriesDeviceMessage)
{
    fake->respond(setUrl(40), 200,
                  R"({"status":"error","message":"fan stalled"})");
    try
    {
        fan.setSpeed(kDesk, 40).get();
        FAIL() << "no error";
    }
    catch (const ApiError& e)
    {
        EXPECT_EQ(e.message(), "fan stalled");
        EXPECT_EQ(std::string(e.what()), "API Error: fan stalled");
    }
}

TEST_F(FanApiTest, SetSpeedErrorWithoutMessageIsUnknownError)
{
    fake->respond(setUrl(40), 200, R"({"status":"error"})");
    try
    {
        fan.setSpeed(kDesk, 40).get();
        FAIL() << "no error";
    }
    catch (const ApiError& e)
    {
        EXPECT_EQ(e.message(), "Unknown error");
    }
}

TEST_F(FanApiTest, SetSpeedNon200IsInvalidResponse)
{
    fake->respond(setUrl(40), 404, R"({"status":"error","message":"x"})");
    try
    {
        fan.setSpeed(kDesk, 40).get();
        FAIL() << "no error";
    }
    catch (const ApiError&)
    {
        FAIL() << "HTTP 404 reported as ApiError";
    }
    catch (const InvalidResponse&)
    {}
}

TEST_F(FanApiTest, SetSpeedMissingStatusIsDecodeError)
{
    fake->respond(setUrl(40), 200, R"({"message":"hi"})");
    EXPECT_THROW(fan.setSpeed(kDesk, 40).get(), DecodeError);
}

TEST_F(FanApiTest, HandlerFormReportsApiError)
{
    fake->respond(kStatusUrl, 200, R"({"status":"overheat"})");
    bool called = false;
    fan.getStatus(kDesk, [&](std::exception_ptr err, DeviceStatus) {
        called = true;
        ASSERT_TRUE(err);
        EXPECT_THROW(std::rethrow_exception(err), ApiError);
    });
    EXPECT_TRUE(called);
}

#include "../core/errors.hpp"
#include "../http/transport_client.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace openfan;
using openfan::test::FakeTransport;

TEST(TransportClient, Validate200Json)
{
    auto j = http::TransportClient::validate({200, R"({"status":"ok"})"});
    EXPECT_EQ(j.at("status"), "ok");
}

TEST(TransportClient, Non200IsInvalidResponseEvenWithGoodBody)
{
    for (unsigned code : {201u, 204u, 301u, 404u, 500u})
    {
        try
        {
            http::TransportClient::validate({code, R"({"status":"ok"})"});
            FAIL() << "accepted HTTP " << code;
        }
        catch (const DecodeError&)
        {
            FAIL() << "HTTP " << code << " reported as decode error";
        }
        catch (const InvalidResponse& e)
        {
            EXPECT_NE(e.detail().find(std::to_string(code)), std::string::npos);
        }
    }
}

TEST(TransportClient, GarbageBodyIsDecodeError)
{
    EXPECT_THROW(http::TransportClient::validate({200, "<html>"}), DecodeError);
    EXPECT_THROW(http::TransportClient::validate({200, ""}), DecodeError);
    // DecodeError is still a transport failure for coarse callers.
    EXPECT_THROW(http::TransportClient::validate({200, "{"}), InvalidResponse);
}

TEST(TransportClient, NetworkErrorPropagatesThroughFuture)
{
    auto fake = std::make_shared<FakeTransport>();
    http::TransportClient client(fake);

    auto fut = client.fetchJson("http://nowhere.local/api/v0/fan/status");
    EXPECT_THROW(fut.get(), InvalidResponse);
    ASSERT_EQ(fake->requests().size(), 1u);
}

TEST(TransportClient, HandlerFormDeliversJson)
{
    auto fake = std::make_shared<FakeTransport>();
    fake->respond("http://a.local/x", 200, R"({"v":3})");
    http::TransportClient client(fake);

    bool called = false;
    client.fetchJson("http://a.local/x",
                     [&](std::exception_ptr err, nlohmann::json j) {
                         called = true;
                         EXPECT_FALSE(err);
                         EXPECT_EQ(j.at("v"), 3);
                     });
    EXPECT_TRUE(called);
}

TEST(TransportClient, NullTransportRejected)
{
    EXPECT_THROW(http::TransportClient(nullptr), std::invalid_argument);
}

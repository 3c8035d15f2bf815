#pragma once

#include "http_transport.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <string>

namespace openfan::http
{

// HTTP/1.1 GET over Boost.Beast. One connection per request
// (Connection: close), no retries. Each request runs on its own strand of the
// given io_context, which must be run by at least one thread.
class BeastTransport : public HttpTransport
{
  public:
    explicit BeastTransport(boost::asio::io_context& io,
                            std::chrono::milliseconds timeout = kRequestTimeout);

    void asyncGet(const std::string& url, GetHandler handler) override;

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

  private:
    boost::asio::io_context& io_;
    std::chrono::milliseconds timeout_;
};

} // namespace openfan::http

#pragma once

#include "http_transport.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace openfan::http
{

// One bounded GET that must answer 200 with a JSON body.
//  - network error / timeout / non-200 -> InvalidResponse
//  - body is not JSON                  -> DecodeError
class TransportClient
{
  public:
    using JsonHandler = std::function<void(std::exception_ptr, nlohmann::json)>;

    explicit TransportClient(std::shared_ptr<HttpTransport> transport);

    void fetchJson(const std::string& url, JsonHandler handler) const;

    // Do not wait on the returned future from the io_context thread.
    std::future<nlohmann::json> fetchJson(const std::string& url) const;

    // Throws InvalidResponse or DecodeError.
    static nlohmann::json validate(const Response& r);

  private:
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace openfan::http

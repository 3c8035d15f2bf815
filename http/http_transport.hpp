#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>

namespace openfan::http
{

// Connect + full response bound for every request.
inline constexpr std::chrono::milliseconds kRequestTimeout{5000};

struct Response
{
    unsigned status{};
    std::string body;
};

// Completion for one GET. On a network error or timeout the exception_ptr
// holds an openfan::InvalidResponse and the Response is empty. A non-200
// status is NOT an error at this level.
using GetHandler = std::function<void(std::exception_ptr, Response)>;

// Raw HTTP exchange seam. Implementations must invoke the handler exactly
// once.
class HttpTransport
{
  public:
    virtual ~HttpTransport() = default;

    virtual void asyncGet(const std::string& url, GetHandler handler) = 0;
};

struct Url
{
    std::string host;
    std::string port;   // "80" when absent
    std::string target; // path + query, "/" when absent
};

// Split "http://host[:port][/target]". Only the http scheme is accepted.
std::optional<Url> parseUrl(const std::string& url);

} // namespace openfan::http

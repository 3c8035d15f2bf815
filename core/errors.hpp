#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace openfan
{

// Base of every failure surfaced by the control path.
class FanError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Transport/protocol failure: non-200 status, connect/read error, timeout.
class InvalidResponse : public FanError
{
  public:
    explicit InvalidResponse(const std::string& detail) :
        FanError("Invalid response from fan: " + detail), detail_(detail)
    {}

    const std::string& detail() const
    {
        return detail_;
    }

  private:
    std::string detail_;
};

// Body is not JSON, or JSON not matching the expected schema.
class DecodeError : public InvalidResponse
{
  public:
    explicit DecodeError(const std::string& detail) :
        InvalidResponse("decode failed: " + detail)
    {}
};

// HTTP exchange succeeded but the device reported status != "ok".
class ApiError : public FanError
{
  public:
    explicit ApiError(const std::string& message) :
        FanError("API Error: " + message), message_(message)
    {}

    const std::string& message() const
    {
        return message_;
    }

  private:
    std::string message_;
};

// Browse subsystem failure (daemon unavailable, browser failure signal).
class DiscoveryError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// what() of a captured exception, for log lines.
inline std::string describe(std::exception_ptr err)
{
    if (!err)
        return "no error";
    try
    {
        std::rethrow_exception(err);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown exception";
    }
}

} // namespace openfan

#include "http_transport.hpp"

namespace openfan::http
{

std::optional<Url> parseUrl(const std::string& url)
{
    static const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0)
        return std::nullopt;

    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find_first_of("/?");
    std::string authority =
        (slash == std::string::npos) ? rest : rest.substr(0, slash);

    Url out{};
    if (slash == std::string::npos)
        out.target = "/";
    else if (rest[slash] == '?')
        out.target = "/" + rest.substr(slash);
    else
        out.target = rest.substr(slash);

    if (authority.empty())
        return std::nullopt;

    // [v6-literal]:port
    if (authority.front() == '[')
    {
        const auto close = authority.find(']');
        if (close == std::string::npos)
            return std::nullopt;
        out.host = authority.substr(1, close - 1);
        const std::string tail = authority.substr(close + 1);
        if (tail.empty())
            out.port = "80";
        else if (tail.front() == ':' && tail.size() > 1)
            out.port = tail.substr(1);
        else
            return std::nullopt;
    }
    else
    {
        const auto colon = authority.rfind(':');
        if (colon == std::string::npos)
        {
            out.host = authority;
            out.port = "80";
        }
        else
        {
            out.host = authority.substr(0, colon);
            out.port = authority.substr(colon + 1);
        }
    }

    if (out.host.empty() || out.port.empty() ||
        out.port.find_first_not_of("0123456789") != std::string::npos)
        return std::nullopt;

    return out;
}

} // namespace openfan::http

#include "transport_client.hpp"

#include "../core/errors.hpp"

#include <stdexcept>
#include <utility>

namespace openfan::http
{

TransportClient::TransportClient(std::shared_ptr<HttpTransport> transport) :
    transport_(std::move(transport))
{
    if (!transport_)
        throw std::invalid_argument("TransportClient: null transport");
}

nlohmann::json TransportClient::validate(const Response& r)
{
    if (r.status != 200)
        throw InvalidResponse("HTTP status " + std::to_string(r.status));

    try
    {
        return nlohmann::json::parse(r.body);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw DecodeError(e.what());
    }
}

void TransportClient::fetchJson(const std::string& url,
                                JsonHandler handler) const
{
    transport_->asyncGet(
        url, [h = std::move(handler)](std::exception_ptr err, Response r) {
            if (err)
                return h(err, nlohmann::json{});

            nlohmann::json body;
            try
            {
                body = validate(r);
            }
            catch (const FanError&)
            {
                return h(std::current_exception(), nlohmann::json{});
            }
            h(nullptr, std::move(body));
        });
}

std::future<nlohmann::json> TransportClient::fetchJson(
    const std::string& url) const
{
    auto p = std::make_shared<std::promise<nlohmann::json>>();
    auto fut = p->get_future();
    fetchJson(url, [p](std::exception_ptr err, nlohmann::json j) {
        if (err)
            p->set_exception(err);
        else
            p->set_value(std::move(j));
    });
    return fut;
}

} // namespace openfan::http

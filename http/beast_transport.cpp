#include "beast_transport.hpp"

#include "../core/errors.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <memory>
#include <utility>

namespace openfan::http
{

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace
{

// One GET from resolve to read. Owns itself through the pending handlers;
// a single deadline timer bounds the whole exchange.
class Session : public std::enable_shared_from_this<Session>
{
  public:
    Session(asio::io_context& io, std::chrono::milliseconds timeout, Url url,
            GetHandler handler) :
        strand_(asio::make_strand(io)), resolver_(strand_), stream_(strand_),
        deadline_(strand_), timeout_(timeout), url_(std::move(url)),
        handler_(std::move(handler))
    {}

    void start()
    {
        asio::post(strand_, [self = shared_from_this()] { self->run(); });
    }

  private:
    void run()
    {
        req_.version(11);
        req_.method(bhttp::verb::get);
        req_.target(url_.target);
        req_.set(bhttp::field::host, url_.host);
        req_.set(bhttp::field::user_agent, "openfan-link");
        req_.set(bhttp::field::accept, "application/json");
        req_.keep_alive(false);

        deadline_.expires_after(timeout_);
        deadline_.async_wait(
            [self = shared_from_this()](beast::error_code ec) {
                if (!ec)
                    self->onTimeout();
            });

        phase_ = "resolve " + url_.host;
        resolver_.async_resolve(
            url_.host, url_.port,
            [self = shared_from_this()](beast::error_code ec,
                                        tcp::resolver::results_type results) {
                self->onResolve(ec, std::move(results));
            });
    }

    // The deadline completes the request itself. A lookup already inside
    // getaddrinfo cannot be cancelled, so late completions are dropped below.
    void onTimeout()
    {
        if (done_)
            return;
        resolver_.cancel();
        beast::error_code ignored;
        stream_.socket().close(ignored);
        finish(std::make_exception_ptr(InvalidResponse(
                   "timed out after " + std::to_string(timeout_.count()) +
                   " ms (" + phase_ + ")")),
               Response{});
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        if (done_)
            return;
        if (ec)
            return fail("resolve " + url_.host, ec);

        phase_ = "connect " + url_.host + ":" + url_.port;
        stream_.async_connect(
            results, [self = shared_from_this()](
                         beast::error_code ec, tcp::endpoint) {
                self->onConnect(ec);
            });
    }

    void onConnect(beast::error_code ec)
    {
        if (done_)
            return;
        if (ec)
            return fail("connect " + url_.host + ":" + url_.port, ec);

        phase_ = "write";
        bhttp::async_write(stream_, req_,
                           [self = shared_from_this()](beast::error_code ec,
                                                       std::size_t) {
                               self->onWrite(ec);
                           });
    }

    void onWrite(beast::error_code ec)
    {
        if (done_)
            return;
        if (ec)
            return fail("write", ec);

        phase_ = "read";
        bhttp::async_read(stream_, buffer_, res_,
                          [self = shared_from_this()](beast::error_code ec,
                                                      std::size_t) {
                              self->onRead(ec);
                          });
    }

    void onRead(beast::error_code ec)
    {
        if (done_)
            return;
        if (ec)
            return fail("read", ec);

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

        Response r{};
        r.status = res_.result_int();
        r.body = std::move(res_.body());
        finish(nullptr, std::move(r));
    }

    void fail(const std::string& what, beast::error_code ec)
    {
        finish(std::make_exception_ptr(
                   InvalidResponse(what + ": " + ec.message())),
               Response{});
    }

    void finish(std::exception_ptr err, Response r)
    {
        if (done_)
            return;
        done_ = true;
        deadline_.cancel();
        auto h = std::move(handler_);
        h(err, std::move(r));
    }

    asio::strand<asio::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    asio::steady_timer deadline_;
    std::chrono::milliseconds timeout_;
    Url url_;
    GetHandler handler_;

    beast::flat_buffer buffer_;
    bhttp::request<bhttp::empty_body> req_;
    bhttp::response<bhttp::string_body> res_;

    std::string phase_;
    bool done_ = false;
};

} // namespace

BeastTransport::BeastTransport(asio::io_context& io,
                               std::chrono::milliseconds timeout) :
    io_(io), timeout_(timeout)
{}

void BeastTransport::asyncGet(const std::string& url, GetHandler handler)
{
    auto parsed = parseUrl(url);
    if (!parsed)
    {
        // Keep the "handler runs on the io thread" contract for bad URLs too.
        asio::post(io_, [h = std::move(handler), url]() {
            h(std::make_exception_ptr(InvalidResponse("bad url: " + url)),
              Response{});
        });
        return;
    }

    std::make_shared<Session>(io_, timeout_, std::move(*parsed),
                              std::move(handler))
        ->start();
}

} // namespace openfan::http

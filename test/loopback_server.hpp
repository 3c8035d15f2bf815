#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace openfan::test
{

// Minimal blocking HTTP server on 127.0.0.1 for transport tests. Serves one
// connection at a time with a fixed reply, or holds the connection open
// without answering (hang) until destroyed.
class LoopbackServer
{
  public:
    enum class Mode
    {
        respond,
        hang,
    };

    LoopbackServer(unsigned status, std::string body,
                   Mode mode = Mode::respond) :
        acceptor_(io_, {boost::asio::ip::make_address("127.0.0.1"), 0}),
        status_(status), body_(std::move(body)), mode_(mode)
    {
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer()
    {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        cv_.notify_all();

        // Unblock accept().
        boost::system::error_code ec;
        boost::asio::io_context io;
        boost::asio::ip::tcp::socket s(io);
        s.connect({boost::asio::ip::make_address("127.0.0.1"), port()}, ec);

        thread_.join();
    }

    unsigned short port() const
    {
        return acceptor_.local_endpoint().port();
    }

    std::string url(const std::string& target) const
    {
        return "http://127.0.0.1:" + std::to_string(port()) + target;
    }

    std::string lastTarget() const
    {
        std::lock_guard<std::mutex> lk(m_);
        return lastTarget_;
    }

  private:
    void serve()
    {
        namespace http = boost::beast::http;

        for (;;)
        {
            boost::system::error_code ec;
            boost::asio::ip::tcp::socket sock(io_);
            acceptor_.accept(sock, ec);
            {
                std::lock_guard<std::mutex> lk(m_);
                if (stop_)
                    return;
            }
            if (ec)
                continue;

            boost::beast::flat_buffer buf;
            http::request<http::string_body> req;
            http::read(sock, buf, req, ec);
            if (ec)
                continue;
            {
                std::lock_guard<std::mutex> lk(m_);
                lastTarget_ = std::string(req.target());
            }

            if (mode_ == Mode::hang)
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait(lk, [this] { return stop_; });
                return;
            }

            http::response<http::string_body> res{
                static_cast<http::status>(status_), req.version()};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = body_;
            res.prepare_payload();
            http::write(sock, res, ec);
            sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        }
    }

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned status_;
    std::string body_;
    Mode mode_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::string lastTarget_;
    std::thread thread_;
};

} // namespace openfan::test

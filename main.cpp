#include "api/fan_api.hpp"
#include "buildjson/buildjson.hpp"
#include "controller/fan_controller.hpp"
#include "controller/status_poller.hpp"
#include "core/errors.hpp"
#include "discovery/avahi_browser.hpp"
#include "discovery/discovery_engine.hpp"
#include "http/beast_transport.hpp"
#include "http/transport_client.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <sdbusplus/asio/connection.hpp>
#include <sdbusplus/bus.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

constexpr const char* kDefaultConfig = "/etc/openfan/openfan.json";

void usage(const char* argv0)
{
    std::cerr << "usage: " << argv0 << " [-c config.json] [command]\n"
              << "  (none)               watch: discover and poll status\n"
              << "  list                 discovered fans with status\n"
              << "  set <name> <0-100>   set fan speed\n"
              << "  on|off|toggle <name> power a fan\n"
              << "  all <0-100>          set every fan\n";
}

std::optional<int> parsePercent(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size())
            return std::nullopt;
        return v;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

// Explicit -c: any error is fatal. Default path: use it when present, fall
// back to built-in defaults on error.
std::optional<openfan::Config> loadConfig(const std::string& path,
                                          bool explicitPath)
{
    const std::string p = explicitPath ? path : kDefaultConfig;
    if (!explicitPath && !std::filesystem::exists(p))
        return openfan::Config{};

    try
    {
        return openfan::loadConfigFromJsonFile(p);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[openfan] Config error: " << e.what() << "\n";
        if (explicitPath)
            return std::nullopt;
        std::cerr << "[openfan] using built-in defaults\n";
        return openfan::Config{};
    }
}

// Run f on the io thread and wait for it.
void runOnIo(boost::asio::io_context& io, std::function<void()> f)
{
    std::promise<void> done;
    auto fut = done.get_future();
    boost::asio::post(io, [&] {
        f();
        done.set_value();
    });
    fut.wait();
}

void printDevices(const openfan::controller::FanController& ctl)
{
    const auto names = ctl.names();
    if (names.empty())
    {
        std::cout << "no fans found\n";
        return;
    }
    for (const auto& n : names)
    {
        auto d = ctl.device(n);
        auto st = ctl.state(n);
        if (!d || !st)
            continue;
        std::cout << n << "  " << d->baseUrl;
        if (st->reachable)
            std::cout << "  " << st->rpm << " RPM  " << st->speed << "%"
                      << (st->isOn ? "" : " (off)");
        else
            std::cout << "  unreachable";
        std::cout << "\n";
    }
}

// Wait on a command future; report failure the way the user should see it.
template <typename T>
bool await(std::future<T>& fut, const std::string& what)
{
    try
    {
        fut.get();
        return true;
    }
    catch (const openfan::ApiError& e)
    {
        std::cerr << what << ": device reported an error: " << e.message()
                  << "\n";
    }
    catch (const openfan::InvalidResponse& e)
    {
        std::cerr << what << ": could not reach/parse device response: "
                  << e.detail() << "\n";
    }
    return false;
}

bool reportFailures(const openfan::controller::Failures& failures)
{
    for (const auto& [name, err] : failures)
        std::cerr << name << ": " << openfan::describe(err) << "\n";
    return failures.empty();
}

} // namespace

int main(int argc, char** argv)
{
    std::string cfgPath;
    bool explicitCfg = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-c" && i + 1 < argc)
        {
            cfgPath = argv[++i];
            explicitCfg = true;
        }
        else if (a == "-h" || a == "--help")
        {
            usage(argv[0]);
            return 0;
        }
        else
        {
            args.push_back(a);
        }
    }

    auto cfg = loadConfig(cfgPath, explicitCfg);
    if (!cfg)
        return 1;

    // Avahi lives on the system bus regardless of who runs us.
    boost::asio::io_context io;
    std::shared_ptr<sdbusplus::asio::connection> conn;
    try
    {
        conn = std::make_shared<sdbusplus::asio::connection>(
            io, sdbusplus::bus::new_system().release());
    }
    catch (const std::exception& e)
    {
        std::cerr << "[openfan] system bus unavailable: " << e.what() << "\n";
        return 1;
    }
    auto& rawbus = static_cast<sdbusplus::bus_t&>(*conn);

    auto transport = std::make_shared<openfan::http::BeastTransport>(io);
    openfan::api::FanApi api{openfan::http::TransportClient(transport)};
    openfan::controller::FanController controller(api, cfg->poll.defaultSpeed);
    controller.setEventLog(cfg->eventLog);

    openfan::discovery::DiscoveryEngine engine(
        std::make_unique<openfan::discovery::AvahiServiceBrowser>(rawbus),
        cfg->discovery.serviceType, cfg->discovery.namePrefix);
    engine.setEventLog(cfg->eventLog);

    engine.subscribe([&](const openfan::discovery::Snapshot& snap) {
        controller.updateDevices(snap);
    });

    // ===== watch mode =====
    if (args.empty())
    {
        openfan::controller::StatusPoller poller(
            io, controller, std::chrono::seconds(cfg->poll.intervalSec));
        poller.onRound([&](const openfan::controller::Failures&) {
            for (const auto& n : controller.names())
            {
                auto st = controller.state(n);
                if (st && st->reachable)
                    std::cerr << "[openfan] " << n << ": " << st->rpm
                              << " RPM " << st->speed << "%\n";
            }
        });

        engine.subscribe([&](const openfan::discovery::Snapshot& snap) {
            std::cerr << "[openfan] " << snap->size() << " fan(s) visible\n";
            // Fresh devices get a status right away.
            if (poller.running())
                controller.pollAll([](openfan::controller::Failures) {});
        });

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            poller.stop();
            engine.stop();
            io.stop();
        });

        boost::asio::post(io, [&] {
            engine.start();
            poller.start();
        });
        io.run();
        return 0;
    }

    // ===== one-shot commands =====
    const std::string& cmd = args[0];
    std::optional<int> percent;
    std::string name;
    if ((cmd == "set" && args.size() == 3) || (cmd == "all" && args.size() == 2))
    {
        percent = parsePercent(args.back());
        if (!percent)
        {
            usage(argv[0]);
            return 1;
        }
        if (cmd == "set")
            name = args[1];
    }
    else if ((cmd == "on" || cmd == "off" || cmd == "toggle") &&
             args.size() == 2)
    {
        name = args[1];
    }
    else if (!(cmd == "list" && args.size() == 1))
    {
        usage(argv[0]);
        return 1;
    }

    auto work = boost::asio::make_work_guard(io);
    std::thread ioThread([&io] { io.run(); });

    // Wait until the browser reports its initial batch (or fails).
    auto readyPromise = std::make_shared<std::promise<bool>>();
    auto readyFuture = readyPromise->get_future();
    auto fired = std::make_shared<bool>(false);
    engine.subscribeState([readyPromise, fired](
                              openfan::discovery::BrowseState s,
                              const std::string&) {
        using openfan::discovery::BrowseState;
        if (*fired || (s != BrowseState::ready && s != BrowseState::failed))
            return;
        *fired = true;
        readyPromise->set_value(s == BrowseState::ready);
    });

    runOnIo(io, [&] { engine.start(); });

    bool discovered = false;
    if (readyFuture.wait_for(std::chrono::seconds(cfg->discovery.waitSec)) ==
        std::future_status::ready)
        discovered = readyFuture.get();
    if (!discovered)
        std::cerr << "[openfan] discovery incomplete, using what was seen\n";

    bool ok = false;
    try
    {
        if (cmd == "list")
        {
            auto f = controller.pollAll();
            f.wait();
            printDevices(controller);
            ok = true;
        }
        else if (cmd == "set")
        {
            auto f = controller.setSpeed(name, *percent);
            ok = await(f, name);
        }
        else if (cmd == "on" || cmd == "off")
        {
            // Refresh lastSpeed so "on" restores what the device last ran at.
            controller.pollAll().wait();
            auto f = controller.setPower(name, cmd == "on");
            ok = await(f, name);
        }
        else if (cmd == "toggle")
        {
            controller.pollAll().wait();
            auto f = controller.toggle(name);
            ok = await(f, name);
        }
        else if (cmd == "all")
        {
            ok = reportFailures(controller.setAll(*percent).get());
        }
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n";
        ok = false;
    }

    runOnIo(io, [&] { engine.stop(); });
    work.reset();
    io.stop();
    ioThread.join();

    return ok ? 0 : 1;
}

#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace openfan::log
{

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
// Empty path disables the event log.
inline void appendLine(const std::string& path, const std::string& line)
{
    if (path.empty())
        return;

    static std::mutex m;
    std::lock_guard<std::mutex> lk(m);

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    std::ofstream f(path, std::ios::app);
    f << nowIso() << " " << line << "\n";
}

// ===== event-log records =====

// "devices=[Desk,Rack1]", names in snapshot order.
inline std::string devicesLine(const std::vector<std::string>& names)
{
    std::string out = "devices=[";
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i)
            out += ",";
        out += names[i];
    }
    return out + "]";
}

// "discovery state=failed error=..."
inline std::string stateLine(const std::string& state,
                             const std::string& error)
{
    std::string out = "discovery state=" + state;
    if (!error.empty())
        out += " error=" + error;
    return out;
}

// "set Desk=40 ok" or "set Desk=40 failed: <why>"
inline std::string speedLine(const std::string& name, int percent,
                             const std::string& error)
{
    std::string out = "set " + name + "=" + std::to_string(percent);
    return error.empty() ? out + " ok" : out + " failed: " + error;
}

} // namespace openfan::log

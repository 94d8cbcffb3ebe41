#pragma once
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <functional>

enum class Severity { Info, Success, Warning, Error };

inline const char* to_cstr(Severity s)
{
    switch (s)
    {
        case Severity::Info: return "info";
        case Severity::Success: return "ok";
        case Severity::Warning: return "warn";
        case Severity::Error: return "error";
    }
    return "?";
}

// Components surface user-relevant events through this callback.
using ReportFn = std::function<void(Severity, const std::string &)>;

// Serialized diagnostic line on stderr: "[tag] message"
inline void log_line(std::string_view tag, std::string_view msg)
{
    static std::mutex io_mtx;
    std::lock_guard<std::mutex> lk(io_mtx);
    std::cerr << "[" << tag << "] " << msg << "\n";
}

// Fallback reporter for components constructed without one.
inline ReportFn make_log_reporter(std::string tag)
{
    return [tag = std::move(tag)](Severity sev, const std::string &msg)
    {
        if (sev == Severity::Warning || sev == Severity::Error)
            log_line(tag, std::string(to_cstr(sev)) + ": " + msg);
        else
            log_line(tag, msg);
    };
}

#pragma once

#include <mutex>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
        case Level::Off:   return "off";
    }
    return "unknown";
}

// Parses a lowercase level name. Returns false for unknown names.
[[nodiscard]]
inline constexpr bool parse_level(std::string_view name, Level& out) noexcept {
    for (auto lvl : {Level::Trace, Level::Debug, Level::Info, Level::Warn,
                     Level::Error, Level::Fatal, Level::Off}) {
        if (to_string(lvl) == name) {
            out = lvl;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = lvl;
    }

    Level level() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    [[nodiscard]] bool enabled(Level lvl) const noexcept {
        return lvl >= level();
    }

    void enable_color(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        color_enabled_ = on;
    }

    // Sink setter (stdout by default). The stream must outlive its use.
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lvl < level_ || level_ == Level::Off) return;
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        os.flush();
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   break;
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    // Wall clock with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Logging macros. The message is only formatted when the level is enabled.
// ---------------------------------------------------------
#define WP_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define WP_TRACE(msg)  WP_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define WP_DEBUG(msg)  WP_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define WP_INFO(msg)   WP_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define WP_WARN(msg)   WP_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define WP_ERROR(msg)  WP_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define WP_FATAL(msg)  WP_LOG_LEVEL(::lcr::log::Level::Fatal) << msg

#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace marketchat::util {

enum class LogLevel : std::uint8_t {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Off   = 255,
};

inline const char* log_level_name(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

inline std::optional<LogLevel> parse_log_level(std::string_view s) {
    if (s == "error") return LogLevel::Error;
    if (s == "warn")  return LogLevel::Warn;
    if (s == "info")  return LogLevel::Info;
    if (s == "debug") return LogLevel::Debug;
    if (s == "off")   return LogLevel::Off;
    return std::nullopt;
}

// Process-wide sink. Lines look like "[WARN][router] text".
class Logger {
public:
    static Logger& instance() {
        static Logger g;
        return g;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mu_);
        level_ = lvl;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lk(mu_);
        return level_;
    }

    void set_sink(std::ostream* out) {
        std::lock_guard<std::mutex> lk(mu_);
        sink_ = out;
    }

    bool enabled(LogLevel lvl) const {
        std::lock_guard<std::mutex> lk(mu_);
        if (level_ == LogLevel::Off || lvl == LogLevel::Off) return false;
        return static_cast<std::uint8_t>(lvl) <= static_cast<std::uint8_t>(level_);
    }

    void write(LogLevel lvl, std::string_view tag, const std::string& text) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lk(mu_);
        if (!sink_) return;
        *sink_ << "[" << log_level_name(lvl) << "][" << tag << "] " << text << "\n";
        sink_->flush();
    }

private:
    Logger() = default;

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    std::ostream* sink_ = &std::cerr;
};

// Stream-style helper: LogLine(LogLevel::Info, "router") << "user " << id;
// The line is emitted when the temporary is destroyed.
class LogLine {
public:
    LogLine(LogLevel lvl, std::string_view tag)
        : lvl_(lvl), tag_(tag), active_(Logger::instance().enabled(lvl)) {}

    ~LogLine() {
        if (active_) Logger::instance().write(lvl_, tag_, out_.str());
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& v) {
        if (active_) out_ << v;
        return *this;
    }

private:
    LogLevel lvl_;
    std::string_view tag_;
    bool active_;
    std::ostringstream out_;
};

inline LogLine log_error(std::string_view tag) { return LogLine(LogLevel::Error, tag); }
inline LogLine log_warn(std::string_view tag)  { return LogLine(LogLevel::Warn, tag); }
inline LogLine log_info(std::string_view tag)  { return LogLine(LogLevel::Info, tag); }
inline LogLine log_debug(std::string_view tag) { return LogLine(LogLevel::Debug, tag); }

} // namespace marketchat::util

#pragma once

#include "util/Log.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace marketchat::config {

struct ServerSection {
    std::string address = "0.0.0.0";
    std::uint16_t port = 9002;
    unsigned threads = 2;
    std::string database = "marketchat.db";
    bool auto_register_users = false;
};

struct PresenceSection {
    std::chrono::milliseconds heartbeat_interval{25000};
    // Zero means three heartbeat intervals.
    std::chrono::milliseconds heartbeat_timeout{0};
    std::chrono::milliseconds sweep_interval{5000};

    std::chrono::milliseconds effective_timeout() const {
        return heartbeat_timeout.count() > 0 ? heartbeat_timeout : heartbeat_interval * 3;
    }
};

struct LogSection {
    util::LogLevel level = util::LogLevel::Info;
};

struct ServerConfig {
    ServerSection server;
    PresenceSection presence;
    LogSection log;
};

// Reads an INI file with [server], [presence] and [log] sections into `out`.
// Keys that are absent keep their defaults. Returns false with `error` set
// on a missing file, a malformed line or an unparsable value.
bool load_config(const std::string& path, ServerConfig& out, std::string& error);

// Same, from INI text already in memory.
bool parse_config(const std::string& text, ServerConfig& out, std::string& error);

} // namespace marketchat::config

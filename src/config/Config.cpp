#include "config/Config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace marketchat::config {

namespace {

std::string trim(const std::string& input) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string strip_inline_comment(const std::string& input) {
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if ((ch == '#' || ch == ';') &&
            (i == 0 || std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
            return trim(input.substr(0, i));
        }
    }
    return input;
}

bool parse_uint(const std::string& text, unsigned long long max, unsigned long long& out) {
    if (text.empty() || text.front() == '-') return false;
    char* end_ptr = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
    if (errno != 0 || end_ptr == text.c_str() || *end_ptr != '\0' || value > max) return false;
    out = value;
    return true;
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "on" || text == "yes") {
        out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "off" || text == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parse_millis(const std::string& text, std::chrono::milliseconds& out) {
    unsigned long long v = 0;
    if (!parse_uint(text, 24ull * 3600 * 1000, v)) return false;
    out = std::chrono::milliseconds(static_cast<std::int64_t>(v));
    return true;
}

// Unknown sections and keys are ignored; known keys must parse.
bool apply_kv(const std::string& section, const std::string& key, const std::string& value,
              ServerConfig& cfg) {
    unsigned long long n = 0;

    if (section == "server") {
        if (key == "address") {
            if (value.empty()) return false;
            cfg.server.address = value;
        } else if (key == "port") {
            if (!parse_uint(value, 65535, n)) return false;
            cfg.server.port = static_cast<std::uint16_t>(n);
        } else if (key == "threads") {
            if (!parse_uint(value, 256, n) || n == 0) return false;
            cfg.server.threads = static_cast<unsigned>(n);
        } else if (key == "database") {
            if (value.empty()) return false;
            cfg.server.database = value;
        } else if (key == "auto_register_users") {
            return parse_bool(value, cfg.server.auto_register_users);
        }
        return true;
    }
    if (section == "presence") {
        if (key == "heartbeat_interval_ms") {
            return parse_millis(value, cfg.presence.heartbeat_interval) &&
                   cfg.presence.heartbeat_interval.count() > 0;
        } else if (key == "heartbeat_timeout_ms") {
            return parse_millis(value, cfg.presence.heartbeat_timeout);
        } else if (key == "sweep_interval_ms") {
            return parse_millis(value, cfg.presence.sweep_interval) &&
                   cfg.presence.sweep_interval.count() > 0;
        }
        return true;
    }
    if (section == "log") {
        if (key == "level") {
            auto lvl = util::parse_log_level(value);
            if (!lvl) return false;
            cfg.log.level = *lvl;
        }
        return true;
    }
    return true;
}

} // namespace

bool parse_config(const std::string& text, ServerConfig& out, std::string& error) {
    ServerConfig cfg = out;
    std::istringstream in(text);
    std::string section;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string trimmed = strip_inline_comment(trim(line));
        if (trimmed.empty()) continue;

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            section = trim(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }

        const auto pos = trimmed.find('=');
        if (pos == std::string::npos) {
            std::ostringstream oss;
            oss << "invalid line " << line_no;
            error = oss.str();
            return false;
        }

        const std::string key = trim(trimmed.substr(0, pos));
        const std::string value = trim(trimmed.substr(pos + 1));
        if (!apply_kv(section, key, value, cfg)) {
            std::ostringstream oss;
            oss << "invalid value for " << section << "." << key << " at line " << line_no;
            error = oss.str();
            return false;
        }
    }

    // A shorter timeout would expire clients between two of their heartbeats.
    const auto& presence = cfg.presence;
    if (presence.heartbeat_timeout.count() != 0 && presence.heartbeat_timeout < presence.heartbeat_interval * 2) {
        error = "presence.heartbeat_timeout_ms must be at least twice heartbeat_interval_ms";
        return false;
    }

    out = cfg;
    return true;
}

bool load_config(const std::string& path, ServerConfig& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "config file not found: " + path;
        return false;
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    return parse_config(buf.str(), out, error);
}

} // namespace marketchat::config

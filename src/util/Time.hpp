#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <string>

namespace marketchat::util {

using TimestampMs = std::int64_t;

// Wall clock source, injectable so tests can drive time.
using WallClock = std::function<TimestampMs()>;

inline TimestampMs now_ms() {
    using namespace std::chrono;
    return static_cast<TimestampMs>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

inline WallClock system_wall_clock() { return [] { return now_ms(); }; }

// 2024-05-01T12:30:00.123Z
inline std::string format_iso8601(TimestampMs ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf, n);

    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%03dZ", millis);
    out += frac;
    return out;
}

} // namespace marketchat::util

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>

namespace marketchat::chat {

// Striped locks keyed by id (user or conversation). Two keys may share a
// stripe; a key always maps to the same one.
template <std::size_t Stripes = 64>
class KeyedMutex {
public:
    std::mutex& for_key(const std::string& key) {
        return stripes_[std::hash<std::string>{}(key) % Stripes];
    }

    std::unique_lock<std::mutex> lock(const std::string& key) {
        return std::unique_lock<std::mutex>(for_key(key));
    }

private:
    std::array<std::mutex, Stripes> stripes_;
};

} // namespace marketchat::chat

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace marketchat::chat {

// Prefixed ULIDs ("msg-01HV..."): 48-bit millisecond timestamp + 80 random
// bits, Crockford base32. Ids minted in the same millisecond are strictly
// increasing, so message ids sort in creation order within one process.
class IDGenerator {
public:
    enum class Kind { Message, Conversation, Connection };

    static constexpr std::size_t kUlidLength = 26;

    IDGenerator() : rng_(seed_engine()) {}

    std::string make(Kind kind) {
        std::string out(prefix_of(kind));
        out.push_back('-');
        out += next_ulid();
        return out;
    }

    std::string message_id()      { return make(Kind::Message); }
    std::string conversation_id() { return make(Kind::Conversation); }
    std::string connection_id()   { return make(Kind::Connection); }

    // "<prefix>-<26 base32 chars>" for the given kind.
    static bool is_well_formed(std::string_view id, Kind kind) {
        const std::string_view prefix = prefix_of(kind);
        if (id.size() != prefix.size() + 1 + kUlidLength) return false;
        if (id.substr(0, prefix.size()) != prefix || id[prefix.size()] != '-') return false;
        for (char c : id.substr(prefix.size() + 1)) {
            if (std::string_view(kAlphabet).find(c) == std::string_view::npos) return false;
        }
        return true;
    }

private:
    using u128 = unsigned __int128;
    using Bytes = std::array<std::uint8_t, 16>;

    static constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    static std::string_view prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Message:      return "msg";
            case Kind::Conversation: return "conv";
            case Kind::Connection:   return "conn";
        }
        return "id";
    }

    std::string next_ulid() {
        const std::uint64_t ts = wall_ms();

        std::lock_guard<std::mutex> lk(mu_);
        if (ts > last_ts_) {
            last_ts_ = ts;
            last_rand_ = random_80();
        } else {
            // Same (or earlier, if the clock stepped back) millisecond:
            // keep the previous timestamp and bump the random part.
            ++last_rand_;
        }
        return encode(pack(last_ts_, last_rand_));
    }

    u128 random_80() {
        const std::uint64_t hi = dist_(rng_) & 0xFFFF;
        const std::uint64_t lo = dist_(rng_);
        return (static_cast<u128>(hi) << 64) | lo;
    }

    static Bytes pack(std::uint64_t ts_ms, u128 rand80) {
        Bytes b{};
        for (int i = 5; i >= 0; --i) {
            b[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(ts_ms & 0xFF);
            ts_ms >>= 8;
        }
        for (int i = 15; i >= 6; --i) {
            b[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
        return b;
    }

    // 128 bits -> 26 chars; the leading 2 pad bits are zero.
    static std::string encode(const Bytes& bytes) {
        u128 v = 0;
        for (std::uint8_t byte : bytes) v = (v << 8) | byte;

        std::string out(kUlidLength, '0');
        for (std::size_t i = kUlidLength; i-- > 0;) {
            out[i] = kAlphabet[static_cast<std::size_t>(v & 0x1F)];
            v >>= 5;
        }
        return out;
    }

    static std::uint64_t wall_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    static std::mt19937_64 seed_engine() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ = 0;
    u128 last_rand_ = 0;
};

} // namespace marketchat::chat

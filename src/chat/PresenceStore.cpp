#include "chat/PresenceStore.h"

#include "chat/Error.h"
#include "util/Log.hpp"

#include <utility>

namespace marketchat::chat {

PresenceStore::PresenceStore(store::ChatStore& store, util::WallClock clock)
    : store_(store), clock_(std::move(clock)) {}

void PresenceStore::set_on_change(OnChange cb) { on_change_ = std::move(cb); }

PresenceRecord PresenceStore::set_online(const UserId& user, const std::string& connection_id) {
    auto lk = user_locks_.lock(user);

    PresenceRecord record;
    record.user_id       = user;
    record.is_online     = true;
    record.last_seen     = clock_();
    record.connection_id = connection_id;
    store_.upsert_presence(record);

    {
        std::lock_guard<std::mutex> live_lk(live_mu_);
        auto& state = live_[user];
        state.connections.insert(connection_id);
        state.last_heartbeat = record.last_seen;
    }

    notify(record);
    return record;
}

PresenceRecord PresenceStore::set_offline(const UserId& user) {
    auto lk = user_locks_.lock(user);
    return set_offline_locked(user);
}

PresenceRecord PresenceStore::set_offline_locked(const UserId& user) {
    PresenceRecord record;
    record.user_id   = user;
    record.is_online = false;
    record.last_seen = clock_();
    store_.upsert_presence(record);

    {
        std::lock_guard<std::mutex> live_lk(live_mu_);
        live_.erase(user);
    }

    notify(record);
    return record;
}

bool PresenceStore::release(const UserId& user, const std::string& connection_id) {
    auto lk = user_locks_.lock(user);

    std::string successor;
    {
        std::lock_guard<std::mutex> live_lk(live_mu_);
        auto it = live_.find(user);
        if (it == live_.end() || it->second.connections.count(connection_id) == 0) return false;

        const auto& conns = it->second.connections;
        if (conns.size() > 1) {
            for (const auto& c : conns) {
                if (c != connection_id) {
                    successor = c;
                    break;
                }
            }
        }
    }

    if (successor.empty()) {
        set_offline_locked(user);
        return true;
    }

    // Still online through another connection; point the record at it.
    PresenceRecord record;
    record.user_id       = user;
    record.is_online     = true;
    record.last_seen     = clock_();
    record.connection_id = successor;
    store_.upsert_presence(record);

    std::lock_guard<std::mutex> live_lk(live_mu_);
    auto it = live_.find(user);
    if (it != live_.end()) it->second.connections.erase(connection_id);
    return false;
}

void PresenceStore::heartbeat(const UserId& user, const std::string& connection_id) {
    auto lk = user_locks_.lock(user);

    bool joined = false;
    {
        std::lock_guard<std::mutex> live_lk(live_mu_);
        auto it = live_.find(user);
        joined = it != live_.end() && it->second.connections.count(connection_id) > 0;
    }

    PresenceRecord record = store_.load_presence(user).value_or(PresenceRecord{user, false, 0, {}});
    record.last_seen = clock_();
    // Only a joined connection may become the one the record points at.
    if (joined) record.connection_id = connection_id;
    store_.upsert_presence(record);

    if (!joined) return;
    std::lock_guard<std::mutex> live_lk(live_mu_);
    auto it = live_.find(user);
    if (it != live_.end()) it->second.last_heartbeat = record.last_seen;
}

PresenceRecord PresenceStore::get(const UserId& user) {
    return store_.load_presence(user).value_or(PresenceRecord{user, false, 0, {}});
}

std::vector<PresenceRecord> PresenceStore::get_many(const std::vector<UserId>& users) {
    std::vector<PresenceRecord> out;
    out.reserve(users.size());
    for (const auto& u : users) out.push_back(get(u));
    return out;
}

std::vector<UserId> PresenceStore::expire_stale(std::chrono::milliseconds timeout) {
    const auto is_stale = [&](const LiveState& s, TimestampMs now) {
        return now - s.last_heartbeat > static_cast<TimestampMs>(timeout.count());
    };

    std::vector<UserId> candidates;
    {
        const TimestampMs now = clock_();
        std::lock_guard<std::mutex> live_lk(live_mu_);
        for (const auto& [user, state] : live_) {
            if (is_stale(state, now)) candidates.push_back(user);
        }
    }

    std::vector<UserId> expired;
    for (const auto& user : candidates) {
        auto lk = user_locks_.lock(user);
        {
            // A heartbeat or join may have landed since the scan.
            std::lock_guard<std::mutex> live_lk(live_mu_);
            auto it = live_.find(user);
            if (it == live_.end() || !is_stale(it->second, clock_())) continue;
        }
        try {
            set_offline_locked(user);
            expired.push_back(user);
        } catch (const ChatError& e) {
            util::log_error("presence") << "expire " << user << " failed: " << e.what();
        }
    }
    return expired;
}

std::size_t PresenceStore::live_connections(const UserId& user) const {
    std::lock_guard<std::mutex> live_lk(live_mu_);
    auto it = live_.find(user);
    return it == live_.end() ? 0 : it->second.connections.size();
}

void PresenceStore::notify(const PresenceRecord& record) {
    if (!on_change_) return;
    try {
        on_change_(record);
    } catch (const std::exception& e) {
        util::log_error("presence") << "status broadcast for " << record.user_id << " failed: " << e.what();
    }
}

} // namespace marketchat::chat

#pragma once

#include "chat/KeyedMutex.hpp"
#include "chat/Types.h"
#include "store/ChatStore.h"
#include "util/Time.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace marketchat::chat {

// Online/offline + last seen per user, persisted through the ChatStore.
// A user is online while at least one of their connections is live.
class PresenceStore {
public:
    using OnChange = std::function<void(const PresenceRecord&)>;

    PresenceStore(store::ChatStore& store, util::WallClock clock = util::system_wall_clock());

    PresenceStore(const PresenceStore&) = delete;
    PresenceStore& operator=(const PresenceStore&) = delete;

    // Called after every set_online / set_offline, under the user's lock.
    void set_on_change(OnChange cb);

    PresenceRecord set_online(const UserId& user, const std::string& connection_id);
    PresenceRecord set_offline(const UserId& user);

    // Drops one live connection; goes offline when it was the last one.
    // Returns true when the user went offline.
    bool release(const UserId& user, const std::string& connection_id);

    // Refreshes last seen, and the connection id when that connection has
    // joined; never changes is_online.
    void heartbeat(const UserId& user, const std::string& connection_id);

    PresenceRecord get(const UserId& user);
    std::vector<PresenceRecord> get_many(const std::vector<UserId>& users);

    // Sets offline every online user silent for longer than `timeout`.
    std::vector<UserId> expire_stale(std::chrono::milliseconds timeout);

    std::size_t live_connections(const UserId& user) const;

private:
    struct LiveState {
        std::set<std::string> connections;
        TimestampMs last_heartbeat = 0;
    };

    PresenceRecord set_offline_locked(const UserId& user);
    void notify(const PresenceRecord& record);

    store::ChatStore& store_;
    util::WallClock clock_;
    OnChange on_change_;

    KeyedMutex<> user_locks_;

    mutable std::mutex live_mu_;
    std::unordered_map<UserId, LiveState> live_;
};

} // namespace marketchat::chat

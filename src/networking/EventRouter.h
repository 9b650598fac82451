#pragma once

#include "chat/ActiveViewTracker.h"
#include "chat/ConversationDirectory.h"
#include "chat/DeliveryEngine.h"
#include "chat/Error.h"
#include "chat/IDGenerator.hpp"
#include "chat/PresenceStore.h"
#include "chat/PushSender.h"
#include "networking/Session.hpp"
#include "networking/Transport.hpp"
#include "protocol/Events.h"
#include "store/ChatStore.h"
#include "util/Time.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace marketchat::networking {

using chat::UserId;

// Binds connections to users and turns inbound events into calls on the
// presence, directory, tracker and delivery components, then fans the
// results out to every connection of every recipient.
//
// Each user has a personal channel: the set of their live connections in
// this process. Fan-out attempts every connection independently; a failed
// send is logged and never stops delivery to the others.
class EventRouter {
public:
    struct Options {
        // Accept handshakes from ids the identity store has never seen.
        bool auto_register_users = false;
    };

    EventRouter(Transport& transport,
                store::ChatStore& identity,
                chat::PresenceStore& presence,
                chat::ConversationDirectory& directory,
                chat::ActiveViewTracker& tracker,
                chat::DeliveryEngine& engine,
                chat::PushSender& push,
                chat::IDGenerator& ids,
                Options options,
                util::WallClock clock = util::system_wall_clock());

    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    Admission on_connect(ClientId client, const std::string& user_id);
    void on_message(ClientId client, const std::string& text);
    void on_disconnect(ClientId client);

    // Sets offline users whose heartbeats stopped; returns them.
    std::vector<UserId> expire_stale(std::chrono::milliseconds timeout);

    std::optional<Session> session(ClientId client) const;
    std::vector<ClientId> connections_of(const UserId& user) const;

private:
    void handle(const Session& s, const protocol::Join& ev);
    void handle(const Session& s, const protocol::EnterChat& ev);
    void handle(const Session& s, const protocol::LeaveChat& ev);
    void handle(const Session& s, const protocol::SendMessage& ev);
    void handle(const Session& s, const protocol::Typing& ev);
    void handle(const Session& s, const protocol::RecordingIndicator& ev);
    void handle(const Session& s, const protocol::MarkRead& ev);
    void handle(const Session& s, const protocol::Heartbeat& ev);
    void handle(const Session& s, const protocol::OpenConversation& ev);
    void handle(const Session& s, const protocol::ListConversations& ev);
    void handle(const Session& s, const protocol::FetchMessages& ev);
    void handle(const Session& s, const protocol::GetStatus& ev);

    // new_message(delivered) to the recipient; on success the receipt moves
    // to delivered and the sender is told. False when nothing was reachable.
    bool deliver(const UserId& recipient, const chat::Message& message);
    void deliver_pending(const UserId& user);
    void notify_offline(const UserId& recipient, const chat::Message& message, const std::string& caption);

    void broadcast_presence(const chat::PresenceRecord& record);
    void broadcast_read(const chat::ReadResult& result, bool include_reader);

    void report(const Session& s, const protocol::RawEvent& raw, const chat::ChatError& e);

    bool emit(ClientId client, const std::string& payload);
    std::size_t emit_to_user(const UserId& user, const std::string& payload);

    Transport& transport_;
    store::ChatStore& identity_;
    chat::PresenceStore& presence_;
    chat::ConversationDirectory& directory_;
    chat::ActiveViewTracker& tracker_;
    chat::DeliveryEngine& engine_;
    chat::PushSender& push_;
    chat::IDGenerator& ids_;
    Options options_;
    util::WallClock clock_;

    mutable std::mutex mu_;
    std::unordered_map<ClientId, Session> sessions_;
    std::unordered_map<UserId, std::set<ClientId>> channels_;
};

} // namespace marketchat::networking

#include "networking/EventRouter.h"

#include "util/Log.hpp"

#include <utility>
#include <variant>

namespace marketchat::networking {

using chat::ChatError;
using chat::ErrorKind;
using chat::MessageStatus;

namespace {

constexpr std::size_t kMaxUserIdLength = 128;

} // namespace

EventRouter::EventRouter(Transport& transport,
                         store::ChatStore& identity,
                         chat::PresenceStore& presence,
                         chat::ConversationDirectory& directory,
                         chat::ActiveViewTracker& tracker,
                         chat::DeliveryEngine& engine,
                         chat::PushSender& push,
                         chat::IDGenerator& ids,
                         Options options,
                         util::WallClock clock)
    : transport_(transport),
      identity_(identity),
      presence_(presence),
      directory_(directory),
      tracker_(tracker),
      engine_(engine),
      push_(push),
      ids_(ids),
      options_(options),
      clock_(std::move(clock)) {
    presence_.set_on_change([this](const chat::PresenceRecord& record) { broadcast_presence(record); });
}

// ---- connection lifecycle ----

Admission EventRouter::on_connect(ClientId client, const std::string& user_id) {
    if (user_id.empty() || user_id.size() > kMaxUserIdLength) return Admission::Reject;

    try {
        if (!identity_.user_exists(user_id)) {
            if (!options_.auto_register_users) {
                util::log_warn("router") << "client " << client << " unknown user " << user_id;
                return Admission::Reject;
            }
            identity_.add_user(user_id, clock_());
        }
    } catch (const ChatError& e) {
        util::log_error("router") << "identity lookup for " << user_id << " failed: " << e.what();
        return Admission::Reject;
    }

    Session s;
    s.client        = client;
    s.connection_id = ids_.connection_id();
    s.user_id       = user_id;

    {
        std::lock_guard<std::mutex> lk(mu_);
        channels_[user_id].insert(client);
        sessions_[client] = s;
    }

    util::log_info("router") << "client " << client << " bound to " << user_id << " as " << s.connection_id;
    return Admission::Accept;
}

void EventRouter::on_disconnect(ClientId client) {
    Session s;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(client);
        if (it == sessions_.end()) return;
        s = std::move(it->second);
        sessions_.erase(it);

        auto ch = channels_.find(s.user_id);
        if (ch != channels_.end()) {
            ch->second.erase(client);
            if (ch->second.empty()) channels_.erase(ch);
        }
    }

    tracker_.clear(s.user_id);
    try {
        if (presence_.release(s.user_id, s.connection_id)) {
            util::log_info("router") << s.user_id << " offline";
        }
    } catch (const ChatError& e) {
        // The heartbeat sweep retries the offline transition later.
        util::log_error("router") << "offline for " << s.user_id << " failed: " << e.what();
    }
    util::log_info("router") << "client " << client << " (" << s.user_id << ") disconnected";
}

std::vector<UserId> EventRouter::expire_stale(std::chrono::milliseconds timeout) {
    auto expired = presence_.expire_stale(timeout);
    for (const auto& user : expired) {
        tracker_.clear(user);
        util::log_info("router") << user << " expired after missing heartbeats";
    }
    return expired;
}

std::optional<Session> EventRouter::session(ClientId client) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(client);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::vector<ClientId> EventRouter::connections_of(const UserId& user) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = channels_.find(user);
    if (it == channels_.end()) return {};
    return std::vector<ClientId>(it->second.begin(), it->second.end());
}

// ---- dispatch ----

void EventRouter::on_message(ClientId client, const std::string& text) {
    std::optional<Session> s;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(client);
        if (it != sessions_.end()) s = it->second;
    }
    if (!s) {
        emit(client, protocol::error("unknown session", chat::error_code(ErrorKind::Unauthorized), ""));
        return;
    }

    protocol::RawEvent raw;
    try {
        raw = protocol::decode(text);
    } catch (const ChatError& e) {
        report(*s, raw, e);
        return;
    }

    try {
        protocol::Inbound in = protocol::parse(raw);
        if (in.claimed_user && *in.claimed_user != s->user_id) {
            throw ChatError(ErrorKind::Unauthorized, "userId does not match the connection");
        }
        std::visit([&](const auto& ev) { handle(*s, ev); }, in.event);
    } catch (const ChatError& e) {
        report(*s, raw, e);
    } catch (const std::exception& e) {
        util::log_error("router") << "internal error handling " << raw.type << " from " << s->user_id
                                  << ": " << e.what();
        report(*s, raw, ChatError(ErrorKind::Internal, "internal error"));
    }
}

void EventRouter::report(const Session& s, const protocol::RawEvent& raw, const ChatError& e) {
    if (e.kind() == ErrorKind::PersistenceFailure || e.kind() == ErrorKind::Internal) {
        util::log_error("router") << (raw.type.empty() ? "event" : raw.type) << " from " << s.user_id
                                  << ": " << e.what();
    } else {
        util::log_warn("router") << (raw.type.empty() ? "event" : raw.type) << " from " << s.user_id
                                 << " rejected (" << e.code() << "): " << e.what();
    }

    if (raw.type == "send_message") {
        emit(s.client, protocol::message_error(e.what(), e.code(), raw.message_id()));
    } else {
        emit(s.client, protocol::error(e.what(), e.code(), raw.type));
    }
}

// ---- handlers ----

void EventRouter::handle(const Session& s, const protocol::Join&) {
    presence_.set_online(s.user_id, s.connection_id);

    const auto now = clock_();
    for (const auto& peer : directory_.peers_of(s.user_id)) {
        emit(s.client, protocol::user_status(presence_.get(peer), now));
    }

    deliver_pending(s.user_id);
}

void EventRouter::handle(const Session& s, const protocol::EnterChat& ev) {
    if (!directory_.exists(ev.conversation_id)) {
        throw ChatError(ErrorKind::NotFound, "Conversation not found");
    }
    if (!directory_.is_participant(ev.conversation_id, s.user_id)) {
        throw ChatError(ErrorKind::Unauthorized, "Not a participant of this conversation");
    }

    tracker_.enter(s.user_id, ev.conversation_id);
    emit(s.client, protocol::ack("enter_chat_success", ev.conversation_id));

    // Opening the chat is an explicit read of everything in it.
    broadcast_read(engine_.mark_read(ev.conversation_id, s.user_id), false);
}

void EventRouter::handle(const Session& s, const protocol::LeaveChat& ev) {
    tracker_.leave(s.user_id, ev.conversation_id);
    emit(s.client, protocol::ack("leave_chat_success", ev.conversation_id));
}

void EventRouter::handle(const Session& s, const protocol::SendMessage& ev) {
    const auto result = engine_.submit(ev.conversation_id, s.user_id, ev.draft);
    const auto& msg = result.message;

    emit_to_user(s.user_id, protocol::message_status(msg, MessageStatus::Sent, clock_()));

    for (const auto& r : result.recipients) {
        try {
            switch (r.status) {
                case MessageStatus::Read:
                    // Instant read: no delivered step for this recipient.
                    if (result.duplicate) break;
                    if (emit_to_user(r.recipient, protocol::new_message(msg, MessageStatus::Read)) > 0) {
                        emit_to_user(s.user_id, protocol::message_status(msg, MessageStatus::Read, clock_()));
                        break;
                    }
                    // Every connection of the viewer failed: replay it on the next join.
                    if (engine_.withdraw_instant_read(msg.id, r.recipient)) {
                        notify_offline(r.recipient, msg, ev.draft.caption);
                    }
                    break;
                case MessageStatus::Sent:
                    if (!deliver(r.recipient, msg) && !result.duplicate) {
                        notify_offline(r.recipient, msg, ev.draft.caption);
                    }
                    break;
                case MessageStatus::Delivered:
                    break;
            }
        } catch (const ChatError& e) {
            util::log_error("router") << "delivery of " << msg.id << " to " << r.recipient
                                      << " failed: " << e.what();
            emit(s.client, protocol::message_error(e.what(), e.code(), msg.id));
        }
    }
}

void EventRouter::notify_offline(const UserId& recipient, const chat::Message& message,
                                 const std::string& caption) {
    if (!push_.send(chat::make_message_push(recipient, message, caption))) {
        util::log_warn("router") << "push to " << recipient << " for " << message.id << " not sent";
    }
}

void EventRouter::handle(const Session& s, const protocol::Typing& ev) {
    const auto participants = directory_.participants_of(ev.conversation_id);
    if (participants.count(s.user_id) == 0) {
        throw ChatError(ErrorKind::Unauthorized, "Not a participant of this conversation");
    }

    const auto payload = protocol::user_typing(ev.conversation_id, s.user_id, ev.is_typing);
    for (const auto& p : participants) {
        if (p != s.user_id) emit_to_user(p, payload);
    }
}

void EventRouter::handle(const Session& s, const protocol::RecordingIndicator& ev) {
    const auto participants = directory_.participants_of(ev.conversation_id);
    if (participants.count(s.user_id) == 0) {
        throw ChatError(ErrorKind::Unauthorized, "Not a participant of this conversation");
    }

    const auto payload = protocol::recording_indicator(s.user_id, ev.conversation_id, ev.is_recording, clock_());
    for (const auto& p : participants) {
        if (p != s.user_id) emit_to_user(p, payload);
    }
}

void EventRouter::handle(const Session& s, const protocol::MarkRead& ev) {
    auto result = engine_.mark_read(ev.conversation_id, s.user_id);
    emit(s.client, protocol::ack("mark_read_success", ev.conversation_id));
    broadcast_read(result, true);
}

void EventRouter::handle(const Session& s, const protocol::Heartbeat&) {
    presence_.heartbeat(s.user_id, s.connection_id);
    util::log_debug("router") << "heartbeat from " << s.user_id;
}

void EventRouter::handle(const Session& s, const protocol::OpenConversation& ev) {
    if (s.user_id != ev.buyer_id && s.user_id != ev.seller_id) {
        throw ChatError(ErrorKind::Unauthorized, "Caller must be the buyer or the seller");
    }
    emit(s.client, protocol::conversation_opened(directory_.open(ev.buyer_id, ev.seller_id, ev.product_id)));
}

void EventRouter::handle(const Session& s, const protocol::ListConversations&) {
    emit(s.client, protocol::conversations(directory_.summaries_for(s.user_id)));
}

void EventRouter::handle(const Session& s, const protocol::FetchMessages& ev) {
    auto items = engine_.history(ev.conversation_id, s.user_id, ev.limit, ev.before);
    emit(s.client, protocol::messages(ev.conversation_id, items));
}

void EventRouter::handle(const Session& s, const protocol::GetStatus& ev) {
    emit(s.client, protocol::user_status(presence_.get(ev.user_id), clock_()));
}

// ---- delivery ----

bool EventRouter::deliver(const UserId& recipient, const chat::Message& message) {
    if (emit_to_user(recipient, protocol::new_message(message, MessageStatus::Delivered)) == 0) {
        return false;
    }
    // A read that raced ahead makes this a no-op; the sender already saw it.
    if (engine_.mark_delivered(message.id, recipient)) {
        emit_to_user(message.sender, protocol::message_status(message, MessageStatus::Delivered, clock_()));
    }
    return true;
}

void EventRouter::deliver_pending(const UserId& user) {
    for (const auto& msg : engine_.pending_for(user)) {
        try {
            deliver(user, msg);
        } catch (const ChatError& e) {
            util::log_error("router") << "replay of " << msg.id << " to " << user << " failed: " << e.what();
        }
    }
}

void EventRouter::broadcast_presence(const chat::PresenceRecord& record) {
    const auto payload = protocol::user_status(record, clock_());
    for (const auto& peer : directory_.peers_of(record.user_id)) {
        emit_to_user(peer, payload);
    }
}

void EventRouter::broadcast_read(const chat::ReadResult& result, bool include_reader) {
    // Nothing moved: stay quiet so repeated mark_read calls do not storm.
    if (!result.changed()) return;

    const auto payload = protocol::messages_read(result.conversation_id, result.reader, clock_());
    for (const auto& p : result.participants) {
        if (!include_reader && p == result.reader) continue;
        emit_to_user(p, payload);
    }
}

// ---- fan-out ----

bool EventRouter::emit(ClientId client, const std::string& payload) {
    if (transport_.send(client, payload)) return true;
    util::log_warn("router") << chat::error_code(ErrorKind::TransportFailure) << ": client " << client;
    return false;
}

std::size_t EventRouter::emit_to_user(const UserId& user, const std::string& payload) {
    std::size_t sent = 0;
    for (ClientId c : connections_of(user)) {
        if (emit(c, payload)) ++sent;
    }
    return sent;
}

} // namespace marketchat::networking

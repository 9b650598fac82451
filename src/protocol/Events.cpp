#include "protocol/Events.h"

#include "chat/Error.h"
#include "util/Time.hpp"

#include <utility>

namespace marketchat::protocol {

using chat::ChatError;
using chat::ErrorKind;

namespace {

std::string to_std(const json::string& s) { return std::string(s.data(), s.size()); }

[[noreturn]] void invalid(const std::string& what) {
    throw ChatError(ErrorKind::InvalidPayload, what);
}

std::optional<std::string> optional_string(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    const json::string* s = v->if_string();
    if (!s) invalid(std::string("field '") + key + "' must be a string");
    return to_std(*s);
}

std::string required_string(const json::object& obj, const char* key) {
    auto s = optional_string(obj, key);
    if (!s || s->empty()) invalid(std::string("missing field '") + key + "'");
    return *s;
}

bool optional_bool(const json::object& obj, const char* key, bool fallback) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return fallback;
    if (!v->is_bool()) invalid(std::string("field '") + key + "' must be a boolean");
    return v->get_bool();
}

std::optional<std::uint64_t> optional_uint(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (v->is_uint64()) return v->get_uint64();
    if (v->is_int64() && v->get_int64() >= 0) return static_cast<std::uint64_t>(v->get_int64());
    invalid(std::string("field '") + key + "' must be a non-negative integer");
}

SendMessage parse_send_message(const json::object& obj) {
    SendMessage out;
    try {
        out.conversation_id = required_string(obj, "conversationId");
        const std::string type = required_string(obj, "messageType");
        auto parsed = chat::parse_message_type(type);
        if (!parsed) invalid("unknown messageType '" + type + "'");
        out.draft.type = *parsed;
    } catch (const ChatError& e) {
        invalid(std::string("Invalid message metadata: ") + e.what());
    }

    const json::value* content = obj.if_contains("content");
    if (!content || content->is_null()) invalid("Invalid message metadata: missing field 'content'");

    if (const json::string* s = content->if_string()) {
        if (s->empty()) invalid("Invalid message metadata: empty content");
        out.draft.caption = to_std(*s);
    } else if (const json::object* c = content->if_object()) {
        if (c->empty()) invalid("Invalid message metadata: empty content");
        if (const json::value* t = c->if_contains("text"); t && t->is_string()) {
            out.draft.caption = to_std(t->get_string());
        } else if (const json::value* f = c->if_contains("fileName"); f && f->is_string()) {
            out.draft.caption = to_std(f->get_string());
        }
    } else {
        invalid("Invalid message metadata: content must be a string or object");
    }
    // Stored verbatim as JSON text; the payload is opaque past this point.
    out.draft.content = json::serialize(*content);

    if (auto id = optional_string(obj, "messageId")) out.draft.client_id = *id;
    return out;
}

json::value content_value(const std::string& stored) {
    boost::system::error_code ec;
    json::value v = json::parse(stored, ec);
    if (ec) return json::value(json::string_view(stored));
    return v;
}

json::value last_seen_value(TimestampMs ms) {
    if (ms <= 0) return nullptr;
    return json::value(util::format_iso8601(ms));
}

const char* status_event_name(chat::MessageStatus status) {
    switch (status) {
        case chat::MessageStatus::Sent:      return "message_sent";
        case chat::MessageStatus::Delivered: return "message_delivered";
        case chat::MessageStatus::Read:      return "message_read";
    }
    return "message_sent";
}

json::object message_object(const chat::Message& m) {
    return json::object{
        {"messageId", m.id},
        {"conversationId", m.conversation_id},
        {"senderId", m.sender},
        {"messageType", chat::to_string(m.type)},
        {"content", content_value(m.content)},
        {"timestamp", util::format_iso8601(m.created_at)},
        {"status", chat::to_string(m.status)},
        {"sequence", m.sequence},
    };
}

json::object conversation_object(const chat::Conversation& c) {
    json::array participants;
    for (const auto& p : c.participants) participants.emplace_back(json::string_view(p));

    json::object out{
        {"conversationId", c.id},
        {"buyerId", c.buyer_id},
        {"sellerId", c.seller_id},
        {"participants", std::move(participants)},
        {"updatedAt", util::format_iso8601(c.updated_at)},
    };
    if (!c.product_id.empty()) out["productId"] = c.product_id;
    if (c.last_message) {
        out["lastMessage"] = json::object{
            {"text", c.last_message->text},
            {"messageType", chat::to_string(c.last_message->type)},
            {"sender", c.last_message->sender},
            {"timestamp", util::format_iso8601(c.last_message->timestamp)},
        };
    } else {
        out["lastMessage"] = nullptr;
    }
    return out;
}

std::string dump(const json::object& obj) { return json::serialize(obj); }

} // namespace

std::string RawEvent::message_id() const {
    const json::value* v = body.if_contains("messageId");
    if (!v || !v->is_string()) return {};
    return to_std(v->get_string());
}

RawEvent decode(std::string_view text) {
    boost::system::error_code ec;
    json::value v = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) invalid("invalid json");

    json::object* obj = v.if_object();
    if (!obj) invalid("payload must be a JSON object");

    const json::value* type = obj->if_contains("type");
    if (!type || !type->is_string() || type->get_string().empty()) invalid("missing type");

    RawEvent raw;
    raw.type = to_std(type->get_string());
    raw.body = std::move(*obj);
    return raw;
}

Inbound parse(const RawEvent& raw) {
    const json::object& obj = raw.body;
    Inbound in;
    in.type = raw.type;

    if (auto u = optional_string(obj, "userId")) in.claimed_user = *u;
    if (auto s = optional_string(obj, "senderId")) {
        if (in.claimed_user && *in.claimed_user != *s) invalid("userId and senderId disagree");
        in.claimed_user = *s;
    }

    const std::string& t = raw.type;
    if (t == "join") {
        in.event = Join{};
    } else if (t == "enter_chat") {
        in.event = EnterChat{required_string(obj, "conversationId")};
    } else if (t == "leave_chat") {
        in.event = LeaveChat{required_string(obj, "conversationId")};
    } else if (t == "send_message") {
        in.event = parse_send_message(obj);
    } else if (t == "typing") {
        in.event = Typing{required_string(obj, "conversationId"), optional_bool(obj, "isTyping", true)};
    } else if (t == "recording_indicator") {
        in.event = RecordingIndicator{required_string(obj, "conversationId"),
                                      optional_bool(obj, "isRecording", true)};
    } else if (t == "mark_read") {
        in.event = MarkRead{required_string(obj, "conversationId")};
    } else if (t == "heartbeat") {
        in.event = Heartbeat{};
    } else if (t == "open_conversation") {
        in.event = OpenConversation{required_string(obj, "buyerId"), required_string(obj, "sellerId"),
                                    optional_string(obj, "productId").value_or("")};
    } else if (t == "list_conversations") {
        in.event = ListConversations{};
    } else if (t == "fetch_messages") {
        FetchMessages f;
        f.conversation_id = required_string(obj, "conversationId");
        f.limit = static_cast<std::size_t>(optional_uint(obj, "limit").value_or(0));
        f.before = optional_uint(obj, "before");
        in.event = std::move(f);
    } else if (t == "get_status") {
        in.event = GetStatus{required_string(obj, "userId")};
    } else {
        invalid("unknown type '" + t + "'");
    }
    return in;
}

std::string user_status(const chat::PresenceRecord& record, TimestampMs now) {
    return dump({
        {"type", "user_status"},
        {"userId", record.user_id},
        {"isOnline", record.is_online},
        {"lastSeen", last_seen_value(record.last_seen)},
        {"timestamp", util::format_iso8601(now)},
    });
}

std::string new_message(const chat::Message& message, chat::MessageStatus status) {
    json::object out = message_object(message);
    out["type"] = "new_message";
    out["status"] = chat::to_string(status);
    return dump(out);
}

std::string message_status(const chat::Message& message, chat::MessageStatus status, TimestampMs now) {
    return dump({
        {"type", status_event_name(status)},
        {"messageId", message.id},
        {"conversationId", message.conversation_id},
        {"status", chat::to_string(status)},
        {"timestamp", util::format_iso8601(now)},
    });
}

std::string messages_read(const ConversationId& conversation, const UserId& reader, TimestampMs now) {
    return dump({
        {"type", "messages_read"},
        {"conversationId", conversation},
        {"userId", reader},
        {"timestamp", util::format_iso8601(now)},
    });
}

std::string user_typing(const ConversationId& conversation, const UserId& user, bool is_typing) {
    return dump({
        {"type", "user_typing"},
        {"conversationId", conversation},
        {"userId", user},
        {"isTyping", is_typing},
    });
}

std::string recording_indicator(const UserId& user, const ConversationId& conversation,
                                bool is_recording, TimestampMs now) {
    return dump({
        {"type", "recording_indicator"},
        {"userId", user},
        {"conversationId", conversation},
        {"isRecording", is_recording},
        {"timestamp", util::format_iso8601(now)},
    });
}

std::string ack(std::string_view type, const ConversationId& conversation) {
    return dump({
        {"type", json::string_view(type.data(), type.size())},
        {"conversationId", conversation},
    });
}

std::string message_error(const std::string& error, const char* code, const std::string& message_id) {
    json::object out{
        {"type", "message_error"},
        {"error", error},
        {"code", code},
    };
    if (!message_id.empty()) out["messageId"] = message_id;
    return dump(out);
}

std::string error(const std::string& error, const char* code, std::string_view action) {
    json::object out{
        {"type", "error"},
        {"error", error},
        {"code", code},
    };
    if (!action.empty()) out["action"] = json::string_view(action.data(), action.size());
    return dump(out);
}

std::string conversation_opened(const chat::Conversation& conversation) {
    return dump({
        {"type", "conversation_opened"},
        {"conversation", conversation_object(conversation)},
    });
}

std::string conversations(const std::vector<chat::ConversationSummary>& items) {
    json::array arr;
    for (const auto& s : items) {
        json::object o = conversation_object(s.conversation);
        o["unreadCount"] = s.unread;
        arr.emplace_back(std::move(o));
    }
    return dump({
        {"type", "conversations"},
        {"items", std::move(arr)},
    });
}

std::string messages(const ConversationId& conversation, const std::vector<chat::Message>& items) {
    json::array arr;
    for (const auto& m : items) arr.emplace_back(message_object(m));
    return dump({
        {"type", "messages"},
        {"conversationId", conversation},
        {"items", std::move(arr)},
    });
}

} // namespace marketchat::protocol

#pragma once

#include "chat/ConversationDirectory.h"
#include "chat/Types.h"

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marketchat::protocol {

namespace json = boost::json;

using chat::ConversationId;
using chat::TimestampMs;
using chat::UserId;

// ---- inbound ----

struct Join {};
struct Heartbeat {};
struct ListConversations {};

struct EnterChat {
    ConversationId conversation_id;
};

struct LeaveChat {
    ConversationId conversation_id;
};

struct SendMessage {
    ConversationId conversation_id;
    chat::MessageDraft draft;
};

struct Typing {
    ConversationId conversation_id;
    bool is_typing = false;
};

struct RecordingIndicator {
    ConversationId conversation_id;
    bool is_recording = false;
};

struct MarkRead {
    ConversationId conversation_id;
};

struct OpenConversation {
    UserId buyer_id;
    UserId seller_id;
    std::string product_id;
};

struct FetchMessages {
    ConversationId conversation_id;
    std::size_t limit = 0;
    std::optional<std::uint64_t> before;
};

struct GetStatus {
    UserId user_id;
};

using Event = std::variant<Join, EnterChat, LeaveChat, SendMessage, Typing,
                           RecordingIndicator, MarkRead, Heartbeat,
                           OpenConversation, ListConversations, FetchMessages, GetStatus>;

// First stage: a JSON object with a string "type".
struct RawEvent {
    std::string type;
    json::object body;

    // Client message id, if any, for message_error correlation.
    std::string message_id() const;
};

struct Inbound {
    std::string type;
    Event event;
    // userId / senderId the client put in the payload; must match the
    // connection's identity when present.
    std::optional<UserId> claimed_user;
};

// Both throw chat::ChatError(InvalidPayload).
RawEvent decode(std::string_view text);
Inbound parse(const RawEvent& raw);

// ---- outbound ----

std::string user_status(const chat::PresenceRecord& record, TimestampMs now);
std::string new_message(const chat::Message& message, chat::MessageStatus status);
// message_sent / message_delivered / message_read, picked from `status`.
std::string message_status(const chat::Message& message, chat::MessageStatus status, TimestampMs now);
std::string messages_read(const ConversationId& conversation, const UserId& reader, TimestampMs now);
std::string user_typing(const ConversationId& conversation, const UserId& user, bool is_typing);
std::string recording_indicator(const UserId& user, const ConversationId& conversation,
                                bool is_recording, TimestampMs now);
std::string ack(std::string_view type, const ConversationId& conversation);
std::string message_error(const std::string& error, const char* code, const std::string& message_id);
std::string error(const std::string& error, const char* code, std::string_view action);
std::string conversation_opened(const chat::Conversation& conversation);
std::string conversations(const std::vector<chat::ConversationSummary>& items);
std::string messages(const ConversationId& conversation, const std::vector<chat::Message>& items);

} // namespace marketchat::protocol

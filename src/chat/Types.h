#pragma once

#include "util/Time.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marketchat::chat {

using UserId         = std::string;
using ConversationId = std::string;
using MessageId      = std::string;
using TimestampMs    = util::TimestampMs;

enum class MessageType { Text, Image, Video, Voice, Document };

// Ordered: a receipt only ever moves to a greater value.
enum class MessageStatus : int { Sent = 0, Delivered = 1, Read = 2 };

const char* to_string(MessageType type) noexcept;
const char* to_string(MessageStatus status) noexcept;
std::optional<MessageType> parse_message_type(std::string_view s);

struct PresenceRecord {
    UserId user_id;
    bool is_online = false;
    TimestampMs last_seen = 0;              // 0 = never seen
    std::optional<std::string> connection_id;
};

struct LastMessageSummary {
    std::string text;
    MessageType type = MessageType::Text;
    UserId sender;
    TimestampMs timestamp = 0;
};

struct Conversation {
    ConversationId id;
    UserId buyer_id;
    UserId seller_id;
    std::string product_id;                  // empty when not about a product
    std::vector<UserId> participants;
    std::optional<LastMessageSummary> last_message;
    std::map<UserId, std::uint32_t> unread_counts;
    TimestampMs updated_at = 0;

    std::uint32_t unread_for(const UserId& user) const {
        auto it = unread_counts.find(user);
        return it == unread_counts.end() ? 0 : it->second;
    }
};

struct Message {
    MessageId id;
    ConversationId conversation_id;
    UserId sender;
    MessageType type = MessageType::Text;
    std::string content;                     // opaque, stored verbatim
    MessageStatus status = MessageStatus::Sent;
    TimestampMs created_at = 0;
    std::uint64_t sequence = 0;
};

struct Receipt {
    UserId recipient;
    MessageStatus status = MessageStatus::Sent;
};

// What the client hands to submit(). `client_id` lets a retry reuse its id.
struct MessageDraft {
    std::string client_id;
    MessageType type = MessageType::Text;
    std::string content;
    std::string caption;                     // human text for previews/pushes
};

std::string preview_text(MessageType type, const std::string& caption);

} // namespace marketchat::chat

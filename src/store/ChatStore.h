#pragma once

#include "chat/Types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace marketchat::store {

using chat::Conversation;
using chat::ConversationId;
using chat::LastMessageSummary;
using chat::Message;
using chat::MessageId;
using chat::MessageStatus;
using chat::PresenceRecord;
using chat::Receipt;
using chat::TimestampMs;
using chat::UserId;

// A message whose receipt for the reader moved to read.
struct ReadTransition {
    MessageId message_id;
    UserId sender;
};

struct ReadOutcome {
    std::vector<ReadTransition> transitions;
    std::uint32_t previous_unread = 0;
};

// Persistence collaborator. Every method throws chat::ChatError with
// ErrorKind::PersistenceFailure when the backing store fails. Each write is
// atomic: either all of its rows change or none do.
class ChatStore {
public:
    virtual ~ChatStore() = default;

    // Identity lookup
    virtual bool user_exists(const UserId& user) = 0;
    virtual void add_user(const UserId& user, TimestampMs now) = 0;

    // Presence
    virtual void upsert_presence(const PresenceRecord& record) = 0;
    virtual std::optional<PresenceRecord> load_presence(const UserId& user) = 0;

    // Conversations
    virtual bool conversation_exists(const ConversationId& id) = 0;
    virtual std::optional<Conversation> load_conversation(const ConversationId& id) = 0;
    virtual std::optional<ConversationId> find_conversation(const UserId& buyer,
                                                            const UserId& seller,
                                                            const std::string& product) = 0;
    virtual void insert_conversation(const Conversation& conversation) = 0;
    virtual bool is_participant(const ConversationId& id, const UserId& user) = 0;
    virtual std::vector<UserId> participants_of(const ConversationId& id) = 0;
    // Most recently updated first.
    virtual std::vector<ConversationId> conversations_of(const UserId& user) = 0;
    virtual std::vector<UserId> peers_of(const UserId& user) = 0;

    // Messages
    virtual std::optional<Message> load_message(const MessageId& id) = 0;
    virtual std::vector<Receipt> receipts_of(const MessageId& id) = 0;
    // Newest `limit` messages with sequence < before (all when unset), oldest first.
    virtual std::vector<Message> list_messages(const ConversationId& id,
                                               std::size_t limit,
                                               std::optional<std::uint64_t> before) = 0;
    // Messages whose receipt for `recipient` is still sent, in send order.
    virtual std::vector<Message> pending_for(const UserId& recipient) = 0;

    // Inserts message + receipts, refreshes the last-message summary and adds
    // one unread to each of `unread_increments`. Returns the assigned sequence.
    virtual std::uint64_t commit_submit(const Message& message,
                                        const std::vector<Receipt>& receipts,
                                        const LastMessageSummary& summary,
                                        const std::vector<UserId>& unread_increments) = 0;

    // Moves the receipt forward to `to`. False when absent or already >= to.
    virtual bool advance_receipt(const MessageId& id, const UserId& recipient,
                                 MessageStatus to, TimestampMs now) = 0;

    // Withdraws an instant read nobody saw: read -> sent and one more unread
    // for the recipient. False when the receipt is not read.
    virtual bool reopen_receipt(const MessageId& id, const UserId& recipient, TimestampMs now) = 0;

    // Marks every non-read receipt of `reader` in the conversation read and
    // zeroes the reader's unread counter.
    virtual ReadOutcome mark_conversation_read(const ConversationId& id,
                                               const UserId& reader,
                                               TimestampMs now) = 0;
};

} // namespace marketchat::store

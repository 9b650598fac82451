#include "chat/DeliveryEngine.h"

#include "chat/Error.h"
#include "util/Log.hpp"

#include <algorithm>
#include <utility>

namespace marketchat::chat {

DeliveryEngine::DeliveryEngine(store::ChatStore& store,
                               ConversationDirectory& directory,
                               ActiveViewTracker& tracker,
                               IDGenerator& ids,
                               util::WallClock clock)
    : store_(store),
      directory_(directory),
      tracker_(tracker),
      ids_(ids),
      clock_(std::move(clock)) {}

void DeliveryEngine::authorize(const ConversationId& conversation, const UserId& user,
                               const char* denied) {
    if (!directory_.exists(conversation)) {
        throw ChatError(ErrorKind::NotFound, "Conversation not found");
    }
    if (!directory_.is_participant(conversation, user)) {
        throw ChatError(ErrorKind::Unauthorized, denied);
    }
}

SubmitResult DeliveryEngine::submit(const ConversationId& conversation, const UserId& sender,
                                    const MessageDraft& draft) {
    if (draft.content.empty()) {
        throw ChatError(ErrorKind::InvalidPayload, "Invalid message metadata");
    }
    if (draft.client_id.size() > kMaxClientIdLength) {
        throw ChatError(ErrorKind::InvalidPayload, "messageId too long");
    }

    authorize(conversation, sender, "Unauthorized sender");
    const auto participants = directory_.participants_of(conversation);

    auto lk = conversation_locks_.lock(conversation);

    if (!draft.client_id.empty()) {
        if (auto existing = store_.load_message(draft.client_id)) {
            if (existing->conversation_id != conversation || existing->sender != sender) {
                throw ChatError(ErrorKind::InvalidPayload, "messageId already in use");
            }
            SubmitResult dup;
            dup.message = std::move(*existing);
            dup.duplicate = true;
            for (auto& r : store_.receipts_of(dup.message.id)) {
                dup.recipients.push_back(RecipientOutcome{std::move(r.recipient), r.status});
            }
            util::log_debug("delivery") << "duplicate submit " << dup.message.id;
            return dup;
        }
    }

    Message msg;
    msg.id              = draft.client_id.empty() ? ids_.message_id() : draft.client_id;
    msg.conversation_id = conversation;
    msg.sender          = sender;
    msg.type            = draft.type;
    msg.content         = draft.content;
    msg.created_at      = clock_();

    SubmitResult result;
    std::vector<Receipt> receipts;
    std::vector<UserId> unread_increments;
    for (const auto& p : participants) {
        if (p == sender) continue;
        // A recipient looking at the conversation reads it on arrival.
        const MessageStatus status =
            tracker_.is_active(p, conversation) ? MessageStatus::Read : MessageStatus::Sent;
        receipts.push_back(Receipt{p, status});
        if (status != MessageStatus::Read) unread_increments.push_back(p);
        result.recipients.push_back(RecipientOutcome{p, status});
    }

    LastMessageSummary summary;
    summary.text      = preview_text(draft.type, draft.caption);
    summary.type      = draft.type;
    summary.sender    = sender;
    summary.timestamp = msg.created_at;

    msg.sequence = store_.commit_submit(msg, receipts, summary, unread_increments);

    MessageStatus aggregate = receipts.empty() ? MessageStatus::Sent : MessageStatus::Read;
    for (const auto& r : receipts) aggregate = std::min(aggregate, r.status);
    msg.status = aggregate;

    util::log_debug("delivery") << "stored " << msg.id << " seq=" << msg.sequence
                                << " conversation=" << conversation << " recipients=" << receipts.size();
    result.message = std::move(msg);
    return result;
}

bool DeliveryEngine::mark_delivered(const MessageId& message, const UserId& recipient) {
    auto msg = store_.load_message(message);
    if (!msg) throw ChatError(ErrorKind::NotFound, "Message not found");

    auto lk = conversation_locks_.lock(msg->conversation_id);
    return store_.advance_receipt(message, recipient, MessageStatus::Delivered, clock_());
}

bool DeliveryEngine::withdraw_instant_read(const MessageId& message, const UserId& recipient) {
    auto msg = store_.load_message(message);
    if (!msg) throw ChatError(ErrorKind::NotFound, "Message not found");

    auto lk = conversation_locks_.lock(msg->conversation_id);
    const bool reopened = store_.reopen_receipt(message, recipient, clock_());
    if (reopened) {
        util::log_debug("delivery") << "instant read of " << message << " by " << recipient << " withdrawn";
    }
    return reopened;
}

ReadResult DeliveryEngine::mark_read(const ConversationId& conversation, const UserId& reader) {
    authorize(conversation, reader);

    ReadResult result;
    result.conversation_id = conversation;
    result.reader = reader;
    result.participants = directory_.participants_of(conversation);

    auto lk = conversation_locks_.lock(conversation);
    auto outcome = store_.mark_conversation_read(conversation, reader, clock_());
    result.transitions = std::move(outcome.transitions);
    result.previous_unread = outcome.previous_unread;

    if (result.changed()) {
        util::log_debug("delivery") << reader << " read " << result.transitions.size()
                                    << " message(s) in " << conversation;
    }
    return result;
}

std::vector<Message> DeliveryEngine::pending_for(const UserId& recipient) {
    return store_.pending_for(recipient);
}

std::vector<Message> DeliveryEngine::history(const ConversationId& conversation, const UserId& user,
                                             std::size_t limit, std::optional<std::uint64_t> before) {
    authorize(conversation, user);
    if (limit == 0) limit = kDefaultHistory;
    limit = std::min(limit, kMaxHistory);
    return store_.list_messages(conversation, limit, before);
}

std::uint32_t DeliveryEngine::unread_count(const ConversationId& conversation, const UserId& user) {
    auto conv = store_.load_conversation(conversation);
    if (!conv) throw ChatError(ErrorKind::NotFound, "Conversation not found");
    return conv->unread_for(user);
}

} // namespace marketchat::chat

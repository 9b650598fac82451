#pragma once

#include "chat/ActiveViewTracker.h"
#include "chat/ConversationDirectory.h"
#include "chat/IDGenerator.hpp"
#include "chat/KeyedMutex.hpp"
#include "chat/Types.h"
#include "store/ChatStore.h"
#include "util/Time.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <vector>

namespace marketchat::chat {

struct RecipientOutcome {
    UserId recipient;
    MessageStatus status = MessageStatus::Sent;   // Read when instant-read applied
};

struct SubmitResult {
    Message message;
    std::vector<RecipientOutcome> recipients;
    bool duplicate = false;                        // resubmitted client id
};

struct ReadResult {
    ConversationId conversation_id;
    UserId reader;
    std::vector<store::ReadTransition> transitions;
    std::uint32_t previous_unread = 0;
    std::set<UserId> participants;

    bool changed() const { return !transitions.empty() || previous_unread > 0; }
};

// Owns the per-(message, recipient) state machine sent -> delivered -> read.
//
// Every operation on a conversation runs under that conversation's lock, so a
// submit and a mark_read for the same conversation never interleave: either
// the reader was already active when the message landed (instant read) or
// the bulk read picks the message up.
//
// Store failures surface as ChatError(PersistenceFailure) and are not
// retried here.
class DeliveryEngine {
public:
    static constexpr std::size_t kMaxClientIdLength = 64;
    static constexpr std::size_t kDefaultHistory = 50;
    static constexpr std::size_t kMaxHistory = 200;

    DeliveryEngine(store::ChatStore& store,
                   ConversationDirectory& directory,
                   ActiveViewTracker& tracker,
                   IDGenerator& ids,
                   util::WallClock clock = util::system_wall_clock());

    DeliveryEngine(const DeliveryEngine&) = delete;
    DeliveryEngine& operator=(const DeliveryEngine&) = delete;

    SubmitResult submit(const ConversationId& conversation, const UserId& sender,
                        const MessageDraft& draft);

    // sent -> delivered. False when the receipt is already delivered or read.
    bool mark_delivered(const MessageId& message, const UserId& recipient);

    // read -> sent for an instant read that reached none of the recipient's
    // connections, so it is replayed on the next join. False when the
    // receipt is no longer read.
    bool withdraw_instant_read(const MessageId& message, const UserId& recipient);

    ReadResult mark_read(const ConversationId& conversation, const UserId& reader);

    std::vector<Message> pending_for(const UserId& recipient);

    std::vector<Message> history(const ConversationId& conversation, const UserId& user,
                                 std::size_t limit, std::optional<std::uint64_t> before);

    std::uint32_t unread_count(const ConversationId& conversation, const UserId& user);

private:
    void authorize(const ConversationId& conversation, const UserId& user,
                   const char* denied = "Not a participant of this conversation");

    store::ChatStore& store_;
    ConversationDirectory& directory_;
    ActiveViewTracker& tracker_;
    IDGenerator& ids_;
    util::WallClock clock_;

    KeyedMutex<> conversation_locks_;
};

} // namespace marketchat::chat

#pragma once

#include "chat/IDGenerator.hpp"
#include "chat/Types.h"
#include "store/ChatStore.h"
#include "util/Time.hpp"

#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace marketchat::chat {

struct ConversationSummary {
    Conversation conversation;
    std::uint32_t unread = 0;       // for the user the summary was built for
};

// Participant lookups for fan-out and authorization.
//
// Membership never changes after a conversation is created, so participant
// sets are cached for fan-out. Authorization (is_participant) always goes to
// the store.
class ConversationDirectory {
public:
    ConversationDirectory(store::ChatStore& store, IDGenerator& ids,
                          util::WallClock clock = util::system_wall_clock());

    ConversationDirectory(const ConversationDirectory&) = delete;
    ConversationDirectory& operator=(const ConversationDirectory&) = delete;

    // Throws ChatError(NotFound) if the conversation does not exist.
    std::set<UserId> participants_of(const ConversationId& conversation);

    std::set<ConversationId> conversations_of(const UserId& user);
    bool is_participant(const ConversationId& conversation, const UserId& user);
    bool exists(const ConversationId& conversation);

    // Everyone sharing at least one conversation with `user`, without `user`.
    std::set<UserId> peers_of(const UserId& user);

    // Get-or-create the buyer/seller conversation, optionally about a product.
    Conversation open(const UserId& buyer, const UserId& seller, const std::string& product_id);

    // Conversations of `user`, most recently updated first.
    std::vector<ConversationSummary> summaries_for(const UserId& user);

private:
    store::ChatStore& store_;
    IDGenerator& ids_;
    util::WallClock clock_;

    std::mutex open_mu_;

    std::shared_mutex cache_mu_;
    std::unordered_map<ConversationId, std::set<UserId>> participants_cache_;
};

} // namespace marketchat::chat

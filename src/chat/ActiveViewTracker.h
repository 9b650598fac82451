#pragma once

#include "chat/Types.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace marketchat::chat {

// Which conversation each user currently has in the foreground. One entry
// per user, process memory only: a restart forgets everything and recipients
// fall back to "delivered" until they enter again.
class ActiveViewTracker {
public:
    // Replaces any previous entry for the user.
    void enter(const UserId& user, const ConversationId& conversation);

    // No-op unless the current entry is `conversation`, so a late leave from
    // a superseded enter cannot clear the newer one.
    void leave(const UserId& user, const ConversationId& conversation);

    bool is_active(const UserId& user, const ConversationId& conversation) const;

    void clear(const UserId& user);

    std::optional<ConversationId> active_conversation(const UserId& user) const;
    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<UserId, ConversationId> active_;
};

} // namespace marketchat::chat

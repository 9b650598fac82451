#include "chat/ActiveViewTracker.h"

namespace marketchat::chat {

void ActiveViewTracker::enter(const UserId& user, const ConversationId& conversation) {
    std::lock_guard<std::mutex> lk(mu_);
    active_[user] = conversation;
}

void ActiveViewTracker::leave(const UserId& user, const ConversationId& conversation) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = active_.find(user);
    if (it != active_.end() && it->second == conversation) active_.erase(it);
}

bool ActiveViewTracker::is_active(const UserId& user, const ConversationId& conversation) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = active_.find(user);
    return it != active_.end() && it->second == conversation;
}

void ActiveViewTracker::clear(const UserId& user) {
    std::lock_guard<std::mutex> lk(mu_);
    active_.erase(user);
}

std::optional<ConversationId> ActiveViewTracker::active_conversation(const UserId& user) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = active_.find(user);
    if (it == active_.end()) return std::nullopt;
    return it->second;
}

std::size_t ActiveViewTracker::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_.size();
}

} // namespace marketchat::chat

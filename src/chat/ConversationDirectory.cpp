#include "chat/ConversationDirectory.h"

#include "chat/Error.h"
#include "util/Log.hpp"

#include <mutex>
#include <utility>

namespace marketchat::chat {

ConversationDirectory::ConversationDirectory(store::ChatStore& store, IDGenerator& ids,
                                             util::WallClock clock)
    : store_(store), ids_(ids), clock_(std::move(clock)) {}

std::set<UserId> ConversationDirectory::participants_of(const ConversationId& conversation) {
    {
        std::shared_lock<std::shared_mutex> lk(cache_mu_);
        auto it = participants_cache_.find(conversation);
        if (it != participants_cache_.end()) return it->second;
    }

    auto list = store_.participants_of(conversation);
    if (list.empty()) {
        throw ChatError(ErrorKind::NotFound, "Conversation not found");
    }

    std::set<UserId> members(list.begin(), list.end());
    std::unique_lock<std::shared_mutex> lk(cache_mu_);
    participants_cache_.emplace(conversation, members);
    return members;
}

std::set<ConversationId> ConversationDirectory::conversations_of(const UserId& user) {
    auto list = store_.conversations_of(user);
    return std::set<ConversationId>(list.begin(), list.end());
}

bool ConversationDirectory::is_participant(const ConversationId& conversation, const UserId& user) {
    return store_.is_participant(conversation, user);
}

bool ConversationDirectory::exists(const ConversationId& conversation) {
    return store_.conversation_exists(conversation);
}

std::set<UserId> ConversationDirectory::peers_of(const UserId& user) {
    auto list = store_.peers_of(user);
    return std::set<UserId>(list.begin(), list.end());
}

Conversation ConversationDirectory::open(const UserId& buyer, const UserId& seller,
                                         const std::string& product_id) {
    if (buyer.empty() || seller.empty()) {
        throw ChatError(ErrorKind::InvalidPayload, "buyerId and sellerId are required");
    }
    if (buyer == seller) {
        throw ChatError(ErrorKind::InvalidPayload, "Buyer and seller cannot be the same user");
    }
    if (!store_.user_exists(buyer) || !store_.user_exists(seller)) {
        throw ChatError(ErrorKind::NotFound, "Buyer or seller not found");
    }

    std::lock_guard<std::mutex> lk(open_mu_);
    if (auto existing = store_.find_conversation(buyer, seller, product_id)) {
        if (auto conv = store_.load_conversation(*existing)) return *conv;
    }

    Conversation conv;
    conv.id           = ids_.conversation_id();
    conv.buyer_id     = buyer;
    conv.seller_id    = seller;
    conv.product_id   = product_id;
    conv.participants = {buyer, seller};
    conv.unread_counts[buyer]  = 0;
    conv.unread_counts[seller] = 0;
    conv.updated_at   = clock_();
    store_.insert_conversation(conv);

    util::log_info("directory") << "opened " << conv.id << " buyer=" << buyer << " seller=" << seller
                                << (product_id.empty() ? "" : " product=") << product_id;
    return conv;
}

std::vector<ConversationSummary> ConversationDirectory::summaries_for(const UserId& user) {
    std::vector<ConversationSummary> out;
    for (const auto& id : store_.conversations_of(user)) {
        auto conv = store_.load_conversation(id);
        if (!conv) continue;
        ConversationSummary s;
        s.unread = conv->unread_for(user);
        s.conversation = std::move(*conv);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace marketchat::chat

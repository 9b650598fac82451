#pragma once

#include "store/ChatStore.h"

#include <mutex>
#include <string>

struct sqlite3;

namespace marketchat::store {

// ChatStore over a single SQLite connection. Pass ":memory:" for a private
// in-memory database.
class SqliteStore : public ChatStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    bool user_exists(const UserId& user) override;
    void add_user(const UserId& user, TimestampMs now) override;

    void upsert_presence(const PresenceRecord& record) override;
    std::optional<PresenceRecord> load_presence(const UserId& user) override;

    bool conversation_exists(const ConversationId& id) override;
    std::optional<Conversation> load_conversation(const ConversationId& id) override;
    std::optional<ConversationId> find_conversation(const UserId& buyer,
                                                    const UserId& seller,
                                                    const std::string& product) override;
    void insert_conversation(const Conversation& conversation) override;
    bool is_participant(const ConversationId& id, const UserId& user) override;
    std::vector<UserId> participants_of(const ConversationId& id) override;
    std::vector<ConversationId> conversations_of(const UserId& user) override;
    std::vector<UserId> peers_of(const UserId& user) override;

    std::optional<Message> load_message(const MessageId& id) override;
    std::vector<Receipt> receipts_of(const MessageId& id) override;
    std::vector<Message> list_messages(const ConversationId& id,
                                       std::size_t limit,
                                       std::optional<std::uint64_t> before) override;
    std::vector<Message> pending_for(const UserId& recipient) override;

    std::uint64_t commit_submit(const Message& message,
                                const std::vector<Receipt>& receipts,
                                const LastMessageSummary& summary,
                                const std::vector<UserId>& unread_increments) override;
    bool advance_receipt(const MessageId& id, const UserId& recipient,
                         MessageStatus to, TimestampMs now) override;
    bool reopen_receipt(const MessageId& id, const UserId& recipient, TimestampMs now) override;
    ReadOutcome mark_conversation_read(const ConversationId& id,
                                       const UserId& reader,
                                       TimestampMs now) override;

private:
    void exec(const char* sql);
    void create_schema();
    void refresh_message_status(const MessageId& id);

    sqlite3* db_ = nullptr;
    std::mutex mu_;
};

} // namespace marketchat::store

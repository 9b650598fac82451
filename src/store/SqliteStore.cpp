#include "store/SqliteStore.h"

#include "chat/Error.h"
#include "util/Log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace marketchat::store {

using chat::ChatError;
using chat::ErrorKind;

namespace {

[[noreturn]] void fail(sqlite3* db, const char* what) {
    throw ChatError(ErrorKind::PersistenceFailure,
                    std::string(what) + ": " + (db ? sqlite3_errmsg(db) : "no database"));
}

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw ChatError(ErrorKind::PersistenceFailure, std::string("exec: ") + msg);
    }
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) fail(db_, "prepare");
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v) {
        if (sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT) != SQLITE_OK)
            fail(db_, "bind");
        return *this;
    }

    Statement& bind(int idx, std::int64_t v) {
        if (sqlite3_bind_int64(stmt_, idx, v) != SQLITE_OK) fail(db_, "bind");
        return *this;
    }

    Statement& bind_null(int idx) {
        if (sqlite3_bind_null(stmt_, idx) != SQLITE_OK) fail(db_, "bind");
        return *this;
    }

    // true = a row is available, false = done
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "step");
    }

    void run() {
        while (step()) {}
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        if (!p) return {};
        return std::string(reinterpret_cast<const char*>(p),
                           static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() ran.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec_sql(db_, "BEGIN IMMEDIATE;"); }

    ~Transaction() {
        if (done_) return;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            util::log_error("store") << "rollback failed: " << sqlite3_errmsg(db_);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT;");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

MessageStatus status_from_int(std::int64_t v) {
    if (v <= 0) return MessageStatus::Sent;
    if (v == 1) return MessageStatus::Delivered;
    return MessageStatus::Read;
}

chat::MessageType type_from_int(std::int64_t v) {
    if (v < 0 || v > static_cast<std::int64_t>(chat::MessageType::Document)) return chat::MessageType::Text;
    return static_cast<chat::MessageType>(v);
}

constexpr const char* kMessageColumns =
    "m.id, m.conversation_id, m.sender_id, m.type, m.content, m.status, m.created_at, m.seq";

Message read_message(const Statement& st) {
    Message m;
    m.id              = st.text(0);
    m.conversation_id = st.text(1);
    m.sender          = st.text(2);
    m.type            = type_from_int(st.int64(3));
    m.content         = st.text(4);
    m.status          = status_from_int(st.int64(5));
    m.created_at      = st.int64(6);
    m.sequence        = static_cast<std::uint64_t>(st.int64(7));
    return m;
}

std::string message_query(const char* tail) {
    return std::string("SELECT ") + kMessageColumns + " " + tail;
}

} // namespace

SqliteStore::SqliteStore(const std::string& path) {
    if (sqlite3_open_v2(path.c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw ChatError(ErrorKind::PersistenceFailure, "open " + path + ": " + msg);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        create_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteStore::exec(const char* sql) { exec_sql(db_, sql); }

void SqliteStore::create_schema() {
    exec("CREATE TABLE IF NOT EXISTS users ("
         " id TEXT PRIMARY KEY,"
         " created_at INTEGER NOT NULL);");
    exec("CREATE TABLE IF NOT EXISTS presence ("
         " user_id TEXT PRIMARY KEY,"
         " is_online INTEGER NOT NULL,"
         " last_seen INTEGER NOT NULL,"
         " connection_id TEXT);");
    exec("CREATE TABLE IF NOT EXISTS conversations ("
         " id TEXT PRIMARY KEY,"
         " buyer_id TEXT NOT NULL,"
         " seller_id TEXT NOT NULL,"
         " product_id TEXT NOT NULL DEFAULT '',"
         " last_text TEXT,"
         " last_type INTEGER,"
         " last_sender TEXT,"
         " last_ts INTEGER,"
         " next_seq INTEGER NOT NULL DEFAULT 1,"
         " updated_at INTEGER NOT NULL);");
    exec("CREATE TABLE IF NOT EXISTS participants ("
         " conversation_id TEXT NOT NULL,"
         " user_id TEXT NOT NULL,"
         " position INTEGER NOT NULL,"
         " unread INTEGER NOT NULL DEFAULT 0,"
         " PRIMARY KEY (conversation_id, user_id));");
    exec("CREATE INDEX IF NOT EXISTS participants_by_user ON participants(user_id);");
    exec("CREATE TABLE IF NOT EXISTS messages ("
         " id TEXT PRIMARY KEY,"
         " conversation_id TEXT NOT NULL,"
         " sender_id TEXT NOT NULL,"
         " type INTEGER NOT NULL,"
         " content TEXT NOT NULL,"
         " status INTEGER NOT NULL,"
         " seq INTEGER NOT NULL,"
         " created_at INTEGER NOT NULL);");
    exec("CREATE INDEX IF NOT EXISTS messages_by_conversation ON messages(conversation_id, seq);");
    exec("CREATE TABLE IF NOT EXISTS receipts ("
         " message_id TEXT NOT NULL,"
         " recipient_id TEXT NOT NULL,"
         " status INTEGER NOT NULL,"
         " updated_at INTEGER NOT NULL,"
         " PRIMARY KEY (message_id, recipient_id));");
    exec("CREATE INDEX IF NOT EXISTS receipts_by_recipient ON receipts(recipient_id, status);");
}

// ---- identity ----

bool SqliteStore::user_exists(const UserId& user) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "SELECT 1 FROM users WHERE id = ?;");
    st.bind(1, user);
    return st.step();
}

void SqliteStore::add_user(const UserId& user, TimestampMs now) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "INSERT OR IGNORE INTO users (id, created_at) VALUES (?, ?);");
    st.bind(1, user).bind(2, now);
    st.run();
}

// ---- presence ----

void SqliteStore::upsert_presence(const PresenceRecord& record) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_,
                 "INSERT OR REPLACE INTO presence (user_id, is_online, last_seen, connection_id)"
                 " VALUES (?, ?, ?, ?);");
    st.bind(1, record.user_id)
      .bind(2, static_cast<std::int64_t>(record.is_online ? 1 : 0))
      .bind(3, record.last_seen);
    if (record.connection_id) st.bind(4, *record.connection_id);
    else st.bind_null(4);
    st.run();
}

std::optional<PresenceRecord> SqliteStore::load_presence(const UserId& user) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "SELECT is_online, last_seen, connection_id FROM presence WHERE user_id = ?;");
    st.bind(1, user);
    if (!st.step()) return std::nullopt;

    PresenceRecord r;
    r.user_id   = user;
    r.is_online = st.int64(0) != 0;
    r.last_seen = st.int64(1);
    if (!st.is_null(2)) r.connection_id = st.text(2);
    return r;
}

// ---- conversations ----

bool SqliteStore::conversation_exists(const ConversationId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "SELECT 1 FROM conversations WHERE id = ?;");
    st.bind(1, id);
    return st.step();
}

std::optional<Conversation> SqliteStore::load_conversation(const ConversationId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    Conversation c;
    {
        Statement st(db_,
                     "SELECT buyer_id, seller_id, product_id, last_text, last_type, last_sender,"
                     " last_ts, updated_at FROM conversations WHERE id = ?;");
        st.bind(1, id);
        if (!st.step()) return std::nullopt;

        c.id         = id;
        c.buyer_id   = st.text(0);
        c.seller_id  = st.text(1);
        c.product_id = st.text(2);
        if (!st.is_null(4)) {
            LastMessageSummary s;
            s.text      = st.text(3);
            s.type      = type_from_int(st.int64(4));
            s.sender    = st.text(5);
            s.timestamp = st.int64(6);
            c.last_message = std::move(s);
        }
        c.updated_at = st.int64(7);
    }

    Statement st(db_,
                 "SELECT user_id, unread FROM participants WHERE conversation_id = ? ORDER BY position;");
    st.bind(1, id);
    while (st.step()) {
        UserId u = st.text(0);
        c.unread_counts[u] = static_cast<std::uint32_t>(std::max<std::int64_t>(0, st.int64(1)));
        c.participants.push_back(std::move(u));
    }
    return c;
}

std::optional<ConversationId> SqliteStore::find_conversation(const UserId& buyer,
                                                             const UserId& seller,
                                                             const std::string& product) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_,
                 "SELECT id FROM conversations"
                 " WHERE buyer_id = ? AND seller_id = ? AND product_id = ? LIMIT 1;");
    st.bind(1, buyer).bind(2, seller).bind(3, product);
    if (!st.step()) return std::nullopt;
    return st.text(0);
}

void SqliteStore::insert_conversation(const Conversation& conversation) {
    std::lock_guard<std::mutex> lk(mu_);
    Transaction tx(db_);
    {
        Statement st(db_,
                     "INSERT INTO conversations (id, buyer_id, seller_id, product_id, next_seq, updated_at)"
                     " VALUES (?, ?, ?, ?, 1, ?);");
        st.bind(1, conversation.id)
          .bind(2, conversation.buyer_id)
          .bind(3, conversation.seller_id)
          .bind(4, conversation.product_id)
          .bind(5, conversation.updated_at);
        st.run();
    }
    std::int64_t position = 0;
    for (const auto& user : conversation.participants) {
        Statement st(db_,
                     "INSERT INTO participants (conversation_id, user_id, position, unread)"
                     " VALUES (?, ?, ?, ?);");
        st.bind(1, conversation.id)
          .bind(2, user)
          .bind(3, position++)
          .bind(4, static_cast<std::int64_t>(conversation.unread_for(user)));
        st.run();
    }
    tx.commit();
}

bool SqliteStore::is_participant(const ConversationId& id, const UserId& user) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "SELECT 1 FROM participants WHERE conversation_id = ? AND user_id = ?;");
    st.bind(1, id).bind(2, user);
    return st.step();
}

std::vector<UserId> SqliteStore::participants_of(const ConversationId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "SELECT user_id FROM participants WHERE conversation_id = ? ORDER BY position;");
    st.bind(1, id);
    std::vector<UserId> out;
    while (st.step()) out.push_back(st.text(0));
    return out;
}

std::vector<ConversationId> SqliteStore::conversations_of(const UserId& user) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_,
                 "SELECT p.conversation_id FROM participants p"
                 " JOIN conversations c ON c.id = p.conversation_id"
                 " WHERE p.user_id = ? ORDER BY c.updated_at DESC, c.id;");
    st.bind(1, user);
    std::vector<ConversationId> out;
    while (st.step()) out.push_back(st.text(0));
    return out;
}

std::vector<UserId> SqliteStore::peers_of(const UserId& user) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_,
                 "SELECT DISTINCT p2.user_id FROM participants p1"
                 " JOIN participants p2 ON p2.conversation_id = p1.conversation_id"
                 " WHERE p1.user_id = ?1 AND p2.user_id <> ?1 ORDER BY p2.user_id;");
    st.bind(1, user);
    std::vector<UserId> out;
    while (st.step()) out.push_back(st.text(0));
    return out;
}

// ---- messages ----

std::optional<Message> SqliteStore::load_message(const MessageId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string sql = message_query("FROM messages m WHERE m.id = ?;");
    Statement st(db_, sql.c_str());
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_message(st);
}

std::vector<Receipt> SqliteStore::receipts_of(const MessageId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    Statement st(db_, "SELECT recipient_id, status FROM receipts WHERE message_id = ? ORDER BY recipient_id;");
    st.bind(1, id);
    std::vector<Receipt> out;
    while (st.step()) out.push_back(Receipt{st.text(0), status_from_int(st.int64(1))});
    return out;
}

std::vector<Message> SqliteStore::list_messages(const ConversationId& id,
                                                std::size_t limit,
                                                std::optional<std::uint64_t> before) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string sql = message_query(
        "FROM messages m WHERE m.conversation_id = ? AND m.seq < ? ORDER BY m.seq DESC LIMIT ?;");
    Statement st(db_, sql.c_str());
    const std::int64_t upper = before ? static_cast<std::int64_t>(*before)
                                      : std::numeric_limits<std::int64_t>::max();
    st.bind(1, id).bind(2, upper).bind(3, static_cast<std::int64_t>(limit));

    std::vector<Message> out;
    while (st.step()) out.push_back(read_message(st));
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<Message> SqliteStore::pending_for(const UserId& recipient) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string sql = message_query(
        "FROM receipts r JOIN messages m ON m.id = r.message_id"
        " WHERE r.recipient_id = ? AND r.status = 0 ORDER BY m.created_at, m.seq;");
    Statement st(db_, sql.c_str());
    st.bind(1, recipient);
    std::vector<Message> out;
    while (st.step()) out.push_back(read_message(st));
    return out;
}

std::uint64_t SqliteStore::commit_submit(const Message& message,
                                         const std::vector<Receipt>& receipts,
                                         const LastMessageSummary& summary,
                                         const std::vector<UserId>& unread_increments) {
    std::lock_guard<std::mutex> lk(mu_);
    Transaction tx(db_);

    std::int64_t seq = 0;
    {
        Statement st(db_, "SELECT next_seq FROM conversations WHERE id = ?;");
        st.bind(1, message.conversation_id);
        if (!st.step()) {
            throw ChatError(ErrorKind::NotFound, "conversation not found: " + message.conversation_id);
        }
        seq = st.int64(0);
    }
    {
        Statement st(db_,
                     "UPDATE conversations SET next_seq = next_seq + 1, last_text = ?, last_type = ?,"
                     " last_sender = ?, last_ts = ?, updated_at = ? WHERE id = ?;");
        st.bind(1, summary.text)
          .bind(2, static_cast<std::int64_t>(summary.type))
          .bind(3, summary.sender)
          .bind(4, summary.timestamp)
          .bind(5, summary.timestamp)
          .bind(6, message.conversation_id);
        st.run();
    }

    MessageStatus aggregate = MessageStatus::Read;
    for (const auto& r : receipts) aggregate = std::min(aggregate, r.status);
    if (receipts.empty()) aggregate = MessageStatus::Sent;

    {
        Statement st(db_,
                     "INSERT INTO messages (id, conversation_id, sender_id, type, content, status, seq, created_at)"
                     " VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        st.bind(1, message.id)
          .bind(2, message.conversation_id)
          .bind(3, message.sender)
          .bind(4, static_cast<std::int64_t>(message.type))
          .bind(5, message.content)
          .bind(6, static_cast<std::int64_t>(aggregate))
          .bind(7, seq)
          .bind(8, message.created_at);
        st.run();
    }
    for (const auto& r : receipts) {
        Statement st(db_,
                     "INSERT INTO receipts (message_id, recipient_id, status, updated_at) VALUES (?, ?, ?, ?);");
        st.bind(1, message.id)
          .bind(2, r.recipient)
          .bind(3, static_cast<std::int64_t>(r.status))
          .bind(4, message.created_at);
        st.run();
    }
    for (const auto& user : unread_increments) {
        Statement st(db_,
                     "UPDATE participants SET unread = unread + 1"
                     " WHERE conversation_id = ? AND user_id = ?;");
        st.bind(1, message.conversation_id).bind(2, user);
        st.run();
    }

    tx.commit();
    return static_cast<std::uint64_t>(seq);
}

void SqliteStore::refresh_message_status(const MessageId& id) {
    Statement st(db_,
                 "UPDATE messages SET status = (SELECT MIN(status) FROM receipts WHERE message_id = ?1)"
                 " WHERE id = ?1 AND EXISTS (SELECT 1 FROM receipts WHERE message_id = ?1);");
    st.bind(1, id);
    st.run();
}

bool SqliteStore::advance_receipt(const MessageId& id, const UserId& recipient,
                                  MessageStatus to, TimestampMs now) {
    std::lock_guard<std::mutex> lk(mu_);
    Transaction tx(db_);

    const auto target = static_cast<std::int64_t>(to);
    Statement st(db_,
                 "UPDATE receipts SET status = ?1, updated_at = ?2"
                 " WHERE message_id = ?3 AND recipient_id = ?4 AND status < ?1;");
    st.bind(1, target).bind(2, now).bind(3, id).bind(4, recipient);
    st.run();
    const bool changed = sqlite3_changes(db_) > 0;
    if (changed) refresh_message_status(id);

    tx.commit();
    return changed;
}

bool SqliteStore::reopen_receipt(const MessageId& id, const UserId& recipient, TimestampMs now) {
    std::lock_guard<std::mutex> lk(mu_);
    Transaction tx(db_);

    {
        Statement st(db_,
                     "UPDATE receipts SET status = 0, updated_at = ?"
                     " WHERE message_id = ? AND recipient_id = ? AND status = 2;");
        st.bind(1, now).bind(2, id).bind(3, recipient);
        st.run();
    }
    if (sqlite3_changes(db_) == 0) return false;

    refresh_message_status(id);
    {
        Statement st(db_,
                     "UPDATE participants SET unread = unread + 1"
                     " WHERE user_id = ? AND conversation_id = (SELECT conversation_id FROM messages WHERE id = ?);");
        st.bind(1, recipient).bind(2, id);
        st.run();
    }

    tx.commit();
    return true;
}

ReadOutcome SqliteStore::mark_conversation_read(const ConversationId& id,
                                                const UserId& reader,
                                                TimestampMs now) {
    std::lock_guard<std::mutex> lk(mu_);
    Transaction tx(db_);
    ReadOutcome out;

    {
        Statement st(db_,
                     "SELECT r.message_id, m.sender_id FROM receipts r"
                     " JOIN messages m ON m.id = r.message_id"
                     " WHERE m.conversation_id = ? AND r.recipient_id = ? AND r.status < 2"
                     " ORDER BY m.seq;");
        st.bind(1, id).bind(2, reader);
        while (st.step()) out.transitions.push_back(ReadTransition{st.text(0), st.text(1)});
    }
    for (const auto& t : out.transitions) {
        Statement st(db_,
                     "UPDATE receipts SET status = 2, updated_at = ? WHERE message_id = ? AND recipient_id = ?;");
        st.bind(1, now).bind(2, t.message_id).bind(3, reader);
        st.run();
        refresh_message_status(t.message_id);
    }
    {
        Statement st(db_, "SELECT unread FROM participants WHERE conversation_id = ? AND user_id = ?;");
        st.bind(1, id).bind(2, reader);
        if (st.step()) out.previous_unread = static_cast<std::uint32_t>(std::max<std::int64_t>(0, st.int64(0)));
    }
    {
        Statement st(db_, "UPDATE participants SET unread = 0 WHERE conversation_id = ? AND user_id = ?;");
        st.bind(1, id).bind(2, reader);
        st.run();
    }

    tx.commit();
    return out;
}

} // namespace marketchat::store

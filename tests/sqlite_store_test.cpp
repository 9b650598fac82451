#include "chat/Error.h"
#include "store/SqliteStore.h"
#include "util/Log.hpp"

#include <cassert>
#include <cstdio>
#include <string>

using namespace marketchat;
using chat::MessageStatus;

namespace {

chat::Conversation make_conversation(const std::string& id) {
    chat::Conversation c;
    c.id = id;
    c.buyer_id = "buyer";
    c.seller_id = "seller";
    c.product_id = "p-1";
    c.participants = {"buyer", "seller"};
    c.updated_at = 100;
    return c;
}

chat::Message make_message(const std::string& id, const std::string& conv, const std::string& sender,
                           chat::TimestampMs at) {
    chat::Message m;
    m.id = id;
    m.conversation_id = conv;
    m.sender = sender;
    m.content = "\"hello\"";
    m.created_at = at;
    return m;
}

chat::LastMessageSummary summary_for(const chat::Message& m) {
    chat::LastMessageSummary s;
    s.text = "hello";
    s.sender = m.sender;
    s.timestamp = m.created_at;
    return s;
}

void test_users_and_presence() {
    store::SqliteStore db(":memory:");
    assert(!db.user_exists("alice"));
    db.add_user("alice", 1);
    db.add_user("alice", 2);
    assert(db.user_exists("alice"));

    assert(!db.load_presence("alice"));
    db.upsert_presence(chat::PresenceRecord{"alice", true, 50, std::string("conn-1")});
    auto p = db.load_presence("alice");
    assert(p && p->is_online && p->last_seen == 50 && p->connection_id == std::string("conn-1"));

    db.upsert_presence(chat::PresenceRecord{"alice", false, 60, std::nullopt});
    p = db.load_presence("alice");
    assert(p && !p->is_online && p->last_seen == 60 && !p->connection_id);
}

void test_conversation_rows() {
    store::SqliteStore db(":memory:");
    db.insert_conversation(make_conversation("conv-1"));

    assert(db.conversation_exists("conv-1"));
    assert(!db.conversation_exists("conv-2"));
    assert(db.is_participant("conv-1", "seller"));
    assert(!db.is_participant("conv-1", "mallory"));
    assert(db.find_conversation("buyer", "seller", "p-1") == std::optional<std::string>("conv-1"));
    assert(!db.find_conversation("buyer", "seller", ""));

    auto conv = db.load_conversation("conv-1");
    assert(conv && conv->participants.size() == 2 && conv->participants[0] == "buyer");
    assert(!conv->last_message);
    assert(db.peers_of("buyer") == std::vector<std::string>{"seller"});
}

void test_submit_sequences_and_unread() {
    store::SqliteStore db(":memory:");
    db.insert_conversation(make_conversation("conv-1"));

    auto m1 = make_message("msg-1", "conv-1", "buyer", 200);
    auto m2 = make_message("msg-2", "conv-1", "buyer", 300);
    assert(db.commit_submit(m1, {chat::Receipt{"seller", MessageStatus::Sent}}, summary_for(m1), {"seller"}) == 1);
    assert(db.commit_submit(m2, {chat::Receipt{"seller", MessageStatus::Sent}}, summary_for(m2), {"seller"}) == 2);

    auto conv = db.load_conversation("conv-1");
    assert(conv->unread_for("seller") == 2);
    assert(conv->unread_for("buyer") == 0);
    assert(conv->last_message && conv->last_message->text == "hello");
    assert(conv->updated_at == 300);

    auto pending = db.pending_for("seller");
    assert(pending.size() == 2 && pending[0].id == "msg-1");

    auto page = db.list_messages("conv-1", 1, std::nullopt);
    assert(page.size() == 1 && page[0].id == "msg-2");
    page = db.list_messages("conv-1", 10, 2);
    assert(page.size() == 1 && page[0].id == "msg-1");

    // Duplicate primary key rolls the whole write back.
    bool threw = false;
    try {
        db.commit_submit(m1, {}, summary_for(m1), {"seller"});
    } catch (const chat::ChatError& e) {
        threw = e.kind() == chat::ErrorKind::PersistenceFailure;
    }
    assert(threw);
    assert(db.load_conversation("conv-1")->unread_for("seller") == 2);
    assert(db.list_messages("conv-1", 10, std::nullopt).size() == 2);
}

void test_receipts_are_monotonic() {
    store::SqliteStore db(":memory:");
    db.insert_conversation(make_conversation("conv-1"));
    auto m = make_message("msg-1", "conv-1", "buyer", 200);
    db.commit_submit(m, {chat::Receipt{"seller", MessageStatus::Sent}}, summary_for(m), {"seller"});

    assert(db.advance_receipt("msg-1", "seller", MessageStatus::Delivered, 210));
    assert(!db.advance_receipt("msg-1", "seller", MessageStatus::Delivered, 220));
    assert(db.load_message("msg-1")->status == MessageStatus::Delivered);

    auto read = db.mark_conversation_read("conv-1", "seller", 230);
    assert(read.transitions.size() == 1 && read.transitions[0].sender == "buyer");
    assert(read.previous_unread == 1);
    assert(db.load_message("msg-1")->status == MessageStatus::Read);

    // Read never goes back to delivered.
    assert(!db.advance_receipt("msg-1", "seller", MessageStatus::Delivered, 240));
    assert(db.receipts_of("msg-1")[0].status == MessageStatus::Read);

    auto again = db.mark_conversation_read("conv-1", "seller", 250);
    assert(again.transitions.empty() && again.previous_unread == 0);
}

void test_reopen_keeps_state() {
    const std::string path = "marketchat_store_test.db";
    std::remove(path.c_str());
    {
        store::SqliteStore db(path);
        db.add_user("alice", 1);
        db.insert_conversation(make_conversation("conv-1"));
    }
    {
        store::SqliteStore db(path);
        assert(db.user_exists("alice"));
        assert(db.conversation_exists("conv-1"));
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

void test_open_failure() {
    bool threw = false;
    try {
        store::SqliteStore db("/nonexistent-dir/for/sure/chat.db");
    } catch (const chat::ChatError& e) {
        threw = e.kind() == chat::ErrorKind::PersistenceFailure;
    }
    assert(threw);
}

} // namespace

int main() {
    util::Logger::instance().set_level(util::LogLevel::Off);
    test_users_and_presence();
    test_conversation_rows();
    test_submit_sequences_and_unread();
    test_receipts_are_monotonic();
    test_reopen_keeps_state();
    test_open_failure();
    return 0;
}

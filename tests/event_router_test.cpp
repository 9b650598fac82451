#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace marketchat;
using namespace std::chrono_literals;
using networking::Admission;
using networking::ClientId;
using test::of_type;
using test::str;

namespace json = boost::json;

namespace {

constexpr ClientId kBuyer = 1;
constexpr ClientId kSeller = 2;
constexpr ClientId kSellerTablet = 3;
constexpr ClientId kStranger = 9;

struct Harness {
    test::World w;
    std::string conv;

    Harness() {
        w.add_users({"buyer", "seller", "stranger"});
        conv = w.directory.open("buyer", "seller", "sofa-9").id;
    }

    void connect(ClientId c, const char* user) { assert(w.router.on_connect(c, user) == Admission::Accept); }

    void send(ClientId c, const json::object& obj) { w.router.on_message(c, test::frame(obj)); }

    void join(ClientId c) { send(c, {{"type", "join"}}); }

    void say(ClientId c, const std::string& text, const std::string& client_id = "") {
        json::object obj{
            {"type", "send_message"},
            {"conversationId", conv},
            {"messageType", "text"},
            {"content", text},
        };
        if (!client_id.empty()) obj["messageId"] = client_id;
        send(c, obj);
    }

    std::vector<json::object> take(ClientId c) { return w.transport.take(c); }

    // Both parties connected and joined, outboxes empty.
    void both_online() {
        connect(kBuyer, "buyer");
        connect(kSeller, "seller");
        join(kBuyer);
        join(kSeller);
        w.transport.clear();
    }
};

void test_handshake_admission() {
    Harness h;
    assert(h.w.router.on_connect(kBuyer, "buyer") == Admission::Accept);
    assert(h.w.router.on_connect(kStranger, "who-is-this") == Admission::Reject);
    assert(h.w.router.on_connect(kStranger, "") == Admission::Reject);
    assert(!h.w.router.session(kStranger));

    auto s = h.w.router.session(kBuyer);
    assert(s && s->user_id == "buyer");
    assert(chat::IDGenerator::is_well_formed(s->connection_id, chat::IDGenerator::Kind::Connection));
}

void test_auto_registration() {
    Harness h;
    networking::EventRouter::Options opts;
    opts.auto_register_users = true;
    networking::EventRouter open_router(h.w.transport, h.w.store, h.w.presence, h.w.directory, h.w.tracker,
                                        h.w.engine, h.w.push, h.w.ids, opts, h.w.clock.fn());
    assert(open_router.on_connect(kStranger, "newcomer") == Admission::Accept);
    assert(h.w.db.user_exists("newcomer"));
}

void test_join_broadcasts_presence_and_snapshot() {
    Harness h;
    h.connect(kBuyer, "buyer");
    h.connect(kSeller, "seller");
    h.join(kSeller);
    h.take(kSeller);

    h.join(kBuyer);
    auto to_seller = of_type(h.take(kSeller), "user_status");
    assert(to_seller.size() == 1);
    assert(str(to_seller[0], "userId") == "buyer" && to_seller[0].at("isOnline").as_bool());

    auto to_buyer = of_type(h.take(kBuyer), "user_status");
    bool saw_seller = false;
    for (const auto& f : to_buyer) {
        if (str(f, "userId") == "seller") saw_seller = f.at("isOnline").as_bool();
    }
    assert(saw_seller);
}

void test_send_to_online_recipient_is_delivered() {
    Harness h;
    h.both_online();
    h.say(kBuyer, "is it still available?");

    auto seller = h.take(kSeller);
    assert(seller.size() == 1);
    assert(str(seller[0], "type") == "new_message");
    assert(str(seller[0], "status") == "delivered");
    assert(str(seller[0], "senderId") == "buyer");

    auto buyer = h.take(kBuyer);
    assert(buyer.size() == 2);
    assert(str(buyer[0], "type") == "message_sent");
    assert(str(buyer[1], "type") == "message_delivered");
    assert(str(buyer[0], "messageId") == str(seller[0], "messageId"));

    assert(h.w.engine.unread_count(h.conv, "seller") == 1);
}

void test_instant_read_while_viewing() {
    Harness h;
    h.both_online();
    h.send(kSeller, {{"type", "enter_chat"}, {"conversationId", h.conv}});
    auto acks = h.take(kSeller);
    assert(acks.size() == 1 && str(acks[0], "type") == "enter_chat_success");
    // Nothing was unread, so nobody hears about a read.
    assert(h.take(kBuyer).empty());

    h.say(kBuyer, "hello");
    auto seller = h.take(kSeller);
    assert(seller.size() == 1 && str(seller[0], "status") == "read");

    auto buyer = h.take(kBuyer);
    assert(of_type(buyer, "message_sent").size() == 1);
    assert(of_type(buyer, "message_read").size() == 1);
    assert(of_type(buyer, "message_delivered").empty());
    assert(h.w.engine.unread_count(h.conv, "seller") == 0);
}

void test_instant_read_to_unreachable_viewer_is_withdrawn() {
    Harness h;
    h.both_online();
    h.send(kSeller, {{"type", "enter_chat"}, {"conversationId", h.conv}});
    h.w.transport.clear();
    h.w.transport.broken.insert(kSeller);

    h.say(kBuyer, "are you there?");
    auto buyer = h.take(kBuyer);
    assert(of_type(buyer, "message_sent").size() == 1);
    assert(of_type(buyer, "message_read").empty());
    assert(h.w.push.sent.size() == 1 && h.w.push.sent[0].recipient == "seller");
    assert(h.w.engine.pending_for("seller").size() == 1);
    assert(h.w.engine.unread_count(h.conv, "seller") == 1);

    // The next join replays it.
    h.w.transport.broken.clear();
    h.connect(kSellerTablet, "seller");
    h.join(kSellerTablet);
    auto replay = of_type(h.take(kSellerTablet), "new_message");
    assert(replay.size() == 1 && str(replay[0], "content") == "are you there?");
    assert(of_type(h.take(kBuyer), "message_delivered").size() == 1);
    assert(h.w.engine.pending_for("seller").empty());
}

void test_enter_then_leave_falls_back_to_delivered() {
    Harness h;
    h.both_online();
    h.send(kSeller, {{"type", "enter_chat"}, {"conversationId", h.conv}});
    h.send(kSeller, {{"type", "leave_chat"}, {"conversationId", h.conv}});
    auto acks = h.take(kSeller);
    assert(acks.size() == 2 && str(acks[1], "type") == "leave_chat_success");

    h.say(kBuyer, "ping");
    auto seller = h.take(kSeller);
    assert(seller.size() == 1 && str(seller[0], "status") == "delivered");
    assert(of_type(h.take(kBuyer), "message_delivered").size() == 1);
}

void test_entering_reads_backlog() {
    Harness h;
    h.both_online();
    h.say(kBuyer, "one");
    h.say(kBuyer, "two");
    h.w.transport.clear();

    h.send(kSeller, {{"type", "enter_chat"}, {"conversationId", h.conv}});
    auto reads = of_type(h.take(kBuyer), "messages_read");
    assert(reads.size() == 1);
    assert(str(reads[0], "userId") == "seller" && str(reads[0], "conversationId") == h.conv);
    // The reader gets the ack, not its own read broadcast.
    assert(of_type(h.take(kSeller), "messages_read").empty());
    assert(h.w.engine.unread_count(h.conv, "seller") == 0);
}

void test_mark_read_is_idempotent() {
    Harness h;
    h.both_online();
    h.say(kBuyer, "one");
    h.say(kBuyer, "two");
    h.w.transport.clear();

    h.send(kSeller, {{"type", "mark_read"}, {"conversationId", h.conv}});
    auto seller = h.take(kSeller);
    assert(of_type(seller, "mark_read_success").size() == 1);
    assert(of_type(seller, "messages_read").size() == 1);
    assert(of_type(h.take(kBuyer), "messages_read").size() == 1);

    h.send(kSeller, {{"type", "mark_read"}, {"conversationId", h.conv}});
    seller = h.take(kSeller);
    assert(seller.size() == 1 && str(seller[0], "type") == "mark_read_success");
    assert(h.take(kBuyer).empty());
}

void test_offline_recipient_gets_push_then_replay() {
    Harness h;
    h.connect(kBuyer, "buyer");
    h.join(kBuyer);
    h.w.transport.clear();

    h.say(kBuyer, "anyone?");
    auto buyer = h.take(kBuyer);
    assert(buyer.size() == 1 && str(buyer[0], "type") == "message_sent");
    assert(h.w.push.sent.size() == 1);
    assert(h.w.push.sent[0].recipient == "seller");
    assert(h.w.push.sent[0].body == "anyone?");
    assert(h.w.engine.pending_for("seller").size() == 1);

    h.connect(kSeller, "seller");
    h.join(kSeller);
    auto replay = of_type(h.take(kSeller), "new_message");
    assert(replay.size() == 1 && str(replay[0], "status") == "delivered");

    buyer = h.take(kBuyer);
    assert(of_type(buyer, "message_delivered").size() == 1);
    assert(of_type(buyer, "user_status").size() == 1);
    assert(h.w.engine.pending_for("seller").empty());
}

void test_broken_connection_counts_as_unreachable() {
    Harness h;
    h.both_online();
    h.w.transport.broken.insert(kSeller);

    h.say(kBuyer, "hello?");
    assert(of_type(h.take(kBuyer), "message_delivered").empty());
    assert(h.w.push.sent.size() == 1);
    assert(h.w.engine.pending_for("seller").size() == 1);
}

void test_every_device_receives() {
    Harness h;
    h.both_online();
    h.connect(kSellerTablet, "seller");
    h.join(kSellerTablet);
    h.w.transport.clear();

    h.say(kBuyer, "hi both");
    assert(h.take(kSeller).size() == 1);
    assert(h.take(kSellerTablet).size() == 1);
    assert(of_type(h.take(kBuyer), "message_delivered").size() == 1);

    // One device leaving keeps the seller online.
    h.w.router.on_disconnect(kSeller);
    assert(h.take(kBuyer).empty());
    assert(h.w.presence.get("seller").is_online);

    h.w.router.on_disconnect(kSellerTablet);
    auto status = of_type(h.take(kBuyer), "user_status");
    assert(status.size() == 1 && !status[0].at("isOnline").as_bool());
    assert(!status[0].at("lastSeen").is_null());
}

void test_one_broken_device_does_not_block_the_other() {
    Harness h;
    h.both_online();
    h.connect(kSellerTablet, "seller");
    h.join(kSellerTablet);
    h.w.transport.clear();
    h.w.transport.broken.insert(kSeller);

    h.say(kBuyer, "tablet only");
    auto tablet = of_type(h.take(kSellerTablet), "new_message");
    assert(tablet.size() == 1 && str(tablet[0], "status") == "delivered");
    assert(of_type(h.take(kBuyer), "message_delivered").size() == 1);
    assert(h.w.push.sent.empty());

    const auto history = h.w.engine.history(h.conv, "buyer", 0, std::nullopt);
    assert(history.size() == 1 && history[0].status == chat::MessageStatus::Delivered);
    assert(h.w.engine.pending_for("seller").empty());
}

void test_disconnect_clears_active_view() {
    Harness h;
    h.both_online();
    h.connect(kSellerTablet, "seller");
    h.send(kSeller, {{"type", "enter_chat"}, {"conversationId", h.conv}});
    h.w.router.on_disconnect(kSeller);
    assert(!h.w.tracker.is_active("seller", h.conv));
    h.w.transport.clear();

    h.say(kBuyer, "still there?");
    auto tablet = h.take(kSellerTablet);
    assert(tablet.size() == 1 && str(tablet[0], "status") == "delivered");
}

void test_typing_and_recording_reach_others_only() {
    Harness h;
    h.both_online();
    h.send(kBuyer, {{"type", "typing"}, {"conversationId", h.conv}, {"isTyping", true}});
    h.send(kBuyer, {{"type", "recording_indicator"}, {"conversationId", h.conv}, {"isRecording", true}});

    auto seller = h.take(kSeller);
    assert(seller.size() == 2);
    assert(str(seller[0], "type") == "user_typing" && seller[0].at("isTyping").as_bool());
    assert(str(seller[1], "type") == "recording_indicator" && str(seller[1], "userId") == "buyer");
    assert(h.take(kBuyer).empty());
}

void test_rejections() {
    Harness h;
    h.both_online();
    h.connect(kStranger, "stranger");

    h.say(kStranger, "let me in", "m-77");
    auto err = h.take(kStranger);
    assert(err.size() == 1 && str(err[0], "type") == "message_error");
    assert(str(err[0], "code") == "unauthorized");
    assert(str(err[0], "messageId") == "m-77");
    assert(h.take(kSeller).empty());

    h.send(kStranger, {{"type", "enter_chat"}, {"conversationId", h.conv}});
    err = h.take(kStranger);
    assert(str(err[0], "type") == "error" && str(err[0], "action") == "enter_chat");
    assert(str(err[0], "code") == "unauthorized");

    h.send(kStranger, {{"type", "typing"}, {"conversationId", h.conv}});
    assert(str(h.take(kStranger)[0], "code") == "unauthorized");

    h.send(kBuyer, {{"type", "enter_chat"}, {"conversationId", "conv-nope"}});
    assert(str(h.take(kBuyer)[0], "code") == "not_found");

    // Claiming to be someone else.
    h.send(kStranger, {{"type", "mark_read"}, {"conversationId", h.conv}, {"userId", "seller"}});
    assert(str(h.take(kStranger)[0], "code") == "unauthorized");

    h.w.router.on_message(kBuyer, "{broken");
    auto bad = h.take(kBuyer);
    assert(str(bad[0], "type") == "error" && str(bad[0], "code") == "invalid_payload");

    h.w.router.on_message(77, test::frame({{"type", "join"}}));
    assert(str(h.w.transport.take(77)[0], "error") == "unknown session");
}

void test_persistence_failure_reports_message_error() {
    Harness h;
    h.both_online();
    h.w.store.fail_writes = true;
    h.say(kBuyer, "lost", "m-1");
    h.w.store.fail_writes = false;

    auto buyer = h.take(kBuyer);
    assert(buyer.size() == 1 && str(buyer[0], "type") == "message_error");
    assert(str(buyer[0], "code") == "persistence_failure");
    assert(h.take(kSeller).empty());
    assert(h.w.engine.unread_count(h.conv, "seller") == 0);
}

void test_unexpected_failure_reports_internal_error() {
    Harness h;
    h.both_online();
    h.w.store.throw_unexpected = true;
    h.send(kSeller, {{"type", "mark_read"}, {"conversationId", h.conv}});
    h.w.store.throw_unexpected = false;

    auto seller = h.take(kSeller);
    assert(seller.size() == 1 && str(seller[0], "type") == "error");
    assert(str(seller[0], "code") == "internal_error");
    assert(str(seller[0], "error") == "internal error");
}

void test_resubmission_does_not_double_count() {
    Harness h;
    h.both_online();
    h.say(kBuyer, "once", "m-5");
    h.say(kBuyer, "once", "m-5");
    assert(h.w.engine.unread_count(h.conv, "seller") == 1);
    assert(h.w.engine.history(h.conv, "seller", 0, std::nullopt).size() == 1);
    assert(h.w.push.sent.empty());
}

void test_heartbeat_expiry() {
    Harness h;
    h.both_online();

    h.w.clock.advance(50000);
    h.send(kSeller, {{"type", "heartbeat"}});
    h.w.clock.advance(30000);

    auto expired = h.w.router.expire_stale(60s);
    assert(expired == std::vector<std::string>{"buyer"});
    assert(!h.w.presence.get("buyer").is_online);
    assert(h.w.presence.get("seller").is_online);

    auto status = of_type(h.take(kSeller), "user_status");
    assert(status.size() == 1 && str(status[0], "userId") == "buyer");
}

void test_conversation_queries() {
    Harness h;
    h.both_online();

    h.send(kBuyer, {{"type", "open_conversation"}, {"buyerId", "buyer"}, {"sellerId", "seller"},
                    {"productId", "sofa-9"}});
    auto opened = h.take(kBuyer);
    assert(str(opened[0], "type") == "conversation_opened");
    assert(str(opened[0].at("conversation").as_object(), "conversationId") == h.conv);

    h.connect(kStranger, "stranger");
    h.send(kStranger, {{"type", "open_conversation"}, {"buyerId", "buyer"}, {"sellerId", "seller"}});
    assert(str(h.take(kStranger).back(), "code") == "unauthorized");

    h.say(kBuyer, "first");
    h.say(kBuyer, "second");
    h.w.transport.clear();

    h.send(kSeller, {{"type", "list_conversations"}});
    auto list = h.take(kSeller);
    const auto& items = list[0].at("items").as_array();
    assert(items.size() == 1);
    assert(items[0].as_object().at("unreadCount").to_number<int>() == 2);

    h.send(kSeller, {{"type", "fetch_messages"}, {"conversationId", h.conv}, {"limit", 1}});
    auto page = h.take(kSeller)[0].at("items").as_array();
    assert(page.size() == 1 && str(page[0].as_object(), "content") == "second");

    h.send(kSeller, {{"type", "get_status"}, {"userId", "buyer"}});
    auto status = h.take(kSeller);
    assert(str(status[0], "type") == "user_status" && status[0].at("isOnline").as_bool());
}

} // namespace

int main() {
    test_handshake_admission();
    test_auto_registration();
    test_join_broadcasts_presence_and_snapshot();
    test_send_to_online_recipient_is_delivered();
    test_instant_read_while_viewing();
    test_instant_read_to_unreachable_viewer_is_withdrawn();
    test_enter_then_leave_falls_back_to_delivered();
    test_entering_reads_backlog();
    test_mark_read_is_idempotent();
    test_offline_recipient_gets_push_then_replay();
    test_broken_connection_counts_as_unreachable();
    test_every_device_receives();
    test_one_broken_device_does_not_block_the_other();
    test_disconnect_clears_active_view();
    test_typing_and_recording_reach_others_only();
    test_rejections();
    test_persistence_failure_reports_message_error();
    test_unexpected_failure_reports_internal_error();
    test_resubmission_does_not_double_count();
    test_heartbeat_expiry();
    test_conversation_queries();
    return 0;
}

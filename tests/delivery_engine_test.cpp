#include "test_support.hpp"

#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace marketchat;
using chat::ErrorKind;
using chat::MessageStatus;

namespace {

struct Fixture {
    test::World w;
    std::string conv;

    Fixture() {
        w.add_users({"buyer", "seller", "stranger"});
        conv = w.directory.open("buyer", "seller", "car-1").id;
    }

    chat::SubmitResult send(const std::string& from, const std::string& text, const std::string& client_id = "") {
        chat::MessageDraft d;
        d.client_id = client_id;
        d.content = "\"" + text + "\"";
        d.caption = text;
        return w.engine.submit(conv, from, d);
    }
};

template <typename Fn>
ErrorKind error_of(Fn&& fn) {
    try {
        fn();
    } catch (const chat::ChatError& e) {
        return e.kind();
    }
    assert(false && "expected ChatError");
    return ErrorKind::TransportFailure;
}

void test_submit_to_inactive_recipient() {
    Fixture f;
    auto r = f.send("buyer", "hi");
    assert(!r.duplicate);
    assert(r.recipients.size() == 1);
    assert(r.recipients[0].recipient == "seller" && r.recipients[0].status == MessageStatus::Sent);
    assert(r.message.status == MessageStatus::Sent);
    assert(r.message.sequence == 1);
    assert(chat::IDGenerator::is_well_formed(r.message.id, chat::IDGenerator::Kind::Message));

    assert(f.w.engine.unread_count(f.conv, "seller") == 1);
    assert(f.w.engine.unread_count(f.conv, "buyer") == 0);

    auto conv = f.w.store.load_conversation(f.conv);
    assert(conv->last_message && conv->last_message->text == "hi" && conv->last_message->sender == "buyer");
}

void test_instant_read_when_recipient_is_viewing() {
    Fixture f;
    f.w.tracker.enter("seller", f.conv);

    auto r = f.send("buyer", "are you there?");
    assert(r.recipients[0].status == MessageStatus::Read);
    assert(r.message.status == MessageStatus::Read);
    assert(f.w.engine.unread_count(f.conv, "seller") == 0);
    assert(f.w.store.receipts_of(r.message.id)[0].status == MessageStatus::Read);

    // Viewing some other conversation does not count.
    f.w.tracker.enter("seller", "conv-elsewhere");
    auto r2 = f.send("buyer", "hello?");
    assert(r2.recipients[0].status == MessageStatus::Sent);
    assert(f.w.engine.unread_count(f.conv, "seller") == 1);
}

void test_withdrawn_instant_read_is_pending_again() {
    Fixture f;
    f.w.tracker.enter("seller", f.conv);
    auto r = f.send("buyer", "ping");
    assert(f.w.engine.pending_for("seller").empty());

    assert(f.w.engine.withdraw_instant_read(r.message.id, "seller"));
    assert(f.w.store.receipts_of(r.message.id)[0].status == MessageStatus::Sent);
    assert(f.w.store.load_message(r.message.id)->status == MessageStatus::Sent);
    assert(f.w.engine.unread_count(f.conv, "seller") == 1);
    assert(f.w.engine.pending_for("seller").size() == 1);

    // Only a read receipt can be withdrawn.
    assert(!f.w.engine.withdraw_instant_read(r.message.id, "seller"));
    assert(f.w.engine.unread_count(f.conv, "seller") == 1);
    assert(error_of([&] { f.w.engine.withdraw_instant_read("msg-missing", "seller"); }) == ErrorKind::NotFound);
}

void test_unread_counts_are_per_user() {
    Fixture f;
    f.send("buyer", "one");
    f.send("buyer", "two");
    f.send("seller", "reply");
    assert(f.w.engine.unread_count(f.conv, "seller") == 2);
    assert(f.w.engine.unread_count(f.conv, "buyer") == 1);

    auto read = f.w.engine.mark_read(f.conv, "seller");
    assert(read.changed());
    assert(read.transitions.size() == 2);
    assert(read.previous_unread == 2);
    assert(f.w.engine.unread_count(f.conv, "seller") == 0);
    assert(f.w.engine.unread_count(f.conv, "buyer") == 1);
}

void test_mark_read_is_idempotent() {
    Fixture f;
    f.send("buyer", "one");
    assert(f.w.engine.mark_read(f.conv, "seller").changed());

    auto second = f.w.engine.mark_read(f.conv, "seller");
    assert(!second.changed());
    assert(f.w.engine.unread_count(f.conv, "seller") == 0);
}

void test_status_only_moves_forward() {
    Fixture f;
    auto r = f.send("buyer", "one");
    const auto& id = r.message.id;

    assert(f.w.engine.mark_delivered(id, "seller"));
    assert(!f.w.engine.mark_delivered(id, "seller"));
    assert(f.w.store.load_message(id)->status == MessageStatus::Delivered);

    f.w.engine.mark_read(f.conv, "seller");
    assert(f.w.store.load_message(id)->status == MessageStatus::Read);

    // A delivery ack that arrives late is ignored.
    assert(!f.w.engine.mark_delivered(id, "seller"));
    assert(f.w.store.load_message(id)->status == MessageStatus::Read);

    assert(error_of([&] { f.w.engine.mark_delivered("msg-missing", "seller"); }) == ErrorKind::NotFound);
}

void test_authorization_and_validation() {
    Fixture f;
    assert(error_of([&] { f.send("stranger", "let me in"); }) == ErrorKind::Unauthorized);
    assert(error_of([&] { f.w.engine.mark_read(f.conv, "stranger"); }) == ErrorKind::Unauthorized);
    assert(error_of([&] { f.w.engine.history(f.conv, "stranger", 10, std::nullopt); }) ==
           ErrorKind::Unauthorized);

    chat::MessageDraft empty;
    assert(error_of([&] { f.w.engine.submit(f.conv, "buyer", empty); }) == ErrorKind::InvalidPayload);

    chat::MessageDraft d;
    d.content = "\"x\"";
    assert(error_of([&] { f.w.engine.submit("conv-missing", "buyer", d); }) == ErrorKind::NotFound);

    d.client_id = std::string(chat::DeliveryEngine::kMaxClientIdLength + 1, 'a');
    assert(error_of([&] { f.w.engine.submit(f.conv, "buyer", d); }) == ErrorKind::InvalidPayload);

    // Nothing was stored along the way.
    assert(f.w.engine.history(f.conv, "buyer", 0, std::nullopt).empty());
}

void test_resubmission_reuses_the_message() {
    Fixture f;
    auto first = f.send("buyer", "hi", "client-123");
    assert(first.message.id == "client-123");

    auto again = f.send("buyer", "hi", "client-123");
    assert(again.duplicate);
    assert(again.message.id == "client-123");
    assert(again.message.sequence == first.message.sequence);
    assert(f.w.engine.unread_count(f.conv, "seller") == 1);
    assert(f.w.engine.history(f.conv, "buyer", 0, std::nullopt).size() == 1);

    // Someone else reusing the id is refused.
    assert(error_of([&] { f.send("seller", "hi", "client-123"); }) == ErrorKind::InvalidPayload);
}

void test_persistence_failure_is_atomic() {
    Fixture f;
    f.w.store.fail_writes = true;
    assert(error_of([&] { f.send("buyer", "lost"); }) == ErrorKind::PersistenceFailure);
    f.w.store.fail_writes = false;

    assert(f.w.engine.unread_count(f.conv, "seller") == 0);
    assert(f.w.engine.history(f.conv, "buyer", 0, std::nullopt).empty());
    assert(f.w.engine.pending_for("seller").empty());
}

void test_history_and_pending() {
    Fixture f;
    for (int i = 0; i < 5; ++i) f.send("buyer", "m" + std::to_string(i));

    auto page = f.w.engine.history(f.conv, "seller", 2, std::nullopt);
    assert(page.size() == 2);
    assert(page[0].sequence == 4 && page[1].sequence == 5);

    auto older = f.w.engine.history(f.conv, "seller", 10, page[0].sequence);
    assert(older.size() == 3 && older.front().sequence == 1);

    auto pending = f.w.engine.pending_for("seller");
    assert(pending.size() == 5);
    f.w.engine.mark_delivered(pending[0].id, "seller");
    assert(f.w.engine.pending_for("seller").size() == 4);
    assert(f.w.engine.pending_for("buyer").empty());
}

void test_submit_and_read_race() {
    // Whatever the interleaving, every message ends up read and the
    // counter at zero once the last mark_read has run.
    Fixture f;
    f.w.tracker.enter("seller", f.conv);

    std::thread sender([&] {
        for (int i = 0; i < 50; ++i) f.send("buyer", "burst");
    });
    std::thread reader([&] {
        for (int i = 0; i < 50; ++i) f.w.engine.mark_read(f.conv, "seller");
    });
    sender.join();
    reader.join();
    f.w.engine.mark_read(f.conv, "seller");

    assert(f.w.engine.unread_count(f.conv, "seller") == 0);
    for (const auto& m : f.w.engine.history(f.conv, "seller", chat::DeliveryEngine::kMaxHistory, std::nullopt)) {
        assert(m.status == MessageStatus::Read);
    }
}

} // namespace

int main() {
    test_submit_to_inactive_recipient();
    test_instant_read_when_recipient_is_viewing();
    test_withdrawn_instant_read_is_pending_again();
    test_unread_counts_are_per_user();
    test_mark_read_is_idempotent();
    test_status_only_moves_forward();
    test_authorization_and_validation();
    test_resubmission_reuses_the_message();
    test_persistence_failure_is_atomic();
    test_history_and_pending();
    test_submit_and_read_race();
    return 0;
}

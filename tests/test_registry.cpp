#include <doctest/doctest.h>
#include "chunkwire/registry.hpp"
#include "test_support.hpp"

using namespace chunkwire;
using testsupport::ScriptedChannel;
using testsupport::VectorSinkProvider;
using testsupport::chain_of;
using testsupport::pattern;
using testsupport::test_key;
using testsupport::tid;

static std::shared_ptr<Sender> streaming_sender(ScriptedChannel& ch, const char* id) {
    auto s = std::make_shared<Sender>(default_config(), test_key());
    Error err;
    auto src = std::make_unique<SliceSource>(std::make_unique<MemoryRangeReader>(pattern(100)), 16384);
    REQUIRE(s->start(std::move(src), tid(id), ch, {}, 0, err));
    return s;
}

TEST_CASE("Registry: one sender and one receiver per id") {
    TransferRegistry reg;
    ScriptedChannel ch;
    CHECK(reg.empty());

    auto s = streaming_sender(ch, "a");
    CHECK(reg.add_sender(tid("a"), s));
    CHECK_FALSE(reg.add_sender(tid("a"), streaming_sender(ch, "a")));
    CHECK_FALSE(reg.add_sender(tid("b"), nullptr));

    auto r = std::make_shared<Receiver>(tid("a"), "f", 10);
    CHECK(reg.add_receiver(tid("a"), r));            // same id, other direction
    CHECK_FALSE(reg.add_receiver(tid("a"), std::make_shared<Receiver>(tid("a"), "f", 10)));

    CHECK(reg.find_sender(tid("a")) == s);
    CHECK(reg.find_receiver(tid("a")) == r);
    CHECK_FALSE(reg.find_sender(tid("zzz")));
    CHECK(reg.sender_count() == 1);
    CHECK(reg.receiver_count() == 1);

    CHECK(reg.remove_sender(tid("a")));
    CHECK_FALSE(reg.remove_sender(tid("a")));
    CHECK(reg.remove_receiver(tid("a")));
    CHECK(reg.empty());
}

TEST_CASE("Registry: cancel removes sender and receiver at once") {
    TransferRegistry reg;
    ScriptedChannel ch;
    auto s = streaming_sender(ch, "x");
    reg.add_sender(tid("x"), s);

    std::vector<uint8_t> out;
    auto r = std::make_shared<Receiver>(tid("x"), "f", 10);
    Error err;
    REQUIRE(r->start(chain_of(std::make_unique<VectorSinkProvider>(&out)), {}, 0, err));
    reg.add_receiver(tid("x"), r);

    CHECK(reg.cancel_sender(tid("x")));
    CHECK(reg.sender_count() == 0);
    CHECK_FALSE(s->active());
    CHECK(reg.add_sender(tid("x"), streaming_sender(ch, "x")));   // id is free again

    CHECK(reg.cancel_receiver(tid("x")));
    CHECK(reg.receiver_count() == 0);
    CHECK(r->state() == Receiver::State::Cancelled);

    s->tick(1);                                       // a held reference winds down
    CHECK(s->state() == Sender::State::Cancelled);
    CHECK(reg.sweep() == 0);
    CHECK(reg.sender_count() == 1);

    CHECK_FALSE(reg.cancel_receiver(tid("x")));
}

TEST_CASE("Registry sweep drops terminal sessions") {
    TransferRegistry reg;
    ScriptedChannel ch;
    auto s = streaming_sender(ch, "done");
    reg.add_sender(tid("done"), s);
    auto r = std::make_shared<Receiver>(tid("done"), "f", 0);
    reg.add_receiver(tid("done"), r);

    CHECK(reg.sweep() == 0);
    s->tick(0);                                       // 100 bytes fit one chunk
    REQUIRE(s->state() == Sender::State::Completed);
    CHECK(reg.sweep() == 1);
    CHECK(reg.sender_count() == 0);
    CHECK(reg.receiver_count() == 1);
}

TEST_CASE("Registry snapshots survive removal during iteration") {
    TransferRegistry reg;
    ScriptedChannel ch;
    reg.add_sender(tid("a"), streaming_sender(ch, "a"));
    reg.add_sender(tid("b"), streaming_sender(ch, "b"));

    auto snap = reg.senders();
    REQUIRE(snap.size() == 2);
    for (const auto& s : snap) reg.remove_sender(s->transfer_id());
    CHECK(reg.empty());
    CHECK(snap[0]->state() == Sender::State::Streaming);
}

TEST_CASE("Registry clear cancels everything") {
    TransferRegistry reg;
    ScriptedChannel ch;
    auto s = streaming_sender(ch, "a");
    reg.add_sender(tid("a"), s);
    auto r = std::make_shared<Receiver>(tid("b"), "f", 10);
    reg.add_receiver(tid("b"), r);

    reg.clear();
    CHECK(reg.empty());
    CHECK_FALSE(s->active());
    CHECK(r->state() == Receiver::State::Cancelled);
}

#include <doctest/doctest.h>
#include <algorithm>
#include "chunkwire/receiver.hpp"
#include "test_support.hpp"

using namespace chunkwire;
using testsupport::Events;
using testsupport::VectorSinkProvider;
using testsupport::chain_of;
using testsupport::pattern;
using testsupport::tid;

// Split @p data into chunk_size slices; index == sequence.
static std::vector<std::vector<uint8_t>> slices(const std::vector<uint8_t>& data, size_t chunk) {
    std::vector<std::vector<uint8_t>> out;
    for (size_t off = 0; off < data.size(); off += chunk) {
        const size_t n = std::min(chunk, data.size() - off);
        out.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(off),
                         data.begin() + static_cast<std::ptrdiff_t>(off + n));
    }
    return out;
}

struct Rig {
    std::vector<uint8_t> out;
    bool closed{false};
    bool aborted{false};
    bool gate{true};
    Events ev;
    VectorSinkProvider* provider{nullptr};
    std::unique_ptr<Receiver> rx;

    explicit Rig(uint64_t declared) {
        rx = std::make_unique<Receiver>(tid("rx"), "file.bin", declared);
    }
    SinkChain chain() {
        auto p = std::make_unique<VectorSinkProvider>(&out);
        p->closed  = &closed;
        p->aborted = &aborted;
        p->gate    = &gate;
        provider = p.get();
        return chain_of(std::move(p));
    }
    void start() {
        Error err;
        REQUIRE(rx->start(chain(), ev.callbacks(), 0, err));
    }
};

TEST_CASE("Receiver writes chunks in sequence order whatever the arrival order") {
    const auto data = pattern(10);
    const auto parts = slices(data, 4);
    std::vector<size_t> order{ 0, 1, 2 };

    do {
        Rig r(10);
        r.start();
        for (size_t i : order) r.rx->on_chunk(static_cast<uint32_t>(i), parts[i], 1);

        CHECK(r.out == data);
        CHECK(r.ev.complete == 1);
        CHECK(r.closed);
        CHECK(r.rx->state() == Receiver::State::Completed);
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_CASE("Receiver holds out-of-order chunks until the gap fills") {
    const auto parts = slices(pattern(12), 4);
    Rig r(12);
    r.start();

    r.rx->on_chunk(2, parts[2], 1);
    r.rx->on_chunk(1, parts[1], 1);
    CHECK(r.out.empty());
    CHECK(r.rx->pending_count() == 2);
    CHECK(r.rx->next_expected() == 0);
    CHECK(r.rx->bytes_received() == 8);
    CHECK(r.rx->bytes_written() == 0);

    r.rx->on_chunk(0, parts[0], 1);
    CHECK(r.rx->pending_count() == 0);
    CHECK(r.rx->bytes_written() == 12);
    CHECK(r.ev.complete == 1);
}

TEST_CASE("Receiver completes only at the declared byte count") {
    const auto parts = slices(pattern(10), 4);
    Rig r(10);
    r.start();
    r.rx->on_chunk(0, parts[0], 1);
    r.rx->on_chunk(1, parts[1], 1);

    CHECK(r.rx->state() == Receiver::State::Active);
    CHECK(r.ev.complete == 0);
    CHECK_FALSE(r.closed);
    CHECK(r.ev.progress == 2);
    CHECK(r.ev.last_pct == doctest::Approx(80.0));
}

TEST_CASE("Receiver stages chunks that arrive before the sink is ready") {
    const auto data = pattern(10);
    const auto parts = slices(data, 4);
    Rig r(10);
    r.gate = false;
    r.start();
    CHECK(r.rx->state() == Receiver::State::AwaitingSink);
    CHECK_FALSE(r.rx->ready());
    CHECK(r.rx->next_wakeup_ms() == 50);

    r.rx->on_chunk(1, parts[1], 5);
    r.rx->on_chunk(0, parts[0], 6);
    CHECK(r.rx->early_count() == 2);
    CHECK(r.out.empty());

    r.rx->tick(50);
    CHECK(r.rx->state() == Receiver::State::AwaitingSink);
    CHECK(r.provider->open_calls == 2);

    r.gate = true;
    r.rx->tick(100);
    CHECK(r.rx->ready());
    CHECK(r.rx->early_count() == 0);
    CHECK(std::string(r.rx->sink_kind()) == "vector");
    CHECK(r.rx->bytes_written() == 8);

    r.rx->on_chunk(2, parts[2], 101);
    CHECK(r.out == data);
    CHECK(r.ev.complete == 1);
}

TEST_CASE("Receiver ignores duplicates") {
    const auto data = pattern(8);
    const auto parts = slices(data, 4);
    Rig r(8);
    r.start();

    r.rx->on_chunk(0, parts[0], 1);
    r.rx->on_chunk(0, parts[0], 2);              // already written
    CHECK(r.rx->bytes_received() == 4);

    Rig g(12);
    g.start();
    const auto more = slices(pattern(12), 4);
    g.rx->on_chunk(2, more[2], 1);
    g.rx->on_chunk(2, more[2], 2);               // already pending
    CHECK(g.rx->bytes_received() == 4);
    CHECK(g.rx->pending_count() == 1);
    CHECK(g.ev.error == 0);

    r.rx->on_chunk(1, parts[1], 3);
    CHECK(r.out == data);
    CHECK(r.ev.complete == 1);
}

TEST_CASE("Receiver fails a chunk that would overrun the declared size") {
    Rig r(5);
    r.start();
    r.rx->on_chunk(0, pattern(4), 1);
    r.rx->on_chunk(1, pattern(4), 2);

    CHECK(r.rx->state() == Receiver::State::Failed);
    CHECK(r.ev.error == 1);
    CHECK(r.ev.last_error.kind == ErrorKind::Sink);
    CHECK(r.aborted);
    CHECK(r.ev.complete == 0);
}

TEST_CASE("Receiver: zero-byte transfer completes as soon as the sink is ready") {
    Rig r(0);
    r.start();
    CHECK(r.rx->state() == Receiver::State::Completed);
    CHECK(r.ev.complete == 1);
    CHECK(r.closed);
    CHECK(r.out.empty());
}

TEST_CASE("Receiver: write failure is a Sink error and aborts the writer") {
    Rig r(12);
    SinkChain c = r.chain();
    r.provider->fail_write_at = 1;
    Error err;
    REQUIRE(r.rx->start(std::move(c), r.ev.callbacks(), 0, err));

    const auto parts = slices(pattern(12), 4);
    r.rx->on_chunk(0, parts[0], 1);
    r.rx->on_chunk(1, parts[1], 2);

    CHECK(r.rx->state() == Receiver::State::Failed);
    CHECK(r.ev.error == 1);
    CHECK(r.ev.last_error.kind == ErrorKind::Sink);
    CHECK(r.ev.last_error.message.find("disk full") != std::string::npos);
    CHECK(r.aborted);

    r.rx->on_chunk(2, parts[2], 3);              // terminal: dropped
    CHECK(r.ev.error == 1);
}

TEST_CASE("Receiver: close failure is a Sink error") {
    Rig r(4);
    SinkChain c = r.chain();
    r.provider->fail_close = true;
    Error err;
    REQUIRE(r.rx->start(std::move(c), r.ev.callbacks(), 0, err));

    r.rx->on_chunk(0, pattern(4), 1);
    CHECK(r.rx->state() == Receiver::State::Failed);
    CHECK(r.ev.last_error.kind == ErrorKind::Sink);
    CHECK(r.ev.complete == 0);
}

TEST_CASE("Receiver: no usable sink fails with the reasons") {
    std::vector<uint8_t> out;
    auto p = std::make_unique<VectorSinkProvider>(&out);
    p->unavailable = true;

    Events ev;
    Receiver rx(tid("x"), "f", 10);
    Error err;
    REQUIRE(rx.start(chain_of(std::move(p)), ev.callbacks(), 0, err));
    CHECK(rx.state() == Receiver::State::Failed);
    CHECK(ev.error == 1);
    CHECK(ev.last_error.kind == ErrorKind::Sink);
    CHECK(ev.last_error.message.find("vector: not here") != std::string::npos);
}

TEST_CASE("Receiver cancel aborts without callbacks") {
    Rig r(12);
    r.start();
    r.rx->on_chunk(0, pattern(4), 1);
    r.rx->on_chunk(2, pattern(4), 1);

    r.rx->cancel();
    CHECK(r.rx->state() == Receiver::State::Cancelled);
    CHECK(r.aborted);
    CHECK(r.rx->pending_count() == 0);
    CHECK(r.ev.error == 0);
    CHECK(r.ev.complete == 0);

    r.rx->on_chunk(1, pattern(4), 2);
    CHECK(r.ev.complete == 0);
    CHECK(r.rx->next_wakeup_ms() == UINT64_MAX);
}

TEST_CASE("Receiver flushes chunks behind a sequence gap when the byte count is reached") {
    const auto a = pattern(4, 1);
    const auto b = pattern(4, 2);
    Rig r(8);
    r.start();
    r.rx->on_chunk(0, a, 1);
    r.rx->on_chunk(2, b, 2);                     // sequence 1 never comes

    std::vector<uint8_t> expect = a;
    expect.insert(expect.end(), b.begin(), b.end());
    CHECK(r.rx->state() == Receiver::State::Completed);
    CHECK(r.out == expect);
    CHECK(r.ev.complete == 1);
}

TEST_CASE("Receiver start twice is refused") {
    Rig r(4);
    r.start();
    Error err;
    CHECK_FALSE(r.rx->start(SinkChain(), {}, 0, err));
    CHECK(err.kind == ErrorKind::Config);
    CHECK(std::string(to_string(r.rx->state())) == "active");
}

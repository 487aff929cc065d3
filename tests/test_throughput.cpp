#include <doctest/doctest.h>
#include "chunkwire/throughput.hpp"

using namespace chunkwire;

TEST_CASE("Throughput needs two samples") {
    ThroughputMeter m;
    CHECK(m.bytes_per_second() == 0.0);
    m.record(0, 0);
    CHECK(m.bytes_per_second() == 0.0);
    m.record(500, 1000);
    CHECK(m.bytes_per_second() == doctest::Approx(2000.0));
}

TEST_CASE("Same-millisecond samples collapse") {
    ThroughputMeter m;
    m.record(0, 0);
    m.record(100, 100);
    m.record(100, 300);
    CHECK(m.bytes_per_second() == doctest::Approx(3000.0));
}

TEST_CASE("Old samples fall out of the window") {
    ThroughputMeter m(1000);
    m.record(0, 0);
    m.record(100, 1000000);          // burst early on
    m.record(2000, 1000100);
    m.record(2500, 1000600);
    // Window now anchored near the recent samples, not the burst.
    CHECK(m.bytes_per_second() < 2000.0);
    CHECK(m.bytes_per_second() > 0.0);

    m.reset();
    CHECK(m.bytes_per_second() == 0.0);
}

TEST_CASE("Sample ring never overflows") {
    ThroughputMeter m(100000);
    for (uint64_t t = 0; t < 100; ++t) m.record(t * 10, t * 100);
    CHECK(m.bytes_per_second() == doctest::Approx(10000.0));
}

TEST_CASE("format_bytes") {
    CHECK(format_bytes(0) == "0 B");
    CHECK(format_bytes(512) == "512 B");
    CHECK(format_bytes(1023) == "1023 B");
    CHECK(format_bytes(1024) == "1.00 KB");
    CHECK(format_bytes(1536) == "1.50 KB");
    CHECK(format_bytes(2 * 1024 * 1024) == "2.00 MB");
    CHECK(format_bytes(1342177280ull) == "1.25 GB");
    CHECK(format_bytes(3ull << 40) == "3.00 TB");
    CHECK(format_bytes(5000ull << 40) == "5000.00 TB");
}

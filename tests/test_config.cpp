#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include "chunkwire/config.hpp"
#include "chunkwire/packet.hpp"

using namespace chunkwire;

TEST_CASE("Default config validates and matches the unified profile") {
    TransferConfig c = default_config();
    Error err;
    CHECK(c.validate(err));
    CHECK(c.chunk_size == 16 * 1024);
    CHECK(c.buffer_threshold == 64 * 1024);
    CHECK(c.send_delay_ms == 0);
    CHECK(c.max_retries == 3);
    CHECK(c.max_poll_attempts == 50);

    TransferConfig u;
    REQUIRE(preset("unified", u));
    CHECK(u.chunk_size == c.chunk_size);
}

TEST_CASE("Every named profile exists and validates") {
    for (const auto& name : preset_names()) {
        TransferConfig c;
        REQUIRE(preset(name, c));
        Error err;
        CHECK_MESSAGE(c.validate(err), name);
        CHECK_MESSAGE(c.retry_budget_ms() < c.stall_timeout_ms, name);
    }
    TransferConfig c;
    CHECK_FALSE(preset("warp", c));
}

TEST_CASE("Profile values") {
    TransferConfig c;
    REQUIRE(preset("robust", c));
    CHECK(c.chunk_size == 1024);
    CHECK(c.max_retries == 10);
    CHECK(c.stall_timeout_ms == 30000);
    CHECK(c.max_poll_attempts == 10);
    CHECK(c.retry_budget_ms() == 100 * 20 + 10 * (10 * 200 + 500));

    REQUIRE(preset("slow", c));
    CHECK(c.stall_timeout_ms == 90000);

    REQUIRE(preset("lan", c));
    CHECK(c.chunk_size == 64 * 1024);
    CHECK(c.buffer_threshold == 128 * 1024);
}

TEST_CASE("Validate rejects zero fields and oversize chunks") {
    Error err;
    TransferConfig c;

    c.chunk_size = 0;
    CHECK_FALSE(c.validate(err));
    CHECK(err.kind == ErrorKind::Config);

    c = default_config();
    c.buffer_threshold = 0;
    CHECK_FALSE(c.validate(err));

    c = default_config();
    c.backoff_base_ms = 2000;
    CHECK_FALSE(c.validate(err));

    c = default_config();
    c.chunk_size = c.max_message_size - PACKET_HEADER_MAX;      // exactly fits
    CHECK(c.validate(err));
    c.chunk_size += 1;
    CHECK_FALSE(c.validate(err));
    c.chunk_size = c.max_message_size + 10;
    CHECK_FALSE(c.validate(err));
}

TEST_CASE("Validate rejects a retry budget that outlasts the stall window") {
    Error err;
    TransferConfig c = default_config();
    CHECK(c.retry_budget_ms() == 3 * (50 * 200 + 1000));

    c.stall_timeout_ms = 33000;                // equal is not enough
    CHECK_FALSE(c.validate(err));
    CHECK(err.kind == ErrorKind::Config);
    CHECK(err.message == "retry budget outlasts stall_timeout_ms");
    c.stall_timeout_ms = 33001;
    CHECK(c.validate(err));

    c = default_config();
    c.max_poll_attempts = 200;                 // 3 * (40 s + 1 s) > 60 s
    CHECK_FALSE(c.validate(err));

    c = default_config();
    c.max_retries = 0;                         // still one full wait
    c.stall_timeout_ms = 10000;
    CHECK_FALSE(c.validate(err));

    c = default_config();
    c.send_delay_ms = 1000;                    // worst pacing is 20 s on top
    c.stall_timeout_ms = 50000;
    CHECK_FALSE(c.validate(err));

    CHECK_FALSE(load_config_json(R"({"max_retries": 20})", c, err));
    CHECK(err.message == "retry budget outlasts stall_timeout_ms");
}

TEST_CASE("JSON config: profile first, then field overrides") {
    TransferConfig c = default_config();
    Error err;
    REQUIRE(load_config_json(R"({"chunk_size": 2048, "profile": "slow", "max_retries": 7})", c, err));
    CHECK(c.chunk_size == 2048);               // override beats profile regardless of key order
    CHECK(c.buffer_threshold == 32 * 1024);    // from "slow"
    CHECK(c.send_delay_ms == 100);
    CHECK(c.max_retries == 7);
}

TEST_CASE("JSON config errors leave the config untouched") {
    TransferConfig c = default_config();
    Error err;

    CHECK_FALSE(load_config_json("{not json", c, err));
    CHECK(err.kind == ErrorKind::Config);

    CHECK_FALSE(load_config_json("[1,2]", c, err));
    CHECK_FALSE(load_config_json(R"({"profile": "warp"})", c, err));
    CHECK_FALSE(load_config_json(R"({"chunk_size": -1})", c, err));
    CHECK_FALSE(load_config_json(R"({"chunk_size": "big"})", c, err));
    CHECK_FALSE(load_config_json(R"({"send_delay_ms": 99999999999})", c, err));
    CHECK(err.message == "send_delay_ms is out of range");

    CHECK_FALSE(load_config_json(R"({"chunk_sz": 10})", c, err));
    CHECK(err.message == "unknown key: chunk_sz");

    CHECK_FALSE(load_config_json(R"({"max_retries": 9, "chunk_size": 0})", c, err));
    CHECK(c.max_retries == 3);                 // partial overrides not applied

    CHECK(c.chunk_size == 16 * 1024);
}

TEST_CASE("JSON config from a file") {
    const std::string path = "chunkwire_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"profile": "wan", "stall_timeout_ms": 45000})";
    }
    TransferConfig c;
    Error err;
    REQUIRE(load_config_file(path, c, err));
    CHECK(c.chunk_size == 8 * 1024);
    CHECK(c.stall_timeout_ms == 45000);
    std::remove(path.c_str());

    CHECK_FALSE(load_config_file("does/not/exist.json", c, err));
    CHECK(err.kind == ErrorKind::Config);
}

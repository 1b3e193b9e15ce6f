// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/range_fetcher.hpp>
#include "test_support.hpp"

using namespace haul;
using namespace haul::core;
using haul::test::Fault;
using haul::test::FakeTransport;

namespace fs = std::filesystem;

namespace {

EngineConfig fast_retry_config(std::uint32_t attempts = 3) {
    EngineConfig config;
    config.retry.max_attempts = attempts;
    config.retry.base_delay = std::chrono::milliseconds{1};
    config.retry.max_delay = std::chrono::milliseconds{4};
    return config;
}

ChunkSpec chunk_of(std::uint32_t index, std::uint64_t start, std::uint64_t end) {
    ChunkSpec c;
    c.index = index;
    c.start = start;
    c.end = end;
    return c;
}

} // namespace

TEST_CASE("RangeFetcher writes a ranged chunk", "[fetcher]") {
    test::TempDir dir;
    const auto payload = test::make_payload(4000);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto config = fast_retry_config();
    disk::ChunkFileStore store(dir.file("out.bin"), config.cleanup, nullptr);
    RangeFetcher fetcher("http://host/file", transport, store, config, false, payload.size(), nullptr);

    auto chunk = chunk_of(1, 1000, 2999);
    auto result = fetcher.fetch(chunk, {});

    REQUIRE(result.has_value());
    CHECK(*result == 2000);
    CHECK(chunk.state == ChunkState::done);
    CHECK(chunk.attempts == 1);
    CHECK(fetcher.received() == 2000);
    CHECK(store.is_done(chunk));
    CHECK(test::read_file(store.chunk_path(chunk)) == payload.substr(1000, 2000));

    auto gets = transport->gets();
    REQUIRE(gets.size() == 1);
    REQUIRE(gets[0].range.has_value());
    CHECK(gets[0].range->start == 1000);
    CHECK(gets[0].range->end == 2999);
}

TEST_CASE("RangeFetcher retries transient failures", "[fetcher][retry]") {
    test::TempDir dir;
    const auto payload = test::make_payload(2000);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto config = fast_retry_config(3);
    disk::ChunkFileStore store(dir.file("out.bin"), config.cleanup, nullptr);
    RangeFetcher fetcher("http://host/file", transport, store, config, false, payload.size(), nullptr);
    auto chunk = chunk_of(0, 0, 999);

    SECTION("Connection lost then success") {
        transport->add_fault(0, Fault{Fault::Kind::transport, NetErrc::connection_lost});

        auto result = fetcher.fetch(chunk, {});

        REQUIRE(result.has_value());
        CHECK(chunk.attempts == 2);
        CHECK(transport->gets().size() == 2);
        CHECK(test::read_file(store.chunk_path(chunk)) == payload.substr(0, 1000));
    }

    SECTION("Short body is retried and its bytes are discounted") {
        transport->add_fault(0, Fault{Fault::Kind::short_body});

        auto result = fetcher.fetch(chunk, {});

        REQUIRE(result.has_value());
        CHECK(chunk.attempts == 2);
        CHECK(fetcher.received() == 1000);
        CHECK(test::read_file(store.chunk_path(chunk)) == payload.substr(0, 1000));
    }

    SECTION("Long body is rejected before overrunning the chunk") {
        transport->add_fault(0, Fault{Fault::Kind::long_body});

        auto result = fetcher.fetch(chunk, {});

        REQUIRE(result.has_value());
        CHECK(chunk.attempts == 2);
        CHECK(fs::file_size(store.chunk_path(chunk)) == 1000);
    }

    SECTION("503 is retried") {
        transport->add_fault(0, Fault{Fault::Kind::status, NetErrc::success, 503});

        auto result = fetcher.fetch(chunk, {});

        REQUIRE(result.has_value());
        CHECK(chunk.attempts == 2);
    }

    SECTION("Retries exhausted") {
        for (int i = 0; i < 3; ++i) {
            transport->add_fault(0, Fault{Fault::Kind::transport, NetErrc::timeout});
        }

        auto result = fetcher.fetch(chunk, {});

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::chunk_fetch_exhausted));
        CHECK(result.error().cause == NetErrc::timeout);
        CHECK(result.error().chunk_index == std::optional<std::uint32_t>{0});
        CHECK(result.error().attempt == std::optional<std::uint32_t>{3});
        CHECK(chunk.state == ChunkState::failed);
        CHECK(transport->gets().size() == 3);
        CHECK(fetcher.received() == 0);
        CHECK_FALSE(store.is_done(chunk));
    }
}

TEST_CASE("RangeFetcher fails at once on terminal errors", "[fetcher][retry]") {
    test::TempDir dir;
    const auto payload = test::make_payload(2000);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto config = fast_retry_config(5);
    disk::ChunkFileStore store(dir.file("out.bin"), config.cleanup, nullptr);
    RangeFetcher fetcher("http://host/file", transport, store, config, false, payload.size(), nullptr);
    auto chunk = chunk_of(0, 0, 999);

    SECTION("404") {
        transport->add_fault(0, Fault{Fault::Kind::status, NetErrc::success, 404});

        auto result = fetcher.fetch(chunk, {});

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::chunk_fetch_exhausted));
        CHECK(result.error().cause == NetErrc::not_found);
        CHECK(result.error().attempt == std::optional<std::uint32_t>{1});
        CHECK(transport->gets().size() == 1);
    }

    SECTION("200 to a Range request") {
        transport->ignore_range = true;

        auto result = fetcher.fetch(chunk, {});

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::range_mismatch));
        CHECK(chunk.state == ChunkState::failed);
        CHECK(transport->gets().size() == 1);
        CHECK(fetcher.received() == 0);
    }
}

TEST_CASE("RangeFetcher sequential mode", "[fetcher][sequential]") {
    test::TempDir dir;
    const auto payload = test::make_payload(3500);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto config = fast_retry_config();
    disk::ChunkFileStore store(dir.file("out.bin"), config.cleanup, nullptr);

    SECTION("Known length sends no Range header and marks done") {
        RangeFetcher fetcher("http://host/file", transport, store, config, true, payload.size(), nullptr);
        auto chunk = chunk_of(0, 0, payload.size() - 1);

        auto result = fetcher.fetch(chunk, {});

        REQUIRE(result.has_value());
        CHECK(*result == payload.size());
        REQUIRE(transport->gets().size() == 1);
        CHECK_FALSE(transport->gets()[0].range.has_value());
        CHECK(store.is_done(chunk));
        CHECK(test::read_file(store.chunk_path(chunk)) == payload);
    }

    SECTION("Open-ended chunk gets no marker") {
        RangeFetcher fetcher("http://host/file", transport, store, config, true, std::nullopt, nullptr);
        ChunkSpec chunk;
        chunk.open_ended = true;

        auto result = fetcher.fetch(chunk, {});

        REQUIRE(result.has_value());
        CHECK(*result == payload.size());
        CHECK(test::read_file(store.chunk_path(chunk)) == payload);
        CHECK_FALSE(fs::exists(store.marker_path(chunk)));
    }
}

TEST_CASE("RangeFetcher honors cancellation", "[fetcher][cancel]") {
    test::TempDir dir;
    const auto payload = test::make_payload(2000);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto config = fast_retry_config();
    disk::ChunkFileStore store(dir.file("out.bin"), config.cleanup, nullptr);
    RangeFetcher fetcher("http://host/file", transport, store, config, false, payload.size(), nullptr);
    auto chunk = chunk_of(0, 0, 999);

    SECTION("Stop before the first attempt") {
        std::stop_source stop;
        stop.request_stop();

        auto result = fetcher.fetch(chunk, stop.get_token());

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::cancelled));
        CHECK(chunk.state == ChunkState::pending);
        CHECK(transport->gets().empty());
    }

    SECTION("Stop during a request") {
        std::stop_source stop;
        transport->on_get = [&](const HttpRequest&) { stop.request_stop(); };

        auto result = fetcher.fetch(chunk, stop.get_token());

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::cancelled));
        CHECK(chunk.state == ChunkState::pending);
        CHECK(transport->gets().size() == 1);
    }
}

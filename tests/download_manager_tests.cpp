// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/core/download_manager.hpp>
#include "test_support.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <thread>

using namespace haul;
using namespace haul::core;
using haul::test::Fault;
using haul::test::FakeTransport;

namespace fs = std::filesystem;

namespace {

constexpr std::size_t PAYLOAD_SIZE = 10'000;

EngineConfig test_config(std::uint32_t concurrency = 4) {
    EngineConfig config;
    config.concurrency = concurrency;
    config.min_chunk_size = 1000;
    config.merge_buffer_size = 4096;
    config.retry.max_attempts = 3;
    config.retry.base_delay = std::chrono::milliseconds{1};
    config.retry.max_delay = std::chrono::milliseconds{4};
    return config;
}

TransferTarget target_for(const test::TempDir& dir, const std::string& name = "out.bin") {
    TransferTarget target;
    target.source = "http://example.test/" + name;
    target.destination = dir.file(name);
    return target;
}

std::size_t count_with_range_start(const FakeTransport& transport, std::uint64_t start) {
    const auto gets = transport.gets();
    return static_cast<std::size_t>(std::count_if(gets.begin(), gets.end(), [start](const HttpRequest& r) {
        return r.range && r.range->start == start;
    }));
}

std::vector<std::string> event_names(const std::vector<ProgressEvent>& events) {
    std::vector<std::string> names;
    for (const auto& e : events) {
        if (auto name = e.get(field::event)) {
            names.emplace_back(*name);
        }
    }
    return names;
}

} // namespace

TEST_CASE("Chunked transfer produces a byte-identical file", "[manager]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    transport->piece_size = 333;

    const std::uint32_t concurrency = GENERATE(1u, 3u, 4u, 8u);
    DownloadManager manager(test_config(concurrency), transport);
    auto target = target_for(dir);

    auto result = manager.start(target);

    REQUIRE(result.has_value());
    CHECK(result->bytes == PAYLOAD_SIZE);
    CHECK(result->chunks == std::min<std::uint32_t>(concurrency, 10));
    CHECK(result->chunks_resumed == 0);
    CHECK_FALSE(result->sequential);
    CHECK(test::read_file(target.destination) == payload);
    CHECK(manager.state() == TransferState::completed);

    // Default policy removes chunk files after success
    CHECK_FALSE(fs::exists(target.destination + ".part0"));
    CHECK_FALSE(fs::exists(target.destination + ".part0.done"));
    CHECK_FALSE(fs::exists(target.destination + ".tmp"));
}

TEST_CASE("1000 bytes over four workers splits into four equal ranges", "[manager]") {
    test::TempDir dir;
    const auto payload = test::make_payload(1000);
    auto transport = std::make_shared<FakeTransport>(payload);

    auto config = test_config(4);
    config.min_chunk_size = 100;
    DownloadManager manager(config, transport);

    auto result = manager.start(target_for(dir));

    REQUIRE(result.has_value());
    CHECK(result->chunks == 4);
    for (std::uint64_t start : {0u, 250u, 500u, 750u}) {
        INFO("range start " << start);
        CHECK(count_with_range_start(*transport, start) == 1);
    }
}

TEST_CASE("A failed chunk leaves no destination and resumes later", "[manager][resume]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto target = target_for(dir);

    // Chunk 3 fails only after chunks 0-2 have published their markers
    transport->on_get = [&target](const HttpRequest& request) {
        if (!request.range || request.range->start != 7500) {
            return;
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (std::chrono::steady_clock::now() < deadline) {
            if (fs::exists(target.destination + ".part0.done") &&
                fs::exists(target.destination + ".part1.done") &&
                fs::exists(target.destination + ".part2.done")) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
        }
    };
    for (int i = 0; i < 3; ++i) {
        transport->add_fault(7500, Fault{Fault::Kind::status, NetErrc::success, 503});
    }

    {
        DownloadManager manager(test_config(4), transport);
        auto first = manager.start(target);

        REQUIRE_FALSE(first.has_value());
        CHECK(first.error().is(TransferErrc::chunk_fetch_exhausted));
        CHECK(first.error().chunk_index == std::optional<std::uint32_t>{3});
        CHECK(first.error().cause == NetErrc::server_error);
        CHECK(manager.state() == TransferState::failed);
        CHECK_FALSE(fs::exists(target.destination));

        // Default policy keeps finished chunks for a resume
        CHECK(fs::exists(target.destination + ".part0.done"));
        CHECK(fs::exists(target.destination + ".part2.done"));
        CHECK_FALSE(fs::exists(target.destination + ".part3.done"));
    }

    transport->on_get = nullptr;
    const auto gets_before = transport->gets().size();

    DownloadManager resumed(test_config(4), transport);
    auto second = resumed.start(target);

    REQUIRE(second.has_value());
    CHECK(second->chunks_resumed == 3);
    CHECK(transport->gets().size() == gets_before + 1);
    CHECK(count_with_range_start(*transport, 0) == 1);
    CHECK(test::read_file(target.destination) == payload);
}

TEST_CASE("Retained chunk files make a repeat transfer fetch nothing", "[manager][resume][cleanup]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto target = target_for(dir);

    auto config = test_config(4);
    config.cleanup.remove_temp_files = false;

    {
        DownloadManager manager(config, transport);
        REQUIRE(manager.start(target).has_value());
    }
    CHECK(fs::exists(target.destination + ".part0"));
    CHECK(fs::exists(target.destination + ".part3.done"));

    const auto gets_before = transport->gets().size();
    DownloadManager again(config, transport);
    auto result = again.start(target);

    REQUIRE(result.has_value());
    CHECK(result->chunks_resumed == 4);
    CHECK(transport->gets().size() == gets_before);
    CHECK(test::read_file(target.destination) == payload);
}

TEST_CASE("remove_on_error drops chunk files of a failed transfer", "[manager][cleanup]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    transport->add_fault(0, Fault{Fault::Kind::status, NetErrc::success, 404});
    auto target = target_for(dir);

    auto config = test_config(4);
    config.cleanup.remove_on_error = true;
    DownloadManager manager(config, transport);

    auto result = manager.start(target);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().cause == NetErrc::not_found);
    for (int i = 0; i < 4; ++i) {
        CHECK_FALSE(fs::exists(target.destination + ".part" + std::to_string(i)));
        CHECK_FALSE(fs::exists(target.destination + ".part" + std::to_string(i) + ".done"));
    }
    CHECK_FALSE(fs::exists(target.destination));
}

TEST_CASE("Sequential fallbacks", "[manager][sequential]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto target = target_for(dir);

    SECTION("No Accept-Ranges sends one request without a Range header") {
        transport->accept_ranges = false;
        DownloadManager manager(test_config(), transport);

        auto result = manager.start(target);

        REQUIRE(result.has_value());
        CHECK(result->sequential);
        CHECK(result->chunks == 1);
        REQUIRE(transport->gets().size() == 1);
        CHECK_FALSE(transport->gets()[0].range.has_value());
        CHECK(test::read_file(target.destination) == payload);
    }

    SECTION("Server answers ranges with 200: rerun as one sequential chunk") {
        transport->ignore_range = true;
        DownloadManager manager(test_config(), transport);

        auto result = manager.start(target);

        REQUIRE(result.has_value());
        CHECK(result->sequential);
        CHECK(test::read_file(target.destination) == payload);
        CHECK_FALSE(transport->gets().back().range.has_value());
        for (int i = 0; i < 4; ++i) {
            CHECK_FALSE(fs::exists(target.destination + ".part" + std::to_string(i)));
        }
    }

    SECTION("HEAD not allowed leaves size unknown") {
        transport->head_status = 405;
        DownloadManager manager(test_config(), transport);

        auto result = manager.start(target);

        REQUIRE(result.has_value());
        CHECK(result->sequential);
        CHECK(result->bytes == PAYLOAD_SIZE);
        CHECK(test::read_file(target.destination) == payload);
        CHECK_FALSE(fs::exists(target.destination + ".part0"));
    }

    SECTION("No Content-Length gives one open-ended chunk") {
        transport->advertise_length = false;
        DownloadManager manager(test_config(), transport);

        auto result = manager.start(target);

        REQUIRE(result.has_value());
        CHECK(result->sequential);
        CHECK(test::read_file(target.destination) == payload);
    }
}

TEST_CASE("Zero-length source publishes an empty file", "[manager]") {
    test::TempDir dir;
    auto transport = std::make_shared<FakeTransport>(std::string{});
    DownloadManager manager(test_config(), transport);
    auto target = target_for(dir);

    auto result = manager.start(target);

    REQUIRE(result.has_value());
    CHECK(result->bytes == 0);
    CHECK(result->chunks == 0);
    REQUIRE(fs::exists(target.destination));
    CHECK(fs::file_size(target.destination) == 0);
    CHECK(transport->gets().empty());
}

TEST_CASE("Probe failures", "[manager][probe]") {
    test::TempDir dir;
    auto transport = std::make_shared<FakeTransport>(test::make_payload(100));
    DownloadManager manager(test_config(), transport);
    auto target = target_for(dir);

    SECTION("404") {
        transport->head_status = 404;
        auto result = manager.start(target);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::probe_failure));
        CHECK(result.error().cause == NetErrc::not_found);
    }

    SECTION("Transport error") {
        transport->head_error = NetErrc::dns_error;
        auto result = manager.start(target);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::probe_failure));
        CHECK(result.error().cause == NetErrc::dns_error);
    }

    SECTION("Unparseable Content-Length") {
        transport->content_length_override = "lots";
        auto result = manager.start(target);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::probe_failure));
        CHECK(result.error().cause == NetErrc::malformed_header);
    }

    CHECK(transport->gets().empty());
    CHECK(manager.state() == TransferState::failed);
    CHECK_FALSE(fs::exists(target.destination));
}

TEST_CASE("probe reports size and range support", "[manager][probe]") {
    auto transport = std::make_shared<FakeTransport>(test::make_payload(1234));
    DownloadManager manager(test_config(), transport);

    TransferTarget target;
    target.source = "http://example.test/file";
    target.destination = "/unused";

    auto probed = manager.probe(target);
    REQUIRE(probed.has_value());
    CHECK(probed->total_size == std::optional<std::uint64_t>{1234});
    CHECK(probed->ranges_supported);

    transport->accept_ranges = false;
    probed = manager.probe(target);
    REQUIRE(probed.has_value());
    CHECK_FALSE(probed->ranges_supported);
}

TEST_CASE("Invalid targets are rejected before any request", "[manager]") {
    auto transport = std::make_shared<FakeTransport>(test::make_payload(10));

    SECTION("Empty source") {
        DownloadManager manager(test_config(), transport);
        auto result = manager.start(TransferTarget{"", "/tmp/x", std::nullopt, false});

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::invalid_source));
    }

    SECTION("Empty destination") {
        DownloadManager manager(test_config(), transport);
        auto result = manager.start(TransferTarget{"http://example.test/x", "", std::nullopt, false});

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::invalid_source));
    }

    SECTION("No transport") {
        DownloadManager manager(test_config(), nullptr);
        auto result = manager.start(TransferTarget{"http://example.test/x", "/tmp/x", std::nullopt, false});

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::invalid_config));
    }

    CHECK(transport->head_count() == 0);
}

TEST_CASE("cancel stops the transfer and keeps chunk files", "[manager][cancel]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto target = target_for(dir);

    DownloadManager manager(test_config(1), transport);
    transport->on_get = [&](const HttpRequest&) { manager.cancel(); };

    auto result = manager.start(target);

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().is(TransferErrc::cancelled));
    CHECK(manager.state() == TransferState::cancelled);
    CHECK_FALSE(fs::exists(target.destination));
    CHECK(fs::exists(target.destination + ".part0"));
    CHECK_FALSE(fs::exists(target.destination + ".part0.done"));

    SECTION("Cancellation is sticky") {
        const auto heads = transport->head_count();
        auto again = manager.start(target);

        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().is(TransferErrc::cancelled));
        CHECK(transport->head_count() == heads);
    }
}

TEST_CASE("cancel keeps finished chunks for a later resume", "[manager][cancel][resume]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto target = target_for(dir);

    {
        DownloadManager manager(test_config(4), transport);

        // Cancel from chunk 3 once chunks 0-2 are marked done
        transport->on_get = [&](const HttpRequest& request) {
            if (!request.range || request.range->start != 7500) {
                return;
            }
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
            while (std::chrono::steady_clock::now() < deadline) {
                if (fs::exists(target.destination + ".part0.done") &&
                    fs::exists(target.destination + ".part1.done") &&
                    fs::exists(target.destination + ".part2.done")) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{2});
            }
            manager.cancel();
        };

        auto result = manager.start(target);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().is(TransferErrc::cancelled));
        CHECK_FALSE(fs::exists(target.destination));
        for (int i = 0; i < 3; ++i) {
            INFO("chunk " << i);
            CHECK(fs::exists(target.destination + ".part" + std::to_string(i)));
            CHECK(fs::exists(target.destination + ".part" + std::to_string(i) + ".done"));
        }
        CHECK_FALSE(fs::exists(target.destination + ".part3.done"));
    }

    transport->on_get = nullptr;
    DownloadManager resumed(test_config(4), transport);
    auto second = resumed.start(target);

    REQUIRE(second.has_value());
    CHECK(second->chunks_resumed == 3);
    CHECK(test::read_file(target.destination) == payload);
}

TEST_CASE("log_level applies to the supplied logger", "[manager][logging]") {
    auto transport = std::make_shared<FakeTransport>(test::make_payload(PAYLOAD_SIZE));
    auto logger = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::trace);

    auto config = test_config(4);
    config.log_level = "error";
    config.logger = logger;
    DownloadManager manager(config, transport);

    CHECK(logger->level() == spdlog::level::err);
}

TEST_CASE("Progress events are ordered and complete", "[manager][progress]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto channel = std::make_shared<ProgressChannel>();

    std::vector<std::uint64_t> seen;
    channel->callback([&seen](const ProgressEvent& e) { seen.push_back(e.sequence); });

    auto config = test_config(4);
    config.progress_interval = std::chrono::milliseconds{10};
    DownloadManager manager(config, transport, channel);
    CHECK(manager.progress() == channel);

    SECTION("Successful transfer") {
        REQUIRE(manager.start(target_for(dir)).has_value());

        auto events = channel->drain();
        auto names = event_names(events);
        REQUIRE(names.size() >= 3);
        CHECK(names.front() == "started");
        CHECK(names.back() == "completed");
        CHECK(names[names.size() - 2] == "merging");

        CHECK(events.front().get_u64(field::total_size) == std::optional<std::uint64_t>{PAYLOAD_SIZE});
        CHECK(events.front().get("ranges_supported") == std::optional<std::string_view>{"true"});
        CHECK(events.back().get_u64(field::downloaded) == std::optional<std::uint64_t>{PAYLOAD_SIZE});

        for (const auto& e : events) {
            CHECK(e.strategy == Strategy::native);
            CHECK(e.get_u64(field::timestamp_ms).has_value());
        }
        for (std::size_t i = 1; i < events.size(); ++i) {
            CHECK(events[i].sequence > events[i - 1].sequence);
        }
        REQUIRE(seen.size() == events.size());
        CHECK(std::is_sorted(seen.begin(), seen.end()));
    }

    SECTION("Failed transfer ends with a failed event") {
        transport->head_status = 403;
        REQUIRE_FALSE(manager.start(target_for(dir)).has_value());

        auto events = channel->drain();
        REQUIRE(events.size() == 1);
        CHECK(events[0].get(field::event) == std::optional<std::string_view>{"failed"});
        REQUIRE(events[0].get(field::error).has_value());
        CHECK_THAT(std::string(*events[0].get(field::error)),
                   Catch::Matchers::ContainsSubstring("probe failed"));
    }
}

TEST_CASE("Periodic progress reports bytes and chunks", "[manager][progress]") {
    test::TempDir dir;
    const auto payload = test::make_payload(PAYLOAD_SIZE);
    auto transport = std::make_shared<FakeTransport>(payload);
    auto channel = std::make_shared<ProgressChannel>();

    // Slow the transfer so the monitor samples at least once
    transport->on_get = [](const HttpRequest&) { std::this_thread::sleep_for(std::chrono::milliseconds{40}); };

    auto config = test_config(4);
    config.progress_interval = std::chrono::milliseconds{10};
    DownloadManager manager(config, transport, channel);

    REQUIRE(manager.start(target_for(dir)).has_value());

    bool saw_progress = false;
    for (const auto& e : channel->drain()) {
        if (e.get(field::event) != std::optional<std::string_view>{"progress"}) {
            continue;
        }
        saw_progress = true;
        CHECK(e.get_u64(field::chunks_total) == std::optional<std::uint64_t>{4});
        CHECK(e.get_u64(field::total_size) == std::optional<std::uint64_t>{PAYLOAD_SIZE});
        REQUIRE(e.get_u64(field::downloaded).has_value());
        CHECK(*e.get_u64(field::downloaded) <= PAYLOAD_SIZE);
        CHECK(e.get_u64(field::speed_bps).has_value());
    }
    CHECK(saw_progress);
}

TEST_CASE("TransferState names", "[manager]") {
    CHECK(to_string(TransferState::idle) == "idle");
    CHECK(to_string(TransferState::merging) == "merging");
    CHECK(to_string(TransferState::cancelled) == "cancelled");
}

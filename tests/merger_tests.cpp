// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <haul/disk/merger.hpp>
#include "test_support.hpp"

using namespace haul;
using haul::disk::Merger;

namespace fs = std::filesystem;

TEST_CASE("Merger concatenates in the given order", "[merger]") {
    test::TempDir dir;
    const auto payload = test::make_payload(40'000);

    // Parts written in reverse order; output order follows the list only
    std::vector<std::string> parts;
    for (int i = 0; i < 4; ++i) {
        parts.push_back(dir.file("part" + std::to_string(i)));
    }
    for (int i = 3; i >= 0; --i) {
        test::write_file(parts[i], payload.substr(static_cast<std::size_t>(i) * 10'000, 10'000));
    }

    const auto dest = dir.file("out.bin");

    SECTION("Buffer smaller than a part") {
        Merger merger(4096);
        auto merged = merger.merge(parts, dest);

        REQUIRE(merged.has_value());
        CHECK(*merged == payload.size());
        CHECK(test::read_file(dest) == payload);
        CHECK_FALSE(fs::exists(Merger::temp_path(dest)));
    }

    SECTION("Default buffer") {
        Merger merger;
        REQUIRE(merger.merge(parts, dest).has_value());
        CHECK(test::read_file(dest) == payload);
    }
}

TEST_CASE("Merger publishes an empty file for no parts", "[merger]") {
    test::TempDir dir;
    const auto dest = dir.file("empty.bin");

    auto merged = Merger{}.merge({}, dest);

    REQUIRE(merged.has_value());
    CHECK(*merged == 0);
    REQUIRE(fs::exists(dest));
    CHECK(fs::file_size(dest) == 0);
}

TEST_CASE("Merger failures leave the destination untouched", "[merger]") {
    test::TempDir dir;
    const auto dest = dir.file("out.bin");
    test::write_file(dest, "previous contents");

    const auto present = dir.file("a");
    test::write_file(present, "abc");

    SECTION("Missing part") {
        auto merged = Merger{}.merge({present, dir.file("missing")}, dest);

        REQUIRE_FALSE(merged.has_value());
        CHECK(test::read_file(dest) == "previous contents");
        CHECK_FALSE(fs::exists(Merger::temp_path(dest)));
    }

    SECTION("Stop requested") {
        std::stop_source stop;
        stop.request_stop();
        auto merged = Merger{}.merge({present}, dest, stop.get_token());

        REQUIRE_FALSE(merged.has_value());
        CHECK(merged.error() == std::errc::operation_canceled);
        CHECK(test::read_file(dest) == "previous contents");
        CHECK_FALSE(fs::exists(Merger::temp_path(dest)));
    }
}

TEST_CASE("Merger::temp_path", "[merger]") {
    CHECK(Merger::temp_path("/tmp/video.mp4") == "/tmp/video.mp4.tmp");
}

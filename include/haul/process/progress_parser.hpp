// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/progress.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace haul::process {

// Split "key=value"; nullopt for lines without '=' or with an empty or
// blank-containing key. Surrounding whitespace and CR are dropped.
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
parse_progress_line(std::string_view line);

// Groups `key=value` lines from a -progress stream into blocks. A block ends
// on a `progress=` line or a blank line.
class ProgressParser {
public:
    struct FeedResult {
        bool parsed{false};                          // line was a valid key=value pair
        std::optional<core::ProgressFields> block;   // set when the line closed a block
    };

    FeedResult feed(std::string_view line);

    // Hand out a partial block left when the stream ends
    [[nodiscard]] std::optional<core::ProgressFields> flush();

    [[nodiscard]] std::uint64_t parsed_lines() const noexcept { return parsed_; }
    [[nodiscard]] std::uint64_t skipped_lines() const noexcept { return skipped_; }

private:
    core::ProgressFields current_;
    std::uint64_t parsed_{0};
    std::uint64_t skipped_{0};
};

} // namespace haul::process

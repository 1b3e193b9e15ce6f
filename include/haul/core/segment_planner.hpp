// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace haul::core {

// Chunk state machine
enum class ChunkState : std::uint8_t {
    pending,   // Not started
    in_flight, // Owned by a fetcher
    done,      // Bytes durable and marker written
    failed     // Retry budget exhausted
};

[[nodiscard]] std::string_view to_string(ChunkState state) noexcept;

// One contiguous byte range [start, end] of the target
struct ChunkSpec {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};          // inclusive
    bool open_ended{false};        // whole file of unknown size; end is meaningless
    ChunkState state{ChunkState::pending};
    std::uint32_t attempts{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

struct ChunkPlan {
    std::vector<ChunkSpec> chunks;
    bool sequential{false};                 // single whole-file chunk, no Range header
    std::optional<std::uint64_t> total_size;
};

// Partition [0, total_size) into at most `max_concurrency` chunks of at least
// `min_chunk_size` bytes (the last chunk absorbs the remainder).
// Unknown size or no range support yields one sequential chunk; a zero size
// yields no chunks.
[[nodiscard]] ChunkPlan plan_chunks(std::optional<std::uint64_t> total_size,
                                    std::uint32_t max_concurrency,
                                    std::uint64_t min_chunk_size,
                                    bool ranges_supported);

// Check that chunks cover [0, total_size) exactly, in index order
[[nodiscard]] bool is_exact_partition(const std::vector<ChunkSpec>& chunks,
                                      std::uint64_t total_size) noexcept;

} // namespace haul::core

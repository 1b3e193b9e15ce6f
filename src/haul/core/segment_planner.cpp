// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/segment_planner.hpp>
#include <algorithm>

namespace haul::core {

std::string_view to_string(ChunkState state) noexcept {
    switch (state) {
        case ChunkState::pending:   return "pending";
        case ChunkState::in_flight: return "in_flight";
        case ChunkState::done:      return "done";
        case ChunkState::failed:    return "failed";
    }
    return "unknown";
}

ChunkPlan plan_chunks(std::optional<std::uint64_t> total_size,
                      std::uint32_t max_concurrency,
                      std::uint64_t min_chunk_size,
                      bool ranges_supported) {
    ChunkPlan plan;
    plan.total_size = total_size;

    if (!total_size || !ranges_supported) {
        plan.sequential = true;
        if (total_size && *total_size == 0) {
            return plan;
        }

        ChunkSpec whole;
        whole.index = 0;
        whole.start = 0;
        if (total_size) {
            whole.end = *total_size - 1;
        } else {
            whole.open_ended = true;
        }
        plan.chunks.push_back(whole);
        return plan;
    }

    const std::uint64_t size = *total_size;
    if (size == 0) {
        return plan;
    }

    const std::uint64_t min_chunk = std::max<std::uint64_t>(min_chunk_size, 1);
    const std::uint64_t ceiling = std::max<std::uint32_t>(max_concurrency, 1);
    const std::uint64_t count = std::min(ceiling, std::max<std::uint64_t>(1, size / min_chunk));
    const std::uint64_t base = size / count;

    plan.chunks.reserve(count);
    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < count; ++i) {
        ChunkSpec chunk;
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.start = offset;
        // Last chunk absorbs the remainder
        chunk.end = (i + 1 == count) ? size - 1 : offset + base - 1;
        offset = chunk.end + 1;
        plan.chunks.push_back(chunk);
    }

    return plan;
}

bool is_exact_partition(const std::vector<ChunkSpec>& chunks, std::uint64_t total_size) noexcept {
    if (chunks.empty()) {
        return total_size == 0;
    }

    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        if (c.index != i || c.open_ended || c.start != expected_start || c.end < c.start) {
            return false;
        }
        expected_start = c.end + 1;
    }
    return expected_start == total_size;
}

} // namespace haul::core

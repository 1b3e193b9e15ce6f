// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/http_session.hpp>
#include <haul/core/segment_planner.hpp>
#include <haul/disk/chunk_file_store.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace spdlog { class logger; }

namespace haul::core {

// Fetches chunks of one plan into their chunk files. One instance is shared
// by all workers of a transfer; each call owns the chunk it is given.
class RangeFetcher {
public:
    RangeFetcher(std::string source,
                 std::shared_ptr<HttpTransport> transport,
                 disk::ChunkFileStore& store,
                 const EngineConfig& config,
                 bool sequential,
                 std::optional<std::uint64_t> total_size,
                 std::shared_ptr<spdlog::logger> logger);

    RangeFetcher(const RangeFetcher&) = delete;
    RangeFetcher& operator=(const RangeFetcher&) = delete;

    // Run the retry loop for `chunk` until it is Done or Failed.
    // Returns the chunk's byte count. Errors: range_mismatch (never retried),
    // chunk_fetch_exhausted (cause = last error), cancelled (chunk back to
    // pending, its files untouched).
    [[nodiscard]] std::expected<std::uint64_t, TransferError>
    fetch(ChunkSpec& chunk, std::stop_token stop) noexcept;

    // Bytes currently held in chunk files written by this fetcher
    [[nodiscard]] std::uint64_t received() const noexcept {
        return received_.load(std::memory_order_relaxed);
    }

private:
    // One request; empty error_code on success
    [[nodiscard]] std::error_code attempt(ChunkSpec& chunk, std::uint64_t& written,
                                          std::stop_token stop) noexcept;

    std::string source_;
    std::shared_ptr<HttpTransport> transport_;
    disk::ChunkFileStore& store_;
    RetryPolicy retry_;
    std::chrono::seconds connect_timeout_;
    std::chrono::seconds low_speed_timeout_;
    bool sequential_;
    std::optional<std::uint64_t> total_size_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<std::uint64_t> received_{0};
};

} // namespace haul::core

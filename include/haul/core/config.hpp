// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog { class logger; }

namespace haul::core {

constexpr std::uint32_t DEFAULT_CONCURRENCY = 8;
constexpr std::uint64_t DEFAULT_MIN_CHUNK_SIZE = 1024 * 1024;       // 1 MiB
constexpr std::size_t MERGE_BUFFER_SIZE = 1024 * 1024;              // 1 MiB

constexpr std::uint32_t RETRY_COUNT = 4;
constexpr std::chrono::milliseconds RETRY_BASE_DELAY{500};
constexpr std::chrono::milliseconds RETRY_MAX_DELAY{8000};

constexpr std::chrono::seconds CONNECTION_TIMEOUT{30};
constexpr std::chrono::seconds LOW_SPEED_TIMEOUT{20};              // no bytes for this long aborts a request
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{500};
constexpr std::size_t PROGRESS_QUEUE_CAPACITY = 1024;                // events kept when nobody drains the channel

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

struct RetryPolicy {
    std::uint32_t max_attempts{RETRY_COUNT};
    std::chrono::milliseconds base_delay{RETRY_BASE_DELAY};
    std::chrono::milliseconds max_delay{RETRY_MAX_DELAY};

    // Delay before attempt `attempt + 1` (attempt is 1-based)
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt) const noexcept;
};

struct CleanupPolicy {
    bool remove_temp_files{true};   // drop chunk files after a successful merge
    bool remove_on_error{false};    // drop chunk files when the transfer fails
};

// Settings for one chunked transfer. Held by value and never mutated while
// a transfer runs.
struct EngineConfig {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::uint64_t min_chunk_size{DEFAULT_MIN_CHUNK_SIZE};
    std::size_t merge_buffer_size{MERGE_BUFFER_SIZE};
    RetryPolicy retry;
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT};
    std::chrono::seconds low_speed_timeout{LOW_SPEED_TIMEOUT};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    CleanupPolicy cleanup;
    std::string log_level{"info"};           // applied to `logger`
    std::shared_ptr<spdlog::logger> logger;  // null: a silent logger is used
};

void to_json(nlohmann::json& j, const RetryPolicy& p);
void from_json(const nlohmann::json& j, RetryPolicy& p);
void to_json(nlohmann::json& j, const CleanupPolicy& p);
void from_json(const nlohmann::json& j, CleanupPolicy& p);
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

// Parse an EngineConfig from JSON text. Missing keys keep their defaults.
[[nodiscard]] std::expected<EngineConfig, TransferError>
parse_engine_config(std::string_view json_text) noexcept;

} // namespace haul::core

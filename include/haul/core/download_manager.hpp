// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/error.hpp>
#include <haul/core/http_session.hpp>
#include <haul/core/progress.hpp>
#include <haul/core/segment_planner.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace spdlog { class logger; }

namespace haul::disk { class ChunkFileStore; }

namespace haul::core {

// One source/destination pair. Size and range support are filled in by the
// probe.
struct TransferTarget {
    std::string source;
    std::string destination;
    std::optional<std::uint64_t> total_size;
    bool ranges_supported{false};
};

struct TransferResult {
    std::string destination;
    std::uint64_t bytes{0};
    std::uint32_t chunks{0};
    std::uint32_t chunks_resumed{0};   // skipped because already Done
    bool sequential{false};
};

// Overall transfer state
enum class TransferState : std::uint8_t {
    idle,        // Not started
    probing,     // HEAD in flight
    fetching,    // Chunk workers running
    merging,     // Concatenating chunk files
    completed,   // Destination published
    failed,      // Terminal error
    cancelled    // Stopped by cancel()
};

[[nodiscard]] std::string_view to_string(TransferState state) noexcept;

// Chunked HTTP transfer: probe, plan, fetch under a concurrency bound,
// merge, verify, clean up. A manager runs one transfer at a time.
class DownloadManager {
public:
    DownloadManager(EngineConfig config,
                    std::shared_ptr<HttpTransport> transport,
                    std::shared_ptr<ProgressChannel> progress = nullptr);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Run the whole transfer on the calling thread
    [[nodiscard]] std::expected<TransferResult, TransferError>
    start(TransferTarget target) noexcept;

    // HEAD the source. 405/501 leaves size and range support unknown.
    [[nodiscard]] std::expected<TransferTarget, TransferError>
    probe(TransferTarget target) noexcept;

    // Thread-safe; stops in-flight fetchers and the merge. Chunk files and
    // markers are kept for a later resume. Sticky for this manager.
    void cancel() noexcept;

    [[nodiscard]] TransferState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<ProgressChannel>& progress() const noexcept { return progress_; }

private:
    [[nodiscard]] std::expected<TransferResult, TransferError>
    run(const TransferTarget& target, bool force_sequential) noexcept;

    [[nodiscard]] std::expected<TransferResult, TransferError>
    run_plan(const TransferTarget& target, ChunkPlan& plan, disk::ChunkFileStore& store) noexcept;

    [[nodiscard]] std::expected<TransferResult, TransferError>
    publish_empty(const TransferTarget& target) noexcept;

    std::expected<TransferResult, TransferError> fail(TransferError error) noexcept;

    void emit(std::string_view event, ProgressFields fields = {}) noexcept;

    const EngineConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<ProgressChannel> progress_;
    std::shared_ptr<spdlog::logger> logger_;
    std::stop_source stop_;
    std::atomic<TransferState> state_{TransferState::idle};
};

} // namespace haul::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/core/segment_planner.hpp>
#include <haul/disk/positional_file.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace haul::disk {

enum class CleanupReason : std::uint8_t {
    success,
    error,
};

// Chunk files and their done markers beside one destination.
//
//   <destination>.part<index>        chunk bytes, preallocated to chunk length
//   <destination>.part<index>.done   marker holding "<start> <end>"
//
// A marker is trusted only when its range matches the planned chunk and the
// chunk file has the chunk's length.
class ChunkFileStore {
public:
    ChunkFileStore(std::string destination,
                   core::CleanupPolicy policy,
                   std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::string chunk_path(const core::ChunkSpec& chunk) const;
    [[nodiscard]] std::string marker_path(const core::ChunkSpec& chunk) const;

    // Drop any marker, then create or truncate the chunk file to its length
    [[nodiscard]] std::error_code prepare(const core::ChunkSpec& chunk) noexcept;

    // Open a prepared chunk file for writing
    [[nodiscard]] std::expected<PositionalFile, std::error_code>
    open_for_write(const core::ChunkSpec& chunk) noexcept;

    [[nodiscard]] bool is_done(const core::ChunkSpec& chunk) const noexcept;

    // Flush the chunk file to stable storage, then publish the marker via
    // temp file + rename. A crash at any point leaves either no marker or a
    // marker over durable bytes.
    [[nodiscard]] std::error_code mark_done(const core::ChunkSpec& chunk) noexcept;

    // Remove chunk file and marker unconditionally
    void remove(const core::ChunkSpec& chunk) noexcept;

    // Remove one chunk's files if the policy asks for it for `reason`.
    // Returns true when files were removed.
    bool cleanup(const core::ChunkSpec& chunk, CleanupReason reason) noexcept;

    // cleanup() over a whole plan
    bool cleanup_all(const std::vector<core::ChunkSpec>& chunks, CleanupReason reason) noexcept;

    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }
    [[nodiscard]] const core::CleanupPolicy& policy() const noexcept { return policy_; }

private:
    std::string destination_;
    core::CleanupPolicy policy_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace haul::disk

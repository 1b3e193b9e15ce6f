// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/disk/chunk_file_store.hpp>
#include <haul/core/logging.hpp>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace haul::disk {

namespace fs = std::filesystem;

namespace {

std::string marker_contents(const core::ChunkSpec& chunk) {
    return std::to_string(chunk.start) + ' ' + std::to_string(chunk.end) + '\n';
}

} // namespace

ChunkFileStore::ChunkFileStore(std::string destination,
                               core::CleanupPolicy policy,
                               std::shared_ptr<spdlog::logger> logger)
    : destination_(std::move(destination))
    , policy_(policy)
    , logger_(core::logger_or_null(logger)) {}

std::string ChunkFileStore::chunk_path(const core::ChunkSpec& chunk) const {
    return destination_ + ".part" + std::to_string(chunk.index);
}

std::string ChunkFileStore::marker_path(const core::ChunkSpec& chunk) const {
    return chunk_path(chunk) + ".done";
}

std::error_code ChunkFileStore::prepare(const core::ChunkSpec& chunk) noexcept {
    try {
        // A marker must never outlive the bytes it vouches for
        std::error_code ec;
        fs::remove(marker_path(chunk), ec);
        if (ec) {
            return ec;
        }

        const std::uint64_t size = chunk.open_ended ? 0 : chunk.length();
        auto file = PositionalFile::open(chunk_path(chunk), PositionalFile::Mode::create_truncate, size);
        if (!file) {
            return file.error();
        }
        logger_->debug("prepared {} ({} bytes)", file->path(), size);
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::allocation_failed);
    }
}

std::expected<PositionalFile, std::error_code>
ChunkFileStore::open_for_write(const core::ChunkSpec& chunk) noexcept {
    try {
        return PositionalFile::open(chunk_path(chunk), PositionalFile::Mode::read_write);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }
}

bool ChunkFileStore::is_done(const core::ChunkSpec& chunk) const noexcept {
    if (chunk.open_ended) {
        return false;
    }

    try {
        std::error_code ec;
        const auto marker = marker_path(chunk);
        if (!fs::is_regular_file(marker, ec)) {
            return false;
        }

        std::ifstream in(marker, std::ios::binary);
        std::uint64_t start = 0;
        std::uint64_t end = 0;
        if (!(in >> start >> end)) {
            logger_->warn("ignoring unreadable marker {}", marker);
            return false;
        }
        if (start != chunk.start || end != chunk.end) {
            logger_->info("marker {} covers {}-{}, plan wants {}-{}; refetching",
                          marker, start, end, chunk.start, chunk.end);
            return false;
        }

        const auto size = fs::file_size(chunk_path(chunk), ec);
        if (ec || size != chunk.length()) {
            logger_->warn("chunk {} has marker but size {} != {}; refetching",
                          chunk.index, ec ? 0 : size, chunk.length());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        logger_->warn("could not inspect marker for chunk {}: {}", chunk.index, e.what());
        return false;
    }
}

std::error_code ChunkFileStore::mark_done(const core::ChunkSpec& chunk) noexcept {
    try {
        const auto path = chunk_path(chunk);
        const auto marker = marker_path(chunk);
        const auto marker_tmp = marker + ".tmp";

        // 1. Chunk bytes to stable storage
        {
            auto file = PositionalFile::open(path, PositionalFile::Mode::read_write);
            if (!file) {
                return file.error();
            }
            if (!chunk.open_ended) {
                auto size = file->size();
                if (!size) {
                    return size.error();
                }
                if (*size != chunk.length()) {
                    return make_error_code(DiskErrc::marker_invalid);
                }
            }
            if (auto ec = file->sync()) {
                return ec;
            }
        }

        // 2. Marker written and synced under a temporary name
        {
            auto tmp = PositionalFile::open(marker_tmp, PositionalFile::Mode::create_truncate);
            if (!tmp) {
                return tmp.error();
            }
            const auto contents = marker_contents(chunk);
            auto written = tmp->write(0, contents.data(), contents.size());
            if (!written) {
                return written.error();
            }
            if (auto ec = tmp->sync()) {
                return ec;
            }
        }

        // 3. Atomic publish
        if (std::rename(marker_tmp.c_str(), marker.c_str()) != 0) {
            return errno_to_error_code(errno, DiskErrc::rename_failed);
        }
        return sync_parent_directory(marker);
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::allocation_failed);
    }
}

void ChunkFileStore::remove(const core::ChunkSpec& chunk) noexcept {
    // Leftover files are harmless; the next prepare() truncates them
    for (const auto& path : {marker_path(chunk), marker_path(chunk) + ".tmp", chunk_path(chunk)}) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            logger_->warn("could not remove {}: {}", path, ec.message());
        }
    }
}

namespace {

bool should_remove(const core::CleanupPolicy& policy, CleanupReason reason) noexcept {
    return reason == CleanupReason::success ? policy.remove_temp_files : policy.remove_on_error;
}

} // namespace

bool ChunkFileStore::cleanup(const core::ChunkSpec& chunk, CleanupReason reason) noexcept {
    if (!should_remove(policy_, reason)) {
        return false;
    }
    remove(chunk);
    return true;
}

bool ChunkFileStore::cleanup_all(const std::vector<core::ChunkSpec>& chunks, CleanupReason reason) noexcept {
    if (!should_remove(policy_, reason)) {
        if (!chunks.empty()) {
            logger_->debug("retaining {} chunk files for {}", chunks.size(), destination_);
        }
        return false;
    }

    for (const auto& chunk : chunks) {
        remove(chunk);
    }
    return true;
}

} // namespace haul::disk

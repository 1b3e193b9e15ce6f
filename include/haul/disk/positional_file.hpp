// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace haul::disk {

// POSIX file handle with explicit-offset I/O.
// Writers at disjoint offsets never share a file position.
class PositionalFile {
public:
    enum class Mode : std::uint8_t {
        create_truncate, // create or truncate, read/write
        read_only,
        read_write,      // existing file
    };

    // Open a file; with create_truncate and size > 0 the file is preallocated
    static std::expected<PositionalFile, std::error_code>
    open(std::string_view path, Mode mode, std::uint64_t size = 0) noexcept;

    ~PositionalFile();

    // Non-copyable, movable
    PositionalFile(const PositionalFile&) = delete;
    PositionalFile& operator=(const PositionalFile&) = delete;
    PositionalFile(PositionalFile&&) noexcept;
    PositionalFile& operator=(PositionalFile&&) noexcept;

    // Set the file length (sparse where the file system allows it)
    [[nodiscard]] std::error_code pre_allocate(std::uint64_t size) noexcept;

    // Write all of `size` bytes at offset
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    // Read up to `size` bytes at offset; 0 means end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::uint64_t offset, void* buffer, std::size_t size) noexcept;

    // fsync
    [[nodiscard]] std::error_code sync() noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    PositionalFile() = default;

    int fd_{-1};
    std::string path_;
};

// fsync the directory holding `path` so a rename inside it is durable
[[nodiscard]] std::error_code sync_parent_directory(std::string_view path) noexcept;

} // namespace haul::disk

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/disk/positional_file.hpp>
#include <cerrno>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace haul::disk {

std::error_code errno_to_error_code(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case ESPIPE:        return make_error_code(DiskErrc::seek_error);
        case ENOMEM:        return make_error_code(DiskErrc::allocation_failed);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(fallback);
    }
}

//=============================================================================
// PositionalFile
//=============================================================================

std::expected<PositionalFile, std::error_code>
PositionalFile::open(std::string_view path, Mode mode, std::uint64_t size) noexcept {
    PositionalFile file;
    try {
        file.path_ = path;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    int flags = O_CLOEXEC;
    switch (mode) {
        case Mode::create_truncate: flags |= O_RDWR | O_CREAT | O_TRUNC; break;
        case Mode::read_only:       flags |= O_RDONLY; break;
        case Mode::read_write:      flags |= O_RDWR; break;
    }

    do {
        file.fd_ = ::open(file.path_.c_str(), flags, 0644);
    } while (file.fd_ < 0 && errno == EINTR);

    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
    }

    if (mode == Mode::create_truncate && size > 0) {
        auto ec = file.pre_allocate(size);
        if (ec) {
            file.close();
            return std::unexpected(ec);
        }
    }

    return file;
}

PositionalFile::~PositionalFile() {
    close();
}

PositionalFile::PositionalFile(PositionalFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

PositionalFile& PositionalFile::operator=(PositionalFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code PositionalFile::pre_allocate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return errno_to_error_code(errno, DiskErrc::allocation_failed);
    }
    return {};
}

std::expected<std::size_t, std::error_code>
PositionalFile::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    const auto* p = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::pwrite(fd_, p + written, size - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
        }
        written += static_cast<std::size_t>(n);
    }
    return written;
}

std::expected<std::size_t, std::error_code>
PositionalFile::read(std::uint64_t offset, void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    for (;;) {
        ssize_t n = ::pread(fd_, buffer, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
        }
        return static_cast<std::size_t>(n);
    }
}

std::error_code PositionalFile::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    return ::fsync(fd_) == 0
        ? std::error_code{}
        : errno_to_error_code(errno, DiskErrc::sync_failed);
}

std::expected<std::uint64_t, std::error_code> PositionalFile::size() const noexcept {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void PositionalFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code sync_parent_directory(std::string_view path) noexcept {
    try {
        auto parent = std::filesystem::path(path).parent_path();
        if (parent.empty()) {
            parent = ".";
        }

        int fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd < 0) {
            return errno_to_error_code(errno, DiskErrc::sync_failed);
        }
        int rc = ::fsync(fd);
        int err = errno;
        ::close(fd);
        return rc == 0 ? std::error_code{} : errno_to_error_code(err, DiskErrc::sync_failed);
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::allocation_failed);
    }
}

} // namespace haul::disk

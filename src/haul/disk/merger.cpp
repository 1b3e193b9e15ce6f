// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/disk/merger.hpp>
#include <haul/disk/positional_file.hpp>
#include <haul/core/logging.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace haul::disk {

Merger::Merger(std::size_t buffer_size, std::shared_ptr<spdlog::logger> logger)
    : buffer_size_(std::max<std::size_t>(buffer_size, 4096))
    , logger_(core::logger_or_null(logger)) {}

std::string Merger::temp_path(const std::string& destination) {
    return destination + ".tmp";
}

std::expected<std::uint64_t, std::error_code>
Merger::merge(const std::vector<std::string>& parts,
              const std::string& destination,
              std::stop_token stop) const noexcept {
    std::string tmp_path;
    try {
        tmp_path = temp_path(destination);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    auto fail = [&](std::error_code ec) -> std::expected<std::uint64_t, std::error_code> {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return std::unexpected(ec);
    };

    auto out = PositionalFile::open(tmp_path, PositionalFile::Mode::create_truncate);
    if (!out) {
        return std::unexpected(out.error());
    }

    std::vector<char> buffer;
    try {
        buffer.resize(buffer_size_);
    } catch (const std::exception&) {
        return fail(make_error_code(DiskErrc::allocation_failed));
    }

    std::uint64_t out_offset = 0;
    for (const auto& part : parts) {
        auto in = PositionalFile::open(part, PositionalFile::Mode::read_only);
        if (!in) {
            logger_->error("merge: cannot open {}: {}", part, in.error().message());
            return fail(in.error());
        }

        std::uint64_t in_offset = 0;
        for (;;) {
            if (stop.stop_requested()) {
                return fail(std::make_error_code(std::errc::operation_canceled));
            }

            auto n = in->read(in_offset, buffer.data(), buffer.size());
            if (!n) {
                return fail(n.error());
            }
            if (*n == 0) {
                break;
            }

            auto w = out->write(out_offset, buffer.data(), *n);
            if (!w) {
                return fail(w.error());
            }
            in_offset += *n;
            out_offset += *n;
        }
        logger_->debug("merge: appended {} ({} bytes)", part, in_offset);
    }

    if (auto ec = out->sync()) {
        return fail(ec);
    }
    out->close();

    if (std::rename(tmp_path.c_str(), destination.c_str()) != 0) {
        return fail(errno_to_error_code(errno, DiskErrc::rename_failed));
    }
    if (auto ec = sync_parent_directory(destination)) {
        logger_->warn("merge: directory sync for {} failed: {}", destination, ec.message());
    }

    return out_offset;
}

} // namespace haul::disk

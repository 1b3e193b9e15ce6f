// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/config.hpp>
#include <haul/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace spdlog { class logger; }

namespace haul::disk {

// Concatenates chunk files in the given order into a destination.
// Output goes to `<destination>.tmp` and is renamed into place only after
// every byte is written and synced.
class Merger {
public:
    explicit Merger(std::size_t buffer_size = core::MERGE_BUFFER_SIZE,
                    std::shared_ptr<spdlog::logger> logger = nullptr);

    // Returns the number of bytes published
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    merge(const std::vector<std::string>& parts,
          const std::string& destination,
          std::stop_token stop = {}) const noexcept;

    [[nodiscard]] static std::string temp_path(const std::string& destination);

private:
    std::size_t buffer_size_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace haul::disk

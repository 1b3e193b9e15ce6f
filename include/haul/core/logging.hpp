// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace haul::core {

// Stderr logger owned by the caller; not registered in spdlog's global registry
[[nodiscard]] std::shared_ptr<spdlog::logger>
make_logger(std::string_view name, std::string_view level = "info");

// Logger that drops everything
[[nodiscard]] std::shared_ptr<spdlog::logger> make_null_logger();

// Use `logger` when set, otherwise a silent one
[[nodiscard]] std::shared_ptr<spdlog::logger>
logger_or_null(const std::shared_ptr<spdlog::logger>& logger);

// logger_or_null() with `level` applied to a supplied logger
[[nodiscard]] std::shared_ptr<spdlog::logger>
configured_logger(const std::shared_ptr<spdlog::logger>& logger, std::string_view level);

} // namespace haul::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/logging.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace haul::core {

std::shared_ptr<spdlog::logger> make_logger(std::string_view name, std::string_view level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string(name), std::move(sink));
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(std::string(level)));
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger() {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("haul-null", std::move(sink));
    logger->set_level(spdlog::level::off);
    return logger;
}

std::shared_ptr<spdlog::logger> logger_or_null(const std::shared_ptr<spdlog::logger>& logger) {
    return logger ? logger : make_null_logger();
}

std::shared_ptr<spdlog::logger> configured_logger(const std::shared_ptr<spdlog::logger>& logger,
                                                  std::string_view level) {
    if (!logger) {
        return make_null_logger();
    }
    logger->set_level(spdlog::level::from_str(std::string(level)));
    return logger;
}

} // namespace haul::core

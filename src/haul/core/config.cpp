// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <algorithm>

namespace haul::core {

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t attempt) const noexcept {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    // base * 2^(attempt-1), capped; shift bounded to avoid overflow
    const auto shift = std::min<std::uint32_t>(attempt - 1, 20);
    const auto delay = base_delay * (std::int64_t{1} << shift);
    return std::min(delay, max_delay);
}

//=============================================================================
// JSON codec
//=============================================================================

void to_json(nlohmann::json& j, const RetryPolicy& p) {
    j = nlohmann::json{
        {"max_attempts", p.max_attempts},
        {"base_delay_ms", p.base_delay.count()},
        {"max_delay_ms", p.max_delay.count()},
    };
}

void from_json(const nlohmann::json& j, RetryPolicy& p) {
    p.max_attempts = j.value("max_attempts", p.max_attempts);
    p.base_delay = std::chrono::milliseconds{j.value("base_delay_ms", p.base_delay.count())};
    p.max_delay = std::chrono::milliseconds{j.value("max_delay_ms", p.max_delay.count())};
}

void to_json(nlohmann::json& j, const CleanupPolicy& p) {
    j = nlohmann::json{
        {"remove_temp_files", p.remove_temp_files},
        {"remove_on_error", p.remove_on_error},
    };
}

void from_json(const nlohmann::json& j, CleanupPolicy& p) {
    p.remove_temp_files = j.value("remove_temp_files", p.remove_temp_files);
    p.remove_on_error = j.value("remove_on_error", p.remove_on_error);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"concurrency", c.concurrency},
        {"min_chunk_size", c.min_chunk_size},
        {"merge_buffer_size", c.merge_buffer_size},
        {"retry", c.retry},
        {"connect_timeout_s", c.connect_timeout.count()},
        {"low_speed_timeout_s", c.low_speed_timeout.count()},
        {"progress_interval_ms", c.progress_interval.count()},
        {"cleanup", c.cleanup},
        {"log_level", c.log_level},
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    c.concurrency = j.value("concurrency", c.concurrency);
    c.min_chunk_size = j.value("min_chunk_size", c.min_chunk_size);
    c.merge_buffer_size = j.value("merge_buffer_size", c.merge_buffer_size);
    if (j.contains("retry")) {
        j.at("retry").get_to(c.retry);
    }
    c.connect_timeout = std::chrono::seconds{j.value("connect_timeout_s", c.connect_timeout.count())};
    c.low_speed_timeout = std::chrono::seconds{j.value("low_speed_timeout_s", c.low_speed_timeout.count())};
    c.progress_interval = std::chrono::milliseconds{
        j.value("progress_interval_ms", c.progress_interval.count())};
    if (j.contains("cleanup")) {
        j.at("cleanup").get_to(c.cleanup);
    }
    c.log_level = j.value("log_level", c.log_level);
}

std::expected<EngineConfig, TransferError>
parse_engine_config(std::string_view json_text) noexcept {
    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "top-level value must be an object"));
        }

        EngineConfig config = j.get<EngineConfig>();
        if (config.concurrency == 0) {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "concurrency must be positive"));
        }
        if (config.merge_buffer_size == 0) {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "merge_buffer_size must be positive"));
        }
        if (spdlog::level::from_str(config.log_level) == spdlog::level::off &&
            config.log_level != "off") {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "unknown log_level " + config.log_level));
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {}, e.what()));
    } catch (const std::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {}, e.what()));
    }
}

} // namespace haul::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace haul::core {

// Terminal outcomes of a transfer, one per failure class a caller can act on
enum class TransferErrc {
    success = 0,
    probe_failure,
    range_mismatch,
    chunk_fetch_exhausted,
    merge_failure,
    size_mismatch,
    process_spawn_failure,
    process_stall_exceeded,
    process_exit_failure,
    cancelled,
    invalid_source,
    invalid_config,
};

// Causes reported by the HTTP transport
enum class NetErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    not_found,
    forbidden,
    client_error,
    server_error,
    rate_limited,
    invalid_range,
    short_body,
    long_body,
    malformed_header,
    ssl_error,
    dns_error,
    connection_lost,
    aborted,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "haul::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:                return "Success";
            case TransferErrc::probe_failure:          return "Capability probe failed";
            case TransferErrc::range_mismatch:         return "Server did not honor the byte range";
            case TransferErrc::chunk_fetch_exhausted:  return "Chunk retries exhausted";
            case TransferErrc::merge_failure:          return "Merge failed";
            case TransferErrc::size_mismatch:          return "Merged size does not match expected size";
            case TransferErrc::process_spawn_failure:  return "Could not spawn transfer process";
            case TransferErrc::process_stall_exceeded: return "Transfer process stalled past restart budget";
            case TransferErrc::process_exit_failure:   return "Transfer process exited with an error";
            case TransferErrc::cancelled:              return "Transfer cancelled";
            case TransferErrc::invalid_source:         return "Invalid source";
            case TransferErrc::invalid_config:         return "Invalid configuration";
            default:                                   return "Unknown error";
        }
    }
};

struct NetErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "haul::net";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<NetErrc>(ev)) {
            case NetErrc::success:          return "Success";
            case NetErrc::network_error:    return "Network error";
            case NetErrc::timeout:          return "Operation timed out";
            case NetErrc::refused:          return "Connection refused";
            case NetErrc::not_found:        return "Resource not found (404)";
            case NetErrc::forbidden:        return "Access forbidden (401/403)";
            case NetErrc::client_error:     return "Client error (4xx)";
            case NetErrc::server_error:     return "Server error (5xx)";
            case NetErrc::rate_limited:     return "Rate limited (408/429)";
            case NetErrc::invalid_range:    return "Invalid byte range";
            case NetErrc::short_body:       return "Body shorter than requested span";
            case NetErrc::long_body:        return "Body longer than requested span";
            case NetErrc::malformed_header: return "Malformed response header";
            case NetErrc::ssl_error:        return "SSL/TLS error";
            case NetErrc::dns_error:        return "DNS resolution failed";
            case NetErrc::connection_lost:  return "Connection lost";
            case NetErrc::aborted:          return "Request aborted";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline const detail::NetErrcCategory& net_errc_category() noexcept {
    static detail::NetErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

inline std::error_code make_error_code(NetErrc e) noexcept {
    return {static_cast<int>(e), net_errc_category()};
}

// Transient causes are retried locally; everything else fails at once
[[nodiscard]] bool is_transient(const std::error_code& ec) noexcept;

// Failure surfaced to callers of either strategy
struct TransferError {
    std::error_code code;                    // TransferErrc
    std::error_code cause;                   // underlying NetErrc / DiskErrc / errno
    std::optional<std::uint32_t> chunk_index;
    std::optional<std::uint32_t> attempt;    // process attempt number (1-based)
    std::string detail;

    [[nodiscard]] std::string message() const;

    [[nodiscard]] bool is(TransferErrc e) const noexcept {
        return code == make_error_code(e);
    }
};

[[nodiscard]] TransferError make_transfer_error(TransferErrc code,
                                                std::error_code cause = {},
                                                std::string detail = {});

} // namespace haul::core

namespace std {

template<>
struct is_error_code_enum<haul::core::TransferErrc> : true_type {};

template<>
struct is_error_code_enum<haul::core::NetErrc> : true_type {};

} // namespace std

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/error.hpp>
#include <utility>

namespace haul::core {

bool is_transient(const std::error_code& ec) noexcept {
    if (ec.category() != net_errc_category()) {
        return false;
    }

    switch (static_cast<NetErrc>(ec.value())) {
        case NetErrc::network_error:
        case NetErrc::timeout:
        case NetErrc::refused:
        case NetErrc::server_error:
        case NetErrc::rate_limited:
        case NetErrc::short_body:
        case NetErrc::long_body:
        case NetErrc::ssl_error:
        case NetErrc::dns_error:
        case NetErrc::connection_lost:
            return true;
        default:
            return false;
    }
}

std::string TransferError::message() const {
    std::string out = code.message();

    if (chunk_index) {
        out += " [chunk " + std::to_string(*chunk_index) + "]";
    }
    if (attempt) {
        out += " [attempt " + std::to_string(*attempt) + "]";
    }
    if (cause) {
        out += ": ";
        out += cause.message();
    }
    if (!detail.empty()) {
        out += " (" + detail + ")";
    }
    return out;
}

TransferError make_transfer_error(TransferErrc code, std::error_code cause, std::string detail) {
    TransferError err;
    err.code = make_error_code(code);
    err.cause = cause;
    err.detail = std::move(detail);
    return err;
}

} // namespace haul::core

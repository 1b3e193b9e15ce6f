// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/range_fetcher.hpp>
#include <haul/core/logging.hpp>
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace haul::core {

namespace {

// Sleep for `delay` unless a stop is requested first. Returns false on stop.
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

} // namespace

RangeFetcher::RangeFetcher(std::string source,
                           std::shared_ptr<HttpTransport> transport,
                           disk::ChunkFileStore& store,
                           const EngineConfig& config,
                           bool sequential,
                           std::optional<std::uint64_t> total_size,
                           std::shared_ptr<spdlog::logger> logger)
    : source_(std::move(source))
    , transport_(std::move(transport))
    , store_(store)
    , retry_(config.retry)
    , connect_timeout_(config.connect_timeout)
    , low_speed_timeout_(config.low_speed_timeout)
    , sequential_(sequential)
    , total_size_(total_size)
    , logger_(logger_or_null(logger)) {}

std::expected<std::uint64_t, TransferError>
RangeFetcher::fetch(ChunkSpec& chunk, std::stop_token stop) noexcept {
    const std::uint32_t max_attempts = std::max<std::uint32_t>(retry_.max_attempts, 1);
    std::error_code last;

    for (std::uint32_t n = 1; n <= max_attempts; ++n) {
        if (stop.stop_requested()) {
            chunk.state = ChunkState::pending;
            return std::unexpected(make_transfer_error(TransferErrc::cancelled));
        }

        chunk.state = ChunkState::in_flight;
        chunk.attempts = n;

        std::uint64_t written = 0;
        last = attempt(chunk, written, stop);
        if (!last) {
            chunk.state = ChunkState::done;
            logger_->debug("chunk {} done ({} bytes, attempt {})", chunk.index, written, n);
            return written;
        }

        // Bytes of a failed attempt are rewritten from the chunk start
        received_.fetch_sub(written, std::memory_order_relaxed);

        if (last == TransferErrc::range_mismatch) {
            chunk.state = ChunkState::failed;
            auto err = make_transfer_error(TransferErrc::range_mismatch, {},
                                           "200 answer to a Range request");
            err.chunk_index = chunk.index;
            return std::unexpected(std::move(err));
        }

        if (stop.stop_requested()) {
            chunk.state = ChunkState::pending;
            return std::unexpected(make_transfer_error(TransferErrc::cancelled));
        }

        if (!is_transient(last)) {
            logger_->error("chunk {} failed: {}", chunk.index, last.message());
            break;
        }
        if (n == max_attempts) {
            logger_->error("chunk {} failed after {} attempts: {}", chunk.index, n, last.message());
            break;
        }

        const auto delay = retry_.backoff(n);
        logger_->warn("chunk {} attempt {}/{} failed: {}; retrying in {} ms",
                      chunk.index, n, max_attempts, last.message(), delay.count());
        if (!interruptible_sleep(delay, stop)) {
            chunk.state = ChunkState::pending;
            return std::unexpected(make_transfer_error(TransferErrc::cancelled));
        }
    }

    chunk.state = ChunkState::failed;
    auto err = make_transfer_error(TransferErrc::chunk_fetch_exhausted, last);
    err.chunk_index = chunk.index;
    err.attempt = chunk.attempts;
    return std::unexpected(std::move(err));
}

std::error_code RangeFetcher::attempt(ChunkSpec& chunk, std::uint64_t& written,
                                      std::stop_token stop) noexcept {
    if (auto ec = store_.prepare(chunk)) {
        return ec;
    }
    auto file = store_.open_for_write(chunk);
    if (!file) {
        return file.error();
    }

    HttpRequest request;
    try {
        request.url = source_;
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::allocation_failed);
    }
    request.connect_timeout = connect_timeout_;
    request.low_speed_timeout = low_speed_timeout_;
    if (!sequential_) {
        request.range = ByteRange{chunk.start, chunk.end};
    }

    // Length the body must have; unknown only for an open-ended chunk
    std::optional<std::uint64_t> expected_length;
    if (!chunk.open_ended) {
        expected_length = chunk.length();
    }

    std::error_code rejected;

    auto on_headers = [&](const HttpResponse& response) -> bool {
        if (auto ec = status_to_error(response.status_code)) {
            rejected = ec;
            return false;
        }

        if (sequential_) {
            if (response.status_code != 200) {
                rejected = make_error_code(NetErrc::client_error);
                return false;
            }
            return true;
        }

        if (response.status_code == 200) {
            rejected = make_error_code(TransferErrc::range_mismatch);
            return false;
        }
        if (response.status_code != 206) {
            rejected = make_error_code(NetErrc::client_error);
            return false;
        }

        auto header = response.header("content-range");
        auto range = header ? parse_content_range(*header) : std::nullopt;
        if (!range) {
            rejected = make_error_code(NetErrc::malformed_header);
            return false;
        }
        if (range->start != chunk.start || range->end != chunk.end ||
            (range->total && total_size_ && *range->total != *total_size_)) {
            logger_->warn("chunk {} asked {}-{}, server sent {}-{}",
                          chunk.index, chunk.start, chunk.end, range->start, range->end);
            rejected = make_error_code(NetErrc::invalid_range);
            return false;
        }
        return true;
    };

    auto on_body = [&](const char* data, std::size_t size) -> bool {
        if (expected_length && written + size > *expected_length) {
            rejected = make_error_code(NetErrc::long_body);
            return false;
        }
        auto w = file->write(written, data, size);
        if (!w) {
            rejected = w.error();
            return false;
        }
        written += size;
        received_.fetch_add(size, std::memory_order_relaxed);
        return true;
    };

    logger_->debug("chunk {} attempt {}: {} {}", chunk.index, chunk.attempts, source_,
                   request.range ? "bytes=" + range_spec(*request.range) : std::string("(whole body)"));

    auto response = transport_->get(request, on_headers, on_body, stop);
    if (rejected) {
        return rejected;
    }
    if (!response) {
        return response.error();
    }

    if (expected_length && written != *expected_length) {
        return make_error_code(NetErrc::short_body);
    }

    if (chunk.open_ended) {
        // No marker: a body of unknown length cannot be resumed
        return file->sync();
    }

    file->close();
    return store_.mark_done(chunk);
}

} // namespace haul::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/download_manager.hpp>
#include <haul/core/logging.hpp>
#include <haul/core/range_fetcher.hpp>
#include <haul/disk/chunk_file_store.hpp>
#include <haul/disk/merger.hpp>
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace haul::core {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds MIN_PROGRESS_INTERVAL{10};

} // namespace

std::string_view to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::idle:      return "idle";
        case TransferState::probing:   return "probing";
        case TransferState::fetching:  return "fetching";
        case TransferState::merging:   return "merging";
        case TransferState::completed: return "completed";
        case TransferState::failed:    return "failed";
        case TransferState::cancelled: return "cancelled";
    }
    return "unknown";
}

DownloadManager::DownloadManager(EngineConfig config,
                                 std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<ProgressChannel> progress)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , progress_(progress ? std::move(progress) : std::make_shared<ProgressChannel>(PROGRESS_QUEUE_CAPACITY))
    , logger_(configured_logger(config_.logger, config_.log_level)) {}

DownloadManager::~DownloadManager() = default;

void DownloadManager::cancel() noexcept {
    if (stop_.request_stop()) {
        logger_->info("cancel requested");
    }
}

std::expected<TransferResult, TransferError>
DownloadManager::start(TransferTarget target) noexcept {
    if (target.source.empty() || target.destination.empty()) {
        return fail(make_transfer_error(TransferErrc::invalid_source, {},
                                        target.source.empty() ? "empty source" : "empty destination"));
    }
    if (!transport_) {
        return fail(make_transfer_error(TransferErrc::invalid_config, {}, "no transport"));
    }
    if (stop_.stop_requested()) {
        return fail(make_transfer_error(TransferErrc::cancelled));
    }

    state_.store(TransferState::probing, std::memory_order_release);
    auto probed = probe(std::move(target));
    if (!probed) {
        return fail(std::move(probed.error()));
    }

    ProgressFields started{{"ranges_supported", probed->ranges_supported ? "true" : "false"}};
    if (probed->total_size) {
        started.emplace(field::total_size, std::to_string(*probed->total_size));
    }
    emit("started", std::move(started));

    state_.store(TransferState::fetching, std::memory_order_release);
    auto result = run(*probed, false);
    if (!result && result.error().is(TransferErrc::range_mismatch)) {
        logger_->warn("{} ignored the Range header; restarting as a single sequential chunk",
                      probed->source);
        result = run(*probed, true);
    }
    if (!result) {
        return fail(std::move(result.error()));
    }

    state_.store(TransferState::completed, std::memory_order_release);
    emit("completed", {
        {std::string(field::downloaded), std::to_string(result->bytes)},
        {std::string(field::chunks_total), std::to_string(result->chunks)},
    });
    logger_->info("{} complete: {} bytes in {} chunk(s), {} resumed",
                  result->destination, result->bytes, result->chunks, result->chunks_resumed);
    return result;
}

std::expected<TransferTarget, TransferError>
DownloadManager::probe(TransferTarget target) noexcept {
    HttpRequest request;
    try {
        request.url = target.source;
    } catch (const std::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::probe_failure, {}, e.what()));
    }
    request.connect_timeout = config_.connect_timeout;
    request.low_speed_timeout = config_.low_speed_timeout;

    auto response = transport_->head(request);
    if (!response) {
        return std::unexpected(make_transfer_error(TransferErrc::probe_failure, response.error()));
    }

    // HEAD not allowed: capabilities unknown, fall back to one sequential GET
    if (response->status_code == 405 || response->status_code == 501) {
        logger_->info("HEAD {} answered {}; size and range support unknown",
                      target.source, response->status_code);
        target.total_size.reset();
        target.ranges_supported = false;
        return target;
    }

    if (auto ec = status_to_error(response->status_code)) {
        return std::unexpected(make_transfer_error(TransferErrc::probe_failure, ec,
                                                   "HTTP " + std::to_string(response->status_code)));
    }

    if (auto cl = response->header("content-length"); cl && !response->content_length) {
        return std::unexpected(make_transfer_error(TransferErrc::probe_failure,
                                                   make_error_code(NetErrc::malformed_header),
                                                   "Content-Length: " + std::string(*cl)));
    }

    target.total_size = response->content_length;
    target.ranges_supported = response->accepts_ranges;
    logger_->info("probed {}: size {}, ranges {}", target.source,
                  target.total_size ? std::to_string(*target.total_size) : std::string("unknown"),
                  target.ranges_supported ? "yes" : "no");
    return target;
}

std::expected<TransferResult, TransferError>
DownloadManager::run(const TransferTarget& target, bool force_sequential) noexcept {
    if (target.total_size && *target.total_size == 0) {
        return publish_empty(target);
    }

    ChunkPlan plan = plan_chunks(target.total_size, config_.concurrency, config_.min_chunk_size,
                                 target.ranges_supported && !force_sequential);
    disk::ChunkFileStore store(target.destination, config_.cleanup, logger_);

    auto result = run_plan(target, plan, store);
    if (!result) {
        const auto& error = result.error();
        if (error.is(TransferErrc::range_mismatch)) {
            // Chunk files of a plan the server cannot serve are worthless
            for (const auto& chunk : plan.chunks) {
                store.remove(chunk);
            }
        } else if (!error.is(TransferErrc::cancelled)) {
            store.cleanup_all(plan.chunks, disk::CleanupReason::error);
        }
    }
    return result;
}

std::expected<TransferResult, TransferError>
DownloadManager::run_plan(const TransferTarget& target, ChunkPlan& plan,
                          disk::ChunkFileStore& store) noexcept {
    const auto chunk_count = static_cast<std::uint32_t>(plan.chunks.size());

    // Resume: chunks with a trusted marker are not fetched again
    std::vector<std::uint32_t> pending;
    std::uint32_t resumed = 0;
    std::uint64_t resumed_bytes = 0;
    try {
        pending.reserve(plan.chunks.size());
        for (auto& chunk : plan.chunks) {
            if (store.is_done(chunk)) {
                chunk.state = ChunkState::done;
                ++resumed;
                resumed_bytes += chunk.length();
            } else {
                pending.push_back(chunk.index);
            }
        }
    } catch (const std::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::chunk_fetch_exhausted, {}, e.what()));
    }
    if (resumed > 0) {
        logger_->info("resuming {}: {}/{} chunks already done", target.destination, resumed, chunk_count);
    }
    logger_->info("fetching {} chunk(s) of {}{}", pending.size(), target.source,
                  plan.sequential ? " sequentially" : "");

    RangeFetcher fetcher(target.source, transport_, store, config_, plan.sequential,
                         plan.total_size, logger_);

    // Stops this plan's workers on the first failure or on cancel()
    std::stop_source plan_stop;
    std::stop_callback forward_cancel(stop_.get_token(), [&plan_stop] { plan_stop.request_stop(); });

    std::atomic<std::size_t> next{0};
    std::atomic<std::uint32_t> chunks_done{resumed};
    std::mutex error_mutex;
    std::optional<TransferError> first_error;

    auto record_error = [&](TransferError error) {
        std::lock_guard<std::mutex> lock(error_mutex);
        // A real failure outranks the cancellations it causes in other workers
        if (!first_error || (first_error->is(TransferErrc::cancelled) && !error.is(TransferErrc::cancelled))) {
            first_error = std::move(error);
        }
        plan_stop.request_stop();
    };

    auto worker = [&] {
        auto token = plan_stop.get_token();
        while (!token.stop_requested()) {
            const auto slot = next.fetch_add(1, std::memory_order_relaxed);
            if (slot >= pending.size()) {
                return;
            }
            auto& chunk = plan.chunks[pending[slot]];
            auto fetched = fetcher.fetch(chunk, token);
            if (!fetched) {
                record_error(std::move(fetched.error()));
                return;
            }
            chunks_done.fetch_add(1, std::memory_order_relaxed);
        }
    };

    const auto interval = std::max(config_.progress_interval, MIN_PROGRESS_INTERVAL);
    auto monitor = [&](std::stop_token st) {
        std::mutex m;
        std::condition_variable_any cv;
        auto last_bytes = resumed_bytes;
        auto last_time = std::chrono::steady_clock::now();

        while (!st.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(m);
                cv.wait_for(lock, st, interval, [] { return false; });
            }
            if (st.stop_requested()) {
                break;
            }

            const auto now = std::chrono::steady_clock::now();
            const auto bytes = resumed_bytes + fetcher.received();
            const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_time).count();
            const std::uint64_t speed = (bytes > last_bytes && elapsed_ms > 0)
                ? (bytes - last_bytes) * 1000 / static_cast<std::uint64_t>(elapsed_ms)
                : 0;
            last_bytes = bytes;
            last_time = now;

            ProgressFields fields{
                {std::string(field::downloaded), std::to_string(bytes)},
                {std::string(field::speed_bps), std::to_string(speed)},
                {std::string(field::chunks_done), std::to_string(chunks_done.load(std::memory_order_relaxed))},
                {std::string(field::chunks_total), std::to_string(chunk_count)},
            };
            if (plan.total_size) {
                fields.emplace(field::total_size, std::to_string(*plan.total_size));
            }
            emit("progress", std::move(fields));
        }
    };

    {
        const auto worker_count = std::min<std::size_t>(std::max<std::uint32_t>(config_.concurrency, 1),
                                                        pending.size());
        std::jthread progress_thread;
        std::vector<std::jthread> workers;
        try {
            progress_thread = std::jthread(monitor);
            workers.reserve(worker_count);
            for (std::size_t i = 0; i < worker_count; ++i) {
                workers.emplace_back(worker);
            }
        } catch (const std::system_error& e) {
            logger_->error("could not start fetch workers: {}", e.what());
            record_error(make_transfer_error(TransferErrc::chunk_fetch_exhausted, e.code(),
                                             "could not start fetch workers"));
        }
        for (auto& w : workers) {
            w.join();
        }
        progress_thread.request_stop();
    }

    if (first_error) {
        return std::unexpected(std::move(*first_error));
    }
    if (stop_.stop_requested()) {
        return std::unexpected(make_transfer_error(TransferErrc::cancelled));
    }

    // Merge only over a complete, correctly sized set of chunks
    std::uint64_t on_disk = 0;
    std::vector<std::string> parts;
    try {
        parts.reserve(plan.chunks.size());
        for (const auto& chunk : plan.chunks) {
            if (chunk.state != ChunkState::done) {
                auto err = make_transfer_error(TransferErrc::merge_failure, {},
                                               "chunk is " + std::string(to_string(chunk.state)));
                err.chunk_index = chunk.index;
                return std::unexpected(std::move(err));
            }
            parts.push_back(store.chunk_path(chunk));
            std::error_code ec;
            const auto size = fs::file_size(parts.back(), ec);
            if (ec) {
                auto err = make_transfer_error(TransferErrc::merge_failure, ec, parts.back());
                err.chunk_index = chunk.index;
                return std::unexpected(std::move(err));
            }
            on_disk += size;
        }
    } catch (const std::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::merge_failure, {}, e.what()));
    }

    if (plan.total_size && on_disk != *plan.total_size) {
        return std::unexpected(make_transfer_error(
            TransferErrc::size_mismatch, {},
            "chunks hold " + std::to_string(on_disk) + " bytes, expected " + std::to_string(*plan.total_size)));
    }

    state_.store(TransferState::merging, std::memory_order_release);
    emit("merging", {{std::string(field::chunks_total), std::to_string(chunk_count)}});

    disk::Merger merger(config_.merge_buffer_size, logger_);
    auto merged = merger.merge(parts, target.destination, stop_.get_token());
    if (!merged) {
        if (merged.error() == std::errc::operation_canceled) {
            return std::unexpected(make_transfer_error(TransferErrc::cancelled));
        }
        return std::unexpected(make_transfer_error(TransferErrc::merge_failure, merged.error()));
    }

    if (*merged != on_disk) {
        std::error_code ec;
        fs::remove(target.destination, ec);
        return std::unexpected(make_transfer_error(
            TransferErrc::size_mismatch, {},
            "merged " + std::to_string(*merged) + " bytes, expected " + std::to_string(on_disk)));
    }

    store.cleanup_all(plan.chunks, disk::CleanupReason::success);

    TransferResult result;
    result.destination = target.destination;
    result.bytes = *merged;
    result.chunks = chunk_count;
    result.chunks_resumed = resumed;
    result.sequential = plan.sequential;
    return result;
}

std::expected<TransferResult, TransferError>
DownloadManager::publish_empty(const TransferTarget& target) noexcept {
    disk::Merger merger(config_.merge_buffer_size, logger_);
    auto merged = merger.merge({}, target.destination, stop_.get_token());
    if (!merged) {
        return std::unexpected(make_transfer_error(TransferErrc::merge_failure, merged.error()));
    }

    TransferResult result;
    result.destination = target.destination;
    return result;
}

std::expected<TransferResult, TransferError> DownloadManager::fail(TransferError error) noexcept {
    const bool cancelled = error.is(TransferErrc::cancelled);
    state_.store(cancelled ? TransferState::cancelled : TransferState::failed, std::memory_order_release);

    const auto text = error.message();
    if (cancelled) {
        logger_->info("transfer cancelled");
    } else {
        logger_->error("transfer failed: {}", text);
    }
    emit("failed", {{std::string(field::error), text}});
    return std::unexpected(std::move(error));
}

void DownloadManager::emit(std::string_view event, ProgressFields fields) noexcept {
    try {
        fields.insert_or_assign(std::string(field::event), std::string(event));
        fields.insert_or_assign(std::string(field::timestamp_ms), std::to_string(now_ms()));
        progress_->publish(Strategy::native, std::move(fields));
    } catch (const std::exception& e) {
        logger_->warn("dropped {} event: {}", event, e.what());
    }
}

} // namespace haul::core

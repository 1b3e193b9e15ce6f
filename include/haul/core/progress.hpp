// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haul::core {

enum class Strategy : std::uint8_t {
    native,  // chunked HTTP Range transfer
    process  // supervised external process
};

[[nodiscard]] std::string_view to_string(Strategy strategy) noexcept;

using ProgressFields = std::map<std::string, std::string, std::less<>>;

// Well-known field names
namespace field {
inline constexpr std::string_view event = "event";            // started, progress, merging, completed, failed, restarting
inline constexpr std::string_view downloaded = "downloaded";
inline constexpr std::string_view total_size = "total_size";
inline constexpr std::string_view speed_bps = "speed_bps";
inline constexpr std::string_view chunks_done = "chunks_done";
inline constexpr std::string_view chunks_total = "chunks_total";
inline constexpr std::string_view timestamp_ms = "timestamp_ms";
inline constexpr std::string_view attempt = "attempt";
inline constexpr std::string_view error = "error";
} // namespace field

struct ProgressEvent {
    Strategy strategy{Strategy::native};
    std::uint64_t sequence{0};   // strictly increasing per channel
    ProgressFields fields;

    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const;
    [[nodiscard]] std::optional<std::uint64_t> get_u64(std::string_view key) const;
};

void to_json(nlohmann::json& j, const ProgressEvent& e);

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Ordered multi-producer event stream. Events are numbered on publish; a
// bounded channel drops its oldest events when full.
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 0);  // 0: unbounded

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    // Returns the sequence number, or 0 once the channel is closed
    std::uint64_t publish(Strategy strategy, ProgressFields fields);

    [[nodiscard]] std::optional<ProgressEvent> try_pop();

    // Wait up to `timeout`; nullopt on timeout or when closed and drained
    [[nodiscard]] std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);

    [[nodiscard]] std::vector<ProgressEvent> drain();

    void close();
    [[nodiscard]] bool closed() const;

    [[nodiscard]] std::uint64_t dropped() const;

    // Invoked synchronously on the publishing thread, in sequence order. The
    // callback may publish again or replace itself.
    void callback(ProgressCallback cb);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    std::size_t capacity_;
    std::uint64_t next_sequence_{1};
    std::uint64_t dropped_{0};
    bool closed_{false};

    std::recursive_mutex delivery_mutex_;  // held across numbering and delivery
    std::mutex callback_mutex_;            // guards callback_ only
    ProgressCallback callback_;
};

[[nodiscard]] std::uint64_t now_ms() noexcept;

} // namespace haul::core

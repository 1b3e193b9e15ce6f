// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/core/progress.hpp>
#include <nlohmann/json.hpp>
#include <charconv>

namespace haul::core {

std::string_view to_string(Strategy strategy) noexcept {
    switch (strategy) {
        case Strategy::native:  return "native";
        case Strategy::process: return "process";
    }
    return "unknown";
}

std::optional<std::string_view> ProgressEvent::get(std::string_view key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::optional<std::uint64_t> ProgressEvent::get_u64(std::string_view key) const {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    std::uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), out);
    if (ec != std::errc{} || ptr != value->data() + value->size()) {
        return std::nullopt;
    }
    return out;
}

void to_json(nlohmann::json& j, const ProgressEvent& e) {
    j = nlohmann::json{
        {"strategy", std::string(to_string(e.strategy))},
        {"sequence", e.sequence},
        {"fields", e.fields},
    };
}

//=============================================================================
// ProgressChannel
//=============================================================================

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(capacity) {}

std::uint64_t ProgressChannel::publish(Strategy strategy, ProgressFields fields) {
    // Callbacks observe sequence order; re-entry from a callback is allowed
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex_);

    ProgressEvent event;
    event.strategy = strategy;
    event.fields = std::move(fields);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }
        event.sequence = next_sequence_++;
        if (capacity_ > 0 && queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();

    ProgressCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) {
        cb(event);
    }
    return event.sequence;
}

std::optional<ProgressEvent> ProgressChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressEvent> out(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::uint64_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void ProgressChannel::callback(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(cb);
}

std::uint64_t now_ms() noexcept {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace haul::core

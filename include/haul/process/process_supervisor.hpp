// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <haul/core/progress.hpp>
#include <haul/process/child_process.hpp>
#include <haul/process/supervisor_state.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog { class logger; }

namespace haul::process {

constexpr std::chrono::seconds DEFAULT_STALL_TIMEOUT{20};
constexpr std::uint32_t DEFAULT_MAX_RESTARTS = 3;
constexpr std::chrono::milliseconds DEFAULT_RESTART_BACKOFF{2000};
constexpr std::chrono::milliseconds POLL_SLICE{100};   // cancellation latency while waiting on the child
constexpr std::string_view DEFAULT_PROGRAM = "ffmpeg";

struct SupervisorOptions {
    std::chrono::milliseconds stall_timeout{DEFAULT_STALL_TIMEOUT};
    bool auto_restart{true};
    std::uint32_t max_restarts{DEFAULT_MAX_RESTARTS};
    std::chrono::milliseconds restart_backoff{DEFAULT_RESTART_BACKOFF};  // doubled per restart
    std::string program{DEFAULT_PROGRAM};
    std::shared_ptr<spdlog::logger> logger;  // null: a silent logger is used
};

// JSON keys: stall_timeout_ms, auto_restart, max_restarts, restart_backoff_ms, program
void to_json(nlohmann::json& j, const SupervisorOptions& o);
void from_json(const nlohmann::json& j, SupervisorOptions& o);

[[nodiscard]] std::expected<SupervisorOptions, core::TransferError>
parse_supervisor_options(std::string_view json_text) noexcept;

struct ProcessResult {
    std::string destination;
    std::uint32_t attempts{0};
    std::uint32_t restarts{0};
    core::ProgressFields last_progress;
};

// Runs an external transfer program against one source, restarting it on
// stalls, and publishes its output only after a clean exit.
class ProcessSupervisor {
public:
    ProcessSupervisor(SupervisorOptions options,
                      std::shared_ptr<ProcessLauncher> launcher,
                      std::shared_ptr<core::ProgressChannel> progress = nullptr);

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Blocks until Completed, Failed or cancel()
    [[nodiscard]] std::expected<ProcessResult, core::TransferError>
    start(const std::string& source, const std::string& destination) noexcept;

    // Thread-safe; kills the child and discards its temp output
    void cancel() noexcept;

    [[nodiscard]] ProcessState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const SupervisorOptions& options() const noexcept { return options_; }
    [[nodiscard]] const std::shared_ptr<core::ProgressChannel>& progress() const noexcept { return progress_; }

    // `<dir>/<stem>.partial<ext>`; keeps the extension so the program can
    // pick the container from it
    [[nodiscard]] static std::string temp_path(const std::string& destination);

    // Arguments after the program name
    [[nodiscard]] static std::vector<std::string> build_args(const std::string& source,
                                                             const std::string& output);

private:
    enum class RunOutcome : std::uint8_t { exited, stalled, cancelled };

    // Read progress until the child exits, stalls or a stop is requested.
    // Stall and stop checks keep running after stdout closes; `exit_code`
    // is set once the child is reaped.
    RunOutcome supervise(ChildProcess& child, SupervisorStateMachine& fsm,
                         core::ProgressFields& last_progress, std::optional<int>& exit_code);

    std::expected<ProcessResult, core::TransferError>
    fail(const SupervisorStateMachine& fsm, core::TransferError error, const std::string& temp) noexcept;

    void emit(std::string_view event, std::uint32_t attempt, core::ProgressFields fields = {}) noexcept;

    const SupervisorOptions options_;
    std::shared_ptr<ProcessLauncher> launcher_;
    std::shared_ptr<core::ProgressChannel> progress_;
    std::shared_ptr<spdlog::logger> logger_;
    std::stop_source stop_;
    std::atomic<ProcessState> state_{ProcessState::starting};
};

} // namespace haul::process

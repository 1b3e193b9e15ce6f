// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <haul/core/error.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace haul::process {

// Supervised process state machine
enum class ProcessState : std::uint8_t {
    starting,    // Spawned, no progress parsed yet
    running,     // Reporting progress
    stalled,     // No progress within stall_timeout
    restarting,  // Killed, fresh process pending
    completed,   // Clean exit (terminal)
    failed       // Terminal error
};

[[nodiscard]] std::string_view to_string(ProcessState state) noexcept;

// What the supervisor must do after an event
enum class SupervisorAction : std::uint8_t {
    none,
    restart,    // kill the child, back off, spawn again
    complete,   // publish the temp output
    fail        // kill the child if alive, discard the temp output
};

// Restart policy as discrete transitions; no clocks, no processes.
class SupervisorStateMachine {
public:
    SupervisorStateMachine(bool auto_restart, std::uint32_t max_restarts) noexcept;

    // A parsed progress line arrived
    SupervisorAction on_progress() noexcept;

    // stall_timeout elapsed without progress
    SupervisorAction on_stall() noexcept;

    // The child exited with `code`
    SupervisorAction on_exit(int code) noexcept;

    // The child could not be spawned
    SupervisorAction on_spawn_failure() noexcept;

    // A replacement process was spawned after restart
    void on_restarted() noexcept;

    [[nodiscard]] ProcessState state() const noexcept { return state_; }
    [[nodiscard]] std::uint32_t restart_count() const noexcept { return restart_count_; }
    [[nodiscard]] std::uint32_t attempt() const noexcept { return restart_count_ + 1; }
    [[nodiscard]] bool terminal() const noexcept {
        return state_ == ProcessState::completed || state_ == ProcessState::failed;
    }

    // Why the machine failed; empty unless state() == failed
    [[nodiscard]] std::optional<core::TransferErrc> failure() const noexcept { return failure_; }
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

private:
    SupervisorAction fail_with(core::TransferErrc reason) noexcept;

    bool auto_restart_;
    std::uint32_t max_restarts_;
    std::uint32_t restart_count_{0};
    ProcessState state_{ProcessState::starting};
    std::optional<core::TransferErrc> failure_;
    std::optional<int> exit_code_;
};

} // namespace haul::process

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/process/supervisor_state.hpp>

namespace haul::process {

std::string_view to_string(ProcessState state) noexcept {
    switch (state) {
        case ProcessState::starting:   return "starting";
        case ProcessState::running:    return "running";
        case ProcessState::stalled:    return "stalled";
        case ProcessState::restarting: return "restarting";
        case ProcessState::completed:  return "completed";
        case ProcessState::failed:     return "failed";
    }
    return "unknown";
}

SupervisorStateMachine::SupervisorStateMachine(bool auto_restart, std::uint32_t max_restarts) noexcept
    : auto_restart_(auto_restart)
    , max_restarts_(max_restarts) {}

SupervisorAction SupervisorStateMachine::on_progress() noexcept {
    if (state_ == ProcessState::starting) {
        state_ = ProcessState::running;
    }
    return SupervisorAction::none;
}

SupervisorAction SupervisorStateMachine::on_stall() noexcept {
    if (state_ != ProcessState::starting && state_ != ProcessState::running) {
        return SupervisorAction::none;
    }

    state_ = ProcessState::stalled;
    if (auto_restart_ && restart_count_ < max_restarts_) {
        ++restart_count_;
        state_ = ProcessState::restarting;
        return SupervisorAction::restart;
    }
    return fail_with(core::TransferErrc::process_stall_exceeded);
}

SupervisorAction SupervisorStateMachine::on_exit(int code) noexcept {
    if (state_ != ProcessState::starting && state_ != ProcessState::running) {
        return SupervisorAction::none;
    }

    exit_code_ = code;
    if (code == 0) {
        state_ = ProcessState::completed;
        return SupervisorAction::complete;
    }
    return fail_with(core::TransferErrc::process_exit_failure);
}

SupervisorAction SupervisorStateMachine::on_spawn_failure() noexcept {
    if (terminal()) {
        return SupervisorAction::none;
    }
    return fail_with(core::TransferErrc::process_spawn_failure);
}

void SupervisorStateMachine::on_restarted() noexcept {
    if (state_ == ProcessState::restarting) {
        state_ = ProcessState::starting;
    }
}

SupervisorAction SupervisorStateMachine::fail_with(core::TransferErrc reason) noexcept {
    state_ = ProcessState::failed;
    failure_ = reason;
    return SupervisorAction::fail;
}

} // namespace haul::process

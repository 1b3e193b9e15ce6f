// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/process/process_supervisor.hpp>
#include <haul/process/progress_parser.hpp>
#include <haul/core/config.hpp>
#include <haul/core/logging.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <mutex>

namespace haul::process {

namespace fs = std::filesystem;

namespace {

// Returns false when a stop was requested before `delay` elapsed
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

std::chrono::milliseconds restart_delay(std::chrono::milliseconds base, std::uint32_t restart) noexcept {
    if (restart == 0) {
        return std::chrono::milliseconds{0};
    }
    const auto shift = std::min<std::uint32_t>(restart - 1, 16);
    return base * (std::int64_t{1} << shift);
}

} // namespace

//=============================================================================
// Options
//=============================================================================

void to_json(nlohmann::json& j, const SupervisorOptions& o) {
    j = nlohmann::json{
        {"stall_timeout_ms", o.stall_timeout.count()},
        {"auto_restart", o.auto_restart},
        {"max_restarts", o.max_restarts},
        {"restart_backoff_ms", o.restart_backoff.count()},
        {"program", o.program},
    };
}

void from_json(const nlohmann::json& j, SupervisorOptions& o) {
    o.stall_timeout = std::chrono::milliseconds{j.value("stall_timeout_ms", o.stall_timeout.count())};
    o.auto_restart = j.value("auto_restart", o.auto_restart);
    o.max_restarts = j.value("max_restarts", o.max_restarts);
    o.restart_backoff = std::chrono::milliseconds{j.value("restart_backoff_ms", o.restart_backoff.count())};
    o.program = j.value("program", o.program);
}

std::expected<SupervisorOptions, core::TransferError>
parse_supervisor_options(std::string_view json_text) noexcept {
    using core::TransferErrc;
    using core::make_transfer_error;

    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "expected a JSON object"));
        }

        SupervisorOptions options;
        j.get_to(options);
        if (options.stall_timeout.count() <= 0) {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "stall_timeout_ms must be positive"));
        }
        if (options.program.empty()) {
            return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {},
                                                       "program must not be empty"));
        }
        return options;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {}, e.what()));
    } catch (const std::exception& e) {
        return std::unexpected(make_transfer_error(TransferErrc::invalid_config, {}, e.what()));
    }
}

//=============================================================================
// ProcessSupervisor
//=============================================================================

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options,
                                     std::shared_ptr<ProcessLauncher> launcher,
                                     std::shared_ptr<core::ProgressChannel> progress)
    : options_(std::move(options))
    , launcher_(std::move(launcher))
    , progress_(progress ? std::move(progress)
                         : std::make_shared<core::ProgressChannel>(core::PROGRESS_QUEUE_CAPACITY))
    , logger_(core::logger_or_null(options_.logger)) {}

void ProcessSupervisor::cancel() noexcept {
    if (stop_.request_stop()) {
        logger_->info("cancel requested");
    }
}

std::string ProcessSupervisor::temp_path(const std::string& destination) {
    const fs::path path(destination);
    auto name = path.stem().string() + ".partial" + path.extension().string();
    return (path.parent_path() / name).string();
}

std::vector<std::string> ProcessSupervisor::build_args(const std::string& source,
                                                       const std::string& output) {
    return {
        "-nostdin",
        "-y",
        "-i", source,
        "-c", "copy",
        "-progress", "pipe:1",
        "-nostats",
        output,
    };
}

std::expected<ProcessResult, core::TransferError>
ProcessSupervisor::start(const std::string& source, const std::string& destination) noexcept {
    using core::TransferErrc;
    using core::make_transfer_error;

    SupervisorStateMachine fsm(options_.auto_restart, options_.max_restarts);

    if (source.empty() || destination.empty()) {
        return fail(fsm, make_transfer_error(TransferErrc::invalid_source, {},
                                             source.empty() ? "empty source" : "empty destination"), {});
    }
    if (!launcher_) {
        return fail(fsm, make_transfer_error(TransferErrc::invalid_config, {}, "no launcher"), {});
    }

    std::string temp;
    ProcessResult result;
    try {
        temp = temp_path(destination);
        result.destination = destination;
    } catch (const std::exception& e) {
        return fail(fsm, make_transfer_error(TransferErrc::invalid_source, {}, e.what()), {});
    }

    for (;;) {
        if (stop_.stop_requested()) {
            return fail(fsm, make_transfer_error(TransferErrc::cancelled), temp);
        }

        const auto attempt = fsm.attempt();
        state_.store(fsm.state(), std::memory_order_release);
        emit("started", attempt);
        logger_->info("starting {} for {} (attempt {})", options_.program, source, attempt);

        std::vector<std::string> args;
        try {
            args = build_args(source, temp);
        } catch (const std::exception& e) {
            fsm.on_spawn_failure();
            return fail(fsm, make_transfer_error(TransferErrc::process_spawn_failure, {}, e.what()), temp);
        }

        auto child = launcher_->launch(options_.program, args);
        if (!child) {
            fsm.on_spawn_failure();
            return fail(fsm, make_transfer_error(TransferErrc::process_spawn_failure, child.error(),
                                                 options_.program), temp);
        }

        RunOutcome outcome;
        std::optional<int> exit_code;
        try {
            outcome = supervise(**child, fsm, result.last_progress, exit_code);
        } catch (const std::exception& e) {
            (*child)->terminate();
            if (auto reaped = (*child)->wait(); !reaped) {
                logger_->warn("could not reap child: {}", reaped.error().message());
            }
            fsm.on_exit(-1);
            return fail(fsm, make_transfer_error(TransferErrc::process_exit_failure, {}, e.what()), temp);
        }

        if (outcome != RunOutcome::exited) {
            // Strict stop-then-start: the old child is reaped before anything else
            (*child)->terminate();
            if (auto reaped = (*child)->wait(); !reaped) {
                logger_->warn("could not reap child: {}", reaped.error().message());
            }
        }

        if (outcome == RunOutcome::cancelled) {
            return fail(fsm, make_transfer_error(TransferErrc::cancelled), temp);
        }

        if (outcome == RunOutcome::stalled) {
            const auto action = fsm.on_stall();
            state_.store(fsm.state(), std::memory_order_release);
            if (action != SupervisorAction::restart) {
                return fail(fsm, make_transfer_error(TransferErrc::process_stall_exceeded, {},
                                                     "no progress for " +
                                                     std::to_string(options_.stall_timeout.count()) + " ms"),
                            temp);
            }

            const auto delay = restart_delay(options_.restart_backoff, fsm.restart_count());
            logger_->warn("{} stalled; restart {}/{} in {} ms", options_.program,
                          fsm.restart_count(), options_.max_restarts, delay.count());
            emit("restarting", attempt);
            if (!interruptible_sleep(delay, stop_.get_token())) {
                return fail(fsm, make_transfer_error(TransferErrc::cancelled), temp);
            }
            fsm.on_restarted();
            continue;
        }

        // Already reaped unless a read error killed the child
        auto code = exit_code ? std::expected<int, std::error_code>(*exit_code) : (*child)->wait();
        if (!code) {
            fsm.on_exit(-1);
            return fail(fsm, make_transfer_error(TransferErrc::process_exit_failure, code.error()), temp);
        }

        if (fsm.on_exit(*code) != SupervisorAction::complete) {
            return fail(fsm, make_transfer_error(TransferErrc::process_exit_failure, {},
                                                 "exit code " + std::to_string(*code)), temp);
        }

        std::error_code ec;
        fs::rename(temp, destination, ec);
        if (ec) {
            return fail(fsm, make_transfer_error(TransferErrc::process_exit_failure, ec,
                                                 "could not publish " + temp), temp);
        }

        state_.store(ProcessState::completed, std::memory_order_release);
        result.attempts = attempt;
        result.restarts = fsm.restart_count();
        emit("completed", attempt);
        logger_->info("{} complete after {} attempt(s)", destination, attempt);
        return result;
    }
}

ProcessSupervisor::RunOutcome
ProcessSupervisor::supervise(ChildProcess& child, SupervisorStateMachine& fsm,
                             core::ProgressFields& last_progress, std::optional<int>& exit_code) {
    using clock = std::chrono::steady_clock;

    ProgressParser parser;
    auto token = stop_.get_token();
    auto last = clock::now();
    bool stdout_open = true;

    auto publish = [&](core::ProgressFields block) {
        last_progress = block;
        emit("progress", fsm.attempt(), std::move(block));
    };

    for (;;) {
        if (token.stop_requested()) {
            return RunOutcome::cancelled;
        }

        const auto quiet = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - last);
        if (quiet >= options_.stall_timeout) {
            logger_->warn("no progress from {} for {} ms (state {})", options_.program, quiet.count(),
                          to_string(fsm.state()));
            return RunOutcome::stalled;
        }

        const auto wait = std::clamp(options_.stall_timeout - quiet,
                                     std::chrono::milliseconds{1}, POLL_SLICE);

        // stdout closed: the child may still run, so reap it under the same checks
        if (!stdout_open) {
            auto reaped = child.wait_for(wait);
            if (!reaped) {
                logger_->warn("could not reap {}: {}", options_.program, reaped.error().message());
                child.terminate();
                return RunOutcome::exited;
            }
            if (*reaped) {
                exit_code = **reaped;
                return RunOutcome::exited;
            }
            continue;
        }

        auto read = child.read_line(wait);

        switch (read.status) {
            case ReadStatus::line: {
                auto fed = parser.feed(read.line);
                if (fed.parsed) {
                    last = clock::now();
                    fsm.on_progress();
                    state_.store(fsm.state(), std::memory_order_release);
                } else if (!read.line.empty()) {
                    logger_->debug("skipping progress line '{}'", read.line);
                }
                if (fed.block) {
                    publish(std::move(*fed.block));
                }
                break;
            }
            case ReadStatus::timeout:
                break;
            case ReadStatus::eof:
                if (auto block = parser.flush()) {
                    publish(std::move(*block));
                }
                stdout_open = false;
                break;
            case ReadStatus::error:
                child.terminate();
                return RunOutcome::exited;
        }
    }
}

std::expected<ProcessResult, core::TransferError>
ProcessSupervisor::fail(const SupervisorStateMachine& fsm, core::TransferError error,
                        const std::string& temp) noexcept {
    error.attempt = fsm.attempt();
    state_.store(ProcessState::failed, std::memory_order_release);

    if (!temp.empty()) {
        std::error_code ec;
        fs::remove(temp, ec);
        if (ec) {
            logger_->warn("could not remove {}: {}", temp, ec.message());
        }
    }

    const auto text = error.message();
    if (error.is(core::TransferErrc::cancelled)) {
        logger_->info("process transfer cancelled");
    } else {
        logger_->error("process transfer failed: {}", text);
    }
    emit("failed", fsm.attempt(), {{std::string(core::field::error), text}});
    return std::unexpected(std::move(error));
}

void ProcessSupervisor::emit(std::string_view event, std::uint32_t attempt,
                             core::ProgressFields fields) noexcept {
    try {
        fields.insert_or_assign(std::string(core::field::event), std::string(event));
        fields.insert_or_assign(std::string(core::field::attempt), std::to_string(attempt));
        fields.insert_or_assign(std::string(core::field::timestamp_ms), std::to_string(core::now_ms()));
        progress_->publish(core::Strategy::process, std::move(fields));
    } catch (const std::exception& e) {
        logger_->warn("dropped {} event: {}", event, e.what());
    }
}

} // namespace haul::process

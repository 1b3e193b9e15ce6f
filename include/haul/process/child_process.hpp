// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace spdlog { class logger; }

namespace haul::process {

enum class ReadStatus : std::uint8_t {
    line,     // `line` holds one stdout line without its newline
    timeout,  // nothing complete arrived in time
    eof,      // stdout closed
    error     // read failed
};

struct ReadResult {
    ReadStatus status{ReadStatus::timeout};
    std::string line;
};

// A spawned child with a piped stdout
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    // Wait up to `timeout` for the next stdout line
    [[nodiscard]] virtual ReadResult read_line(std::chrono::milliseconds timeout) = 0;

    // Kill the child; wait() still has to reap it
    virtual void terminate() noexcept = 0;

    // Block until the child exits. Death by signal N reports 128 + N.
    [[nodiscard]] virtual std::expected<int, std::error_code> wait() noexcept = 0;

    // Reap the child if it exits within `timeout`; nullopt while it still
    // runs. Keeps draining stderr meanwhile.
    [[nodiscard]] virtual std::expected<std::optional<int>, std::error_code>
    wait_for(std::chrono::milliseconds timeout) noexcept = 0;
};

// Process seam of the supervisor
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // `args` excludes the program name
    [[nodiscard]] virtual std::expected<std::unique_ptr<ChildProcess>, std::error_code>
    launch(const std::string& program, const std::vector<std::string>& args) noexcept = 0;
};

// posix_spawnp with stdin on /dev/null and stdout/stderr on pipes. Child
// stderr lines go to the logger at debug level.
class PosixProcessLauncher final : public ProcessLauncher {
public:
    explicit PosixProcessLauncher(std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] std::expected<std::unique_ptr<ChildProcess>, std::error_code>
    launch(const std::string& program, const std::vector<std::string>& args) noexcept override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace haul::process

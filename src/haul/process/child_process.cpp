// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/process/child_process.hpp>
#include <haul/core/logging.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <optional>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace haul::process {

namespace {

constexpr std::size_t READ_CHUNK = 4096;
constexpr std::int64_t REAP_SLICE_MS = 20;  // waitpid polling interval

std::error_code last_error() noexcept {
    return {errno, std::system_category()};
}

// Owned file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

// Remove and return the first complete line of `buffer`
std::optional<std::string> take_line(std::string& buffer) {
    auto nl = buffer.find('\n');
    if (nl == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer.substr(0, nl);
    buffer.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

class PosixChildProcess final : public ChildProcess {
public:
    PosixChildProcess(pid_t pid, UniqueFd out, UniqueFd err, std::shared_ptr<spdlog::logger> logger)
        : pid_(pid)
        , out_(std::move(out))
        , err_(std::move(err))
        , logger_(std::move(logger)) {}

    ~PosixChildProcess() override {
        if (!reaped_) {
            ::kill(pid_, SIGKILL);
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        }
    }

    ReadResult read_line(std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        for (;;) {
            if (auto line = take_line(out_buffer_)) {
                return {ReadStatus::line, std::move(*line)};
            }
            if (!out_) {
                if (!out_buffer_.empty()) {
                    // Last line without a trailing newline
                    std::string line = std::move(out_buffer_);
                    out_buffer_.clear();
                    return {ReadStatus::line, std::move(line)};
                }
                return {ReadStatus::eof, {}};
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            const int wait_ms = static_cast<int>(std::max<std::int64_t>(remaining.count(), 0));

            pollfd fds[2] = {{out_.get(), POLLIN, 0}, {err_.get(), POLLIN, 0}};
            const nfds_t count = err_ ? 2 : 1;
            const int rc = ::poll(fds, count, wait_ms);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                logger_->warn("poll on child {} failed: {}", pid_, last_error().message());
                return {ReadStatus::error, {}};
            }
            if (rc == 0) {
                return {ReadStatus::timeout, {}};
            }

            if (count > 1 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                drain_stderr();
            }
            if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                char buf[READ_CHUNK];
                const ssize_t n = ::read(out_.get(), buf, sizeof(buf));
                if (n > 0) {
                    out_buffer_.append(buf, static_cast<std::size_t>(n));
                } else if (n == 0) {
                    out_.reset();
                } else if (errno != EINTR && errno != EAGAIN) {
                    logger_->warn("read from child {} failed: {}", pid_, last_error().message());
                    return {ReadStatus::error, {}};
                }
            } else if (std::chrono::steady_clock::now() >= deadline) {
                return {ReadStatus::timeout, {}};
            }
        }
    }

    void terminate() noexcept override {
        if (!reaped_) {
            ::kill(pid_, SIGKILL);
        }
    }

    std::expected<int, std::error_code> wait() noexcept override {
        if (reaped_) {
            return exit_code_;
        }

        int status = 0;
        pid_t rc;
        do {
            rc = ::waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            return std::unexpected(last_error());
        }

        return record(status);
    }

    std::expected<std::optional<int>, std::error_code>
    wait_for(std::chrono::milliseconds timeout) noexcept override {
        if (reaped_) {
            return exit_code_;
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            int status = 0;
            const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(last_error());
            }
            if (rc == pid_) {
                return record(status);
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }
            const int slice_ms = static_cast<int>(std::min<std::int64_t>(remaining.count(), REAP_SLICE_MS));

            if (err_) {
                pollfd fd{err_.get(), POLLIN, 0};
                const int polled = ::poll(&fd, 1, slice_ms);
                if (polled > 0 && (fd.revents & (POLLIN | POLLHUP | POLLERR))) {
                    try {
                        drain_stderr();
                    } catch (const std::bad_alloc&) {
                        err_buffer_.clear();
                        err_.reset();
                    }
                } else if (polled < 0 && errno != EINTR) {
                    return std::unexpected(last_error());
                }
            } else {
                ::usleep(static_cast<useconds_t>(slice_ms) * 1000);
            }
        }
    }

private:
    int record(int status) noexcept {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
        return exit_code_;
    }

    void drain_stderr() {
        char buf[READ_CHUNK];
        const ssize_t n = ::read(err_.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                err_.reset();
            }
            return;
        }
        if (n == 0) {
            if (!err_buffer_.empty()) {
                logger_->debug("[child {} stderr] {}", pid_, err_buffer_);
                err_buffer_.clear();
            }
            err_.reset();
            return;
        }

        err_buffer_.append(buf, static_cast<std::size_t>(n));
        while (auto line = take_line(err_buffer_)) {
            logger_->debug("[child {} stderr] {}", pid_, *line);
        }
    }

    pid_t pid_;
    UniqueFd out_;
    UniqueFd err_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string out_buffer_;
    std::string err_buffer_;
    bool reaped_{false};
    int exit_code_{-1};
};

// posix_spawn_file_actions_t cleanup
struct SpawnActions {
    posix_spawn_file_actions_t actions;
    SpawnActions() { posix_spawn_file_actions_init(&actions); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions); }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;
};

} // namespace

PosixProcessLauncher::PosixProcessLauncher(std::shared_ptr<spdlog::logger> logger)
    : logger_(core::logger_or_null(logger)) {}

std::expected<std::unique_ptr<ChildProcess>, std::error_code>
PosixProcessLauncher::launch(const std::string& program, const std::vector<std::string>& args) noexcept {
    try {
        int out_pipe[2];
        if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
            return std::unexpected(last_error());
        }
        UniqueFd out_read(out_pipe[0]);
        UniqueFd out_write(out_pipe[1]);

        int err_pipe[2];
        if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
            return std::unexpected(last_error());
        }
        UniqueFd err_read(err_pipe[0]);
        UniqueFd err_write(err_pipe[1]);

        SpawnActions spawn;
        posix_spawn_file_actions_addopen(&spawn.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&spawn.actions, out_write.get(), STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&spawn.actions, err_write.get(), STDERR_FILENO);

        std::vector<std::string> storage;
        storage.reserve(args.size() + 1);
        storage.push_back(program);
        storage.insert(storage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(storage.size() + 1);
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        pid_t pid = -1;
        const int rc = ::posix_spawnp(&pid, program.c_str(), &spawn.actions, nullptr, argv.data(), environ);
        if (rc != 0) {
            logger_->error("could not launch {}: {}", program, std::system_category().message(rc));
            return std::unexpected(std::error_code(rc, std::system_category()));
        }

        logger_->debug("launched {} with process id {}", program, pid);
        return std::make_unique<PosixChildProcess>(pid, std::move(out_read), std::move(err_read), logger_);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace haul::process

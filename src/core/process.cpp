/*
 * Copyright 2025 Rotor Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Rotor Process Supervisor - Implementation

#include "process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "errors.hpp"
#include "filesystem.hpp"

namespace rotor::core {

namespace {

constexpr std::chrono::milliseconds SETTLE_POLL_INTERVAL{25};
constexpr size_t READ_CHUNK_SIZE = 4096;
constexpr size_t MAX_LINE_LENGTH = 16384;

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) {
        ::close(fds[0]);
        fds[0] = -1;
    }
    if (fds[1] >= 0) {
        ::close(fds[1]);
        fds[1] = -1;
    }
}

// Child side of fork(): only async-signal-safe calls from here on
[[noreturn]] void exec_child(const char* path, char* const* argv, int output_fd, int error_fd) {
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigaction(SIGPIPE, &dfl, nullptr);
    sigaction(SIGHUP, &dfl, nullptr);
    sigaction(SIGINT, &dfl, nullptr);
    sigaction(SIGTERM, &dfl, nullptr);

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
    }

    ::dup2(output_fd, STDOUT_FILENO);
    ::dup2(output_fd, STDERR_FILENO);

    ::execv(path, argv);

    // exec failed: report errno through the close-on-exec pipe
    int err = errno;
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

}  // namespace

std::unique_ptr<SupervisedProcess> SupervisedProcess::start(ProcessSpec spec,
                                                            std::stop_token stop,
                                                            std::error_code& error_out) {
    auto* log = logging::logger();
    error_out.clear();

    auto path = find_executable(spec.program);
    if (!path) {
        error_out = make_error_code(Errc::missing_executable);
        LOG_ERROR(log, "Program not found: service={}, port={}, program={}", spec.service,
                  spec.port, spec.program);
        return nullptr;
    }

    // argv is built before fork so the child does not allocate
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(*path);
    for (const auto& arg : spec.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int output_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    if (::pipe2(output_pipe, O_CLOEXEC) != 0) {
        error_out = make_error_code(Errc::launch_failed);
        LOG_PROCESS_ERROR(log, "Failed to create output pipe", spec.service, spec.port, -1,
                          last_system_error());
        return nullptr;
    }
    if (::pipe2(error_pipe, O_CLOEXEC) != 0) {
        error_out = make_error_code(Errc::launch_failed);
        LOG_PROCESS_ERROR(log, "Failed to create exec status pipe", spec.service, spec.port, -1,
                          last_system_error());
        close_pipe(output_pipe);
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error_out = make_error_code(Errc::launch_failed);
        LOG_PROCESS_ERROR(log, "fork failed", spec.service, spec.port, -1, last_system_error());
        close_pipe(output_pipe);
        close_pipe(error_pipe);
        return nullptr;
    }

    if (pid == 0) {
        exec_child(argv[0], argv.data(), output_pipe[1], error_pipe[1]);
    }

    // Parent: keep only the read end of the output pipe
    ::close(output_pipe[1]);
    output_pipe[1] = -1;
    ::close(error_pipe[1]);
    error_pipe[1] = -1;

    // EOF on the status pipe means exec succeeded
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        ::close(output_pipe[0]);
        error_out = make_error_code(Errc::launch_failed);
        LOG_ERROR(log, "exec failed: service={}, port={}, program={}, error={}", spec.service,
                  spec.port, *path, std::strerror(exec_errno));
        return nullptr;
    }

    auto process = std::make_unique<SupervisedProcess>(ConstructionKey{}, std::move(spec), pid,
                                                       output_pipe[0]);

    // Settle window: the process has to stay up for a moment to count as started
    auto deadline = std::chrono::steady_clock::now() + process->spec_.settle;
    while (std::chrono::steady_clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!sleep_for(stop, std::min(remaining, SETTLE_POLL_INTERVAL))) {
            if (auto ec = process->terminate(); ec) {
                LOG_PROCESS_ERROR(log, "Failed to kill process after cancelled start",
                                  process->service(), process->port(), pid, ec);
            }
            process->wait();
            error_out = make_error_code(Errc::shutting_down);
            return nullptr;
        }

        siginfo_t info{};
        info.si_pid = 0;
        int rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) {
            // Flush whatever the process said before dying, then reap it
            process->wait();
            auto status = process->exit_status();
            LOG_ERROR(log, "Process exited during settle window: service={}, port={}, pid={}, {}",
                      process->service(), process->port(), pid,
                      status ? describe_exit(*status) : std::string("status unknown"));
            error_out = make_error_code(Errc::exited_during_settle);
            return nullptr;
        }
    }

    LOG_PROCESS(log, "running", process->service(), process->port(), process->pid());
    return process;
}

SupervisedProcess::SupervisedProcess(ConstructionKey, ProcessSpec spec, pid_t pid,
                                     int output_fd)
    : spec_(std::move(spec)), pid_(pid), output_fd_(output_fd) {}

SupervisedProcess::~SupervisedProcess() {
    if (auto ec = terminate(); ec) {
        LOG_PROCESS_ERROR(logging::logger(), "Failed to kill process", spec_.service, spec_.port,
                          static_cast<int>(pid_), ec);
    }

    if (waiter_.joinable()) {
        waiter_.join();
    }

    if (output_fd_ >= 0) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
}

void SupervisedProcess::wait() {
    if (wait_started_.exchange(true)) {
        exited_.wait();
        return;
    }

    auto* log = logging::logger();

    std::string pending;
    std::array<char, READ_CHUNK_SIZE> buffer{};

    while (true) {
        ssize_t n = ::read(output_fd_, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_PROCESS_ERROR(log, "Output error", spec_.service, spec_.port, pid(),
                              make_error_code(Errc::stream_error));
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer.data(), static_cast<size_t>(n));

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            emit(std::string_view(pending).substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);

        // A line without terminator must not grow without bound
        if (pending.size() > MAX_LINE_LENGTH) {
            emit(pending);
            pending.clear();
        }
    }

    if (!pending.empty()) {
        emit(pending);
    }

    ::close(output_fd_);
    output_fd_ = -1;

    if (auto ec = reap(); ec) {
        LOG_PROCESS_ERROR(log, "Failed to reap process", spec_.service, spec_.port,
                          static_cast<int>(pid_), ec);
        return;
    }

    auto status = exit_status();
    LOG_INFO(log, "Process exited: service={}, port={}, pid={}, {}", spec_.service, spec_.port,
             static_cast<int>(pid_),
             status ? describe_exit(*status) : std::string("status unknown"));
}

void SupervisedProcess::wait_async() {
    if (waiter_.joinable()) {
        return;
    }
    waiter_ = std::thread([this] { wait(); });
}

std::error_code SupervisedProcess::terminate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_.has_value()) {
            return {};
        }

        LOG_DEBUG(logging::logger(), "Killing process: service={}, port={}, pid={}",
                  spec_.service, spec_.port, static_cast<int>(pid_));
        if (::kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
            return last_system_error();
        }
    }

    return reap();
}

std::optional<int> SupervisedProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void SupervisedProcess::emit(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return;
    }

    if (!spec_.classifier) {
        logging::log_process_line(logging::Severity::Info, spec_.service, spec_.port, pid(), line);
        return;
    }

    ClassifiedLine classified = spec_.classifier(line);
    logging::log_process_line(classified.severity, spec_.service, spec_.port, pid(),
                              classified.message);
}

std::error_code SupervisedProcess::reap() {
    // Wait for exit without consuming the zombie, so the pid stays reserved
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0 && errno != ECHILD) {
        return last_system_error();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!status_.has_value()) {
            int status = 0;
            pid_t reaped;
            do {
                reaped = ::waitpid(pid_, &status, 0);
            } while (reaped < 0 && errno == EINTR);

            if (reaped != pid_) {
                return last_system_error();
            }
            status_ = status;
            reaped_.store(true, std::memory_order_release);
        }
    }

    exited_.set();
    return {};
}

std::string describe_exit(int status) {
    if (WIFEXITED(status)) {
        return fmt::format("exit status {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return fmt::format("killed by signal {}", WTERMSIG(status));
    }
    return fmt::format("wait status {}", status);
}

}  // namespace rotor::core

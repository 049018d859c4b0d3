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

// Rotor Process Supervisor - Header
// Owns one external process: start with settle check, output draining, completion, kill

#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "event.hpp"
#include "logging.hpp"

namespace rotor::core {

/// One output line after program-specific parsing
struct ClassifiedLine {
    logging::Severity severity = logging::Severity::Info;
    std::string message;
};

/// Maps a raw output line to a severity and a cleaned message
using LineClassifier = std::function<ClassifiedLine(std::string_view line)>;

/// What to run and how to identify it in logs
struct ProcessSpec {
    std::string service;  // Log identity: service name
    uint16_t port = 0;    // Log identity: assigned port

    std::string program;  // Name resolved on PATH, or a path
    std::vector<std::string> args;

    LineClassifier classifier;  // Empty = every line logged at info

    std::chrono::milliseconds settle{250};
};

/// Supervised external process
///
/// stdout and stderr are merged into one pipe. wait() must run on its own
/// thread (or use wait_async()) so the pipe keeps draining while the child runs.
///
/// Thread-safety: terminate(), pid(), exited() and exit_status() may be called
/// from any thread, concurrently with wait().
class SupervisedProcess {
public:
    /// Spawn the process and observe it surviving the settle window
    /// @param stop Cancels the settle wait (process is killed, error is shutting_down)
    /// @param error_out launch_failed, missing_executable, exited_during_settle or shutting_down
    /// @return Running process or nullptr on error
    [[nodiscard]] static std::unique_ptr<SupervisedProcess> start(ProcessSpec spec,
                                                                  std::stop_token stop,
                                                                  std::error_code& error_out);

    /// Kills the process if still running and joins the wait_async() thread
    ~SupervisedProcess();

    // Non-copyable, non-movable (owns pid, pipe and thread)
    SupervisedProcess(const SupervisedProcess&) = delete;
    SupervisedProcess& operator=(const SupervisedProcess&) = delete;
    SupervisedProcess(SupervisedProcess&&) = delete;
    SupervisedProcess& operator=(SupervisedProcess&&) = delete;

    /// Drain and classify output until EOF, reap the process, fire exited()
    /// A second concurrent call only waits for completion.
    void wait();

    /// Run wait() on a thread owned by this object
    void wait_async();

    /// Completion signal (fires once, visible to late waiters)
    [[nodiscard]] const Event& exited() const noexcept {
        return exited_;
    }

    /// Kill (SIGKILL) and reap
    /// Returns no error if the process had already exited or died from the kill
    [[nodiscard]] std::error_code terminate();

    /// OS process id, -1 once the process has been reaped
    [[nodiscard]] int pid() const noexcept {
        return reaped_.load(std::memory_order_acquire) ? -1 : static_cast<int>(pid_);
    }

    /// Raw wait status once reaped
    [[nodiscard]] std::optional<int> exit_status() const;

    [[nodiscard]] const std::string& service() const noexcept {
        return spec_.service;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return spec_.port;
    }

private:
    // Restricts construction to start()
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    SupervisedProcess(ConstructionKey, ProcessSpec spec, pid_t pid, int output_fd);

private:
    /// Classify and log one output line
    void emit(std::string_view line);

    /// Block until the child exits, reap it exactly once, fire exited()
    std::error_code reap();

    ProcessSpec spec_;
    pid_t pid_;
    int output_fd_;

    Event exited_;

    // Guards status_; kill() and the reaping waitpid() both run under it so a
    // kill can never reach a recycled pid
    mutable std::mutex mutex_;
    std::optional<int> status_;
    std::atomic<bool> reaped_{false};

    std::atomic<bool> wait_started_{false};
    std::thread waiter_;
};

/// Human-readable wait status ("exit status 1", "killed by signal 9")
[[nodiscard]] std::string describe_exit(int status);

}  // namespace rotor::core

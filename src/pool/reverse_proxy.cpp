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

// Rotor Reverse Proxy Controller - Implementation

#include "reverse_proxy.hpp"

#include <algorithm>
#include <string>

#include "../core/errors.hpp"
#include "../core/filesystem.hpp"
#include "../core/logging.hpp"
#include "log_formats.hpp"

namespace rotor::pool {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

constexpr std::string_view SERVICE_NAME = "haproxy";

ReverseProxyOptions ReverseProxyOptions::from_config(const control::Config& config) {
    ReverseProxyOptions options;
    options.binary = config.proxy.binary;
    options.dir = fs::path(config.runtime.work_dir) / "haproxy";
    options.listen_port = config.proxy.listen_port;
    options.stats_port = config.proxy.stats_port;
    options.max_connections = config.proxy.max_connections;
    options.balance = config.proxy.balance;
    options.quiet = std::chrono::milliseconds(config.proxy.reload_quiet_ms);
    options.ceiling = std::chrono::milliseconds(config.proxy.reload_ceiling_ms);
    options.settle = std::chrono::milliseconds(config.runtime.settle_ms);
    return options;
}

ReverseProxyController::ReverseProxyController(ReverseProxyOptions options,
                                               BackendRegistry& registry)
    : options_(std::move(options)),
      registry_(registry),
      config_path_(options_.dir / "haproxy.cfg") {}

ReverseProxyController::~ReverseProxyController() {
    stop();
}

std::error_code ReverseProxyController::start(std::stop_token stop) {
    auto* log = logging::logger();

    if (reload_thread_.joinable()) {
        return {};
    }

    constexpr auto dir_perms = fs::perms::owner_all | fs::perms::group_read |
                               fs::perms::group_exec | fs::perms::others_read |
                               fs::perms::others_exec;
    if (auto ec = core::make_work_dir(options_.dir, dir_perms); ec) {
        LOG_ERROR(log, "Failed to create proxy directory: path={}, error={}",
                  options_.dir.string(), ec.message());
        return ec;
    }

    // Initial write happens once, before the first instance reads it
    if (auto ec = write_config(); ec) {
        return ec;
    }

    std::error_code ec;
    auto process = launch(-1, stop, ec);
    if (!process) {
        LOG_PROCESS_ERROR(log, "Failed to start reverse proxy", SERVICE_NAME, options_.listen_port,
                          -1, ec);
        return ec;
    }
    process->wait_async();

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        current_ = std::move(process);
    }

    reload_thread_ = std::thread([this, token = thread_stop_.get_token()] { reload_loop(token); });

    LOG_INFO(log, "Reverse proxy started: listen_port={}, stats_port={}, config={}",
             options_.listen_port, options_.stats_port, config_path_.string());
    return {};
}

void ReverseProxyController::request_reload() {
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        switch (state_) {
            case State::Idle:
                state_ = State::Pending;
                batch_start_ = now;
                quiet_deadline_ = now + options_.quiet;
                break;
            case State::Pending:
                quiet_deadline_ = now + options_.quiet;
                break;
            case State::Reloading:
                if (queued_) {
                    LOG_DEBUG(logging::logger(), "Reload already queued");
                    return;
                }
                queued_ = true;
                break;
        }
        ++generation_;
    }
    state_cv_.notify_all();
}

void ReverseProxyController::reload_now() {
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        switch (state_) {
            case State::Idle:
                state_ = State::Pending;
                batch_start_ = now;
                quiet_deadline_ = now;
                break;
            case State::Pending:
                quiet_deadline_ = now;
                break;
            case State::Reloading:
                queued_ = true;
                queued_immediate_ = true;
                break;
        }
        ++generation_;
    }
    LOG_INFO(logging::logger(), "Immediate reload requested");
    state_cv_.notify_all();
}

void ReverseProxyController::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    auto* log = logging::logger();

    thread_stop_.request_stop();
    if (reload_thread_.joinable()) {
        reload_thread_.join();
    }

    std::unique_ptr<core::SupervisedProcess> current;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        current = std::move(current_);
    }

    if (current) {
        if (auto ec = current->terminate(); ec) {
            LOG_WARNING(log, "Failed to kill reverse proxy: pid={}, error={}", current->pid(),
                        ec.message());
        }
        current.reset();
    }

    if (auto ec = core::remove_work_dir(options_.dir); ec) {
        LOG_WARNING(log, "Failed to remove proxy directory: path={}, error={}",
                    options_.dir.string(), ec.message());
    }

    LOG_INFO(log, "Reverse proxy stopped: reloads={}, failed_reloads={}", reload_count(),
             failed_reload_count());
}

ReverseProxyController::State ReverseProxyController::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

int ReverseProxyController::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return current_ ? current_->pid() : -1;
}

void ReverseProxyController::reload_loop(std::stop_token token) {
    std::unique_lock<std::mutex> lock(state_mutex_);

    while (!token.stop_requested()) {
        if (state_ != State::Pending) {
            state_cv_.wait(lock, token, [this] { return state_ == State::Pending; });
            continue;
        }

        auto fire_at = std::min(quiet_deadline_, batch_start_ + options_.ceiling);
        if (Clock::now() < fire_at) {
            // Wake early when a request moves the deadline
            uint64_t seen = generation_;
            state_cv_.wait_until(lock, token, fire_at,
                                 [this, seen] { return generation_ != seen; });
            continue;
        }

        state_ = State::Reloading;
        lock.unlock();

        // Errors are logged inside; the old instance stays in place
        std::error_code ec = execute_reload(token);
        if (ec) {
            failed_reload_count_.fetch_add(1, std::memory_order_acq_rel);
        }

        lock.lock();
        if (queued_) {
            auto now = Clock::now();
            state_ = State::Pending;
            batch_start_ = now;
            quiet_deadline_ = queued_immediate_ ? now : now + options_.quiet;
            queued_ = false;
            queued_immediate_ = false;
        } else {
            state_ = State::Idle;
        }
    }
}

std::error_code ReverseProxyController::execute_reload(std::stop_token token) {
    auto* log = logging::logger();

    if (auto ec = write_config(); ec) {
        return ec;
    }

    // A dead instance gets no handoff; its pid may already belong to another process
    int previous_pid = -1;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (current_ && current_->exited().is_set()) {
            auto status = current_->exit_status();
            LOG_WARNING(log, "Entry-point proxy had exited, starting without handoff: {}",
                        status ? core::describe_exit(*status) : std::string("status unknown"));
        } else if (current_) {
            previous_pid = current_->pid();
        }
    }

    std::error_code ec;
    auto next = launch(previous_pid, token, ec);
    if (!next) {
        LOG_PROCESS_ERROR(log, "Reload failed, keeping current instance", SERVICE_NAME,
                          options_.listen_port, previous_pid, ec);
        return core::make_error_code(core::Errc::handoff_failed);
    }
    next->wait_async();

    std::unique_ptr<core::SupervisedProcess> previous;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        previous = std::move(current_);
        current_ = std::move(next);
    }

    if (previous) {
        if (auto kill_ec = previous->terminate(); kill_ec) {
            LOG_WARNING(log, "Failed to clean up previous instance: pid={}, error={}",
                        previous->pid(), kill_ec.message());
        }
        previous.reset();
    }

    reload_count_.fetch_add(1, std::memory_order_acq_rel);
    LOG_INFO(log, "Reverse proxy reloaded: previous_pid={}, pid={}, backends={}", previous_pid,
             pid(), registry_.size());
    return {};
}

std::error_code ReverseProxyController::write_config() {
    auto* log = logging::logger();

    ProxyDescriptor descriptor;
    descriptor.listen_port = options_.listen_port;
    descriptor.stats_port = options_.stats_port;
    descriptor.max_connections = options_.max_connections;
    descriptor.balance = options_.balance;
    descriptor.backends = registry_.snapshot();

    std::string text;
    if (auto ec = render_haproxy_config(descriptor, text); ec) {
        LOG_ERROR(log, "Failed to render proxy config: error={}", ec.message());
        return ec;
    }

    if (auto ec = core::write_file_atomic(config_path_, text); ec) {
        LOG_ERROR(log, "Failed to write proxy config: path={}, error={}", config_path_.string(),
                  ec.message());
        return core::make_error_code(core::Errc::render_failed);
    }

    LOG_DEBUG(log, "Proxy config written: path={}, backends={}", config_path_.string(),
              descriptor.backends.size());
    return {};
}

std::unique_ptr<core::SupervisedProcess> ReverseProxyController::launch(int previous_pid,
                                                                        std::stop_token token,
                                                                        std::error_code& error_out) {
    core::ProcessSpec spec;
    spec.service = std::string(SERVICE_NAME);
    spec.port = options_.listen_port;
    spec.program = options_.binary;
    spec.args = {"-f", config_path_.string()};
    if (previous_pid > 0) {
        spec.args.push_back("-sf");
        spec.args.push_back(std::to_string(previous_pid));
    }
    spec.classifier = classify_haproxy_line;
    spec.settle = options_.settle;

    return core::SupervisedProcess::start(std::move(spec), std::move(token), error_out);
}

}  // namespace rotor::pool

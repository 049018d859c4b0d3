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

// Rotor Reverse Proxy Controller - Header
// Supervises haproxy and performs debounced, connection-preserving reloads

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <thread>

#include "../control/config.hpp"
#include "../core/process.hpp"
#include "backend_registry.hpp"
#include "haproxy_config.hpp"

namespace rotor::pool {

/// Reverse proxy controller settings
struct ReverseProxyOptions {
    std::string binary = "haproxy";
    std::filesystem::path dir;  // Holds haproxy.cfg

    uint16_t listen_port = 8080;
    uint16_t stats_port = 0;
    uint32_t max_connections = 256;
    std::string balance = "roundrobin";

    std::chrono::milliseconds quiet{2000};     // Re-armed by every request while pending
    std::chrono::milliseconds ceiling{10000};  // Upper bound from the first request of a batch
    std::chrono::milliseconds settle{250};

    /// Build options from the application config (dir = <work_dir>/haproxy)
    [[nodiscard]] static ReverseProxyOptions from_config(const control::Config& config);
};

/// Reverse proxy controller
///
/// Debounce state machine driven by one reload thread:
///   Idle -> Pending       request_reload() or reload_now()
///   Pending -> Reloading  quiet deadline or batch ceiling reached
///   Reloading -> Idle     reload finished (or failed, keeping the old instance)
///   Reloading -> Pending  a request arrived during the reload
///
/// At most one reload is in flight. Each reload renders from the registry as
/// it is at execution time and replaces haproxy with `-sf <old pid>`.
class ReverseProxyController {
public:
    enum class State : uint8_t {
        Idle,
        Pending,
        Reloading
    };

    ReverseProxyController(ReverseProxyOptions options, BackendRegistry& registry);

    /// Stops the reload thread and the proxy, removes the proxy directory
    ~ReverseProxyController();

    // Non-copyable, non-movable (reload thread holds this)
    ReverseProxyController(const ReverseProxyController&) = delete;
    ReverseProxyController& operator=(const ReverseProxyController&) = delete;
    ReverseProxyController(ReverseProxyController&&) = delete;
    ReverseProxyController& operator=(ReverseProxyController&&) = delete;

    /// Write the initial config and start the first proxy instance (synchronous)
    /// Failure here is fatal to the application.
    /// @param stop Cancels the settle wait of the first instance
    [[nodiscard]] std::error_code start(std::stop_token stop);

    /// Debounced reload request; never blocks on the reload itself
    void request_reload();

    /// Immediate reload, still serialized through the reload thread
    void reload_now();

    /// Stop the reload thread (an in-flight reload completes), kill the proxy,
    /// remove the proxy directory. Idempotent.
    void stop();

    [[nodiscard]] State state() const;

    /// Completed reloads that replaced the proxy instance
    [[nodiscard]] uint64_t reload_count() const noexcept {
        return reload_count_.load(std::memory_order_acquire);
    }

    /// Reloads that failed and kept the old instance
    [[nodiscard]] uint64_t failed_reload_count() const noexcept {
        return failed_reload_count_.load(std::memory_order_acquire);
    }

    /// Current proxy instance pid, -1 if none
    [[nodiscard]] int pid() const;

    [[nodiscard]] const std::filesystem::path& config_path() const noexcept {
        return config_path_;
    }

private:
    void reload_loop(std::stop_token token);

    /// Render from the current registry, write atomically, hand off to a new instance
    std::error_code execute_reload(std::stop_token token);

    /// Render and write the config file for the given registry snapshot
    std::error_code write_config();

    std::unique_ptr<core::SupervisedProcess> launch(int previous_pid, std::stop_token token,
                                                    std::error_code& error_out);

    ReverseProxyOptions options_;
    BackendRegistry& registry_;
    std::filesystem::path config_path_;

    // Debounce state (guarded by state_mutex_)
    mutable std::mutex state_mutex_;
    std::condition_variable_any state_cv_;
    State state_ = State::Idle;
    std::chrono::steady_clock::time_point batch_start_;
    std::chrono::steady_clock::time_point quiet_deadline_;
    bool queued_ = false;
    bool queued_immediate_ = false;
    uint64_t generation_ = 0;

    // Current proxy instance (guarded by process_mutex_)
    mutable std::mutex process_mutex_;
    std::unique_ptr<core::SupervisedProcess> current_;

    std::atomic<uint64_t> reload_count_{0};
    std::atomic<uint64_t> failed_reload_count_{0};

    std::stop_source thread_stop_;
    std::thread reload_thread_;
    std::atomic<bool> stopped_{false};
};

[[nodiscard]] constexpr std::string_view to_string(ReverseProxyController::State state) noexcept {
    switch (state) {
        case ReverseProxyController::State::Idle:
            return "idle";
        case ReverseProxyController::State::Pending:
            return "pending";
        case ReverseProxyController::State::Reloading:
            return "reloading";
    }
    return "unknown";
}

}  // namespace rotor::pool

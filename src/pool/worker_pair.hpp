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

// Rotor Worker Pair - Header
// Circuit (tor) + forwarder (privoxy) composed into one backend

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>

#include "../control/config.hpp"
#include "../core/process.hpp"
#include "backend_registry.hpp"
#include "port_allocator.hpp"

namespace rotor::pool {

/// Worker pair lifecycle state
enum class PairState : uint8_t {
    Allocating,  // Leasing the circuit port
    Starting,    // Launching circuit, then forwarder
    Registered,  // Both running, forwarder port eligible for traffic
    Retiring,    // Deregistered, processes being torn down
    Done         // Ports released
};

/// Why a registered pair left the pool
enum class RetireReason : uint8_t {
    None,
    Shutdown,
    CircuitExited,
    ForwarderExited,
    LifetimeExpired
};

/// Transition table
///   Allocating -> Starting, Done
///   Starting   -> Allocating (retry), Registered, Done
///   Registered -> Retiring
///   Retiring   -> Done
[[nodiscard]] bool is_valid_transition(PairState from, PairState to) noexcept;

/// Worker pair settings
struct WorkerPairOptions {
    std::string circuit_binary = "tor";
    std::string forwarder_binary = "privoxy";
    std::filesystem::path work_dir = "/tmp/rotor";

    std::chrono::seconds max_lifetime{900};
    std::chrono::seconds circuit_period{120};
    std::chrono::milliseconds retry_backoff{500};
    std::chrono::milliseconds settle{250};

    [[nodiscard]] static WorkerPairOptions from_config(const control::Config& config);
};

/// Point-in-time view of a pair for status output
struct PairInfo {
    uint64_t id = 0;
    PairState state = PairState::Allocating;
    uint16_t circuit_port = 0;
    uint16_t forwarder_port = 0;
    int circuit_pid = -1;
    int forwarder_pid = -1;
    uint32_t attempts = 0;
    std::chrono::seconds age{0};  // Since registration
};

/// Circuit command line for a SOCKS port and data directory
[[nodiscard]] core::ProcessSpec circuit_process_spec(const WorkerPairOptions& options,
                                                     uint16_t socks_port,
                                                     const std::filesystem::path& dir);

/// Forwarder command line for its config file
[[nodiscard]] core::ProcessSpec forwarder_process_spec(const WorkerPairOptions& options,
                                                       uint16_t listen_port,
                                                       const std::filesystem::path& dir);

/// Forwarder config: listens on listen_port, forwards to the circuit's SOCKS port
[[nodiscard]] std::string render_forwarder_config(uint16_t listen_port, uint16_t circuit_port,
                                                  const std::filesystem::path& dir);

/// Worker pair
///
/// run() drives the whole lifecycle on the calling thread: start with retries,
/// register, wait for the first retirement condition, retire. The forwarder
/// port is registered only once both processes survived their settle window,
/// and deregistered before either process is killed.
///
/// Thread-safety: run() is called once, from one thread. state() and info()
/// may be read from any thread.
class WorkerPair {
public:
    WorkerPair(uint64_t id, WorkerPairOptions options, PortAllocator& ports,
               BackendRegistry& registry);

    /// Retires the pair if run() did not finish
    ~WorkerPair();

    // Non-copyable, non-movable (owns processes referenced by callbacks)
    WorkerPair(const WorkerPair&) = delete;
    WorkerPair& operator=(const WorkerPair&) = delete;
    WorkerPair(WorkerPair&&) = delete;
    WorkerPair& operator=(WorkerPair&&) = delete;

    /// Run the pair to completion
    /// @return Why the pair retired (Shutdown if it never got registered)
    RetireReason run(std::stop_token stop);

    [[nodiscard]] PairState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] PairInfo info() const;

    [[nodiscard]] uint64_t id() const noexcept {
        return id_;
    }

    /// Start attempts made so far
    [[nodiscard]] uint32_t attempts() const noexcept {
        return attempts_.load(std::memory_order_relaxed);
    }

private:
    /// Apply a transition; invalid transitions are rejected and logged
    bool transition_to(PairState next);

    /// One start attempt: lease, launch circuit, lease, launch forwarder
    std::error_code start_attempt(std::stop_token stop);

    /// First of: stop, circuit exit, forwarder exit, max lifetime
    RetireReason wait_for_retirement(std::stop_token stop);

    /// Kill both processes, remove their directories, release both ports
    void teardown();

    [[nodiscard]] std::filesystem::path circuit_dir(uint16_t port) const;
    [[nodiscard]] std::filesystem::path forwarder_dir(uint16_t port) const;

    const uint64_t id_;
    WorkerPairOptions options_;
    PortAllocator& ports_;
    BackendRegistry& registry_;

    std::atomic<PairState> state_{PairState::Allocating};
    std::atomic<uint32_t> attempts_{0};

    // Guards ports, processes and registration time for info()
    mutable std::mutex mutex_;
    uint16_t circuit_port_ = 0;
    uint16_t forwarder_port_ = 0;
    std::unique_ptr<core::SupervisedProcess> circuit_;
    std::unique_ptr<core::SupervisedProcess> forwarder_;
    std::chrono::steady_clock::time_point registered_at_;
};

[[nodiscard]] constexpr std::string_view to_string(PairState state) noexcept {
    switch (state) {
        case PairState::Allocating:
            return "allocating";
        case PairState::Starting:
            return "starting";
        case PairState::Registered:
            return "registered";
        case PairState::Retiring:
            return "retiring";
        case PairState::Done:
            return "done";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(RetireReason reason) noexcept {
    switch (reason) {
        case RetireReason::None:
            return "none";
        case RetireReason::Shutdown:
            return "shutdown";
        case RetireReason::CircuitExited:
            return "circuit exited";
        case RetireReason::ForwarderExited:
            return "forwarder exited";
        case RetireReason::LifetimeExpired:
            return "lifetime expired";
    }
    return "unknown";
}

}  // namespace rotor::pool

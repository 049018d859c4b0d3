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

// Rotor Runtime Orchestrator - Header
// Wires the port allocator, backend registry, reverse proxy and rotation scheduler

#pragma once

#include <filesystem>
#include <stop_token>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../pool/backend_registry.hpp"
#include "../pool/port_allocator.hpp"
#include "../pool/reverse_proxy.hpp"
#include "../pool/scheduler.hpp"

namespace rotor::runtime {

/// Check that every collaborator binary resolves on PATH
/// Logs each missing program and returns missing_executable if any is absent.
[[nodiscard]] std::error_code check_dependencies(const control::Config& config);

/// Proxy pool orchestrator
///
/// Owns the process-wide registry and allocator and the two long-running
/// components built on them. run() starts the reverse proxy synchronously,
/// then blocks in the rotation scheduler until stop is requested and every
/// pair has retired. Each instance keeps its files in a private run directory
/// under the configured work root and removes only that directory (and the
/// root, if this instance created it) before run() returns.
class Orchestrator {
public:
    explicit Orchestrator(const control::Config& config);
    ~Orchestrator();

    // Non-copyable, non-movable (components hold references to each other)
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Run the pool until stop is requested
    /// @return Error if the reverse proxy could not be started (fatal)
    [[nodiscard]] std::error_code run(std::stop_token stop);

    /// Operator-triggered reload (SIGHUP)
    void reload_now();

    /// Log every live pair and the proxy state
    void log_status() const;

    [[nodiscard]] std::vector<pool::PairInfo> pairs() const {
        return scheduler_.snapshot();
    }

    [[nodiscard]] const pool::BackendRegistry& registry() const noexcept {
        return registry_;
    }

    [[nodiscard]] const pool::ReverseProxyController& proxy() const noexcept {
        return proxy_;
    }

    /// Private directory of this instance under the work root
    [[nodiscard]] const std::filesystem::path& run_dir() const noexcept {
        return run_dir_;
    }

private:
    void cleanup();
    void remove_root();

    control::Config config_;
    std::filesystem::path run_dir_;
    bool created_root_ = false;
    pool::PortAllocator ports_;
    pool::BackendRegistry registry_;
    pool::ReverseProxyController proxy_;
    pool::RotationScheduler scheduler_;
};

}  // namespace rotor::runtime

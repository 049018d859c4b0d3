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

// Rotor Runtime Orchestrator - Implementation

#include "orchestrator.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <string>

#include "../core/errors.hpp"
#include "../core/filesystem.hpp"
#include "../core/logging.hpp"

namespace rotor::runtime {

namespace fs = std::filesystem;

namespace {

constexpr auto RUN_DIR_PERMS = fs::perms::owner_all | fs::perms::group_read |
                               fs::perms::group_exec | fs::perms::others_read |
                               fs::perms::others_exec;

// rotor-<pid>-<start time>, so a recycled pid never lands on a leftover directory
fs::path make_run_dir_path(const std::string& root) {
    auto started = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return fs::path(root) / fmt::format("rotor-{}-{:x}", ::getpid(), started.count());
}

// Components see the run directory as their work root
control::Config with_work_dir(control::Config config, const fs::path& dir) {
    config.runtime.work_dir = dir.string();
    return config;
}

}  // namespace

std::error_code check_dependencies(const control::Config& config) {
    auto* log = logging::logger();

    const std::array<const std::string*, 3> programs = {
        &config.pool.circuit_binary, &config.pool.forwarder_binary, &config.proxy.binary};

    bool missing = false;
    for (const auto* program : programs) {
        if (auto path = core::find_executable(*program)) {
            LOG_DEBUG(log, "Dependency found: program={}, path={}", *program, *path);
        } else {
            LOG_ERROR(log, "Required program not found on PATH: program={}", *program);
            missing = true;
        }
    }

    if (missing) {
        return core::make_error_code(core::Errc::missing_executable);
    }
    return {};
}

Orchestrator::Orchestrator(const control::Config& config)
    : config_(config),
      run_dir_(make_run_dir_path(config.runtime.work_dir)),
      ports_(config.pool.port_range_start, config.pool.port_range_end),
      proxy_(pool::ReverseProxyOptions::from_config(with_work_dir(config, run_dir_)), registry_),
      scheduler_(config.pool.size,
                 pool::WorkerPairOptions::from_config(with_work_dir(config, run_dir_)), ports_,
                 registry_) {}

Orchestrator::~Orchestrator() {
    registry_.set_change_listener(nullptr);
}

std::error_code Orchestrator::run(std::stop_token stop) {
    auto* log = logging::logger();
    const fs::path work_dir = config_.runtime.work_dir;

    std::error_code ec;
    created_root_ = !fs::exists(work_dir, ec);
    if (ec) {
        LOG_ERROR(log, "Failed to inspect work directory: path={}, error={}", work_dir.string(),
                  ec.message());
        return ec;
    }
    if (ec = core::make_work_dir(work_dir, RUN_DIR_PERMS); ec) {
        LOG_ERROR(log, "Failed to create work directory: path={}, error={}", work_dir.string(),
                  ec.message());
        return ec;
    }

    // The run directory must be new; anything already there is not ours to remove
    if (!fs::create_directory(run_dir_, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        LOG_ERROR(log, "Failed to create run directory: path={}, error={}", run_dir_.string(),
                  ec.message());
        remove_root();
        return ec;
    }
    fs::permissions(run_dir_, RUN_DIR_PERMS, fs::perm_options::replace, ec);
    if (ec) {
        LOG_ERROR(log, "Failed to set run directory permissions: path={}, error={}",
                  run_dir_.string(), ec.message());
        cleanup();
        return ec;
    }
    LOG_DEBUG(log, "Run directory created: path={}", run_dir_.string());

    registry_.set_change_listener([this] { proxy_.request_reload(); });

    if (ec = proxy_.start(stop); ec) {
        LOG_ERROR(log, "Reverse proxy failed to start: error={}", ec.message());
        registry_.set_change_listener(nullptr);
        cleanup();
        return ec;
    }

    LOG_INFO(log, "Pool running: entry_port={}, pool_size={}, ports={}-{}",
             config_.proxy.listen_port, config_.pool.size, config_.pool.port_range_start,
             config_.pool.port_range_end);

    // Blocks until stop is requested and every pair has retired
    scheduler_.run(stop);

    registry_.set_change_listener(nullptr);
    cleanup();
    return {};
}

void Orchestrator::reload_now() {
    proxy_.reload_now();
}

void Orchestrator::log_status() const {
    auto* log = logging::logger();

    auto pairs = scheduler_.snapshot();
    LOG_INFO(log, "Pool status: live_pairs={}, backends={}, proxy_pid={}, proxy_state={}, "
                  "reloads={}, failed_reloads={}",
             pairs.size(), registry_.size(), proxy_.pid(), pool::to_string(proxy_.state()),
             proxy_.reload_count(), proxy_.failed_reload_count());

    for (const auto& pair : pairs) {
        LOG_INFO(log,
                 "Pair: id={}, state={}, circuit_port={}, circuit_pid={}, forwarder_port={}, "
                 "forwarder_pid={}, attempts={}, age_s={}",
                 pair.id, pool::to_string(pair.state), pair.circuit_port, pair.circuit_pid,
                 pair.forwarder_port, pair.forwarder_pid, pair.attempts, pair.age.count());
    }
}

void Orchestrator::cleanup() {
    auto* log = logging::logger();

    proxy_.stop();

    if (auto ec = core::remove_work_dir(run_dir_); ec) {
        LOG_WARNING(log, "Failed to remove run directory: path={}, error={}", run_dir_.string(),
                    ec.message());
    }

    remove_root();
}

void Orchestrator::remove_root() {
    if (!created_root_) {
        return;
    }

    // Only an empty root goes; other instances may still be using it
    std::error_code ec;
    fs::remove(config_.runtime.work_dir, ec);
    if (ec) {
        LOG_DEBUG(logging::logger(), "Work directory left in place: path={}, error={}",
                  config_.runtime.work_dir, ec.message());
    }
}

}  // namespace rotor::runtime

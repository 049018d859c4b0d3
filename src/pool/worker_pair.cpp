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

// Rotor Worker Pair - Implementation

#include "worker_pair.hpp"

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/event.hpp"
#include "../core/filesystem.hpp"
#include "../core/logging.hpp"
#include "log_formats.hpp"

namespace rotor::pool {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view CIRCUIT_SERVICE = "tor";
constexpr std::string_view FORWARDER_SERVICE = "privoxy";

// {0} = log directory, {1} = listen port, {2} = circuit SOCKS port
constexpr std::string_view FORWARDER_CONFIG_TEMPLATE =
    "user-manual /usr/share/doc/privoxy/user-manual/\n"
    "confdir /etc/privoxy\n"
    "logdir {0}\n"
    "actionsfile match-all.action\n"
    "actionsfile default.action\n"
    "actionsfile user.action\n"
    "filterfile default.filter\n"
    "filterfile user.filter\n"
    "logfile logfile\n"
    "listen-address  127.0.0.1:{1}\n"
    "forward-socks5t / 127.0.0.1:{2} .\n"
    "toggle  1\n"
    "enable-remote-toggle  0\n"
    "enable-remote-http-toggle  0\n"
    "enable-edit-actions 0\n"
    "enforce-blocks 0\n"
    "buffer-limit 4096\n"
    "enable-proxy-authentication-forwarding 0\n"
    "forwarded-connect-retries  0\n"
    "accept-intercepted-requests 0\n"
    "allow-cgi-request-crunching 0\n"
    "split-large-forms 0\n"
    "keep-alive-timeout 5\n"
    "tolerate-pipelining 1\n"
    "socket-timeout 300\n";

constexpr auto FORWARDER_DIR_PERMS = fs::perms::owner_all | fs::perms::group_read |
                                     fs::perms::group_exec | fs::perms::others_read |
                                     fs::perms::others_exec;

}  // namespace

bool is_valid_transition(PairState from, PairState to) noexcept {
    switch (from) {
        case PairState::Allocating:
            return to == PairState::Starting || to == PairState::Done;
        case PairState::Starting:
            return to == PairState::Allocating || to == PairState::Registered ||
                   to == PairState::Done;
        case PairState::Registered:
            return to == PairState::Retiring;
        case PairState::Retiring:
            return to == PairState::Done;
        case PairState::Done:
            return false;
    }
    return false;
}

WorkerPairOptions WorkerPairOptions::from_config(const control::Config& config) {
    WorkerPairOptions options;
    options.circuit_binary = config.pool.circuit_binary;
    options.forwarder_binary = config.pool.forwarder_binary;
    options.work_dir = config.runtime.work_dir;
    options.max_lifetime = std::chrono::seconds(config.pool.max_lifetime_seconds);
    options.circuit_period = std::chrono::seconds(config.pool.circuit_period_seconds);
    options.retry_backoff = std::chrono::milliseconds(config.pool.retry_backoff_ms);
    options.settle = std::chrono::milliseconds(config.runtime.settle_ms);
    return options;
}

core::ProcessSpec circuit_process_spec(const WorkerPairOptions& options, uint16_t socks_port,
                                       const fs::path& dir) {
    core::ProcessSpec spec;
    spec.service = std::string(CIRCUIT_SERVICE);
    spec.port = socks_port;
    spec.program = options.circuit_binary;
    spec.args = {"--allow-missing-torrc",
                 "--SocksPort",
                 std::to_string(socks_port),
                 "--NewCircuitPeriod",
                 std::to_string(options.circuit_period.count()),
                 "--DataDirectory",
                 dir.string(),
                 "--PidFile",
                 (dir / "tor.pid").string(),
                 "--Log",
                 "notice stdout"};
    spec.classifier = classify_tor_line;
    spec.settle = options.settle;
    return spec;
}

core::ProcessSpec forwarder_process_spec(const WorkerPairOptions& options, uint16_t listen_port,
                                         const fs::path& dir) {
    core::ProcessSpec spec;
    spec.service = std::string(FORWARDER_SERVICE);
    spec.port = listen_port;
    spec.program = options.forwarder_binary;
    spec.args = {"--no-daemon", "--pidfile", (dir / "privoxy.pid").string(),
                 (dir / "privoxy.conf").string()};
    spec.classifier = classify_privoxy_line;
    spec.settle = options.settle;
    return spec;
}

std::string render_forwarder_config(uint16_t listen_port, uint16_t circuit_port,
                                    const fs::path& dir) {
    return fmt::format(FORWARDER_CONFIG_TEMPLATE, dir.string(), listen_port, circuit_port);
}

WorkerPair::WorkerPair(uint64_t id, WorkerPairOptions options, PortAllocator& ports,
                       BackendRegistry& registry)
    : id_(id), options_(std::move(options)), ports_(ports), registry_(registry) {}

WorkerPair::~WorkerPair() {
    if (state() == PairState::Registered) {
        uint16_t forwarder_port;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            forwarder_port = forwarder_port_;
        }
        registry_.remove(forwarder_port);
    }
    teardown();
}

RetireReason WorkerPair::run(std::stop_token stop) {
    auto* log = logging::logger();

    while (true) {
        if (stop.stop_requested()) {
            transition_to(PairState::Done);
            return RetireReason::Shutdown;
        }

        uint32_t attempt = attempts_.fetch_add(1, std::memory_order_relaxed) + 1;
        std::error_code ec = start_attempt(stop);
        if (!ec) {
            break;
        }

        if (ec == core::make_error_code(core::Errc::shutting_down) || stop.stop_requested()) {
            transition_to(PairState::Done);
            return RetireReason::Shutdown;
        }

        if (state() == PairState::Starting) {
            transition_to(PairState::Allocating);
        }

        LOG_WARNING(log, "Pair start failed: pair={}, attempt={}, error={}, retry_in_ms={}", id_,
                    attempt, ec.message(), options_.retry_backoff.count());

        if (!core::sleep_for(stop, options_.retry_backoff)) {
            transition_to(PairState::Done);
            return RetireReason::Shutdown;
        }
    }

    uint16_t circuit_port;
    uint16_t forwarder_port;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        circuit_port = circuit_port_;
        forwarder_port = forwarder_port_;
        registered_at_ = std::chrono::steady_clock::now();
    }

    registry_.add(forwarder_port);
    transition_to(PairState::Registered);
    LOG_INFO(log, "Pair started: pair={}, circuit_port={}, forwarder_port={}, attempts={}", id_,
             circuit_port, forwarder_port, attempts());

    RetireReason reason = wait_for_retirement(stop);
    LOG_INFO(log, "Pair stopping: pair={}, circuit_port={}, forwarder_port={}, reason={}", id_,
             circuit_port, forwarder_port, to_string(reason));

    // Deregister before anything is killed
    transition_to(PairState::Retiring);
    registry_.remove(forwarder_port);
    teardown();
    transition_to(PairState::Done);

    LOG_INFO(log, "Pair terminated: pair={}, circuit_port={}, forwarder_port={}", id_,
             circuit_port, forwarder_port);
    return reason;
}

PairInfo WorkerPair::info() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PairInfo view;
    view.id = id_;
    view.state = state();
    view.circuit_port = circuit_port_;
    view.forwarder_port = forwarder_port_;
    view.circuit_pid = circuit_ ? circuit_->pid() : -1;
    view.forwarder_pid = forwarder_ ? forwarder_->pid() : -1;
    view.attempts = attempts();
    if (view.state == PairState::Registered) {
        view.age = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - registered_at_);
    }
    return view;
}

bool WorkerPair::transition_to(PairState next) {
    auto current = state_.load(std::memory_order_acquire);
    if (current == next) {
        return true;
    }

    if (!is_valid_transition(current, next)) {
        LOG_ERROR(logging::logger(), "Invalid pair transition: pair={}, from={}, to={}", id_,
                  to_string(current), to_string(next));
        return false;
    }

    state_.store(next, std::memory_order_release);
    LOG_DEBUG(logging::logger(), "Pair state: pair={}, {} -> {}", id_, to_string(current),
              to_string(next));
    return true;
}

std::error_code WorkerPair::start_attempt(std::stop_token stop) {
    auto* log = logging::logger();

    // Allocating
    auto circuit_port = ports_.lease();
    if (!circuit_port) {
        LOG_WARNING(log, "No free port for circuit: pair={}, leased={}", id_,
                    ports_.leased_count());
        return core::make_error_code(core::Errc::ports_exhausted);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        circuit_port_ = *circuit_port;
    }

    transition_to(PairState::Starting);

    fs::path cdir = circuit_dir(*circuit_port);
    if (auto ec = core::make_work_dir(cdir, fs::perms::owner_all); ec) {
        LOG_ERROR(log, "Failed to create circuit directory: path={}, error={}", cdir.string(),
                  ec.message());
        teardown();
        return ec;
    }

    std::error_code ec;
    auto circuit = core::SupervisedProcess::start(
        circuit_process_spec(options_, *circuit_port, cdir), stop, ec);
    if (!circuit) {
        teardown();
        return ec;
    }
    circuit->wait_async();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        circuit_ = std::move(circuit);
    }

    auto forwarder_port = ports_.lease();
    if (!forwarder_port) {
        LOG_WARNING(log, "No free port for forwarder: pair={}, leased={}", id_,
                    ports_.leased_count());
        teardown();
        return core::make_error_code(core::Errc::ports_exhausted);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forwarder_port_ = *forwarder_port;
    }

    fs::path fdir = forwarder_dir(*forwarder_port);
    if (auto dir_ec = core::make_work_dir(fdir, FORWARDER_DIR_PERMS); dir_ec) {
        LOG_ERROR(log, "Failed to create forwarder directory: path={}, error={}", fdir.string(),
                  dir_ec.message());
        teardown();
        return dir_ec;
    }

    std::string config = render_forwarder_config(*forwarder_port, *circuit_port, fdir);
    if (auto write_ec = core::write_file_atomic(fdir / "privoxy.conf", config); write_ec) {
        LOG_ERROR(log, "Failed to write forwarder config: path={}, error={}",
                  (fdir / "privoxy.conf").string(), write_ec.message());
        teardown();
        return write_ec;
    }

    auto forwarder = core::SupervisedProcess::start(
        forwarder_process_spec(options_, *forwarder_port, fdir), stop, ec);
    if (!forwarder) {
        teardown();
        return ec;
    }
    forwarder->wait_async();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forwarder_ = std::move(forwarder);
    }

    return {};
}

RetireReason WorkerPair::wait_for_retirement(std::stop_token stop) {
    const core::SupervisedProcess* circuit;
    const core::SupervisedProcess* forwarder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        circuit = circuit_.get();
        forwarder = forwarder_.get();
    }

    core::Event retire;
    std::stop_callback on_stop(stop, [&retire] { retire.set(); });
    std::stop_callback on_circuit_exit(circuit->exited().token(), [&retire] { retire.set(); });
    std::stop_callback on_forwarder_exit(forwarder->exited().token(),
                                         [&retire] { retire.set(); });

    retire.wait_for(options_.max_lifetime);

    if (stop.stop_requested()) {
        return RetireReason::Shutdown;
    }
    if (circuit->exited().is_set()) {
        return RetireReason::CircuitExited;
    }
    if (forwarder->exited().is_set()) {
        return RetireReason::ForwarderExited;
    }
    return RetireReason::LifetimeExpired;
}

void WorkerPair::teardown() {
    auto* log = logging::logger();

    std::unique_ptr<core::SupervisedProcess> circuit;
    std::unique_ptr<core::SupervisedProcess> forwarder;
    uint16_t circuit_port;
    uint16_t forwarder_port;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        circuit = std::move(circuit_);
        forwarder = std::move(forwarder_);
        circuit_port = circuit_port_;
        forwarder_port = forwarder_port_;
        circuit_port_ = 0;
        forwarder_port_ = 0;
    }

    if (forwarder) {
        if (auto ec = forwarder->terminate(); ec) {
            LOG_WARNING(log, "Failed to kill forwarder: pair={}, pid={}, error={}", id_,
                        forwarder->pid(), ec.message());
        }
        forwarder.reset();
    }

    if (circuit) {
        if (auto ec = circuit->terminate(); ec) {
            LOG_WARNING(log, "Failed to kill circuit: pair={}, pid={}, error={}", id_,
                        circuit->pid(), ec.message());
        }
        circuit.reset();
    }

    if (forwarder_port != 0) {
        if (auto ec = core::remove_work_dir(forwarder_dir(forwarder_port)); ec) {
            LOG_WARNING(log, "Failed to remove forwarder directory: port={}, error={}",
                        forwarder_port, ec.message());
        }
        ports_.release(forwarder_port);
    }

    if (circuit_port != 0) {
        if (auto ec = core::remove_work_dir(circuit_dir(circuit_port)); ec) {
            LOG_WARNING(log, "Failed to remove circuit directory: port={}, error={}",
                        circuit_port, ec.message());
        }
        ports_.release(circuit_port);
    }
}

fs::path WorkerPair::circuit_dir(uint16_t port) const {
    return options_.work_dir / fmt::format("tor-{}", port);
}

fs::path WorkerPair::forwarder_dir(uint16_t port) const {
    return options_.work_dir / fmt::format("privoxy-{}", port);
}

}  // namespace rotor::pool

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

// Rotor - Main Entry Point
#include <pthread.h>
#include <signal.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/orchestrator.hpp"

namespace {

/// Command-line options; unset overrides keep the configured value
struct CommandLine {
    std::string config_path;
    bool help = false;

    std::optional<uint16_t> listen_port;
    std::optional<uint16_t> stats_port;
    std::optional<uint32_t> pool_size;
    std::optional<uint16_t> port_range_start;
    std::optional<uint16_t> port_range_end;
    std::optional<uint32_t> max_lifetime;
    std::optional<uint32_t> circuit_period;
    std::optional<std::string> work_dir;
    std::optional<std::string> log_level;
};

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s [--config <config.json>] [options]\n"
            "\n"
            "Options:\n"
            "  --config <file>            JSON configuration file\n"
            "  --port <port>              Entry point port (default 8080)\n"
            "  --stats-port <port>        HAProxy stats port, 0 disables (default 0)\n"
            "  --pool-size <n>            Concurrent tor/privoxy pairs (default 3)\n"
            "  --port-range-start <port>  First port leased to pairs (default 30000)\n"
            "  --port-range-end <port>    Last port leased to pairs (default 65535)\n"
            "  --max-lifetime <seconds>   Pair lifetime before rotation (default 900)\n"
            "  --circuit-period <seconds> Tor NewCircuitPeriod (default 120)\n"
            "  --work-dir <dir>           Working directory root (default /tmp/rotor)\n"
            "  --log-level <level>        debug, info, warning, error (default info)\n"
            "  --help                     Show this message\n"
            "\n"
            "Signals: SIGHUP reloads the proxy immediately, SIGINT/SIGTERM drain and exit.\n",
            program);
}

template <typename T>
bool parse_number(std::string_view text, std::optional<T>& out) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() ||
        value > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

bool parse_command_line(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cli.help = true;
            return true;
        }

        if (i + 1 >= argc) {
            fprintf(stderr, "Missing value for %s\n", argv[i]);
            return false;
        }
        std::string_view value = argv[++i];

        bool ok = true;
        if (arg == "--config") {
            cli.config_path = std::string(value);
        } else if (arg == "--port") {
            ok = parse_number(value, cli.listen_port);
        } else if (arg == "--stats-port") {
            ok = parse_number(value, cli.stats_port);
        } else if (arg == "--pool-size") {
            ok = parse_number(value, cli.pool_size);
        } else if (arg == "--port-range-start") {
            ok = parse_number(value, cli.port_range_start);
        } else if (arg == "--port-range-end") {
            ok = parse_number(value, cli.port_range_end);
        } else if (arg == "--max-lifetime") {
            ok = parse_number(value, cli.max_lifetime);
        } else if (arg == "--circuit-period") {
            ok = parse_number(value, cli.circuit_period);
        } else if (arg == "--work-dir") {
            cli.work_dir = std::string(value);
        } else if (arg == "--log-level") {
            cli.log_level = std::string(value);
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i - 1]);
            return false;
        }

        if (!ok) {
            fprintf(stderr, "Invalid value for %s: %s\n", argv[i - 1], argv[i]);
            return false;
        }
    }
    return true;
}

void apply_overrides(const CommandLine& cli, rotor::control::Config& config) {
    if (cli.listen_port) {
        config.proxy.listen_port = *cli.listen_port;
    }
    if (cli.stats_port) {
        config.proxy.stats_port = *cli.stats_port;
    }
    if (cli.pool_size) {
        config.pool.size = *cli.pool_size;
    }
    if (cli.port_range_start) {
        config.pool.port_range_start = *cli.port_range_start;
    }
    if (cli.port_range_end) {
        config.pool.port_range_end = *cli.port_range_end;
    }
    if (cli.max_lifetime) {
        config.pool.max_lifetime_seconds = *cli.max_lifetime;
    }
    if (cli.circuit_period) {
        config.pool.circuit_period_seconds = *cli.circuit_period;
    }
    if (cli.work_dir) {
        config.runtime.work_dir = *cli.work_dir;
    }
    if (cli.log_level) {
        config.logging.level = *cli.log_level;
    }
}

void print_validation(const rotor::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
}

// Signal watcher: the only thread with the handled signals deliverable.
// SIGUSR1 is sent by main to release it once the pool has stopped.
void watch_signals(const sigset_t& signals, std::stop_source& stop,
                   rotor::runtime::Orchestrator& orchestrator) {
    auto* log = rotor::logging::logger();

    while (true) {
        int received = 0;
        if (int rc = sigwait(&signals, &received); rc != 0) {
            LOG_ERROR(log, "sigwait failed: error={}", rc);
            return;
        }

        if (received == SIGUSR1) {
            return;
        }

        if (received == SIGINT || received == SIGTERM) {
            if (stop.request_stop()) {
                LOG_INFO(log, "Received {}, draining pool",
                         received == SIGINT ? "SIGINT" : "SIGTERM");
            } else {
                LOG_INFO(log, "Shutdown already in progress");
            }
        } else if (received == SIGHUP) {
            LOG_INFO(log, "Received SIGHUP, reloading proxy");
            orchestrator.reload_now();
            orchestrator.log_status();
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Rotor v0.1.0\n");
    printf("Rotating anonymizing proxy pool\n\n");

    CommandLine cli;
    if (!parse_command_line(argc, argv, cli)) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli.help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    rotor::control::Config config;
    if (!cli.config_path.empty()) {
        printf("Loading configuration from %s...\n", cli.config_path.c_str());

        rotor::control::ValidationResult load_result;
        auto loaded = rotor::control::ConfigLoader::load_from_file(cli.config_path, load_result);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration\n");
            print_validation(load_result);
            return EXIT_FAILURE;
        }
        config = *loaded;
    }

    // Overrides are validated together with the file values
    apply_overrides(cli, config);
    auto validation = rotor::control::ConfigLoader::validate(config);
    print_validation(validation);
    if (validation.has_errors()) {
        return EXIT_FAILURE;
    }

    // Block handled signals before any thread exists so every thread inherits the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    sigaddset(&signals, SIGUSR1);
    if (int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        fprintf(stderr, "Failed to block signals (error %d)\n", rc);
        return EXIT_FAILURE;
    }

    rotor::logging::init_logging_system();
    auto* log = rotor::logging::init_logger(config.logging);
    LOG_INFO(log, "Rotor starting: entry_port={}, pool_size={}, work_dir={}",
             config.proxy.listen_port, config.pool.size, config.runtime.work_dir);

    if (auto ec = rotor::runtime::check_dependencies(config); ec) {
        fprintf(stderr, "Dependency check failed: %s\n", ec.message().c_str());
        rotor::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    std::error_code ec;
    {
        std::stop_source stop;
        rotor::runtime::Orchestrator orchestrator(config);

        std::thread watcher([&signals, &stop, &orchestrator] {
            watch_signals(signals, stop, orchestrator);
        });

        ec = orchestrator.run(stop.get_token());

        stop.request_stop();
        if (int rc = pthread_kill(watcher.native_handle(), SIGUSR1); rc != 0) {
            LOG_ERROR(log, "Failed to wake signal watcher: error={}", rc);
        }
        watcher.join();
    }

    if (ec) {
        LOG_ERROR(log, "Rotor failed: error={}", ec.message());
        rotor::logging::shutdown_logging();
        fprintf(stderr, "Rotor error: %s\n", ec.message().c_str());
        return EXIT_FAILURE;
    }

    LOG_INFO(log, "Rotor stopped");
    rotor::logging::shutdown_logging();
    printf("Rotor stopped.\n");
    return EXIT_SUCCESS;
}

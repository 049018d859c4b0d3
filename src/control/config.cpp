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

// Rotor Configuration - Implementation

#include "config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace rotor::control {

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult& result) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        result.add_error("Cannot open configuration file '" + path_str + "'");
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, result);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult& result) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        result.add_error(std::string("JSON parsing error: ") + e.what());
        return std::nullopt;
    }

    result = validate(config);
    if (result.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Reverse proxy
    if (config.proxy.binary.empty()) {
        result.add_error("proxy.binary cannot be empty");
    }

    if (config.proxy.listen_port == 0) {
        result.add_error("proxy.listen_port must be > 0");
    }

    if (config.proxy.max_connections == 0) {
        result.add_error("proxy.max_connections must be > 0");
    }

    if (config.proxy.balance != "roundrobin" && config.proxy.balance != "leastconn") {
        result.add_error("Unknown proxy.balance policy '" + config.proxy.balance +
                         "' (must be 'roundrobin' or 'leastconn')");
    }

    if (config.proxy.stats_port != 0 && config.proxy.stats_port == config.proxy.listen_port) {
        result.add_error("proxy.stats_port must differ from proxy.listen_port");
    }

    if (config.proxy.reload_quiet_ms == 0) {
        result.add_error("proxy.reload_quiet_ms must be > 0");
    }

    if (config.proxy.reload_ceiling_ms < config.proxy.reload_quiet_ms) {
        result.add_error("proxy.reload_ceiling_ms must be >= proxy.reload_quiet_ms");
    }

    // Worker pool
    if (config.pool.circuit_binary.empty()) {
        result.add_error("pool.circuit_binary cannot be empty");
    }

    if (config.pool.forwarder_binary.empty()) {
        result.add_error("pool.forwarder_binary cannot be empty");
    }

    if (config.pool.size == 0) {
        result.add_error("pool.size must be > 0");
    }

    if (config.pool.port_range_start == 0) {
        result.add_error("pool.port_range_start must be > 0");
    }

    if (config.pool.port_range_start > config.pool.port_range_end) {
        result.add_error("pool.port_range_start must be <= pool.port_range_end");
    } else {
        // Every live pair holds two leases
        uint64_t range_size =
            static_cast<uint64_t>(config.pool.port_range_end) - config.pool.port_range_start + 1;
        if (range_size < 2ull * config.pool.size) {
            result.add_error("Port range " + std::to_string(config.pool.port_range_start) + "-" +
                             std::to_string(config.pool.port_range_end) + " cannot hold " +
                             std::to_string(config.pool.size) + " worker pairs");
        } else if (range_size < 4ull * config.pool.size) {
            result.add_warning("Port range leaves little room for port reuse delay");
        }

        auto in_range = [&](uint16_t port) {
            return port >= config.pool.port_range_start && port <= config.pool.port_range_end;
        };
        if (in_range(config.proxy.listen_port)) {
            result.add_error("proxy.listen_port falls inside the pool port range");
        }
        if (config.proxy.stats_port != 0 && in_range(config.proxy.stats_port)) {
            result.add_error("proxy.stats_port falls inside the pool port range");
        }
    }

    if (config.pool.max_lifetime_seconds == 0) {
        result.add_error("pool.max_lifetime_seconds must be > 0");
    }

    if (config.pool.circuit_period_seconds == 0) {
        result.add_error("pool.circuit_period_seconds must be > 0");
    } else if (config.pool.circuit_period_seconds > config.pool.max_lifetime_seconds) {
        result.add_warning("pool.circuit_period_seconds exceeds pool.max_lifetime_seconds "
                           "(circuits will never rotate before the pair is recycled)");
    }

    if (config.pool.retry_backoff_ms == 0) {
        result.add_warning("pool.retry_backoff_ms is 0 (failed starts will retry in a tight loop)");
    }

    // Runtime
    if (config.runtime.work_dir.empty() || config.runtime.work_dir == "/") {
        result.add_error("runtime.work_dir must be a dedicated directory");
    }

    if (config.runtime.settle_ms == 0) {
        result.add_error("runtime.settle_ms must be > 0");
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.format == "json" && config.logging.output.empty()) {
        result.add_warning("logging.format 'json' applies to file output only");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

}  // namespace rotor::control

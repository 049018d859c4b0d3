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

// Rotor Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rotor::control {

/// Reverse proxy (entry point) configuration
struct ProxyConfig {
    std::string binary = "haproxy";

    uint16_t listen_port = 8080;
    uint16_t stats_port = 0;  // 0 = stats endpoint disabled
    uint32_t max_connections = 256;
    std::string balance = "roundrobin";  // roundrobin, leastconn

    // Reload debounce (milliseconds)
    uint32_t reload_quiet_ms = 2000;     // Quiet period re-armed by every request
    uint32_t reload_ceiling_ms = 10000;  // Forced reload after first request in a batch
};

/// Worker pool configuration
struct PoolConfig {
    std::string circuit_binary = "tor";
    std::string forwarder_binary = "privoxy";

    uint32_t size = 3;  // Concurrently live worker pairs

    // Lease range (inclusive)
    uint16_t port_range_start = 30000;
    uint16_t port_range_end = 65535;

    uint32_t max_lifetime_seconds = 900;    // Pair is recycled after this long
    uint32_t circuit_period_seconds = 120;  // Circuit rebuild period passed to the circuit process
    uint32_t retry_backoff_ms = 500;        // Delay between failed pair start attempts
};

/// Process supervision and filesystem settings
struct RuntimeConfig {
    std::string work_dir = "/tmp/rotor";  // Root of per-process working directories
    uint32_t settle_ms = 250;             // Process must survive this long to count as started
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // text, json (json applies to file output)
    std::string output;           // Log directory, empty = console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Root configuration
struct Config {
    ProxyConfig proxy;
    PoolConfig pool;
    RuntimeConfig runtime;
    LogConfig logging;
};

// ============================================================================
// from_json functions
// ============================================================================

inline void from_json(const nlohmann::json& j, ProxyConfig& p) {
    p.binary = j.value("binary", std::string("haproxy"));
    p.listen_port = j.value("listen_port", uint16_t(8080));
    p.stats_port = j.value("stats_port", uint16_t(0));
    p.max_connections = j.value("max_connections", 256u);
    p.balance = j.value("balance", std::string("roundrobin"));
    p.reload_quiet_ms = j.value("reload_quiet_ms", 2000u);
    p.reload_ceiling_ms = j.value("reload_ceiling_ms", 10000u);
}

inline void from_json(const nlohmann::json& j, PoolConfig& p) {
    p.circuit_binary = j.value("circuit_binary", std::string("tor"));
    p.forwarder_binary = j.value("forwarder_binary", std::string("privoxy"));
    p.size = j.value("size", 3u);
    p.port_range_start = j.value("port_range_start", uint16_t(30000));
    p.port_range_end = j.value("port_range_end", uint16_t(65535));
    p.max_lifetime_seconds = j.value("max_lifetime_seconds", 900u);
    p.circuit_period_seconds = j.value("circuit_period_seconds", 120u);
    p.retry_backoff_ms = j.value("retry_backoff_ms", 500u);
}

inline void from_json(const nlohmann::json& j, RuntimeConfig& r) {
    r.work_dir = j.value("work_dir", std::string("/tmp/rotor"));
    r.settle_ms = j.value("settle_ms", 250u);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() keeps defaults for absent sections
    if (j.contains("proxy")) {
        j.at("proxy").get_to(c.proxy);
    }
    if (j.contains("pool")) {
        j.at("pool").get_to(c.pool);
    }
    if (j.contains("runtime")) {
        j.at("runtime").get_to(c.runtime);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

// ============================================================================
// to_json functions
// ============================================================================

inline void to_json(nlohmann::json& j, const ProxyConfig& p) {
    j = nlohmann::json{{"binary", p.binary},
                       {"listen_port", p.listen_port},
                       {"stats_port", p.stats_port},
                       {"max_connections", p.max_connections},
                       {"balance", p.balance},
                       {"reload_quiet_ms", p.reload_quiet_ms},
                       {"reload_ceiling_ms", p.reload_ceiling_ms}};
}

inline void to_json(nlohmann::json& j, const PoolConfig& p) {
    j = nlohmann::json{{"circuit_binary", p.circuit_binary},
                       {"forwarder_binary", p.forwarder_binary},
                       {"size", p.size},
                       {"port_range_start", p.port_range_start},
                       {"port_range_end", p.port_range_end},
                       {"max_lifetime_seconds", p.max_lifetime_seconds},
                       {"circuit_period_seconds", p.circuit_period_seconds},
                       {"retry_backoff_ms", p.retry_backoff_ms}};
}

inline void to_json(nlohmann::json& j, const RuntimeConfig& r) {
    j = nlohmann::json{{"work_dir", r.work_dir}, {"settle_ms", r.settle_ms}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["proxy"] = c.proxy;
    j["pool"] = c.pool;
    j["runtime"] = c.runtime;
    j["logging"] = c.logging;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (parse and validation messages go to result)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult& result);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult& result);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace rotor::control

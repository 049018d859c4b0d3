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

// Rotor HAProxy Configuration - Implementation

#include "haproxy_config.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace rotor::pool {

namespace {

constexpr std::string_view DEFAULTS_SECTION =
    "defaults\n"
    "  mode http\n"
    "  maxconn 1024\n"
    "  option  httplog\n"
    "  option  dontlognull\n"
    "  retries 3\n"
    "  timeout connect 5s\n"
    "  timeout client  30s\n"
    "  timeout server  30s\n"
    "\n";

constexpr std::string_view STATS_SECTION =
    "listen stats\n"
    "  bind            :{}\n"
    "  mode            http\n"
    "  maxconn 10\n"
    "  timeout client  100s\n"
    "  timeout server  100s\n"
    "  timeout connect 100s\n"
    "  timeout queue   100s\n"
    "  stats enable\n"
    "  stats hide-version\n"
    "  stats refresh 30s\n"
    "  stats show-node\n"
    "  stats uri /haproxy?stats\n"
    "\n";

constexpr std::string_view FRONTEND_SECTION =
    "frontend rotating_proxies\n"
    "  bind *:{}\n"
    "  default_backend privoxies\n"
    "  option http_proxy\n"
    "\n";

constexpr std::string_view BACKEND_HEADER =
    "backend privoxies\n"
    "  balance {}\n"
    "  timeout http-keep-alive 3000\n"
    "\n"
    "  option forwardfor\n"
    "  option http-server-close\n"
    "  option http_proxy\n";

}  // namespace

bool is_known_balance(std::string_view balance) noexcept {
    return balance == "roundrobin" || balance == "leastconn";
}

std::error_code render_haproxy_config(const ProxyDescriptor& descriptor, std::string& out) {
    out.clear();

    if (descriptor.listen_port == 0 || !is_known_balance(descriptor.balance)) {
        LOG_ERROR(logging::logger(), "Cannot render proxy config: listen_port={}, balance={}",
                  descriptor.listen_port, descriptor.balance);
        return core::make_error_code(core::Errc::render_failed);
    }

    // Backends are emitted in port order regardless of the order given
    std::vector<uint16_t> backends = descriptor.backends;
    std::sort(backends.begin(), backends.end());
    backends.erase(std::unique(backends.begin(), backends.end()), backends.end());

    try {
        fmt::memory_buffer buffer;
        auto it = std::back_inserter(buffer);

        fmt::format_to(it, "global\n  maxconn {}\n\n", descriptor.max_connections);
        fmt::format_to(it, "{}", DEFAULTS_SECTION);

        if (descriptor.stats_port != 0) {
            fmt::format_to(it, fmt::runtime(STATS_SECTION), descriptor.stats_port);
        }

        fmt::format_to(it, fmt::runtime(FRONTEND_SECTION), descriptor.listen_port);
        fmt::format_to(it, fmt::runtime(BACKEND_HEADER), descriptor.balance);

        for (uint16_t port : backends) {
            fmt::format_to(it, "  server privoxy-{0} 127.0.0.1:{0} check\n", port);
        }

        out = fmt::to_string(buffer);
    } catch (const fmt::format_error& e) {
        LOG_ERROR(logging::logger(), "Proxy config template error: {}", e.what());
        out.clear();
        return core::make_error_code(core::Errc::render_failed);
    }

    return {};
}

}  // namespace rotor::pool

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

// Rotor HAProxy Configuration - Header
// Pure rendering of the reverse proxy configuration from a descriptor

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rotor::pool {

/// Everything the reverse proxy configuration depends on
struct ProxyDescriptor {
    uint16_t listen_port = 8080;
    uint16_t stats_port = 0;  // 0 = no stats listener
    uint32_t max_connections = 256;
    std::string balance = "roundrobin";
    std::vector<uint16_t> backends;  // Forwarder ports
};

/// Check a balance policy name (roundrobin, leastconn)
[[nodiscard]] bool is_known_balance(std::string_view balance) noexcept;

/// Render the complete haproxy.cfg text
/// Deterministic: the same descriptor always renders the same bytes.
/// @param out Receives the rendered text; left empty on error
/// @return render_failed if the descriptor cannot be rendered
[[nodiscard]] std::error_code render_haproxy_config(const ProxyDescriptor& descriptor,
                                                    std::string& out);

}  // namespace rotor::pool

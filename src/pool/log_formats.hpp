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

// Rotor Collaborator Log Formats - Header
// Line classifiers for the circuit (tor), forwarder (privoxy) and reverse proxy (haproxy)

#pragma once

#include <string_view>

#include "../core/process.hpp"

namespace rotor::pool {

/// Tor: "Mar 12 12:34:56.789 [notice] Bootstrapped 100% (done): Done"
[[nodiscard]] core::ClassifiedLine classify_tor_line(std::string_view line);

/// Privoxy: "2025-03-12 12:34:56.789 7f2b3c4d5700 Info: Listening on port 30001"
/// Multi-word levels ("Fatal error") classify by their first word.
[[nodiscard]] core::ClassifiedLine classify_privoxy_line(std::string_view line);

/// HAProxy: "[WARNING]  (1234) : Server privoxies/privoxy-30001 is DOWN"
[[nodiscard]] core::ClassifiedLine classify_haproxy_line(std::string_view line);

}  // namespace rotor::pool

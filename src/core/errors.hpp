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

// Rotor Errors - Header
// Error category shared by the supervisor, the pool and the reverse proxy controller

#pragma once

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>

namespace rotor::core {

/// Orchestrator error conditions
enum class Errc {
    launch_failed = 1,     // Process could not be spawned
    exited_during_settle,  // Process died before the settle window elapsed
    stream_error,          // Reading the merged output stream failed
    render_failed,         // Config template produced no output or could not be written
    handoff_failed,        // Replacement reverse proxy did not start
    ports_exhausted,       // Every port in the lease range is in use
    missing_executable,    // Collaborator binary not found on PATH
    shutting_down,         // Operation abandoned because shutdown was requested
};

/// Error category for rotor::core::Errc
class ErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "rotor";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get rotor error category instance
[[nodiscard]] const ErrorCategory& error_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

/// Error code from the current errno
[[nodiscard]] inline std::error_code last_system_error() noexcept {
    return {errno, std::system_category()};
}

}  // namespace rotor::core

template <>
struct std::is_error_code_enum<rotor::core::Errc> : std::true_type {};

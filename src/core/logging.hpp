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

// Rotor Logging - Header
// Quill-backed application logger and severity mapping for child process output

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <cstdint>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace rotor::control {
struct LogConfig;
}

namespace rotor::logging {

/// Severity of a classified child process line
enum class Severity : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the application logger with config-driven sink, format and level
quill::Logger* init_logger(const rotor::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Application logger (a console logger is created on first use if init_logger was not called)
quill::Logger* logger();

/// Map a level name to a severity; unknown names map to Info
[[nodiscard]] Severity parse_severity(std::string_view level) noexcept;

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Debug:
            return "debug";
        case Severity::Info:
            return "info";
        case Severity::Warn:
            return "warn";
        case Severity::Error:
            return "error";
    }
    return "info";
}

/// Emit one line of child process output at its classified severity
void log_process_line(Severity severity, std::string_view service, uint16_t port, int pid,
                      std::string_view message);

// Process lifecycle event logging
#define LOG_PROCESS(logger, event, service, port, pid) \
    LOG_INFO(logger, "Process {}: service={}, port={}, pid={}", event, service, port, pid)

// Error logging with process context
#define LOG_PROCESS_ERROR(logger, message, service, port, pid, error_code)                   \
    LOG_ERROR(logger, "{}: service={}, port={}, pid={}, error={}", message, service, port, pid, \
              error_code.message())

}  // namespace rotor::logging

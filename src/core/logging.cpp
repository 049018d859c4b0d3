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

// Rotor Logging - Implementation

#include "logging.hpp"

#include <fmt/format.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <string>

#include "../control/config.hpp"

namespace rotor::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
    quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    quill::Logger* created = nullptr;

    if (log_config.output.empty()) {
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        created = quill::Frontend::create_or_get_logger("rotor", std::move(console_sink));
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        std::string log_path = fmt::format("{}/rotor.log", log_config.output);

        if (log_config.format == "json") {
            auto json_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
            created = quill::Frontend::create_or_get_logger("rotor", std::move(json_sink));
        } else {
            auto file_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
            created = quill::Frontend::create_or_get_logger("rotor", std::move(file_sink));
        }
    }

    std::string level_lower = log_config.level;
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

    if (level_lower == "debug") {
        created->set_log_level(quill::LogLevel::Debug);
    } else if (level_lower == "warning" || level_lower == "warn") {
        created->set_log_level(quill::LogLevel::Warning);
    } else if (level_lower == "error") {
        created->set_log_level(quill::LogLevel::Error);
    } else {
        created->set_log_level(quill::LogLevel::Info);
    }

    g_logger.store(created, std::memory_order_release);
    return created;
}

void shutdown_logging() {
    if (auto* current = g_logger.load(std::memory_order_acquire)) {
        current->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    auto* current = g_logger.load(std::memory_order_acquire);
    if (current) {
        return current;
    }

    // Components used before init_logger (unit tests) log to the console
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    current = quill::Frontend::create_or_get_logger("rotor", std::move(console_sink));

    quill::Logger* expected = nullptr;
    g_logger.compare_exchange_strong(expected, current, std::memory_order_acq_rel);
    return g_logger.load(std::memory_order_acquire);
}

Severity parse_severity(std::string_view level) noexcept {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return Severity::Debug;
    }
    if (lower == "warn" || lower == "warning") {
        return Severity::Warn;
    }
    if (lower == "err" || lower == "error" || lower == "fatal" || lower == "alert" ||
        lower == "emerg" || lower == "crit") {
        return Severity::Error;
    }
    return Severity::Info;
}

void log_process_line(Severity severity, std::string_view service, uint16_t port, int pid,
                      std::string_view message) {
    quill::Logger* log = logger();

    switch (severity) {
        case Severity::Debug:
            LOG_DEBUG(log, "service={}, port={}, pid={}: {}", service, port, pid, message);
            break;
        case Severity::Info:
            LOG_INFO(log, "service={}, port={}, pid={}: {}", service, port, pid, message);
            break;
        case Severity::Warn:
            LOG_WARNING(log, "service={}, port={}, pid={}: {}", service, port, pid, message);
            break;
        case Severity::Error:
            LOG_ERROR(log, "service={}, port={}, pid={}: {}", service, port, pid, message);
            break;
    }
}

}  // namespace rotor::logging

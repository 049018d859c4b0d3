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

// Rotor Collaborator Log Formats - Implementation

#include "log_formats.hpp"

#include <string>

namespace rotor::pool {

using core::ClassifiedLine;
using logging::Severity;

namespace {

// "Mmm dd hh:mm:ss.mmm "
constexpr size_t TOR_TIMESTAMP_WIDTH = 20;

std::string_view trim_left(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    return s;
}

/// Drop one whitespace-delimited token and the blanks after it
std::string_view skip_token(std::string_view s) {
    s = trim_left(s);
    size_t end = s.find_first_of(" \t");
    if (end == std::string_view::npos) {
        return {};
    }
    return trim_left(s.substr(end));
}

ClassifiedLine unparsed(std::string_view line) {
    return ClassifiedLine{Severity::Info, std::string(line)};
}

}  // namespace

ClassifiedLine classify_tor_line(std::string_view line) {
    if (line.size() <= TOR_TIMESTAMP_WIDTH || line[TOR_TIMESTAMP_WIDTH] != '[') {
        return unparsed(line);
    }

    std::string_view rest = line.substr(TOR_TIMESTAMP_WIDTH + 1);
    size_t close = rest.find(']');
    if (close == std::string_view::npos) {
        return unparsed(line);
    }

    ClassifiedLine result;
    result.severity = logging::parse_severity(rest.substr(0, close));
    result.message = std::string(trim_left(rest.substr(close + 1)));
    return result;
}

ClassifiedLine classify_privoxy_line(std::string_view line) {
    // date, time, thread id
    std::string_view rest = skip_token(skip_token(skip_token(line)));
    if (rest.empty()) {
        return unparsed(line);
    }

    size_t colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return unparsed(line);
    }

    std::string_view level = rest.substr(0, colon);
    if (size_t space = level.find(' '); space != std::string_view::npos) {
        level = level.substr(0, space);
    }

    ClassifiedLine result;
    result.severity = logging::parse_severity(level);
    result.message = std::string(trim_left(rest.substr(colon + 1)));
    return result;
}

ClassifiedLine classify_haproxy_line(std::string_view line) {
    std::string_view rest = trim_left(line);
    if (rest.empty() || rest.front() != '[') {
        return unparsed(line);
    }

    size_t close = rest.find(']');
    if (close == std::string_view::npos) {
        return unparsed(line);
    }

    ClassifiedLine result;
    result.severity = logging::parse_severity(rest.substr(1, close - 1));

    // Message follows the "(pid) : " header
    std::string_view after = rest.substr(close + 1);
    size_t sep = after.find(" : ");
    if (sep != std::string_view::npos) {
        result.message = std::string(after.substr(sep + 3));
    } else {
        result.message = std::string(trim_left(after));
    }
    return result;
}

}  // namespace rotor::pool

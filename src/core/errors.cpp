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

// Rotor Errors - Implementation

#include "errors.hpp"

namespace rotor::core {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<Errc>(ev)) {
        case Errc::launch_failed:
            return "process could not be started";
        case Errc::exited_during_settle:
            return "process exited during settle window";
        case Errc::stream_error:
            return "failed to read process output";
        case Errc::render_failed:
            return "failed to render configuration";
        case Errc::handoff_failed:
            return "replacement process failed to take over";
        case Errc::ports_exhausted:
            return "no free port in lease range";
        case Errc::missing_executable:
            return "required program not found";
        case Errc::shutting_down:
            return "shutdown in progress";
    }
    return "unknown rotor error";
}

const ErrorCategory& error_category() noexcept {
    static ErrorCategory instance;
    return instance;
}

}  // namespace rotor::core

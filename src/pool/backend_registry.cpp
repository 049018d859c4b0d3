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

// Rotor Backend Registry - Implementation

#include "backend_registry.hpp"

#include "../core/logging.hpp"

namespace rotor::pool {

void BackendRegistry::set_change_listener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void BackendRegistry::add(uint16_t port) {
    size_t count;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ports_.insert(port);
        count = ports_.size();
    }

    LOG_INFO(logging::logger(), "Backend registered: port={}, backends={}", port, count);
    notify();
}

void BackendRegistry::remove(uint16_t port) {
    size_t count;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ports_.erase(port);
        count = ports_.size();
    }

    LOG_INFO(logging::logger(), "Backend deregistered: port={}, backends={}", port, count);
    notify();
}

std::vector<uint16_t> BackendRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {ports_.begin(), ports_.end()};
}

bool BackendRegistry::contains(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.contains(port);
}

size_t BackendRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.size();
}

void BackendRegistry::notify() {
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }

    if (listener) {
        listener();
    }
}

}  // namespace rotor::pool

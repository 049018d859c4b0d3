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

// Rotor Port Allocator - Implementation

#include "port_allocator.hpp"

#include <algorithm>

#include "../core/logging.hpp"

namespace rotor::pool {

PortAllocator::PortAllocator(uint16_t floor, uint16_t ceiling)
    : floor_(floor), ceiling_(std::max(floor, ceiling)), next_(floor) {}

std::optional<uint16_t> PortAllocator::lease() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (leased_.size() >= capacity()) {
        return std::nullopt;
    }

    for (size_t attempts = 0; attempts < capacity(); ++attempts) {
        if (next_ > ceiling_) {
            next_ = floor_;
            LOG_DEBUG(logging::logger(), "Port counter wrapped: next_port={}", floor_);
        }

        auto candidate = static_cast<uint16_t>(next_);
        ++next_;

        if (leased_.insert(candidate).second) {
            return candidate;
        }
    }

    return std::nullopt;
}

bool PortAllocator::release(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_.erase(port) > 0;
}

bool PortAllocator::is_leased(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_.contains(port);
}

size_t PortAllocator::leased_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_.size();
}

}  // namespace rotor::pool

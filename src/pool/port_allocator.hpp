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

// Rotor Port Allocator - Header
// Round-robin port leases from a fixed range, never reissuing a port still leased

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace rotor::pool {

/// Port allocator
///
/// Candidates advance monotonically from the floor and wrap back to it past
/// the ceiling. Ports still leased are skipped, so a released port is only
/// reused after the counter comes around again.
///
/// Thread-safety: all operations are serialized by one mutex.
class PortAllocator {
public:
    /// @param floor First port of the range
    /// @param ceiling Last port of the range (inclusive)
    PortAllocator(uint16_t floor, uint16_t ceiling);
    ~PortAllocator() = default;

    // Non-copyable, non-movable (shared by reference)
    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    /// Lease the next free port
    /// @return Port, or nullopt when every port in the range is leased
    [[nodiscard]] std::optional<uint16_t> lease();

    /// Return a port to the pool
    /// @return false if the port was not leased
    bool release(uint16_t port);

    [[nodiscard]] bool is_leased(uint16_t port) const;

    [[nodiscard]] size_t leased_count() const;

    /// Number of ports in the range
    [[nodiscard]] size_t capacity() const noexcept {
        return static_cast<size_t>(ceiling_) - floor_ + 1;
    }

    [[nodiscard]] uint16_t floor() const noexcept {
        return floor_;
    }

    [[nodiscard]] uint16_t ceiling() const noexcept {
        return ceiling_;
    }

private:
    uint16_t floor_;
    uint16_t ceiling_;

    // Next candidate; 32-bit so a ceiling of 65535 does not overflow
    uint32_t next_;

    std::unordered_set<uint16_t> leased_;
    mutable std::mutex mutex_;
};

}  // namespace rotor::pool

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

// Rotor Backend Registry - Header
// Set of forwarder ports currently eligible for traffic

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace rotor::pool {

/// Backend registry
///
/// Every mutation is followed by a call to the change listener (normally the
/// reverse proxy controller's request_reload()). The listener runs after the
/// registry lock is released and must not block.
class BackendRegistry {
public:
    using ChangeListener = std::function<void()>;

    BackendRegistry() = default;
    ~BackendRegistry() = default;

    // Non-copyable, non-movable (shared by reference)
    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /// Install the listener notified after each mutation
    void set_change_listener(ChangeListener listener);

    /// Register a backend port
    void add(uint16_t port);

    /// Deregister a backend port
    void remove(uint16_t port);

    /// Sorted copy of the registered ports
    [[nodiscard]] std::vector<uint16_t> snapshot() const;

    [[nodiscard]] bool contains(uint16_t port) const;

    [[nodiscard]] size_t size() const;

private:
    void notify();

    mutable std::mutex mutex_;
    std::set<uint16_t> ports_;
    ChangeListener listener_;
};

}  // namespace rotor::pool

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

// Rotor Admission Gate - Header
// Counting gate bounding the number of live worker pairs

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

namespace rotor::pool {

/// Counting semaphore whose acquire honors cancellation
class AdmissionGate {
public:
    explicit AdmissionGate(size_t capacity) : capacity_(capacity) {}
    ~AdmissionGate() = default;

    // Non-copyable, non-movable (shared by reference)
    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /// Block until a slot is free
    /// @return false if stop was requested before a slot was taken
    [[nodiscard]] bool acquire(std::stop_token stop);

    /// Take a slot without blocking
    [[nodiscard]] bool try_acquire();

    /// Give a slot back
    void release();

    [[nodiscard]] size_t in_use() const;

    [[nodiscard]] size_t capacity() const noexcept {
        return capacity_;
    }

private:
    const size_t capacity_;
    size_t in_use_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace rotor::pool

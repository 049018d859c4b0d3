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

// Rotor Admission Gate - Implementation

#include "admission_gate.hpp"

namespace rotor::pool {

bool AdmissionGate::acquire(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait(lock, stop, [this] { return in_use_ < capacity_; })) {
        return false;
    }
    ++in_use_;
    return true;
}

bool AdmissionGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ >= capacity_) {
        return false;
    }
    ++in_use_;
    return true;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

size_t AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

}  // namespace rotor::pool

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

// Rotor Event - Header
// One-shot, multiply-observable signal and cancellable sleeps

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace rotor::core {

/// One-shot event
///
/// Fires at most once. Any number of threads may wait on it, before or after
/// it fired. token() exposes it as a std::stop_token so it can be combined
/// with std::stop_callback to wait on the first of several events.
class Event {
public:
    Event() = default;
    ~Event() = default;

    // Non-copyable, non-movable (waiters hold references)
    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    /// Fire the event. Returns true only for the call that fired it.
    bool set() noexcept {
        return source_.request_stop();
    }

    [[nodiscard]] bool is_set() const noexcept {
        return source_.stop_requested();
    }

    /// Block until the event fires
    void wait() const {
        auto token = source_.get_token();
        std::unique_lock lock(mutex_);
        cv_.wait(lock, token, [] { return false; });
    }

    /// Block until the event fires or the timeout elapses
    /// Returns true if the event fired
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        auto token = source_.get_token();
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, token, timeout, [&token] { return token.stop_requested(); });
    }

    [[nodiscard]] std::stop_token token() const noexcept {
        return source_.get_token();
    }

private:
    std::stop_source source_;
    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;
};

/// Sleep that returns early when stop is requested
/// Returns false if the sleep was cut short by cancellation
template <typename Rep, typename Period>
bool sleep_for(std::stop_token stop, std::chrono::duration<Rep, Period> duration) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace rotor::core

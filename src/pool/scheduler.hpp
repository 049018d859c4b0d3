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

// Rotor Rotation Scheduler - Header
// Keeps a bounded set of live worker pairs, replacing each when it fails or expires

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "admission_gate.hpp"
#include "backend_registry.hpp"
#include "port_allocator.hpp"
#include "worker_pair.hpp"

namespace rotor::pool {

/// Rotation scheduler
///
/// Capacity is enforced by the admission gate: a pair task holds its slot
/// from admission until it is fully retired. Every task ever spawned is
/// tracked separately and joined at shutdown.
class RotationScheduler {
public:
    RotationScheduler(size_t capacity, WorkerPairOptions options, PortAllocator& ports,
                      BackendRegistry& registry);

    /// Joins any pair threads still running
    ~RotationScheduler();

    // Non-copyable, non-movable (pair threads hold this)
    RotationScheduler(const RotationScheduler&) = delete;
    RotationScheduler& operator=(const RotationScheduler&) = delete;

    /// Admit pairs until stop is requested, then wait for all of them to retire
    /// Blocks the calling thread for the lifetime of the pool.
    void run(std::stop_token stop);

    /// Pairs currently holding an admission slot
    [[nodiscard]] size_t live_pairs() const {
        return gate_.in_use();
    }

    [[nodiscard]] size_t capacity() const noexcept {
        return gate_.capacity();
    }

    /// Status of every pair that has not finished
    [[nodiscard]] std::vector<PairInfo> snapshot() const;

    /// Pair tasks spawned since start
    [[nodiscard]] uint64_t pairs_created() const noexcept {
        return pairs_created_.load(std::memory_order_relaxed);
    }

    /// Pair tasks that ran to completion
    [[nodiscard]] uint64_t pairs_retired() const noexcept {
        return pairs_retired_.load(std::memory_order_relaxed);
    }

private:
    struct PairTask {
        std::unique_ptr<WorkerPair> pair;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void spawn(std::stop_token stop);

    /// Join and drop tasks whose pair has finished
    void reap_finished();

    /// Join every task (shutdown)
    void join_all();

    WorkerPairOptions options_;
    PortAllocator& ports_;
    BackendRegistry& registry_;
    AdmissionGate gate_;

    mutable std::mutex tasks_mutex_;
    std::list<std::unique_ptr<PairTask>> tasks_;

    std::atomic<uint64_t> next_pair_id_{1};
    std::atomic<uint64_t> pairs_created_{0};
    std::atomic<uint64_t> pairs_retired_{0};
};

}  // namespace rotor::pool

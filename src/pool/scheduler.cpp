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

// Rotor Rotation Scheduler - Implementation

#include "scheduler.hpp"

#include "../core/logging.hpp"

namespace rotor::pool {

RotationScheduler::RotationScheduler(size_t capacity, WorkerPairOptions options,
                                     PortAllocator& ports, BackendRegistry& registry)
    : options_(std::move(options)), ports_(ports), registry_(registry), gate_(capacity) {}

RotationScheduler::~RotationScheduler() {
    join_all();
}

void RotationScheduler::run(std::stop_token stop) {
    auto* log = logging::logger();
    LOG_INFO(log, "Rotation started: capacity={}, max_lifetime_s={}", gate_.capacity(),
             options_.max_lifetime.count());

    while (!stop.stop_requested()) {
        if (!gate_.acquire(stop)) {
            break;
        }
        if (stop.stop_requested()) {
            gate_.release();
            break;
        }

        reap_finished();
        spawn(stop);
    }

    size_t remaining;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        remaining = tasks_.size();
    }
    LOG_INFO(log, "Rotation stopping: waiting for {} pairs to retire", remaining);

    join_all();

    LOG_INFO(log, "Rotation stopped: created={}, retired={}", pairs_created(), pairs_retired());
}

std::vector<PairInfo> RotationScheduler::snapshot() const {
    std::vector<PairInfo> result;

    std::lock_guard<std::mutex> lock(tasks_mutex_);
    result.reserve(tasks_.size());
    for (const auto& task : tasks_) {
        if (!task->finished.load(std::memory_order_acquire)) {
            result.push_back(task->pair->info());
        }
    }
    return result;
}

void RotationScheduler::spawn(std::stop_token stop) {
    uint64_t id = next_pair_id_.fetch_add(1, std::memory_order_relaxed);

    auto task = std::make_unique<PairTask>();
    task->pair = std::make_unique<WorkerPair>(id, options_, ports_, registry_);

    PairTask* raw = task.get();
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.push_back(std::move(task));
    }

    pairs_created_.fetch_add(1, std::memory_order_relaxed);

    raw->thread = std::thread([this, raw, stop] {
        RetireReason reason = raw->pair->run(stop);
        LOG_DEBUG(logging::logger(), "Pair task finished: pair={}, reason={}", raw->pair->id(),
                  to_string(reason));

        pairs_retired_.fetch_add(1, std::memory_order_relaxed);
        raw->finished.store(true, std::memory_order_release);
        gate_.release();
    });
}

void RotationScheduler::reap_finished() {
    std::list<std::unique_ptr<PairTask>> finished;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if ((*it)->finished.load(std::memory_order_acquire)) {
                auto next = std::next(it);
                finished.splice(finished.end(), tasks_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }

    for (auto& task : finished) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }
}

void RotationScheduler::join_all() {
    std::list<std::unique_ptr<PairTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(tasks_);
    }

    for (auto& task : tasks) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }
}

}  // namespace rotor::pool

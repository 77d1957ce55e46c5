/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The Sentinet Authors and Contributors
 */

#pragma once
#include "sentinet_core/southbound/FlowJob.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

/**
 * @brief Per-switch ordered queues of flow jobs, drained by one worker thread per DPID.
 *
 * Jobs for the same switch are sent in enqueue order; different switches never wait on each
 * other. Workers are spawned lazily on the first job for a DPID.
 */
class FlowDispatcher
{
  public:
    using SenderFn = std::function<void(const std::vector<FlowJob>& batch)>;

    explicit FlowDispatcher(SenderFn sender, size_t burstSize = 64);
    ~FlowDispatcher();

    void start();
    void stop();

    // Jobs enqueued while the dispatcher is stopped are discarded.
    void enqueue(const FlowJob& job);
    void enqueue(std::vector<FlowJob> jobs);

    // Discard jobs still waiting for a switch that went away.
    void purge(uint64_t dpid);

    size_t pending(uint64_t dpid);

  private:
    void workerLoop_(uint64_t dpid);
    void spawnWorkerLocked_(uint64_t dpid);

    std::unordered_map<uint64_t, std::deque<FlowJob>> queues_;
    std::unordered_map<uint64_t, std::thread> workers_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};

    // Southbound push, e.g. RyuRestChannel posting each job to ofctl_rest.
    SenderFn sender_;
    size_t burstSize_;
};

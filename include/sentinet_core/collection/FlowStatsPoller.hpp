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
#include "common_types/FlowTypes.hpp"
#include "sentinet_core/southbound/SwitchChannel.hpp"
#include "sentinet_core/switching/SwitchRegistry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Periodically requests flow statistics from every active switch.
 *
 * Each cycle first calls the cycle hook (operator command poll), then fetches the flow
 * table of every Active datapath and hands successful replies to the stats sink. A failed
 * fetch is skipped for that cycle.
 */
class FlowStatsPoller
{
  public:
    using CycleHook = std::function<void()>;
    using StatsSink =
        std::function<void(uint64_t dpid, std::vector<FlowStatEntry> entries, TimePoint at)>;

    FlowStatsPoller(std::shared_ptr<SwitchRegistry> registry,
                    std::shared_ptr<SwitchChannel> channel,
                    std::chrono::seconds interval,
                    CycleHook onCycle,
                    StatsSink sink);
    ~FlowStatsPoller();

    void start();
    void stop();

    // One polling cycle on the calling thread.
    void pollOnce();

  private:
    void run();

    std::shared_ptr<SwitchRegistry> m_registry;
    std::shared_ptr<SwitchChannel> m_channel;
    std::chrono::seconds m_interval;
    CycleHook m_onCycle;
    StatsSink m_sink;

    std::atomic<bool> m_running{false};
    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

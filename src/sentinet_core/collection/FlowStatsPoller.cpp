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

#include "sentinet_core/collection/FlowStatsPoller.hpp"
#include "utils/Logger.hpp"

FlowStatsPoller::FlowStatsPoller(std::shared_ptr<SwitchRegistry> registry,
                                 std::shared_ptr<SwitchChannel> channel,
                                 std::chrono::seconds interval,
                                 CycleHook onCycle,
                                 StatsSink sink)
    : m_registry(std::move(registry)),
      m_channel(std::move(channel)),
      m_interval(interval),
      m_onCycle(std::move(onCycle)),
      m_sink(std::move(sink))
{
}

FlowStatsPoller::~FlowStatsPoller()
{
    stop();
}

void
FlowStatsPoller::start()
{
    if (m_running.exchange(true))
    {
        return;
    }
    m_thread = std::thread(&FlowStatsPoller::run, this);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "FlowStatsPoller started, interval {}s",
                       m_interval.count());
}

void
FlowStatsPoller::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running.store(false);
    }
    m_cv.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
        SPDLOG_LOGGER_INFO(Logger::instance(), "FlowStatsPoller stopped.");
    }
}

void
FlowStatsPoller::pollOnce()
{
    if (m_onCycle)
    {
        m_onCycle();
    }

    for (uint64_t dpid : m_registry->activeDatapaths())
    {
        auto entries = m_channel->fetchFlowStats(dpid);
        if (!entries)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "No flow stats from dpid {} this cycle", dpid);
            continue;
        }
        m_sink(dpid, std::move(*entries), Clock::now());
    }
}

void
FlowStatsPoller::run()
{
    while (m_running.load())
    {
        pollOnce();

        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, m_interval, [this] { return !m_running.load(); });
    }
}

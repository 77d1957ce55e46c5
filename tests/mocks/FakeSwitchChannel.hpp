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
#include "sentinet_core/southbound/SwitchChannel.hpp"
#include <map>
#include <mutex>
#include <vector>

/**
 * @brief SwitchChannel that records installed rules and serves canned flow stats.
 */
class FakeSwitchChannel : public SwitchChannel
{
  public:
    void installFlow(const FlowJob& job) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        installed.push_back(job);
    }

    std::optional<std::vector<FlowStatEntry>> fetchFlowStats(uint64_t dpid) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        fetched.push_back(dpid);
        auto it = stats.find(dpid);
        if (it == stats.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void discardPending(uint64_t dpid) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        discarded.push_back(dpid);
    }

    std::vector<FlowJob> jobsWithPriority(int priority) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<FlowJob> jobs;
        for (const auto& job : installed)
        {
            if (job.priority == priority)
            {
                jobs.push_back(job);
            }
        }
        return jobs;
    }

    std::vector<FlowJob> installed;
    std::vector<uint64_t> fetched;
    std::vector<uint64_t> discarded;
    std::map<uint64_t, std::vector<FlowStatEntry>> stats;

  private:
    mutable std::mutex m_mutex;
};

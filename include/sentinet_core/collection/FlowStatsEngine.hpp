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
#include "common_types/FlowTypes.hpp"               // for FlowKey, FlowStatE...
#include "sentinet_core/topology/TopologyModel.hpp" // for TopologyModel
#include "utils/AppConfig.hpp"                      // for FORWARDING_PRIORITY
#include <map>                                      // for map
#include <memory>                                   // for shared_ptr
#include <mutex>                                    // for mutex
#include <string>                                   // for string
#include <unordered_map>                            // for unordered_map
#include <utility>                                  // for pair
#include <vector>                                   // for vector

// (fromSwitch, toSwitch) -> bits per second
using LinkUtilization = std::map<std::pair<std::string, std::string>, double>;

/**
 * @brief Turns cumulative flow counters into instantaneous per-flow rates.
 *
 * Only the previous sample is retained per (switch, src, dst). The first sample of a key
 * yields zero rates. A key that is missing from FLOW_SAMPLE_MISS_LIMIT consecutive replies of
 * its switch is evicted, and forgetSwitch() drops every key of a disconnected switch.
 *
 * Entries whose priority differs from the forwarding-rule priority (table-miss, drop rules)
 * are ignored.
 */
class FlowStatsEngine
{
  public:
    explicit FlowStatsEngine(std::shared_ptr<const TopologyModel> topology,
                             int forwardingPriority = AppConfig::FORWARDING_PRIORITY,
                             int missLimit = AppConfig::FLOW_SAMPLE_MISS_LIMIT);

    std::vector<FlowRecord> processReply(uint64_t dpid,
                                         const std::string& switchId,
                                         const std::vector<FlowStatEntry>& entries,
                                         TimePoint now);

    void forgetSwitch(uint64_t dpid);

    /**
     * @brief Sum of the latest flow bps per directed switch-to-switch link.
     *
     * Every directed link of the topology is present; links without traffic report 0.
     */
    LinkUtilization linkUtilization() const;

    std::vector<FlowRecord> latestRecords(uint64_t dpid) const;
    size_t sampleCount() const;

  private:
    void logTopFlows(const std::string& switchId, std::vector<FlowRecord> records) const;

    std::shared_ptr<const TopologyModel> m_topology;
    int m_forwardingPriority;
    int m_missLimit;

    mutable std::mutex m_mutex;
    std::unordered_map<FlowKey, FlowSample, FlowKeyHash> m_samples;
    std::unordered_map<uint64_t, std::vector<FlowRecord>> m_latest;
};

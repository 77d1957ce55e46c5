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
#include "sentinet_core/southbound/FlowJob.hpp"
#include <cstdint>
#include <optional>
#include <vector>

/**
 * @brief Southbound capability the decision core needs from the OpenFlow controller platform.
 *
 * installFlow must not block the caller; fetchFlowStats may block and is only called from the
 * stats poller thread.
 */
class SwitchChannel
{
  public:
    virtual ~SwitchChannel() = default;

    virtual void installFlow(const FlowJob& job) = 0;

    /**
     * @brief Read the flow table counters of one switch.
     * @return The reported entries, or std::nullopt when the switch could not be queried.
     */
    virtual std::optional<std::vector<FlowStatEntry>> fetchFlowStats(uint64_t dpid) = 0;

    // Drop queued, not yet sent, operations for a switch that disconnected.
    virtual void discardPending(uint64_t /*dpid*/) {}
};

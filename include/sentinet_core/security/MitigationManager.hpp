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
#include "sentinet_core/scheduling/TaskScheduler.hpp"
#include "sentinet_core/southbound/SwitchChannel.hpp"
#include "sentinet_core/switching/SwitchRegistry.hpp"
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

struct BlockedFlow
{
    MacPair pair;
    TimePoint expiry;
};

/**
 * @brief Installs drop rules for blocked (src, dst) pairs and lifts them at their deadline.
 *
 * The drop rule carries a hard timeout equal to the block duration, so switches expire it on
 * their own; the matching unblock is a keyed task on the TaskScheduler. Re-blocking a pair
 * extends the deadline and replaces its pending unblock.
 */
class MitigationManager
{
  public:
    MitigationManager(std::shared_ptr<SwitchRegistry> registry,
                      std::shared_ptr<SwitchChannel> channel,
                      std::shared_ptr<TaskScheduler> scheduler);

    void block(uint64_t srcMac, uint64_t dstMac, int durationSec);
    // Returns false when the pair was not blocked.
    bool unblock(uint64_t srcMac, uint64_t dstMac);
    bool isBlocked(uint64_t srcMac, uint64_t dstMac) const;

    std::vector<BlockedFlow> blockedFlows() const;
    nlohmann::json toJson() const;

    static std::string unblockTaskKey(const MacPair& pair);

  private:
    std::shared_ptr<SwitchRegistry> m_registry;
    std::shared_ptr<SwitchChannel> m_channel;
    std::shared_ptr<TaskScheduler> m_scheduler;

    mutable std::mutex m_mutex;
    std::unordered_map<MacPair, TimePoint, MacPairHash> m_blocked;
};

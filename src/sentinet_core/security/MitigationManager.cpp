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

#include "sentinet_core/security/MitigationManager.hpp"
#include "utils/AppConfig.hpp"                          // for AppConfig
#include "utils/Logger.hpp"                             // for Logger
#include "utils/Utils.hpp"                              // for macToString
#include <algorithm>                                    // for max

using json = nlohmann::json;

MitigationManager::MitigationManager(std::shared_ptr<SwitchRegistry> registry,
                                     std::shared_ptr<SwitchChannel> channel,
                                     std::shared_ptr<TaskScheduler> scheduler)
    : m_registry(std::move(registry)),
      m_channel(std::move(channel)),
      m_scheduler(std::move(scheduler))
{
}

std::string
MitigationManager::unblockTaskKey(const MacPair& pair)
{
    return "unblock:" + utils::macToString(pair.srcMac) + ">" + utils::macToString(pair.dstMac);
}

void
MitigationManager::block(uint64_t srcMac, uint64_t dstMac, int durationSec)
{
    if (durationSec <= 0)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Ignoring block of {} -> {} with non-positive duration {}",
                           utils::macToString(srcMac),
                           utils::macToString(dstMac),
                           durationSec);
        return;
    }

    const MacPair pair{srcMac, dstMac};
    const auto duration = std::chrono::seconds(durationSec);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_blocked[pair] = m_scheduler->now() + duration;
    }

    const auto datapaths = m_registry->activeDatapaths();
    for (uint64_t dpid : datapaths)
    {
        FlowJob drop;
        drop.dpid = dpid;
        drop.op = FlowOp::Install;
        drop.priority = AppConfig::DROP_PRIORITY;
        drop.match = json{{"eth_src", utils::macToString(srcMac)},
                          {"eth_dst", utils::macToString(dstMac)}};
        drop.actions = json::array();
        drop.hardTimeout = durationSec;
        m_channel->installFlow(drop);
    }

    m_scheduler->scheduleAfter(unblockTaskKey(pair),
                               std::chrono::duration_cast<std::chrono::milliseconds>(duration),
                               [this, pair]() { unblock(pair.srcMac, pair.dstMac); });

    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "[BLOCK] {} -> {} for {}s on {} switches",
                       utils::macToString(srcMac),
                       utils::macToString(dstMac),
                       durationSec,
                       datapaths.size());
}

bool
MitigationManager::unblock(uint64_t srcMac, uint64_t dstMac)
{
    const MacPair pair{srcMac, dstMac};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_blocked.erase(pair) == 0)
        {
            return false;
        }
    }
    m_scheduler->cancel(unblockTaskKey(pair));
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "[UNBLOCK] {} -> {}",
                       utils::macToString(srcMac),
                       utils::macToString(dstMac));
    return true;
}

bool
MitigationManager::isBlocked(uint64_t srcMac, uint64_t dstMac) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_blocked.count(MacPair{srcMac, dstMac}) > 0;
}

std::vector<BlockedFlow>
MitigationManager::blockedFlows() const
{
    std::vector<BlockedFlow> flows;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [pair, expiry] : m_blocked)
    {
        flows.push_back(BlockedFlow{pair, expiry});
    }
    return flows;
}

json
MitigationManager::toJson() const
{
    const auto now = m_scheduler->now();
    json flows = json::array();
    for (const auto& flow : blockedFlows())
    {
        flows.push_back(
            {{"src_mac", utils::macToString(flow.pair.srcMac)},
             {"dst_mac", utils::macToString(flow.pair.dstMac)},
             {"remaining_sec",
              std::max<int64_t>(0,
                                std::chrono::duration_cast<std::chrono::seconds>(flow.expiry - now)
                                    .count())}});
    }
    return flows;
}

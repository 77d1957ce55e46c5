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

#include "sentinet_core/collection/FlowStatsEngine.hpp"
#include "utils/Logger.hpp"                             // for Logger
#include "utils/Utils.hpp"                              // for macToString, g...
#include <algorithm>                                    // for max, min, sort
#include <unordered_map>                                // for unordered_map, ...

FlowStatsEngine::FlowStatsEngine(std::shared_ptr<const TopologyModel> topology,
                                 int forwardingPriority,
                                 int missLimit)
    : m_topology(std::move(topology)),
      m_forwardingPriority(forwardingPriority),
      m_missLimit(missLimit < 1 ? 1 : missLimit)
{
}

std::vector<FlowRecord>
FlowStatsEngine::processReply(uint64_t dpid,
                              const std::string& switchId,
                              const std::vector<FlowStatEntry>& entries,
                              TimePoint now)
{
    const int64_t wallMs = utils::getCurrentTimeMillisSystemClock();

    // Rules are installed per (in_port, src, dst), so one key may be reported by several
    // entries; their counters are summed. Ports come from the first entry seen.
    std::vector<FlowKey> order;
    std::unordered_map<FlowKey, FlowStatEntry, FlowKeyHash> totals;
    for (const auto& entry : entries)
    {
        if (entry.priority != m_forwardingPriority)
        {
            continue;
        }

        FlowKey key{dpid, entry.srcMac, entry.dstMac};
        auto [it, inserted] = totals.try_emplace(key, entry);
        if (inserted)
        {
            order.push_back(key);
            continue;
        }
        it->second.packetCount += entry.packetCount;
        it->second.byteCount += entry.byteCount;
        it->second.durationSec = std::max(it->second.durationSec, entry.durationSec);
    }

    std::vector<FlowRecord> records;
    records.reserve(order.size());

    std::lock_guard<std::mutex> lock(m_mutex);

    for (const auto& key : order)
    {
        const FlowStatEntry& entry = totals.at(key);

        FlowRecord record;
        record.switchId = switchId;
        record.dpid = dpid;
        record.srcMac = entry.srcMac;
        record.dstMac = entry.dstMac;
        record.inPort = entry.inPort;
        record.outPort = entry.outPort;
        record.packetCount = entry.packetCount;
        record.byteCount = entry.byteCount;
        record.durationSec = entry.durationSec;
        record.timestampMs = wallMs;
        record.avgPktSize = entry.packetCount > 0
                                ? static_cast<double>(entry.byteCount) / entry.packetCount
                                : 0.0;

        auto it = m_samples.find(key);
        if (it != m_samples.end())
        {
            const double dt = std::chrono::duration<double>(now - it->second.timestamp).count();
            if (dt > 0.0)
            {
                const double dPackets = static_cast<double>(entry.packetCount) -
                                        static_cast<double>(it->second.packetCount);
                const double dBytes = static_cast<double>(entry.byteCount) -
                                      static_cast<double>(it->second.byteCount);
                record.pps = std::max(0.0, dPackets / dt);
                record.bps = std::max(0.0, dBytes * 8.0 / dt);
            }
        }

        m_samples[key] = FlowSample{entry.packetCount, entry.byteCount, now, 0};
        records.push_back(std::move(record));
    }

    for (auto it = m_samples.begin(); it != m_samples.end();)
    {
        if (it->first.dpid == dpid && !totals.count(it->first) &&
            ++it->second.missedPolls >= m_missLimit)
        {
            SPDLOG_LOGGER_TRACE(Logger::instance(),
                                "Evicting flow sample {} -> {} on {}",
                                utils::macToString(it->first.srcMac),
                                utils::macToString(it->first.dstMac),
                                switchId);
            it = m_samples.erase(it);
        }
        else
        {
            ++it;
        }
    }

    m_latest[dpid] = records;
    logTopFlows(switchId, records);
    return records;
}

void
FlowStatsEngine::forgetSwitch(uint64_t dpid)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::erase_if(m_samples, [dpid](const auto& item) { return item.first.dpid == dpid; });
    m_latest.erase(dpid);
}

LinkUtilization
FlowStatsEngine::linkUtilization() const
{
    LinkUtilization usage;
    for (const auto& link : m_topology->links())
    {
        usage[{link.fromSwitch, link.toSwitch}] = 0.0;
        usage[{link.toSwitch, link.fromSwitch}] = 0.0;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [dpid, records] : m_latest)
    {
        for (const auto& record : records)
        {
            if (!record.outPort.has_value())
            {
                continue;
            }
            auto neighbor = m_topology->neighborOnPort(record.switchId, record.outPort.value());
            if (neighbor.has_value())
            {
                usage[{record.switchId, neighbor.value()}] += record.bps;
            }
        }
    }
    return usage;
}

std::vector<FlowRecord>
FlowStatsEngine::latestRecords(uint64_t dpid) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_latest.find(dpid);
    if (it == m_latest.end())
    {
        return {};
    }
    return it->second;
}

size_t
FlowStatsEngine::sampleCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_samples.size();
}

void
FlowStatsEngine::logTopFlows(const std::string& switchId, std::vector<FlowRecord> records) const
{
    if (records.empty() || !Logger::instance()->should_log(spdlog::level::debug))
    {
        return;
    }

    std::sort(records.begin(), records.end(), [](const FlowRecord& a, const FlowRecord& b) {
        return a.pps > b.pps;
    });
    const size_t shown = std::min<size_t>(records.size(), 5);
    for (size_t i = 0; i < shown; ++i)
    {
        const auto& r = records[i];
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "[STATS] {} {} -> {} pps={:.2f} bps={:.2f} avg={:.1f}B",
                            switchId,
                            utils::macToString(r.srcMac),
                            utils::macToString(r.dstMac),
                            r.pps,
                            r.bps,
                            r.avgPktSize);
    }
}

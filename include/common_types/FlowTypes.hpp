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

#include "common_types/TopologyTypes.hpp"
#include "utils/Utils.hpp"
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tuple>

template <typename T>
inline void
hashCombine(std::size_t& seed, const T& val)
{
    seed ^= std::hash<T>{}(val) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

/**
 * @brief Identity of a host-to-host flow as seen by one switch.
 */
struct FlowKey
{
    uint64_t dpid = 0;
    uint64_t srcMac = 0;
    uint64_t dstMac = 0;

    bool operator==(const FlowKey& o) const = default;

    bool operator<(const FlowKey& o) const
    {
        return std::tie(dpid, srcMac, dstMac) < std::tie(o.dpid, o.srcMac, o.dstMac);
    }
};

struct FlowKeyHash
{
    std::size_t operator()(const FlowKey& key) const
    {
        std::size_t seed = 0;
        hashCombine(seed, key.dpid);
        hashCombine(seed, key.srcMac);
        hashCombine(seed, key.dstMac);
        return seed;
    }
};

/**
 * @brief Ordered (source, destination) MAC pair, the unit of blocking and alert cooldown.
 */
struct MacPair
{
    uint64_t srcMac = 0;
    uint64_t dstMac = 0;

    bool operator==(const MacPair& o) const = default;
};

struct MacPairHash
{
    std::size_t operator()(const MacPair& key) const
    {
        std::size_t seed = 0;
        hashCombine(seed, key.srcMac);
        hashCombine(seed, key.dstMac);
        return seed;
    }
};

/**
 * @brief One flow entry as reported by a switch in a flow-stats reply.
 */
struct FlowStatEntry
{
    int priority = 0;
    uint64_t srcMac = 0;
    uint64_t dstMac = 0;
    uint32_t inPort = 0;
    std::optional<uint32_t> outPort;
    uint64_t packetCount = 0;
    uint64_t byteCount = 0;
    double durationSec = 0.0;
};

/**
 * @brief Previous counter snapshot kept per FlowKey for delta computation.
 *
 * missedPolls counts consecutive polls of the owning switch that did not report this key.
 */
struct FlowSample
{
    uint64_t packetCount = 0;
    uint64_t byteCount = 0;
    TimePoint timestamp;
    int missedPolls = 0;
};

/**
 * @brief Per-flow rate record produced by the Flow Statistics Engine for one poll.
 */
struct FlowRecord
{
    std::string switchId;
    uint64_t dpid = 0;
    uint64_t srcMac = 0;
    uint64_t dstMac = 0;
    uint32_t inPort = 0;
    std::optional<uint32_t> outPort;
    uint64_t packetCount = 0;
    uint64_t byteCount = 0;
    double durationSec = 0.0;
    double pps = 0.0;
    double bps = 0.0;
    double avgPktSize = 0.0;
    int64_t timestampMs = 0;
};

inline void
to_json(nlohmann::json& j, const FlowRecord& r)
{
    j = nlohmann::json{{"switch", r.switchId},
                       {"dpid", r.dpid},
                       {"src_mac", utils::macToString(r.srcMac)},
                       {"dst_mac", utils::macToString(r.dstMac)},
                       {"in_port", r.inPort},
                       {"packet_count", r.packetCount},
                       {"byte_count", r.byteCount},
                       {"duration_sec", r.durationSec},
                       {"pps", r.pps},
                       {"bps", r.bps},
                       {"avg_pkt_size", r.avgPktSize},
                       {"timestamp", r.timestampMs / 1000.0}};
    if (r.outPort.has_value())
    {
        j["out_port"] = r.outPort.value();
    }
}

/**
 * @brief Security alert published once per confirmed, non-cooldown attack.
 */
struct SecurityAlert
{
    uint64_t attackerMac = 0;
    uint64_t targetMac = 0;
    std::string attackerIp;
    std::string targetIp;
    std::string attackType;
    double confidence = 0.0;
    double pps = 0.0;
    double bps = 0.0;
    std::string severity = "CRITICAL";
    std::string actionTaken = "BLOCKED";
    int blockDurationSec = 0;
    int64_t timestampMs = 0;
};

inline void
to_json(nlohmann::json& j, const SecurityAlert& a)
{
    j = nlohmann::json{{"type", "security_alert"},
                       {"timestamp", a.timestampMs / 1000.0},
                       {"attacker_mac", utils::macToString(a.attackerMac)},
                       {"target_mac", utils::macToString(a.targetMac)},
                       {"attacker_ip", a.attackerIp},
                       {"target_ip", a.targetIp},
                       {"attack_type", a.attackType},
                       {"confidence", a.confidence},
                       {"pps", a.pps},
                       {"bps", a.bps},
                       {"severity", a.severity},
                       {"action_taken", a.actionTaken},
                       {"block_duration_sec", a.blockDurationSec}};
}

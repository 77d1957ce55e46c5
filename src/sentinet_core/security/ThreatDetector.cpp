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

#include "sentinet_core/security/ThreatDetector.hpp"
#include "utils/Logger.hpp"                          // for Logger
#include "utils/Utils.hpp"                           // for macToString, getC...
#include <unordered_map>                             // for erase_if

using json = nlohmann::json;

ThreatDetector::ThreatDetector(std::shared_ptr<ThreatModel> model,
                               std::shared_ptr<MitigationManager> mitigation,
                               std::shared_ptr<BridgeCapabilities> bridge,
                               std::shared_ptr<TaskScheduler> scheduler,
                               std::shared_ptr<const TopologyModel> topology,
                               DetectorSettings settings)
    : m_model(std::move(model)),
      m_mitigation(std::move(mitigation)),
      m_bridge(std::move(bridge)),
      m_scheduler(std::move(scheduler)),
      m_topology(std::move(topology)),
      m_settings(settings)
{
}

size_t
ThreatDetector::evaluate(const std::vector<FlowRecord>& records)
{
    size_t alerts = 0;
    for (const auto& record : records)
    {
        if (evaluate(record))
        {
            ++alerts;
        }
    }
    return alerts;
}

bool
ThreatDetector::evaluate(const FlowRecord& record)
{
    if (m_mitigation->isBlocked(record.srcMac, record.dstMac))
    {
        return false;
    }

    const ThreatVerdict verdict = classify(record.pps, record.bps, record.avgPktSize);
    if (!verdict.isThreat)
    {
        return false;
    }

    const MacPair pair{record.srcMac, record.dstMac};
    const TimePoint now = m_scheduler->now();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_cooldowns.find(pair);
        if (it != m_cooldowns.end() && it->second > now)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "{} -> {} still in alert cooldown",
                                utils::macToString(pair.srcMac),
                                utils::macToString(pair.dstMac));
            return false;
        }
        m_cooldowns[pair] = now + m_settings.cooldown;
    }

    SPDLOG_LOGGER_ERROR(Logger::instance(),
                        "[ATTACK] {} detected: {} -> {} PPS={:.2f} BPS={:.2f} confidence={:.2f}{}",
                        verdict.attackType,
                        utils::macToString(pair.srcMac),
                        utils::macToString(pair.dstMac),
                        record.pps,
                        record.bps,
                        verdict.confidence,
                        verdict.thresholdFallback ? " (threshold rule)" : "");

    m_mitigation->block(pair.srcMac, pair.dstMac, m_settings.blockDurationSec);

    if (m_bridge)
    {
        SecurityAlert alert;
        alert.attackerMac = pair.srcMac;
        alert.targetMac = pair.dstMac;
        alert.attackerIp = hostLabel(pair.srcMac);
        alert.targetIp = hostLabel(pair.dstMac);
        alert.attackType = verdict.attackType;
        alert.confidence = verdict.confidence;
        alert.pps = record.pps;
        alert.bps = record.bps;
        alert.blockDurationSec = m_settings.blockDurationSec;
        alert.timestampMs = utils::getCurrentTimeMillisSystemClock();
        m_bridge->publishAlert(alert);
    }
    return true;
}

ThreatVerdict
ThreatDetector::classify(double pps, double bps, double avgPktSize)
{
    try
    {
        auto signals = m_model->infer(pps, bps, avgPktSize);
        if (signals.has_value())
        {
            return fuse(signals.value());
        }
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Threat model failed, using threshold rule: {}",
                           e.what());
    }
    return thresholdVerdict(pps, bps);
}

ThreatVerdict
ThreatDetector::fuse(const ModelSignals& signals)
{
    ThreatVerdict verdict;
    const bool namedAttack = signals.attackClass != "Normal";
    verdict.isThreat = signals.anomaly || namedAttack;
    verdict.confidence = signals.confidence;
    if (namedAttack)
    {
        verdict.attackType = signals.attackClass;
    }
    else if (signals.anomaly)
    {
        verdict.attackType = "Unknown Anomaly";
    }
    return verdict;
}

ThreatVerdict
ThreatDetector::thresholdVerdict(double pps, double bps) const
{
    ThreatVerdict verdict;
    verdict.thresholdFallback = true;
    if (pps > m_settings.ppsThreshold || bps > m_settings.bpsThreshold)
    {
        verdict.isThreat = true;
        verdict.attackType = "Threshold Breach";
        verdict.confidence = 1.0;
    }
    return verdict;
}

size_t
ThreatDetector::sweepExpiredCooldowns()
{
    const TimePoint now = m_scheduler->now();
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::erase_if(m_cooldowns, [now](const auto& item) { return item.second <= now; });
}

bool
ThreatDetector::inCooldown(uint64_t srcMac, uint64_t dstMac) const
{
    const TimePoint now = m_scheduler->now();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cooldowns.find(MacPair{srcMac, dstMac});
    return it != m_cooldowns.end() && it->second > now;
}

json
ThreatDetector::activeAlerts() const
{
    const TimePoint now = m_scheduler->now();
    json alerts = json::array();
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [pair, until] : m_cooldowns)
    {
        if (until <= now)
        {
            continue;
        }
        alerts.push_back(
            {{"src_mac", utils::macToString(pair.srcMac)},
             {"dst_mac", utils::macToString(pair.dstMac)},
             {"cooldown_remaining_sec",
              std::chrono::duration_cast<std::chrono::seconds>(until - now).count()}});
    }
    return alerts;
}

std::string
ThreatDetector::hostLabel(uint64_t mac) const
{
    auto host = m_topology->hostByMac(mac);
    if (host.has_value() && !host->ip.empty())
    {
        return host->ip;
    }
    return utils::macToString(mac);
}

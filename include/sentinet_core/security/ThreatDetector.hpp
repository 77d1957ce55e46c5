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
#include "sentinet_core/bridge/BridgeCapabilities.hpp"
#include "sentinet_core/scheduling/TaskScheduler.hpp"
#include "sentinet_core/security/MitigationManager.hpp"
#include "sentinet_core/security/ThreatModel.hpp"
#include "sentinet_core/topology/TopologyModel.hpp"
#include "utils/AppConfig.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

struct ThreatVerdict
{
    bool isThreat = false;
    std::string attackType = "Normal";
    double confidence = 0.0;
    bool thresholdFallback = false;
};

struct DetectorSettings
{
    std::chrono::seconds cooldown{AppConfig::ALERT_COOLDOWN_SEC};
    int blockDurationSec = AppConfig::BLOCK_DURATION_SEC;
    double ppsThreshold = AppConfig::ATTACK_PPS_THRESHOLD;
    double bpsThreshold = AppConfig::ATTACK_BPS_THRESHOLD;
};

/**
 * @brief Classifies per-flow rates and turns confirmed threats into blocks and alerts.
 *
 * A threat is confirmed when the anomaly signal fires or the classifier names a class other
 * than "Normal". When the models are unavailable or fail, the static PPS/BPS threshold rule
 * decides instead. Each (src, dst) pair raises at most one alert per cooldown window.
 */
class ThreatDetector
{
  public:
    ThreatDetector(std::shared_ptr<ThreatModel> model,
                   std::shared_ptr<MitigationManager> mitigation,
                   std::shared_ptr<BridgeCapabilities> bridge,
                   std::shared_ptr<TaskScheduler> scheduler,
                   std::shared_ptr<const TopologyModel> topology,
                   DetectorSettings settings = {});

    // Returns the number of alerts raised.
    size_t evaluate(const std::vector<FlowRecord>& records);
    bool evaluate(const FlowRecord& record);

    ThreatVerdict classify(double pps, double bps, double avgPktSize);
    static ThreatVerdict fuse(const ModelSignals& signals);
    ThreatVerdict thresholdVerdict(double pps, double bps) const;

    size_t sweepExpiredCooldowns();
    bool inCooldown(uint64_t srcMac, uint64_t dstMac) const;
    nlohmann::json activeAlerts() const;

  private:
    std::string hostLabel(uint64_t mac) const;

    std::shared_ptr<ThreatModel> m_model;
    std::shared_ptr<MitigationManager> m_mitigation;
    std::shared_ptr<BridgeCapabilities> m_bridge;
    std::shared_ptr<TaskScheduler> m_scheduler;
    std::shared_ptr<const TopologyModel> m_topology;
    DetectorSettings m_settings;

    mutable std::mutex m_mutex;
    std::unordered_map<MacPair, TimePoint, MacPairHash> m_cooldowns;
};

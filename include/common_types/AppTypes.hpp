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
#include "utils/AppConfig.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Q-learning hyperparameters and scoring constants of the Navigator.
 *
 * destinationBonus and weightPenaltyFactor shape the greedy score
 * Q[cur][n] + bonus(n == dst) - weight * weightPenaltyFactor. With the defaults below a fully
 * congested direct link scores below an idle multi-hop detour.
 */
struct NavigatorParameters
{
    double alpha = 0.1;
    double gamma = 0.9;
    double epsilon = 0.1;
    double epsilonDecay = 0.995;
    double epsilonMin = 0.01;
    double congestionPenaltyScale = 100.0;
    double weightPenaltyFactor = 1.0;
    double destinationBonus = 10.0;
    double rewardCongestionScale = 50.0;
    std::optional<uint32_t> seed;
};

/**
 * @brief Runtime configuration of the whole controller, filled by main().
 */
struct ControllerConfig
{
    std::string topologyFile = AppConfig::TOPOLOGY_FILE;
    std::string ryuRestUrl = AppConfig::RYU_REST_URL;
    unsigned short eventServerPort = AppConfig::EVENT_SERVER_PORT;

    std::chrono::seconds pollInterval{AppConfig::POLL_INTERVAL_SEC};
    int flowIdleTimeoutSec = AppConfig::FLOW_IDLE_TIMEOUT_SEC;
    int flowHardTimeoutSec = AppConfig::FLOW_HARD_TIMEOUT_SEC;
    int navigatorIdleTimeoutSec = AppConfig::NAVIGATOR_IDLE_TIMEOUT_SEC;

    std::chrono::seconds alertCooldown{AppConfig::ALERT_COOLDOWN_SEC};
    std::chrono::seconds cooldownSweepInterval{AppConfig::COOLDOWN_SWEEP_INTERVAL_SEC};
    int blockDurationSec = AppConfig::BLOCK_DURATION_SEC;
    double ppsThreshold = AppConfig::ATTACK_PPS_THRESHOLD;
    double bpsThreshold = AppConfig::ATTACK_BPS_THRESHOLD;

    bool navigatorEnabled = true;
    NavigatorParameters navigator;
    std::string qTableFile = AppConfig::QTABLE_FILE;

    bool bridgeEnabled = true;
    std::string bridgeHost = AppConfig::BRIDGE_HOST;
    std::string bridgePort = AppConfig::BRIDGE_PORT;

    bool csvEnabled = true;
    std::string csvFile = AppConfig::FLOW_CSV_FILE;
};

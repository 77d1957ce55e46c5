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
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Operator command fetched from the front end's pending-command mailbox.
 *
 * A "block" command names either an explicit (srcMac, dstMac) pair or a single host target
 * (by MAC or IP) that is blocked as a source towards every other known host.
 */
struct PendingCommand
{
    std::string command;
    std::optional<uint64_t> srcMac;
    std::optional<uint64_t> dstMac;
    std::optional<uint64_t> targetMac;
    std::string targetIp;
    int durationSec = 0;
};

/**
 * @brief Parse a GET /api/control/pending reply.
 * @return std::nullopt for {"command": null} or an unknown shape.
 * @throws nlohmann::json::exception or std::invalid_argument on malformed fields.
 */
std::optional<PendingCommand> parsePendingCommand(const nlohmann::json& j, int defaultDurationSec);

/**
 * @brief Publish/poll surface towards the visualization and alerting front end.
 *
 * Every call returns immediately; implementations queue the work.
 */
class BridgeCapabilities
{
  public:
    virtual ~BridgeCapabilities() = default;

    virtual void publishTopology(const nlohmann::json& topology) = 0;
    virtual void publishStats(const std::string& switchId,
                              uint64_t dpid,
                              const std::vector<FlowRecord>& records) = 0;
    virtual void publishAlert(const SecurityAlert& alert) = 0;
    virtual void publishSwitchEvent(const std::string& event, uint64_t dpid) = 0;

    // Returns a command fetched earlier, if any, and requests the next one.
    virtual std::optional<PendingCommand> pollPendingCommand() = 0;
};

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
#include "sentinet_core/bridge/BridgeCapabilities.hpp"
#include "sentinet_core/bridge/HttpBridgeTransport.hpp"
#include <deque>
#include <stdexcept>
#include <utility>

/**
 * @brief BridgeCapabilities that keeps everything it is asked to publish.
 */
class FakeBridge : public BridgeCapabilities
{
  public:
    void publishTopology(const nlohmann::json& topology) override { topologies.push_back(topology); }

    void publishStats(const std::string& switchId,
                      uint64_t dpid,
                      const std::vector<FlowRecord>& records) override
    {
        stats.push_back({switchId, dpid, records});
    }

    void publishAlert(const SecurityAlert& alert) override { alerts.push_back(alert); }

    void publishSwitchEvent(const std::string& event, uint64_t dpid) override
    {
        switchEvents.emplace_back(event, dpid);
    }

    std::optional<PendingCommand> pollPendingCommand() override
    {
        ++polls;
        if (commands.empty())
        {
            return std::nullopt;
        }
        PendingCommand command = commands.front();
        commands.pop_front();
        return command;
    }

    struct StatsPublish
    {
        std::string switchId;
        uint64_t dpid;
        std::vector<FlowRecord> records;
    };

    std::vector<nlohmann::json> topologies;
    std::vector<StatsPublish> stats;
    std::vector<SecurityAlert> alerts;
    std::vector<std::pair<std::string, uint64_t>> switchEvents;
    std::deque<PendingCommand> commands;
    int polls = 0;
};

/**
 * @brief BridgeTransport that fails a configurable number of times before succeeding,
 * or rejects every request with a fixed 4xx status.
 */
class FakeBridgeTransport : public BridgeTransport
{
  public:
    void post(const std::string& target, const nlohmann::json& body) override
    {
        ++attempts;
        if (rejectStatus != 0)
        {
            throw BridgeRejectedError("POST " + target + " rejected", rejectStatus);
        }
        if (failuresLeft > 0)
        {
            --failuresLeft;
            throw std::runtime_error("connection refused");
        }
        posted.emplace_back(target, body);
    }

    nlohmann::json get(const std::string& target) override
    {
        ++attempts;
        if (rejectStatus != 0)
        {
            throw BridgeRejectedError("GET " + target + " rejected", rejectStatus);
        }
        if (failuresLeft > 0)
        {
            --failuresLeft;
            throw std::runtime_error("connection refused");
        }
        gets.push_back(target);
        if (replies.empty())
        {
            return nlohmann::json{{"command", nullptr}};
        }
        nlohmann::json reply = replies.front();
        replies.pop_front();
        return reply;
    }

    int failuresLeft = 0;
    int rejectStatus = 0;
    int attempts = 0;
    std::vector<std::pair<std::string, nlohmann::json>> posted;
    std::vector<std::string> gets;
    std::deque<nlohmann::json> replies;
};

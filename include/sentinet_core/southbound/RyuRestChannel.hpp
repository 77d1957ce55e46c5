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
#include "sentinet_core/southbound/FlowDispatcher.hpp"
#include "sentinet_core/southbound/SwitchChannel.hpp"
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief SwitchChannel backed by Ryu's ofctl_rest application, driven through curl.
 *
 * Flow operations are queued on a FlowDispatcher so each switch receives its rules in order
 * on its own worker thread; stats requests are synchronous GET /stats/flow/<dpid> calls.
 */
class RyuRestChannel : public SwitchChannel
{
  public:
    explicit RyuRestChannel(std::string ryuRestUrl);
    ~RyuRestChannel() override;

    void start();
    void stop();

    void installFlow(const FlowJob& job) override;
    std::optional<std::vector<FlowStatEntry>> fetchFlowStats(uint64_t dpid) override;
    void discardPending(uint64_t dpid) override;

    /**
     * @brief Body of a POST /stats/flowentry/{add,delete} request for the job.
     */
    static nlohmann::json buildFlowEntry(const FlowJob& job);

    /**
     * @brief Parse a GET /stats/flow/<dpid> reply ({"<dpid>": [entry, ...]}).
     *
     * Entries without both source and destination MAC in their match are skipped.
     * @throws nlohmann::json::exception when the reply is not the expected shape.
     */
    static std::vector<FlowStatEntry> parseFlowStats(uint64_t dpid, const nlohmann::json& reply);

  private:
    void sendBatch(const std::vector<FlowJob>& batch);

    std::string m_ryuRestUrl;
    FlowDispatcher m_dispatcher;
};

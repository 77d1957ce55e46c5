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
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Kind of southbound flow-table operation.
 */
enum class FlowOp : uint8_t
{
    Install,
    Delete
};

inline std::string
to_string(FlowOp op)
{
    switch (op)
    {
    case FlowOp::Install:
        return "install";
    case FlowOp::Delete:
        return "delete";
    }
    return "unknown";
}

/**
 * @brief One flow-table operation destined for a single switch.
 *
 * match and actions use the Ryu ofctl_rest field names (in_port, eth_src, eth_dst and
 * {"type": "OUTPUT", "port": n}). An empty actions array is a drop rule.
 * A timeout of 0 means the rule never expires on that timer.
 */
struct FlowJob
{
    uint64_t dpid = 0;
    FlowOp op = FlowOp::Install;
    int priority = 0;
    nlohmann::json match = nlohmann::json::object();
    nlohmann::json actions = nlohmann::json::array();

    int idleTimeout = 0;
    int hardTimeout = 0;
};

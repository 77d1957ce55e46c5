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
#include "sentinet_core/forwarding/ForwardingEngine.hpp"
#include <cstdint>
#include <variant>
#include <vector>

// Southbound events routed by ControllerCore::dispatch.

struct SwitchUp
{
    uint64_t dpid = 0;
};

struct SwitchDown
{
    uint64_t dpid = 0;
};

struct PacketIn
{
    PacketInfo packet;
};

struct StatsReply
{
    uint64_t dpid = 0;
    std::vector<FlowStatEntry> entries;
    TimePoint receivedAt;
};

using ControllerEvent = std::variant<SwitchUp, SwitchDown, PacketIn, StatsReply>;

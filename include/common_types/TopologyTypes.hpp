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

#include "utils/Utils.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Raised when a topology descriptor is malformed or its port map cannot be derived.
 */
class TopologyError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Switch entry of the static topology descriptor.
 */
struct SwitchDescriptor
{
    std::string id;
    uint64_t dpid = 0;
    std::string role;
};

/**
 * @brief Host entry of the static topology descriptor.
 *
 * port is derived by TopologyModel: it is the port number on the attachment switch.
 */
struct HostDescriptor
{
    std::string id;
    uint64_t mac = 0;
    std::string ip;
    std::string switchId;
    uint32_t port = 0;
};

/**
 * @brief Switch-to-switch link. fromPort and toPort are derived by TopologyModel.
 */
struct LinkDescriptor
{
    std::string fromSwitch;
    std::string toSwitch;
    double bandwidthMbps = 100.0;
    double delayMs = 1.0;
    uint32_t fromPort = 0;
    uint32_t toPort = 0;
};

/**
 * @brief Raw link entry as it appears in a descriptor file, endpoints not yet classified.
 */
struct RawLink
{
    std::string from;
    std::string to;
    double bandwidthMbps = 100.0;
    double delayMs = 1.0;
};

inline void
from_json(const nlohmann::json& j, SwitchDescriptor& s)
{
    s.id = j.at("id").get<std::string>();
    s.dpid = j.at("dpid").get<uint64_t>();
    s.role = j.value("role", std::string{});
}

inline void
to_json(nlohmann::json& j, const SwitchDescriptor& s)
{
    j = nlohmann::json{{"id", s.id}, {"dpid", s.dpid}, {"role", s.role}};
}

inline void
from_json(const nlohmann::json& j, HostDescriptor& h)
{
    h.id = j.contains("id") ? j.at("id").get<std::string>() : j.at("name").get<std::string>();
    h.mac = utils::macToUint64(j.at("mac").get<std::string>());
    h.ip = j.value("ip", std::string{});
    h.switchId = j.at("switch").get<std::string>();
}

inline void
to_json(nlohmann::json& j, const HostDescriptor& h)
{
    j = nlohmann::json{{"id", h.id},
                       {"mac", utils::macToString(h.mac)},
                       {"ip", h.ip},
                       {"switch", h.switchId},
                       {"port", h.port}};
}

inline void
from_json(const nlohmann::json& j, RawLink& l)
{
    l.from = j.at("from").get<std::string>();
    l.to = j.at("to").get<std::string>();
    l.bandwidthMbps = j.value("bw_mbps", 100.0);
    l.delayMs = j.value("delay_ms", 1.0);
}

inline void
to_json(nlohmann::json& j, const LinkDescriptor& l)
{
    j = nlohmann::json{{"from", l.fromSwitch},
                       {"to", l.toSwitch},
                       {"bw_mbps", l.bandwidthMbps},
                       {"delay_ms", l.delayMs},
                       {"from_port", l.fromPort},
                       {"to_port", l.toPort}};
}

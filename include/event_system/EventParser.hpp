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

#include "event_system/ControllerEvents.hpp"
#include "sentinet_core/southbound/RyuRestChannel.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Parsers for the JSON bodies the Ryu shim posts to the event server.
// Each returns std::nullopt and logs when the body is malformed.

inline std::optional<uint64_t>
parseDpidField(const nlohmann::json& data)
{
    if (!data.contains("dpid") || !data["dpid"].is_number_unsigned())
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Missing or invalid dpid");
        return std::nullopt;
    }
    return data["dpid"].get<uint64_t>();
}

inline std::optional<SwitchUp>
parseSwitchUp(const std::string& jsonStr)
{
    try
    {
        auto dpid = parseDpidField(nlohmann::json::parse(jsonStr));
        if (!dpid)
        {
            return std::nullopt;
        }
        return SwitchUp{dpid.value()};
    }
    catch (const nlohmann::json::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Malformed switch_up body: {}", e.what());
        return std::nullopt;
    }
}

inline std::optional<SwitchDown>
parseSwitchDown(const std::string& jsonStr)
{
    try
    {
        auto dpid = parseDpidField(nlohmann::json::parse(jsonStr));
        if (!dpid)
        {
            return std::nullopt;
        }
        return SwitchDown{dpid.value()};
    }
    catch (const nlohmann::json::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Malformed switch_down body: {}", e.what());
        return std::nullopt;
    }
}

/**
 * @brief Parse {"dpid", "in_port", "eth_src", "eth_dst", "eth_type"}.
 *
 * eth_type may be a number or a hex string such as "0x88cc".
 */
inline std::optional<PacketIn>
parsePacketIn(const std::string& jsonStr)
{
    try
    {
        auto data = nlohmann::json::parse(jsonStr);
        auto dpid = parseDpidField(data);
        if (!dpid)
        {
            return std::nullopt;
        }

        PacketIn event;
        event.packet.dpid = dpid.value();
        event.packet.inPort = data.at("in_port").get<uint32_t>();
        event.packet.srcMac = utils::macToUint64(data.at("eth_src").get<std::string>());
        event.packet.dstMac = utils::macToUint64(data.at("eth_dst").get<std::string>());

        const auto& ethType = data.at("eth_type");
        if (ethType.is_string())
        {
            event.packet.ethType =
                static_cast<uint16_t>(std::stoul(ethType.get<std::string>(), nullptr, 16));
        }
        else
        {
            event.packet.ethType = ethType.get<uint16_t>();
        }
        return event;
    }
    catch (const nlohmann::json::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Malformed packet_in body: {}", e.what());
        return std::nullopt;
    }
    catch (const std::logic_error& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Invalid packet_in field: {}", e.what());
        return std::nullopt;
    }
}

/**
 * @brief Parse {"dpid": n, "flows": [ofctl flow entry, ...]} pushed by the shim.
 */
inline std::optional<StatsReply>
parseStatsReply(const std::string& jsonStr)
{
    try
    {
        auto data = nlohmann::json::parse(jsonStr);
        auto dpid = parseDpidField(data);
        if (!dpid)
        {
            return std::nullopt;
        }

        nlohmann::json reply;
        reply[std::to_string(dpid.value())] = data.at("flows");

        StatsReply event;
        event.dpid = dpid.value();
        event.entries = RyuRestChannel::parseFlowStats(dpid.value(), reply);
        event.receivedAt = Clock::now();
        return event;
    }
    catch (const nlohmann::json::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Malformed stats_reply body: {}", e.what());
        return std::nullopt;
    }
    catch (const std::invalid_argument& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Invalid stats_reply field: {}", e.what());
        return std::nullopt;
    }
}

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

#include "sentinet_core/southbound/RyuRestChannel.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <sstream>

using json = nlohmann::json;

namespace
{

std::optional<uint32_t>
parseOutputPort(const json& action)
{
    if (action.is_string())
    {
        const auto& text = action.get_ref<const std::string&>();
        const std::string prefix = "OUTPUT:";
        if (text.rfind(prefix, 0) != 0)
        {
            return std::nullopt;
        }
        const std::string port = text.substr(prefix.size());
        uint32_t value = 0;
        auto [p, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || p != port.data() + port.size())
        {
            return std::nullopt;
        }
        return value;
    }
    if (action.is_object() && action.value("type", "") == "OUTPUT" && action.contains("port") &&
        action.at("port").is_number_unsigned())
    {
        return action.at("port").get<uint32_t>();
    }
    return std::nullopt;
}

std::optional<uint64_t>
matchMac(const json& match, const char* ofKey, const char* legacyKey)
{
    for (const char* key : {ofKey, legacyKey})
    {
        if (match.contains(key) && match.at(key).is_string())
        {
            return utils::macToUint64(match.at(key).get<std::string>());
        }
    }
    return std::nullopt;
}

} // namespace

RyuRestChannel::RyuRestChannel(std::string ryuRestUrl)
    : m_ryuRestUrl(std::move(ryuRestUrl)),
      m_dispatcher([this](const std::vector<FlowJob>& batch) { sendBatch(batch); })
{
}

RyuRestChannel::~RyuRestChannel()
{
    stop();
}

void
RyuRestChannel::start()
{
    m_dispatcher.start();
    SPDLOG_LOGGER_INFO(Logger::instance(), "Southbound channel using ofctl_rest at {}", m_ryuRestUrl);
}

void
RyuRestChannel::stop()
{
    m_dispatcher.stop();
}

void
RyuRestChannel::installFlow(const FlowJob& job)
{
    m_dispatcher.enqueue(job);
}

void
RyuRestChannel::discardPending(uint64_t dpid)
{
    m_dispatcher.purge(dpid);
}

json
RyuRestChannel::buildFlowEntry(const FlowJob& job)
{
    json jsonData;
    jsonData["dpid"] = job.dpid;
    jsonData["priority"] = job.priority;
    jsonData["match"] = job.match;
    jsonData["actions"] = job.actions;
    if (job.idleTimeout > 0)
    {
        jsonData["idle_timeout"] = job.idleTimeout;
    }
    if (job.hardTimeout > 0)
    {
        jsonData["hard_timeout"] = job.hardTimeout;
    }
    return jsonData;
}

void
RyuRestChannel::sendBatch(const std::vector<FlowJob>& batch)
{
    for (const auto& job : batch)
    {
        const char* endpoint = job.op == FlowOp::Delete ? "delete" : "add";

        std::ostringstream cmd;
        cmd << "curl -s -f -X POST " << m_ryuRestUrl << "/stats/flowentry/" << endpoint << " "
            << "-H \"Content-Type: application/json\" " << "-d '" << buildFlowEntry(job).dump()
            << "'";

        SPDLOG_LOGGER_TRACE(Logger::instance(), "execCommand: {}", cmd.str());
        try
        {
            utils::execCommand(cmd.str());
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Flow {} on dpid {} (priority {}) failed: {}",
                                to_string(job.op),
                                job.dpid,
                                job.priority,
                                e.what());
        }
    }
}

std::optional<std::vector<FlowStatEntry>>
RyuRestChannel::fetchFlowStats(uint64_t dpid)
{
    std::string curlCommand = "curl -s -f -X GET " + m_ryuRestUrl + "/stats/flow/" +
                              std::to_string(dpid);
    std::string replyText;
    try
    {
        replyText = utils::execCommand(curlCommand);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Flow stats request for dpid {} failed: {}",
                           dpid,
                           e.what());
        return std::nullopt;
    }

    try
    {
        return parseFlowStats(dpid, json::parse(replyText));
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Malformed flow stats reply for dpid {}: {}",
                            dpid,
                            e.what());
        return std::nullopt;
    }
}

std::vector<FlowStatEntry>
RyuRestChannel::parseFlowStats(uint64_t dpid, const json& reply)
{
    std::vector<FlowStatEntry> entries;
    const auto& flows = reply.at(std::to_string(dpid));

    for (const auto& flow : flows)
    {
        const json match = flow.value("match", json::object());
        auto src = matchMac(match, "eth_src", "dl_src");
        auto dst = matchMac(match, "eth_dst", "dl_dst");
        if (!src || !dst)
        {
            continue;
        }

        FlowStatEntry entry;
        entry.priority = flow.value("priority", 0);
        entry.srcMac = *src;
        entry.dstMac = *dst;
        entry.inPort = match.value("in_port", 0u);
        entry.packetCount = flow.value("packet_count", uint64_t{0});
        entry.byteCount = flow.value("byte_count", uint64_t{0});
        entry.durationSec = flow.value("duration_sec", 0.0) + flow.value("duration_nsec", 0.0) / 1e9;

        for (const auto& action : flow.value("actions", json::array()))
        {
            if (auto port = parseOutputPort(action))
            {
                entry.outPort = port;
                break;
            }
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

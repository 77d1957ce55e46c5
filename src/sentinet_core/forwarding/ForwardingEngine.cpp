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

#include "sentinet_core/forwarding/ForwardingEngine.hpp"
#include "utils/Logger.hpp"                              // for Logger
#include "utils/Utils.hpp"                               // for macToString
#include <algorithm>                                     // for find

using json = nlohmann::json;

std::string
to_string(ForwardingAction action)
{
    switch (action)
    {
    case ForwardingAction::Ignore:
        return "ignore";
    case ForwardingAction::Drop:
        return "drop";
    case ForwardingAction::Output:
        return "output";
    case ForwardingAction::Flood:
        return "flood";
    }
    return "unknown";
}

void
to_json(json& j, const ForwardingDecision& d)
{
    j = json{{"action", to_string(d.action)}};
    if (d.action == ForwardingAction::Output)
    {
        j["port"] = d.port;
    }
}

ForwardingEngine::ForwardingEngine(std::shared_ptr<const TopologyModel> topology,
                                   std::shared_ptr<SwitchRegistry> registry,
                                   std::shared_ptr<MitigationManager> mitigation,
                                   std::shared_ptr<SwitchChannel> channel,
                                   std::shared_ptr<Navigator> navigator,
                                   ForwardingSettings settings)
    : m_topology(std::move(topology)),
      m_registry(std::move(registry)),
      m_mitigation(std::move(mitigation)),
      m_channel(std::move(channel)),
      m_navigator(std::move(navigator)),
      m_settings(settings)
{
}

bool
ForwardingEngine::navigatorActive() const
{
    return m_settings.navigatorEnabled && m_navigator && m_navigator->isInitialized();
}

ForwardingDecision
ForwardingEngine::handlePacketIn(const PacketInfo& packet)
{
    if (packet.ethType == ETH_TYPE_LLDP || packet.ethType == ETH_TYPE_IPV6)
    {
        return ForwardingDecision::ignore();
    }

    m_registry->learnSource(packet.dpid, packet.srcMac, packet.inPort);

    if (m_mitigation->isBlocked(packet.srcMac, packet.dstMac))
    {
        SPDLOG_LOGGER_TRACE(Logger::instance(),
                            "Dropping blocked {} -> {} on dpid {}",
                            utils::macToString(packet.srcMac),
                            utils::macToString(packet.dstMac),
                            packet.dpid);
        return ForwardingDecision::drop();
    }

    std::optional<uint32_t> outPort = m_registry->lookupPort(packet.dpid, packet.dstMac);

    if (!outPort.has_value() && navigatorActive())
    {
        auto path = m_navigator->getPathForHosts(packet.srcMac,
                                                 packet.dstMac,
                                                 m_topology->hostToSwitch());
        if (!path.empty())
        {
            outPort = translatePath(m_registry->switchIdFor(packet.dpid),
                                    packet.dpid,
                                    packet.dstMac,
                                    path);
        }
    }

    if (!outPort.has_value())
    {
        SPDLOG_LOGGER_TRACE(Logger::instance(),
                            "Flooding {} -> {} on dpid {}",
                            utils::macToString(packet.srcMac),
                            utils::macToString(packet.dstMac),
                            packet.dpid);
        return ForwardingDecision::flood();
    }

    installForwardingRule(packet, outPort.value());
    return ForwardingDecision::output(outPort.value());
}

std::optional<uint32_t>
ForwardingEngine::translatePath(const std::string& switchId,
                                uint64_t dpid,
                                uint64_t dstMac,
                                const std::vector<std::string>& path) const
{
    auto it = std::find(path.begin(), path.end(), switchId);
    if (it == path.end())
    {
        return std::nullopt;
    }

    if (std::next(it) == path.end())
    {
        if (auto learned = m_registry->lookupPort(dpid, dstMac))
        {
            return learned;
        }
        auto host = m_topology->hostByMac(dstMac);
        if (host.has_value() && host->switchId == switchId)
        {
            return host->port;
        }
        return std::nullopt;
    }

    return m_topology->portToward(switchId, *std::next(it));
}

void
ForwardingEngine::installForwardingRule(const PacketInfo& packet, uint32_t outPort)
{
    FlowJob job;
    job.dpid = packet.dpid;
    job.op = FlowOp::Install;
    job.priority = AppConfig::FORWARDING_PRIORITY;
    job.match = json{{"in_port", packet.inPort},
                     {"eth_src", utils::macToString(packet.srcMac)},
                     {"eth_dst", utils::macToString(packet.dstMac)}};
    job.actions = json::array({json{{"type", "OUTPUT"}, {"port", outPort}}});
    job.idleTimeout =
        navigatorActive() ? m_settings.navigatorIdleTimeoutSec : m_settings.idleTimeoutSec;
    job.hardTimeout = m_settings.hardTimeoutSec;
    m_channel->installFlow(job);

    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Installed {} -> {} on dpid {} in_port {} out_port {}",
                        utils::macToString(packet.srcMac),
                        utils::macToString(packet.dstMac),
                        packet.dpid,
                        packet.inPort,
                        outPort);
}

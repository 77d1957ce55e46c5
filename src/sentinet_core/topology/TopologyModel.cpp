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

#include "sentinet_core/topology/TopologyModel.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <set>
#include <unordered_set>

using json = nlohmann::json;

TopologyModel::TopologyModel(std::vector<SwitchDescriptor> switches,
                             std::vector<HostDescriptor> hosts,
                             const std::vector<RawLink>& links)
    : m_switches(std::move(switches)),
      m_hosts(std::move(hosts))
{
    validateAndIndex();
    derivePorts(links);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Topology loaded: {} switches, {} hosts, {} links",
                       m_switches.size(),
                       m_hosts.size(),
                       m_links.size());
}

TopologyModel
TopologyModel::fromJson(const json& j)
{
    try
    {
        auto switches = j.at("switches").get<std::vector<SwitchDescriptor>>();
        auto hosts = j.value("hosts", json::array()).get<std::vector<HostDescriptor>>();
        auto links = j.value("links", json::array()).get<std::vector<RawLink>>();
        return TopologyModel(std::move(switches), std::move(hosts), links);
    }
    catch (const json::exception& e)
    {
        throw TopologyError(std::string("Malformed topology descriptor: ") + e.what());
    }
    catch (const std::invalid_argument& e)
    {
        throw TopologyError(std::string("Malformed topology descriptor: ") + e.what());
    }
}

TopologyModel
TopologyModel::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw TopologyError("Cannot open topology file: " + path);
    }

    json j;
    try
    {
        file >> j;
    }
    catch (const json::parse_error& e)
    {
        throw TopologyError("Cannot parse topology file " + path + ": " + e.what());
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Loading topology from {}", path);
    return fromJson(j);
}

TopologyModel
TopologyModel::defaultTopology()
{
    std::vector<SwitchDescriptor> switches = {{"s1", 1, "core"},
                                              {"s2", 2, "distribution"},
                                              {"s3", 3, "access"},
                                              {"s4", 4, "access"},
                                              {"s5", 5, "access"}};
    std::vector<HostDescriptor> hosts;
    const std::pair<int, const char*> attachments[] = {
        {1, "s3"}, {2, "s3"}, {3, "s3"}, {4, "s2"}, {5, "s4"}, {6, "s5"}, {7, "s5"}, {8, "s5"}};
    for (const auto& [n, switchId] : attachments)
    {
        hosts.push_back({"h" + std::to_string(n),
                         static_cast<uint64_t>(n),
                         "10.0.0." + std::to_string(n),
                         switchId,
                         0});
    }
    std::vector<RawLink> links = {{"s1", "s2", 100.0, 1.0},
                                  {"s1", "s4", 50.0, 2.0},
                                  {"s1", "s5", 100.0, 1.0},
                                  {"s2", "s3", 50.0, 3.0}};
    return TopologyModel(std::move(switches), std::move(hosts), links);
}

void
TopologyModel::validateAndIndex()
{
    if (m_switches.empty())
    {
        throw TopologyError("Topology declares no switches");
    }

    for (const auto& sw : m_switches)
    {
        if (sw.id.empty())
        {
            throw TopologyError("Switch with empty id");
        }
        if (!m_switchToDpid.emplace(sw.id, sw.dpid).second)
        {
            throw TopologyError("Duplicate switch id: " + sw.id);
        }
        if (!m_dpidToSwitch.emplace(sw.dpid, sw.id).second)
        {
            throw TopologyError("Duplicate datapath id " + std::to_string(sw.dpid) + " on " +
                                sw.id);
        }
    }

    for (size_t i = 0; i < m_hosts.size(); ++i)
    {
        const auto& host = m_hosts[i];
        if (m_switchToDpid.count(host.id))
        {
            throw TopologyError("Host id collides with a switch id: " + host.id);
        }
        if (!m_switchToDpid.count(host.switchId))
        {
            throw TopologyError("Host " + host.id + " attaches to unknown switch " +
                                host.switchId);
        }
        if (!m_hostIndexById.emplace(host.id, i).second)
        {
            throw TopologyError("Duplicate host id: " + host.id);
        }
        if (!m_hostToSwitch.emplace(host.mac, host.switchId).second)
        {
            throw TopologyError("Duplicate host MAC: " + utils::macToString(host.mac));
        }
    }
}

void
TopologyModel::derivePorts(const std::vector<RawLink>& links)
{
    std::unordered_map<std::string, uint32_t> nextPort;
    for (const auto& sw : m_switches)
    {
        nextPort[sw.id] = 1;
    }

    for (auto& host : m_hosts)
    {
        host.port = nextPort[host.switchId]++;
    }

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& raw : links)
    {
        const bool fromIsSwitch = m_switchToDpid.count(raw.from) > 0;
        const bool toIsSwitch = m_switchToDpid.count(raw.to) > 0;

        if (!fromIsSwitch || !toIsSwitch)
        {
            const std::string& hostId = fromIsSwitch ? raw.to : raw.from;
            const std::string& switchId = fromIsSwitch ? raw.from : raw.to;
            auto hostIt = m_hostIndexById.find(hostId);
            if ((fromIsSwitch || toIsSwitch) && hostIt != m_hostIndexById.end() &&
                m_hosts[hostIt->second].switchId == switchId)
            {
                continue;
            }
            throw TopologyError("Link " + raw.from + "-" + raw.to +
                                " references an unknown node or a mismatched host attachment");
        }

        if (raw.from == raw.to)
        {
            throw TopologyError("Self-loop link on " + raw.from);
        }
        if (raw.bandwidthMbps <= 0.0 || raw.delayMs < 0.0)
        {
            throw TopologyError("Link " + raw.from + "-" + raw.to +
                                " has a non-positive bandwidth or negative delay");
        }
        auto key = raw.from < raw.to ? std::make_pair(raw.from, raw.to)
                                     : std::make_pair(raw.to, raw.from);
        if (!seen.insert(key).second)
        {
            throw TopologyError("Duplicate link " + raw.from + "-" + raw.to);
        }

        LinkDescriptor link;
        link.fromSwitch = raw.from;
        link.toSwitch = raw.to;
        link.bandwidthMbps = raw.bandwidthMbps;
        link.delayMs = raw.delayMs;
        link.fromPort = nextPort[raw.from]++;
        link.toPort = nextPort[raw.to]++;

        m_portToward[{link.fromSwitch, link.toSwitch}] = link.fromPort;
        m_portToward[{link.toSwitch, link.fromSwitch}] = link.toPort;
        m_neighborOnPort[{link.fromSwitch, link.fromPort}] = link.toSwitch;
        m_neighborOnPort[{link.toSwitch, link.toPort}] = link.fromSwitch;

        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Link {}:{} <-> {}:{}",
                            link.fromSwitch,
                            link.fromPort,
                            link.toSwitch,
                            link.toPort);
        m_links.push_back(std::move(link));
    }
}

std::optional<uint32_t>
TopologyModel::portToward(const std::string& fromSwitch, const std::string& toSwitch) const
{
    auto it = m_portToward.find({fromSwitch, toSwitch});
    if (it == m_portToward.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string>
TopologyModel::neighborOnPort(const std::string& switchId, uint32_t port) const
{
    auto it = m_neighborOnPort.find({switchId, port});
    if (it == m_neighborOnPort.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string>
TopologyModel::switchIdForDpid(uint64_t dpid) const
{
    auto it = m_dpidToSwitch.find(dpid);
    if (it == m_dpidToSwitch.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint64_t>
TopologyModel::dpidForSwitch(const std::string& switchId) const
{
    auto it = m_switchToDpid.find(switchId);
    if (it == m_switchToDpid.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<HostDescriptor>
TopologyModel::hostByMac(uint64_t mac) const
{
    for (const auto& host : m_hosts)
    {
        if (host.mac == mac)
        {
            return host;
        }
    }
    return std::nullopt;
}

std::optional<HostDescriptor>
TopologyModel::hostByIp(const std::string& ip) const
{
    for (const auto& host : m_hosts)
    {
        if (host.ip == ip)
        {
            return host;
        }
    }
    return std::nullopt;
}

json
TopologyModel::toJson() const
{
    return json{{"type", "topology"},
                {"switches", m_switches},
                {"hosts", m_hosts},
                {"links", m_links}};
}

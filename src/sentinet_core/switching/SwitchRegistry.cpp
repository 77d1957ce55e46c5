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

#include "sentinet_core/switching/SwitchRegistry.hpp"
#include "utils/AppConfig.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <mutex>

using json = nlohmann::json;

std::string
to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Active:
        return "active";
    case ConnectionState::Dead:
        return "dead";
    }
    return "unknown";
}

SwitchRegistry::SwitchRegistry(std::shared_ptr<const TopologyModel> topology,
                               std::shared_ptr<SwitchChannel> channel)
    : m_topology(std::move(topology)),
      m_channel(std::move(channel))
{
}

bool
SwitchRegistry::handleConnect(uint64_t dpid)
{
    const std::string id = switchIdFor(dpid);
    {
        std::unique_lock lock(m_mutex);
        auto& sw = m_switches[dpid];
        sw.id = id;
        sw.dpid = dpid;
        sw.state = ConnectionState::Connecting;
        sw.macTable.clear();
    }

    FlowJob tableMiss;
    tableMiss.dpid = dpid;
    tableMiss.op = FlowOp::Install;
    tableMiss.priority = AppConfig::TABLE_MISS_PRIORITY;
    tableMiss.match = json::object();
    tableMiss.actions = json::array(
        {json{{"type", "OUTPUT"}, {"port", "CONTROLLER"}, {"max_len", 65535}}});
    m_channel->installFlow(tableMiss);

    bool first = false;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_switches.find(dpid);
        if (it != m_switches.end() && it->second.state == ConnectionState::Connecting)
        {
            it->second.state = ConnectionState::Active;
        }
        first = !m_anyActivated;
        m_anyActivated = true;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "[SWITCH] {} (dpid {}) connected", id, dpid);
    return first;
}

bool
SwitchRegistry::handleDisconnect(uint64_t dpid)
{
    {
        std::unique_lock lock(m_mutex);
        auto it = m_switches.find(dpid);
        if (it == m_switches.end() || it->second.state == ConnectionState::Dead)
        {
            return false;
        }
        it->second.state = ConnectionState::Dead;
        it->second.macTable.clear();
    }
    m_channel->discardPending(dpid);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "[SWITCH] {} (dpid {}) disconnected",
                       switchIdFor(dpid),
                       dpid);
    return true;
}

void
SwitchRegistry::learnSource(uint64_t dpid, uint64_t mac, uint32_t port)
{
    std::unique_lock lock(m_mutex);
    auto it = m_switches.find(dpid);
    if (it == m_switches.end() || it->second.state == ConnectionState::Dead)
    {
        return;
    }
    auto [entry, inserted] = it->second.macTable.insert_or_assign(mac, port);
    if (inserted)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Learned {} on {} port {}",
                            utils::macToString(mac),
                            it->second.id,
                            port);
    }
}

std::optional<uint32_t>
SwitchRegistry::lookupPort(uint64_t dpid, uint64_t mac) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_switches.find(dpid);
    if (it == m_switches.end())
    {
        return std::nullopt;
    }
    auto portIt = it->second.macTable.find(mac);
    if (portIt == it->second.macTable.end())
    {
        return std::nullopt;
    }
    return portIt->second;
}

std::vector<uint64_t>
SwitchRegistry::activeDatapaths() const
{
    std::vector<uint64_t> active;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [dpid, sw] : m_switches)
        {
            if (sw.state == ConnectionState::Active)
            {
                active.push_back(dpid);
            }
        }
    }
    std::sort(active.begin(), active.end());
    return active;
}

bool
SwitchRegistry::isActive(uint64_t dpid) const
{
    auto s = state(dpid);
    return s.has_value() && s.value() == ConnectionState::Active;
}

std::optional<ConnectionState>
SwitchRegistry::state(uint64_t dpid) const
{
    std::shared_lock lock(m_mutex);
    auto it = m_switches.find(dpid);
    if (it == m_switches.end())
    {
        return std::nullopt;
    }
    return it->second.state;
}

std::string
SwitchRegistry::switchIdFor(uint64_t dpid) const
{
    if (auto id = m_topology->switchIdForDpid(dpid))
    {
        return *id;
    }
    return "s" + std::to_string(dpid);
}

json
SwitchRegistry::toJson() const
{
    json switches = json::array();
    std::shared_lock lock(m_mutex);
    for (const auto& [dpid, sw] : m_switches)
    {
        switches.push_back({{"id", sw.id},
                            {"dpid", dpid},
                            {"state", to_string(sw.state)},
                            {"mac_table_size", sw.macTable.size()}});
    }
    return switches;
}

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
#include "sentinet_core/southbound/SwitchChannel.hpp"
#include "sentinet_core/topology/TopologyModel.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class ConnectionState
{
    Connecting,
    Active,
    Dead
};

std::string to_string(ConnectionState state);

/**
 * @brief A datapath known to the controller together with its learned MAC table.
 */
struct SwitchState
{
    std::string id;
    uint64_t dpid = 0;
    ConnectionState state = ConnectionState::Connecting;
    std::unordered_map<uint64_t, uint32_t> macTable;
};

/**
 * @brief Lifecycle of connected datapaths and their MAC -> port tables.
 *
 * Sole owner of per-switch state. Switches not named in the topology are still accepted and
 * named "s<dpid>".
 */
class SwitchRegistry
{
  public:
    SwitchRegistry(std::shared_ptr<const TopologyModel> topology,
                   std::shared_ptr<SwitchChannel> channel);

    /**
     * @brief Handshake completed: install the table-miss rule and mark the switch Active.
     * @return true when this is the first switch to become Active since startup.
     */
    bool handleConnect(uint64_t dpid);

    /**
     * @brief Mark the switch Dead, stop polling it and purge its MAC table.
     * @return false when the switch was not known or already Dead.
     */
    bool handleDisconnect(uint64_t dpid);

    // Last writer wins.
    void learnSource(uint64_t dpid, uint64_t mac, uint32_t port);
    std::optional<uint32_t> lookupPort(uint64_t dpid, uint64_t mac) const;

    std::vector<uint64_t> activeDatapaths() const;
    bool isActive(uint64_t dpid) const;
    std::optional<ConnectionState> state(uint64_t dpid) const;
    std::string switchIdFor(uint64_t dpid) const;

    nlohmann::json toJson() const;

  private:
    std::shared_ptr<const TopologyModel> m_topology;
    std::shared_ptr<SwitchChannel> m_channel;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<uint64_t, SwitchState> m_switches;
    bool m_anyActivated = false;
};

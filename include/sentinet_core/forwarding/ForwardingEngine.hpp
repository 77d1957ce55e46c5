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
#include "sentinet_core/routing/Navigator.hpp"
#include "sentinet_core/security/MitigationManager.hpp"
#include "sentinet_core/southbound/SwitchChannel.hpp"
#include "sentinet_core/switching/SwitchRegistry.hpp"
#include "sentinet_core/topology/TopologyModel.hpp"
#include "utils/AppConfig.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

constexpr uint16_t ETH_TYPE_LLDP = 0x88cc;
constexpr uint16_t ETH_TYPE_IPV6 = 0x86dd;

enum class ForwardingAction
{
    Ignore,
    Drop,
    Output,
    Flood
};

std::string to_string(ForwardingAction action);

/**
 * @brief What the platform should do with the packet that triggered a packet-in.
 *
 * port is meaningful only for Output.
 */
struct ForwardingDecision
{
    ForwardingAction action = ForwardingAction::Flood;
    uint32_t port = 0;

    static ForwardingDecision ignore() { return {ForwardingAction::Ignore, 0}; }
    static ForwardingDecision drop() { return {ForwardingAction::Drop, 0}; }
    static ForwardingDecision flood() { return {ForwardingAction::Flood, 0}; }
    static ForwardingDecision output(uint32_t port) { return {ForwardingAction::Output, port}; }

    bool operator==(const ForwardingDecision& o) const = default;
};

void to_json(nlohmann::json& j, const ForwardingDecision& d);

/**
 * @brief Header fields of a packet-in the decision depends on.
 */
struct PacketInfo
{
    uint64_t dpid = 0;
    uint32_t inPort = 0;
    uint64_t srcMac = 0;
    uint64_t dstMac = 0;
    uint16_t ethType = 0;
};

struct ForwardingSettings
{
    bool navigatorEnabled = true;
    int idleTimeoutSec = AppConfig::FLOW_IDLE_TIMEOUT_SEC;
    int hardTimeoutSec = AppConfig::FLOW_HARD_TIMEOUT_SEC;
    int navigatorIdleTimeoutSec = AppConfig::NAVIGATOR_IDLE_TIMEOUT_SEC;
};

/**
 * @brief Packet-in handler combining MAC learning, the block list and Navigator paths.
 *
 * Blocked (src, dst) pairs are always dropped. Otherwise the learned destination port wins;
 * without one the Navigator path is translated into a port; failing both the packet floods.
 * A concrete port also installs a forwarding rule matching (in_port, eth_src, eth_dst).
 */
class ForwardingEngine
{
  public:
    ForwardingEngine(std::shared_ptr<const TopologyModel> topology,
                     std::shared_ptr<SwitchRegistry> registry,
                     std::shared_ptr<MitigationManager> mitigation,
                     std::shared_ptr<SwitchChannel> channel,
                     std::shared_ptr<Navigator> navigator,
                     ForwardingSettings settings = {});

    ForwardingDecision handlePacketIn(const PacketInfo& packet);

    /**
     * @brief Output port on switchId for a Navigator path towards dstMac.
     *
     * The last switch of the path uses the port towards the destination host; any other
     * switch uses the topology port towards the next hop.
     */
    std::optional<uint32_t> translatePath(const std::string& switchId,
                                          uint64_t dpid,
                                          uint64_t dstMac,
                                          const std::vector<std::string>& path) const;

    bool navigatorActive() const;

  private:
    void installForwardingRule(const PacketInfo& packet, uint32_t outPort);

    std::shared_ptr<const TopologyModel> m_topology;
    std::shared_ptr<SwitchRegistry> m_registry;
    std::shared_ptr<MitigationManager> m_mitigation;
    std::shared_ptr<SwitchChannel> m_channel;
    std::shared_ptr<Navigator> m_navigator;
    ForwardingSettings m_settings;
};

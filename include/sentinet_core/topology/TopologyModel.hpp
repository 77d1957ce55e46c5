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

#include "common_types/TopologyTypes.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Static network descriptor (switches, hosts, switch links) with derived port numbers.
 *
 * Port numbers are derived the way the emulator creates interfaces: every switch starts at
 * port 1, each host (in declaration order) takes the next port on its attachment switch, then
 * each link (in declaration order) takes the next port on both of its endpoints.
 *
 * Links that connect a host to its declared attachment switch may appear in the link list;
 * they are skipped because the host entry already accounts for them. Any other inconsistency
 * raises TopologyError.
 *
 * Immutable after construction, so it can be shared freely between threads.
 */
class TopologyModel
{
  public:
    TopologyModel(std::vector<SwitchDescriptor> switches,
                  std::vector<HostDescriptor> hosts,
                  const std::vector<RawLink>& links);

    /**
     * @brief Build a topology from a descriptor {"switches": [], "hosts": [], "links": []}.
     * @throws TopologyError on a missing or malformed field.
     */
    static TopologyModel fromJson(const nlohmann::json& j);

    /**
     * @brief Load and parse a descriptor file.
     * @throws TopologyError if the file cannot be read or parsed.
     */
    static TopologyModel loadFromFile(const std::string& path);

    /**
     * @brief Loop-free five-switch tree used when no descriptor is given.
     *
     * s1 is the core with s2, s4 and s5 below it, and s3 hangs off s2. Hosts h1-h3 sit on s3,
     * h4 on s2, h5 on s4 and h6-h8 on s5, with MACs 00:00:00:00:00:0n and IPs 10.0.0.n.
     */
    static TopologyModel defaultTopology();

    const std::vector<SwitchDescriptor>& switches() const { return m_switches; }
    const std::vector<HostDescriptor>& hosts() const { return m_hosts; }
    const std::vector<LinkDescriptor>& links() const { return m_links; }
    size_t numSwitches() const { return m_switches.size(); }

    // Port on fromSwitch that leads to toSwitch.
    std::optional<uint32_t> portToward(const std::string& fromSwitch,
                                       const std::string& toSwitch) const;
    // Switch reached through the given port, if the port is a switch-to-switch link.
    std::optional<std::string> neighborOnPort(const std::string& switchId, uint32_t port) const;

    std::optional<std::string> switchIdForDpid(uint64_t dpid) const;
    std::optional<uint64_t> dpidForSwitch(const std::string& switchId) const;

    std::optional<HostDescriptor> hostByMac(uint64_t mac) const;
    std::optional<HostDescriptor> hostByIp(const std::string& ip) const;
    // Host MAC -> attachment switch id.
    const std::unordered_map<uint64_t, std::string>& hostToSwitch() const { return m_hostToSwitch; }

    /**
     * @brief Topology message body as published to the bridge.
     */
    nlohmann::json toJson() const;

  private:
    void validateAndIndex();
    void derivePorts(const std::vector<RawLink>& links);

    std::vector<SwitchDescriptor> m_switches;
    std::vector<HostDescriptor> m_hosts;
    std::vector<LinkDescriptor> m_links;

    std::unordered_map<std::string, uint64_t> m_switchToDpid;
    std::unordered_map<uint64_t, std::string> m_dpidToSwitch;
    std::unordered_map<uint64_t, std::string> m_hostToSwitch;
    std::unordered_map<std::string, size_t> m_hostIndexById;
    std::map<std::pair<std::string, std::string>, uint32_t> m_portToward;
    std::map<std::pair<std::string, uint32_t>, std::string> m_neighborOnPort;
};

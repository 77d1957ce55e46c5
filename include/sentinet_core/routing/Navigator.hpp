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
#include "common_types/AppTypes.hpp"
#include "common_types/GraphTypes.hpp"
#include "sentinet_core/collection/FlowStatsEngine.hpp"
#include "sentinet_core/topology/TopologyModel.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Congestion-aware Q-learning router over the switch graph.
 *
 * The Q-table maps state (current switch) -> action (neighbor switch) -> value. Paths are
 * found with an epsilon-greedy walk that never revisits a switch and backtracks out of dead
 * ends; every successful walk is followed by a backward temporal-difference update using the
 * path reward -(sum delay + rewardCongestionScale * sum congestion).
 *
 * All public operations lock the Navigator; a path computation holds the lock for both the
 * walk and the update.
 */
class Navigator
{
  public:
    explicit Navigator(NavigatorParameters params = {});

    void initializeFromTopology(const TopologyModel& topology);
    bool isInitialized() const;

    /**
     * @brief Refresh congestion and weight of every edge that has a measurement.
     *
     * Edges absent from liveStats keep their state. Decays epsilon afterwards.
     */
    void updateLinkWeights(const LinkUtilization& liveStats);

    /**
     * @return The switch sequence from src to dst, [src] when equal, or empty on failure.
     */
    std::vector<std::string> getOptimalPath(const std::string& src, const std::string& dst);

    std::vector<std::string> getPathForHosts(
        uint64_t srcMac,
        uint64_t dstMac,
        const std::unordered_map<uint64_t, std::string>& hostToSwitch);

    double calculateReward(const std::vector<std::string>& path) const;

    std::optional<double> qValue(const std::string& state, const std::string& action) const;
    std::optional<LinkEdge> edge(const std::string& from, const std::string& to) const;
    double epsilon() const;
    void setEpsilon(double epsilon);

    nlohmann::json status() const;
    nlohmann::json linkInfo() const;

    bool saveQTable(const std::string& path) const;
    bool loadQTable(const std::string& path);

  private:
    std::optional<Edge> findEdgeLocked(Vertex from, Vertex to) const;
    double rewardLocked(const std::vector<Vertex>& path) const;
    void backwardUpdateLocked(const std::vector<Vertex>& path, double reward);
    double maxQLocked(const std::string& state) const;

    mutable std::mutex m_mutex;
    NavigatorParameters m_params;
    double m_epsilon;
    std::mt19937 m_rng;

    Graph m_graph;
    std::unordered_map<std::string, Vertex> m_vertexBySwitch;
    std::map<std::string, std::map<std::string, double>> m_qTable;

    bool m_initialized = false;
    uint64_t m_totalUpdates = 0;
    uint64_t m_pathsCalculated = 0;
};

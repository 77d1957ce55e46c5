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

#include "sentinet_core/routing/Navigator.hpp"
#include "utils/Logger.hpp"                    // for Logger
#include "utils/Utils.hpp"                     // for macToString
#include <algorithm>                           // for max, min, clamp
#include <boost/range/iterator_range.hpp>      // for make_iterator_range
#include <cmath>                               // for pow, round
#include <fstream>                             // for ifstream, ofstream
#include <set>                                 // for set
#include <unordered_set>                       // for unordered_set

using json = nlohmann::json;

namespace
{

std::string
joinPath(const std::vector<std::string>& path)
{
    std::string text;
    for (const auto& id : path)
    {
        if (!text.empty())
        {
            text += ",";
        }
        text += id;
    }
    return text;
}

double
roundTo(double value, int digits)
{
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

} // namespace

Navigator::Navigator(NavigatorParameters params)
    : m_params(params),
      m_epsilon(params.epsilon),
      m_rng(params.seed.has_value() ? params.seed.value() : std::random_device{}())
{
}

void
Navigator::initializeFromTopology(const TopologyModel& topology)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_graph.clear();
    m_vertexBySwitch.clear();
    m_qTable.clear();

    for (const auto& sw : topology.switches())
    {
        Vertex v = boost::add_vertex(SwitchVertex{sw.id}, m_graph);
        m_vertexBySwitch[sw.id] = v;
        m_qTable[sw.id];
    }

    std::uniform_real_distribution<double> jitter(0.0, 0.1);
    for (const auto& link : topology.links())
    {
        const Vertex u = m_vertexBySwitch.at(link.fromSwitch);
        const Vertex v = m_vertexBySwitch.at(link.toSwitch);
        LinkEdge props;
        props.weight = link.delayMs;
        props.bandwidthMbps = link.bandwidthMbps;
        props.delayMs = link.delayMs;

        boost::add_edge(u, v, props, m_graph);
        boost::add_edge(v, u, props, m_graph);

        m_qTable[link.fromSwitch][link.toSwitch] = -link.delayMs + jitter(m_rng);
        m_qTable[link.toSwitch][link.fromSwitch] = -link.delayMs + jitter(m_rng);
    }

    m_initialized = true;
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "[NAVIGATOR] Initialized from topology: {} switches, {} links",
                       boost::num_vertices(m_graph),
                       topology.links().size());
}

bool
Navigator::isInitialized() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

void
Navigator::updateLinkWeights(const LinkUtilization& liveStats)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized)
    {
        return;
    }

    for (const auto& [key, bps] : liveStats)
    {
        auto from = m_vertexBySwitch.find(key.first);
        auto to = m_vertexBySwitch.find(key.second);
        if (from == m_vertexBySwitch.end() || to == m_vertexBySwitch.end())
        {
            continue;
        }
        auto e = findEdgeLocked(from->second, to->second);
        if (!e.has_value())
        {
            continue;
        }

        LinkEdge& props = m_graph[e.value()];
        const double capacityBps = props.bandwidthMbps * 1e6;
        props.currentBps = std::max(0.0, bps);
        props.congestion = capacityBps > 0.0 ? std::min(1.0, props.currentBps / capacityBps) : 1.0;
        props.weight = props.delayMs + props.congestion * m_params.congestionPenaltyScale;

        if (props.congestion > 0.5)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "[NAVIGATOR] {} -> {} congestion {:.2f}, weight {:.2f}",
                                key.first,
                                key.second,
                                props.congestion,
                                props.weight);
        }
    }

    if (m_epsilon > m_params.epsilonMin)
    {
        m_epsilon = std::max(m_params.epsilonMin, m_epsilon * m_params.epsilonDecay);
    }
}

std::vector<std::string>
Navigator::getOptimalPath(const std::string& src, const std::string& dst)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (src == dst)
    {
        return {src};
    }
    if (!m_initialized)
    {
        return {};
    }
    auto srcIt = m_vertexBySwitch.find(src);
    auto dstIt = m_vertexBySwitch.find(dst);
    if (srcIt == m_vertexBySwitch.end() || dstIt == m_vertexBySwitch.end())
    {
        return {};
    }

    const Vertex target = dstIt->second;
    const size_t numSwitches = boost::num_vertices(m_graph);
    const size_t maxLength = numSwitches + 1;
    const size_t maxExpansions = 64 * numSwitches * numSwitches + 64;
    size_t expansions = 0;

    // rejected[d] holds neighbors already abandoned from the node at depth d.
    std::vector<Vertex> path{srcIt->second};
    std::vector<std::unordered_set<Vertex>> rejected(1);
    std::unordered_set<Vertex> visited{srcIt->second};
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    while (!path.empty() && path.back() != target)
    {
        if (++expansions > maxExpansions)
        {
            path.clear();
            break;
        }
        const Vertex current = path.back();
        const std::string& currentId = m_graph[current].switchId;

        std::vector<std::pair<Vertex, double>> candidates;
        if (path.size() < maxLength)
        {
            for (auto e : boost::make_iterator_range(boost::out_edges(current, m_graph)))
            {
                const Vertex n = boost::target(e, m_graph);
                if (visited.count(n) || rejected.back().count(n))
                {
                    continue;
                }
                const std::string& neighborId = m_graph[n].switchId;
                double q = 0.0;
                auto stateIt = m_qTable.find(currentId);
                if (stateIt != m_qTable.end())
                {
                    auto actionIt = stateIt->second.find(neighborId);
                    if (actionIt != stateIt->second.end())
                    {
                        q = actionIt->second;
                    }
                }
                const double bonus = n == target ? m_params.destinationBonus : 0.0;
                const double score = q + bonus - m_graph[e].weight * m_params.weightPenaltyFactor;
                candidates.emplace_back(n, score);
            }
        }

        if (candidates.empty())
        {
            path.pop_back();
            visited.erase(current);
            rejected.pop_back();
            if (!rejected.empty())
            {
                rejected.back().insert(current);
            }
            continue;
        }

        Vertex next = candidates.front().first;
        if (m_epsilon > 0.0 && coin(m_rng) < m_epsilon)
        {
            std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
            next = candidates[pick(m_rng)].first;
        }
        else
        {
            double best = candidates.front().second;
            for (const auto& [n, score] : candidates)
            {
                if (score > best)
                {
                    best = score;
                    next = n;
                }
            }
        }

        path.push_back(next);
        visited.insert(next);
        rejected.emplace_back();
    }

    if (path.empty())
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "[NAVIGATOR] No path {} -> {}", src, dst);
        return {};
    }

    const double reward = rewardLocked(path);
    backwardUpdateLocked(path, reward);
    ++m_pathsCalculated;

    std::vector<std::string> result;
    result.reserve(path.size());
    for (Vertex v : path)
    {
        result.push_back(m_graph[v].switchId);
    }
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "[NAVIGATOR] Path {} -> {}: {} (reward {:.2f})",
                        src,
                        dst,
                        joinPath(result),
                        reward);
    return result;
}

std::vector<std::string>
Navigator::getPathForHosts(uint64_t srcMac,
                           uint64_t dstMac,
                           const std::unordered_map<uint64_t, std::string>& hostToSwitch)
{
    auto srcIt = hostToSwitch.find(srcMac);
    auto dstIt = hostToSwitch.find(dstMac);
    if (srcIt == hostToSwitch.end() || dstIt == hostToSwitch.end())
    {
        return {};
    }
    return getOptimalPath(srcIt->second, dstIt->second);
}

double
Navigator::calculateReward(const std::vector<std::string>& path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Vertex> vertices;
    for (const auto& id : path)
    {
        auto it = m_vertexBySwitch.find(id);
        if (it == m_vertexBySwitch.end())
        {
            return 0.0;
        }
        vertices.push_back(it->second);
    }
    return rewardLocked(vertices);
}

double
Navigator::rewardLocked(const std::vector<Vertex>& path) const
{
    if (path.size() < 2)
    {
        return 0.0;
    }

    double totalDelay = 0.0;
    double totalCongestion = 0.0;
    for (size_t i = 0; i + 1 < path.size(); ++i)
    {
        auto e = findEdgeLocked(path[i], path[i + 1]);
        if (e.has_value())
        {
            totalDelay += m_graph[e.value()].delayMs;
            totalCongestion += m_graph[e.value()].congestion;
        }
    }
    return -(totalDelay + m_params.rewardCongestionScale * totalCongestion);
}

void
Navigator::backwardUpdateLocked(const std::vector<Vertex>& path, double reward)
{
    for (size_t i = path.size() - 1; i-- > 0;)
    {
        const std::string& state = m_graph[path[i]].switchId;
        const std::string& action = m_graph[path[i + 1]].switchId;
        double& q = m_qTable[state][action];
        // The destination is not terminal: its own Q row supplies max_a' like any other node.
        q += m_params.alpha * (reward + m_params.gamma * maxQLocked(action) - q);
        ++m_totalUpdates;
    }
}

double
Navigator::maxQLocked(const std::string& state) const
{
    auto it = m_qTable.find(state);
    if (it == m_qTable.end() || it->second.empty())
    {
        return 0.0;
    }
    double best = it->second.begin()->second;
    for (const auto& [action, value] : it->second)
    {
        best = std::max(best, value);
    }
    return best;
}

std::optional<Edge>
Navigator::findEdgeLocked(Vertex from, Vertex to) const
{
    auto [e, exists] = boost::edge(from, to, m_graph);
    if (!exists)
    {
        return std::nullopt;
    }
    return e;
}

std::optional<double>
Navigator::qValue(const std::string& state, const std::string& action) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stateIt = m_qTable.find(state);
    if (stateIt == m_qTable.end())
    {
        return std::nullopt;
    }
    auto actionIt = stateIt->second.find(action);
    if (actionIt == stateIt->second.end())
    {
        return std::nullopt;
    }
    return actionIt->second;
}

std::optional<LinkEdge>
Navigator::edge(const std::string& from, const std::string& to) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto fromIt = m_vertexBySwitch.find(from);
    auto toIt = m_vertexBySwitch.find(to);
    if (fromIt == m_vertexBySwitch.end() || toIt == m_vertexBySwitch.end())
    {
        return std::nullopt;
    }
    auto e = findEdgeLocked(fromIt->second, toIt->second);
    if (!e.has_value())
    {
        return std::nullopt;
    }
    return m_graph[e.value()];
}

double
Navigator::epsilon() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_epsilon;
}

void
Navigator::setEpsilon(double epsilon)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_epsilon = std::clamp(epsilon, 0.0, 1.0);
}

json
Navigator::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t qTableSize = 0;
    for (const auto& [state, actions] : m_qTable)
    {
        qTableSize += actions.size();
    }
    return json{{"name", "Navigator"},
                {"initialized", m_initialized},
                {"switches", boost::num_vertices(m_graph)},
                {"epsilon", roundTo(m_epsilon, 4)},
                {"total_updates", m_totalUpdates},
                {"paths_calculated", m_pathsCalculated},
                {"q_table_size", qTableSize}};
}

json
Navigator::linkInfo() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    json links = json::array();
    std::set<std::pair<Vertex, Vertex>> seen;
    for (auto e : boost::make_iterator_range(boost::edges(m_graph)))
    {
        const Vertex u = boost::source(e, m_graph);
        const Vertex v = boost::target(e, m_graph);
        if (!seen.insert({std::min(u, v), std::max(u, v)}).second)
        {
            continue;
        }
        const LinkEdge& props = m_graph[e];
        links.push_back({{"from", m_graph[u].switchId},
                         {"to", m_graph[v].switchId},
                         {"weight", roundTo(props.weight, 2)},
                         {"congestion", roundTo(props.congestion, 2)},
                         {"current_bps", props.currentBps},
                         {"bandwidth_mbps", props.bandwidthMbps}});
    }
    return links;
}

bool
Navigator::saveQTable(const std::string& path) const
{
    json j;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        j = json{{"q_table", m_qTable},
                 {"epsilon", m_epsilon},
                 {"total_updates", m_totalUpdates},
                 {"paths_calculated", m_pathsCalculated}};
    }

    std::ofstream ofs(path);
    if (!ofs.is_open())
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "[NAVIGATOR] Cannot write Q-table to {}", path);
        return false;
    }
    ofs << j.dump(2);
    SPDLOG_LOGGER_INFO(Logger::instance(), "[NAVIGATOR] Q-table saved to {}", path);
    return true;
}

bool
Navigator::loadQTable(const std::string& path)
{
    std::ifstream ifs(path);
    if (!ifs.is_open())
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "[NAVIGATOR] No saved Q-table at {}", path);
        return false;
    }

    try
    {
        json j = json::parse(ifs);
        auto table = j.at("q_table").get<std::map<std::string, std::map<std::string, double>>>();

        std::lock_guard<std::mutex> lock(m_mutex);
        size_t applied = 0;
        for (const auto& [state, actions] : table)
        {
            auto stateIt = m_qTable.find(state);
            if (stateIt == m_qTable.end())
            {
                continue;
            }
            for (const auto& [action, value] : actions)
            {
                auto actionIt = stateIt->second.find(action);
                if (actionIt != stateIt->second.end())
                {
                    actionIt->second = value;
                    ++applied;
                }
            }
        }
        m_epsilon = std::clamp(j.value("epsilon", m_epsilon), 0.0, 1.0);
        m_totalUpdates = j.value("total_updates", m_totalUpdates);
        m_pathsCalculated = j.value("paths_calculated", m_pathsCalculated);
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "[NAVIGATOR] Loaded {} Q-values from {}",
                           applied,
                           path);
        return true;
    }
    catch (const json::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "[NAVIGATOR] Malformed Q-table file {}: {}",
                            path,
                            e.what());
        return false;
    }
}

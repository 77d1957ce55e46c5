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

#include <boost/graph/adjacency_list.hpp>
#include <string>

/**
 * @brief Navigator graph vertex: one OpenFlow switch.
 */
struct SwitchVertex
{
    std::string switchId;
};

/**
 * @brief Directed switch-to-switch edge with its live cost.
 *
 * weight = delayMs + congestion * congestionPenaltyScale, congestion in [0, 1].
 */
struct LinkEdge
{
    double weight = 0.0;
    double bandwidthMbps = 0.0;
    double delayMs = 0.0;
    double currentBps = 0.0;
    double congestion = 0.0;
};

// setS keeps at most one edge per ordered pair and iterates neighbors in vertex order.
using Graph =
    boost::adjacency_list<boost::setS, boost::vecS, boost::directedS, SwitchVertex, LinkEdge>;
using Vertex = boost::graph_traits<Graph>::vertex_descriptor;
using Edge = boost::graph_traits<Graph>::edge_descriptor;

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

#include "TestTopology.hpp"
#include "mocks/FakeSwitchChannel.hpp"
#include "mocks/ManualScheduler.hpp"
#include "sentinet_core/forwarding/ForwardingEngine.hpp"
#include <gtest/gtest.h>

using testdata::H1_MAC;
using testdata::H2_MAC;
using testdata::UNKNOWN_MAC;

namespace
{
constexpr uint16_t ETH_TYPE_IPV4 = 0x0800;
}

class ForwardingEngineTests : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        for (uint64_t dpid : {1, 2, 3, 4})
        {
            registry->handleConnect(dpid);
        }
        channel->installed.clear();

        NavigatorParameters params;
        params.epsilon = 0.0;
        params.epsilonMin = 0.0;
        params.seed = 5;
        navigator = std::make_shared<Navigator>(params);
        navigator->initializeFromTopology(*topology);
    }

    ForwardingEngine makeEngine(bool navigatorEnabled)
    {
        ForwardingSettings settings;
        settings.navigatorEnabled = navigatorEnabled;
        return ForwardingEngine{topology, registry, mitigation, channel, navigator, settings};
    }

    std::shared_ptr<const TopologyModel> topology = testdata::diamond();
    std::shared_ptr<FakeSwitchChannel> channel = std::make_shared<FakeSwitchChannel>();
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<SwitchRegistry> registry = std::make_shared<SwitchRegistry>(topology, channel);
    std::shared_ptr<MitigationManager> mitigation =
        std::make_shared<MitigationManager>(registry, channel, scheduler);
    std::shared_ptr<Navigator> navigator;
};

TEST_F(ForwardingEngineTests, IgnoresLldpAndIpv6)
{
    auto engine = makeEngine(true);
    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_LLDP}),
              ForwardingDecision::ignore());
    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV6}),
              ForwardingDecision::ignore());
    EXPECT_FALSE(registry->lookupPort(1, H1_MAC).has_value());
    EXPECT_TRUE(channel->installed.empty());
}

TEST_F(ForwardingEngineTests, LearningSwitchFloodsThenOutputs)
{
    auto engine = makeEngine(false);

    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::flood());
    EXPECT_EQ(registry->lookupPort(1, H1_MAC), 1u);
    EXPECT_TRUE(channel->installed.empty());

    EXPECT_EQ(engine.handlePacketIn({1, 2, H2_MAC, H1_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::output(1));

    ASSERT_EQ(channel->installed.size(), 1u);
    const auto& job = channel->installed.front();
    EXPECT_EQ(job.priority, AppConfig::FORWARDING_PRIORITY);
    EXPECT_EQ(job.match.at("in_port"), 2);
    EXPECT_EQ(job.match.at("eth_src"), "00:00:00:00:00:02");
    EXPECT_EQ(job.match.at("eth_dst"), "00:00:00:00:00:01");
    EXPECT_EQ(job.actions[0].at("port"), 1);
    EXPECT_EQ(job.idleTimeout, AppConfig::FLOW_IDLE_TIMEOUT_SEC);
    EXPECT_EQ(job.hardTimeout, AppConfig::FLOW_HARD_TIMEOUT_SEC);
}

TEST_F(ForwardingEngineTests, NavigatorPathChoosesNextHopPort)
{
    auto engine = makeEngine(true);
    ASSERT_TRUE(engine.navigatorActive());

    // s1 towards s4 over the fast direct link (port 2).
    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::output(2));
    ASSERT_EQ(channel->installed.size(), 1u);
    EXPECT_EQ(channel->installed.front().idleTimeout, AppConfig::NAVIGATOR_IDLE_TIMEOUT_SEC);

    // Last hop uses the host attachment port from the topology.
    EXPECT_EQ(engine.handlePacketIn({4, 2, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::output(1));
}

TEST_F(ForwardingEngineTests, LearnedPortTakesPrecedenceOverNavigator)
{
    auto engine = makeEngine(true);
    registry->learnSource(1, H2_MAC, 3);
    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::output(3));
}

TEST_F(ForwardingEngineTests, UnknownDestinationFloods)
{
    auto engine = makeEngine(true);
    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, UNKNOWN_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::flood());
}

TEST_F(ForwardingEngineTests, SwitchOffPathFloods)
{
    auto engine = makeEngine(true);
    // Greedy path is s1,s4 so s2 is not on it.
    EXPECT_EQ(engine.handlePacketIn({2, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::flood());
}

TEST_F(ForwardingEngineTests, BlockedPairIsDroppedEvenWithKnownPort)
{
    auto engine = makeEngine(true);
    registry->learnSource(1, H2_MAC, 2);
    mitigation->block(H1_MAC, H2_MAC, 30);
    channel->installed.clear();

    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::drop());
    EXPECT_TRUE(channel->installed.empty());
    // The reverse direction is unaffected.
    EXPECT_EQ(engine.handlePacketIn({1, 2, H2_MAC, H1_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::output(1));
}

TEST_F(ForwardingEngineTests, UninitializedNavigatorDegradesToLearning)
{
    navigator = std::make_shared<Navigator>();
    auto engine = makeEngine(true);
    EXPECT_FALSE(engine.navigatorActive());
    EXPECT_EQ(engine.handlePacketIn({1, 1, H1_MAC, H2_MAC, ETH_TYPE_IPV4}),
              ForwardingDecision::flood());
}

TEST_F(ForwardingEngineTests, TranslatePath)
{
    auto engine = makeEngine(true);
    const std::vector<std::string> path{"s1", "s2", "s3", "s4"};

    EXPECT_EQ(engine.translatePath("s1", 1, H2_MAC, path), 3u);
    EXPECT_EQ(engine.translatePath("s2", 2, H2_MAC, path), 2u);
    EXPECT_EQ(engine.translatePath("s3", 3, H2_MAC, path), 2u);
    EXPECT_EQ(engine.translatePath("s4", 4, H2_MAC, path), 1u);
    EXPECT_FALSE(engine.translatePath("s4", 4, UNKNOWN_MAC, path).has_value());
    EXPECT_FALSE(engine.translatePath("s9", 9, H2_MAC, path).has_value());
}

TEST_F(ForwardingEngineTests, DecisionSerialization)
{
    EXPECT_EQ(nlohmann::json(ForwardingDecision::output(4)),
              (nlohmann::json{{"action", "output"}, {"port", 4}}));
    EXPECT_EQ(nlohmann::json(ForwardingDecision::flood()), (nlohmann::json{{"action", "flood"}}));
}

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
#include "sentinet_core/collection/FlowStatsEngine.hpp"
#include <gtest/gtest.h>

using namespace std::chrono_literals;
using testdata::flowEntry;
using testdata::H1_MAC;
using testdata::H2_MAC;

class FlowStatsEngineTests : public ::testing::Test
{
  protected:
    FlowStatsEngine engine{testdata::diamond()};
    TimePoint t0 = Clock::now();
};

TEST_F(FlowStatsEngineTests, FirstSampleHasZeroRates)
{
    auto records = engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 50, 5000)}, t0);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_DOUBLE_EQ(records[0].pps, 0.0);
    EXPECT_DOUBLE_EQ(records[0].bps, 0.0);
    EXPECT_DOUBLE_EQ(records[0].avgPktSize, 100.0);
    EXPECT_EQ(records[0].switchId, "s1");
}

// Counters 0 -> 100 over one second, then unchanged.
TEST_F(FlowStatsEngineTests, RateRisesThenDropsToZero)
{
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 0, 0)}, t0);

    auto second = engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 100, 6400)}, t0 + 1s);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NEAR(second[0].pps, 100.0, 1e-6);
    EXPECT_NEAR(second[0].bps, 6400.0 * 8, 1e-6);

    auto third = engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 100, 6400)}, t0 + 2s);
    ASSERT_EQ(third.size(), 1u);
    EXPECT_DOUBLE_EQ(third[0].pps, 0.0);
    EXPECT_DOUBLE_EQ(third[0].bps, 0.0);
}

TEST_F(FlowStatsEngineTests, CounterResetNeverGoesNegative)
{
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 500, 50000)}, t0);
    auto records = engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 10, 1000)}, t0 + 1s);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_GE(records[0].pps, 0.0);
    EXPECT_GE(records[0].bps, 0.0);
}

TEST_F(FlowStatsEngineTests, IgnoresNonForwardingPriorities)
{
    auto tableMiss = flowEntry(H1_MAC, H2_MAC, 10, 1000);
    tableMiss.priority = 0;
    auto drop = flowEntry(H2_MAC, H1_MAC, 10, 1000);
    drop.priority = 100;

    auto records = engine.processReply(1, "s1", {tableMiss, drop}, t0);
    EXPECT_TRUE(records.empty());
    EXPECT_EQ(engine.sampleCount(), 0u);
}

TEST_F(FlowStatsEngineTests, EvictsSamplesMissingFromTwoPolls)
{
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 10, 1000)}, t0);
    EXPECT_EQ(engine.sampleCount(), 1u);

    engine.processReply(1, "s1", {}, t0 + 1s);
    EXPECT_EQ(engine.sampleCount(), 1u);

    engine.processReply(1, "s1", {}, t0 + 2s);
    EXPECT_EQ(engine.sampleCount(), 0u);

    // Polls of another switch do not age this switch's samples.
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 10, 1000)}, t0 + 3s);
    engine.processReply(4, "s4", {}, t0 + 4s);
    engine.processReply(4, "s4", {}, t0 + 5s);
    EXPECT_EQ(engine.sampleCount(), 1u);
}

TEST_F(FlowStatsEngineTests, ForgetSwitchDropsHistory)
{
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 10, 1000)}, t0);
    engine.processReply(4, "s4", {flowEntry(H1_MAC, H2_MAC, 10, 1000)}, t0);
    engine.forgetSwitch(1);

    EXPECT_EQ(engine.sampleCount(), 1u);
    EXPECT_TRUE(engine.latestRecords(1).empty());

    auto records = engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 20, 2000)}, t0 + 1s);
    EXPECT_DOUBLE_EQ(records[0].pps, 0.0);
}

TEST_F(FlowStatsEngineTests, LinkUtilizationFollowsOutputPorts)
{
    // s1 port 2 leads to s4.
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 0, 0, 2)}, t0);
    engine.processReply(1, "s1", {flowEntry(H1_MAC, H2_MAC, 100, 125000, 2)}, t0 + 1s);

    auto usage = engine.linkUtilization();
    EXPECT_EQ(usage.size(), 8u);
    EXPECT_NEAR(usage.at({"s1", "s4"}), 1e6, 1e-3);
    EXPECT_DOUBLE_EQ(usage.at({"s4", "s1"}), 0.0);
    EXPECT_DOUBLE_EQ(usage.at({"s1", "s2"}), 0.0);
}

TEST_F(FlowStatsEngineTests, HostFacingPortsDoNotCountAsLinks)
{
    engine.processReply(4, "s4", {flowEntry(H1_MAC, H2_MAC, 0, 0, 1)}, t0);
    engine.processReply(4, "s4", {flowEntry(H1_MAC, H2_MAC, 100, 10000, 1)}, t0 + 1s);

    for (const auto& [link, bps] : engine.linkUtilization())
    {
        EXPECT_DOUBLE_EQ(bps, 0.0) << link.first << "->" << link.second;
    }
}

namespace
{

FlowStatEntry
entryOnPort(uint32_t inPort, uint64_t packets)
{
    FlowStatEntry entry = flowEntry(H1_MAC, H2_MAC, packets, packets * 100);
    entry.inPort = inPort;
    return entry;
}

} // namespace

// Two rules for the same pair arriving on different ports count as one flow.
TEST_F(FlowStatsEngineTests, RulesSharingAPairAreSummed)
{
    engine.processReply(1, "s1", {entryOnPort(1, 100), entryOnPort(3, 200)}, t0);

    auto records =
        engine.processReply(1, "s1", {entryOnPort(1, 110), entryOnPort(3, 5200)}, t0 + 1s);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].packetCount, 5310u);
    EXPECT_NEAR(records[0].pps, 5010.0, 1e-6);
    EXPECT_NEAR(records[0].bps, 5010.0 * 100 * 8, 1e-3);
}

TEST_F(FlowStatsEngineTests, ReplyOrderDoesNotCreateRates)
{
    engine.processReply(1, "s1", {entryOnPort(1, 10), entryOnPort(3, 100000)}, t0);

    auto records =
        engine.processReply(1, "s1", {entryOnPort(3, 100000), entryOnPort(1, 10)}, t0 + 1s);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_DOUBLE_EQ(records[0].pps, 0.0);
    EXPECT_DOUBLE_EQ(records[0].bps, 0.0);
}

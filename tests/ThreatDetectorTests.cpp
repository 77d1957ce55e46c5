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
#include "mocks/FakeBridge.hpp"
#include "mocks/FakeSwitchChannel.hpp"
#include "mocks/FakeThreatModel.hpp"
#include "mocks/ManualScheduler.hpp"
#include "sentinet_core/security/ThreatDetector.hpp"
#include <gtest/gtest.h>

using namespace std::chrono_literals;
using testdata::H1_MAC;
using testdata::H2_MAC;

class ThreatDetectorTests : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        registry->handleConnect(1);
        registry->handleConnect(4);
    }

    FlowRecord record(double pps, double bps, uint64_t src = H1_MAC, uint64_t dst = H2_MAC) const
    {
        FlowRecord r;
        r.switchId = "s1";
        r.dpid = 1;
        r.srcMac = src;
        r.dstMac = dst;
        r.pps = pps;
        r.bps = bps;
        r.avgPktSize = 64.0;
        return r;
    }

    std::shared_ptr<const TopologyModel> topology = testdata::diamond();
    std::shared_ptr<FakeSwitchChannel> channel = std::make_shared<FakeSwitchChannel>();
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<SwitchRegistry> registry = std::make_shared<SwitchRegistry>(topology, channel);
    std::shared_ptr<MitigationManager> mitigation =
        std::make_shared<MitigationManager>(registry, channel, scheduler);
    std::shared_ptr<FakeThreatModel> model = std::make_shared<FakeThreatModel>();
    std::shared_ptr<FakeBridge> bridge = std::make_shared<FakeBridge>();
    ThreatDetector detector{model, mitigation, bridge, scheduler, topology};
};

TEST_F(ThreatDetectorTests, FuseNamedAttackWins)
{
    auto verdict = ThreatDetector::fuse(ModelSignals{true, "SYN Flood", 0.93});
    EXPECT_TRUE(verdict.isThreat);
    EXPECT_EQ(verdict.attackType, "SYN Flood");
    EXPECT_DOUBLE_EQ(verdict.confidence, 0.93);
}

TEST_F(ThreatDetectorTests, FuseAnomalyOnlyIsUnknownAnomaly)
{
    auto verdict = ThreatDetector::fuse(ModelSignals{true, "Normal", 0.6});
    EXPECT_TRUE(verdict.isThreat);
    EXPECT_EQ(verdict.attackType, "Unknown Anomaly");

    auto benign = ThreatDetector::fuse(ModelSignals{false, "Normal", 0.99});
    EXPECT_FALSE(benign.isThreat);
    EXPECT_EQ(benign.attackType, "Normal");
}

TEST_F(ThreatDetectorTests, UnloadedModelFallsBackToThresholds)
{
    model->signals.reset();

    auto quiet = detector.classify(10.0, 1000.0, 100.0);
    EXPECT_FALSE(quiet.isThreat);
    EXPECT_TRUE(quiet.thresholdFallback);

    auto flood = detector.classify(5000.0, 1000.0, 64.0);
    EXPECT_TRUE(flood.isThreat);
    EXPECT_EQ(flood.attackType, "Threshold Breach");
    EXPECT_DOUBLE_EQ(flood.confidence, 1.0);

    EXPECT_TRUE(detector.classify(1.0, 200000.0, 1500.0).isThreat);
}

TEST_F(ThreatDetectorTests, ThrowingModelFallsBackToThresholds)
{
    model->throwOnInfer = true;
    auto verdict = detector.classify(5000.0, 0.0, 64.0);
    EXPECT_TRUE(verdict.isThreat);
    EXPECT_TRUE(verdict.thresholdFallback);
    EXPECT_EQ(model->calls, 1);
}

TEST_F(ThreatDetectorTests, ConfirmedAttackBlocksAndAlerts)
{
    model->signals = ModelSignals{false, "SYN Flood", 0.9};

    EXPECT_TRUE(detector.evaluate(record(2000.0, 1e6)));

    EXPECT_TRUE(mitigation->isBlocked(H1_MAC, H2_MAC));
    EXPECT_EQ(channel->jobsWithPriority(AppConfig::DROP_PRIORITY).size(), 2u);

    ASSERT_EQ(bridge->alerts.size(), 1u);
    const auto& alert = bridge->alerts.front();
    EXPECT_EQ(alert.attackType, "SYN Flood");
    EXPECT_EQ(alert.attackerIp, "10.0.0.1");
    EXPECT_EQ(alert.targetIp, "10.0.0.2");
    EXPECT_EQ(alert.blockDurationSec, AppConfig::BLOCK_DURATION_SEC);

    auto j = nlohmann::json(alert);
    EXPECT_EQ(j.at("type"), "security_alert");
    EXPECT_EQ(j.at("attacker_mac"), "00:00:00:00:00:01");
    EXPECT_EQ(j.at("severity"), "CRITICAL");
    EXPECT_EQ(j.at("action_taken"), "BLOCKED");
}

// Three more identical detections inside the cooldown window publish nothing.
TEST_F(ThreatDetectorTests, OneAlertPerCooldownWindow)
{
    model->signals = ModelSignals{true, "SYN Flood", 0.95};

    EXPECT_TRUE(detector.evaluate(record(2000.0, 1e6)));
    for (int i = 0; i < 3; ++i)
    {
        scheduler->advance(1s);
        EXPECT_FALSE(detector.evaluate(record(2000.0, 1e6)));
    }
    EXPECT_EQ(bridge->alerts.size(), 1u);

    // Lift the block early: the cooldown alone still suppresses the alert.
    mitigation->unblock(H1_MAC, H2_MAC);
    EXPECT_FALSE(detector.evaluate(record(2000.0, 1e6)));
    EXPECT_TRUE(detector.inCooldown(H1_MAC, H2_MAC));
    EXPECT_EQ(bridge->alerts.size(), 1u);

    scheduler->advance(AppConfig::ALERT_COOLDOWN_SEC * 1s);
    EXPECT_FALSE(detector.inCooldown(H1_MAC, H2_MAC));
    EXPECT_TRUE(detector.evaluate(record(2000.0, 1e6)));
    EXPECT_EQ(bridge->alerts.size(), 2u);
}

TEST_F(ThreatDetectorTests, CooldownIsPerPair)
{
    model->signals = ModelSignals{true, "UDP Flood", 0.8};
    EXPECT_TRUE(detector.evaluate(record(2000.0, 1e6, H1_MAC, H2_MAC)));
    EXPECT_TRUE(detector.evaluate(record(2000.0, 1e6, H2_MAC, H1_MAC)));
    EXPECT_EQ(bridge->alerts.size(), 2u);
}

TEST_F(ThreatDetectorTests, BenignTrafficNeverAlerts)
{
    model->signals = ModelSignals{false, "Normal", 0.99};
    std::vector<FlowRecord> records{record(50.0, 4e4), record(10.0, 1e3, H2_MAC, H1_MAC)};
    EXPECT_EQ(detector.evaluate(records), 0u);
    EXPECT_TRUE(bridge->alerts.empty());
    EXPECT_TRUE(mitigation->blockedFlows().empty());
}

TEST_F(ThreatDetectorTests, SweepRemovesOnlyExpiredCooldowns)
{
    model->signals = ModelSignals{true, "SYN Flood", 0.95};
    detector.evaluate(record(2000.0, 1e6, H1_MAC, H2_MAC));
    scheduler->advance(5s);
    detector.evaluate(record(2000.0, 1e6, H2_MAC, H1_MAC));
    EXPECT_EQ(detector.activeAlerts().size(), 2u);

    scheduler->advance(6s);
    EXPECT_EQ(detector.sweepExpiredCooldowns(), 1u);
    EXPECT_EQ(detector.activeAlerts().size(), 1u);
    EXPECT_TRUE(detector.inCooldown(H2_MAC, H1_MAC));
}

TEST_F(ThreatDetectorTests, AlertWithoutBridgeStillBlocks)
{
    ThreatDetector standalone{model, mitigation, nullptr, scheduler, topology};
    model->signals = ModelSignals{true, "Port Scan", 0.7};
    EXPECT_TRUE(standalone.evaluate(record(10.0, 10.0)));
    EXPECT_TRUE(mitigation->isBlocked(H1_MAC, H2_MAC));
}

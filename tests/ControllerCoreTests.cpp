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
#include "sentinet_core/event_handling/ControllerCore.hpp"
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

using namespace std::chrono_literals;
using testdata::flowEntry;
using testdata::H1_MAC;
using testdata::H2_MAC;

class ControllerCoreTests : public ::testing::Test
{
  protected:
    std::shared_ptr<ControllerCore> makeCore(bool withNavigator)
    {
        std::shared_ptr<Navigator> navigator;
        if (withNavigator)
        {
            navigator = std::make_shared<Navigator>();
            navigator->initializeFromTopology(*topology);
        }
        ForwardingSettings settings;
        settings.navigatorEnabled = withNavigator;
        forwarding = std::make_shared<ForwardingEngine>(topology,
                                                        registry,
                                                        mitigation,
                                                        channel,
                                                        navigator,
                                                        settings);

        CoreComponents c;
        c.topology = topology;
        c.registry = registry;
        c.statsEngine = statsEngine;
        c.detector = detector;
        c.mitigation = mitigation;
        c.forwarding = forwarding;
        c.scheduler = scheduler;
        c.navigator = navigator;
        c.bridge = bridge;
        return std::make_shared<ControllerCore>(ioc, std::move(c), 5s);
    }

    boost::asio::io_context ioc;
    std::shared_ptr<const TopologyModel> topology = testdata::diamond();
    std::shared_ptr<FakeSwitchChannel> channel = std::make_shared<FakeSwitchChannel>();
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<SwitchRegistry> registry = std::make_shared<SwitchRegistry>(topology, channel);
    std::shared_ptr<FlowStatsEngine> statsEngine = std::make_shared<FlowStatsEngine>(topology);
    std::shared_ptr<MitigationManager> mitigation =
        std::make_shared<MitigationManager>(registry, channel, scheduler);
    std::shared_ptr<FakeThreatModel> model = std::make_shared<FakeThreatModel>();
    std::shared_ptr<FakeBridge> bridge = std::make_shared<FakeBridge>();
    std::shared_ptr<ThreatDetector> detector =
        std::make_shared<ThreatDetector>(model, mitigation, bridge, scheduler, topology);
    std::shared_ptr<ForwardingEngine> forwarding;
};

TEST_F(ControllerCoreTests, FirstSwitchUpPublishesTopologyOnce)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});
    core->dispatch(SwitchUp{4});

    ASSERT_EQ(bridge->topologies.size(), 1u);
    EXPECT_EQ(bridge->topologies[0].at("switches").size(), 4u);
    ASSERT_EQ(bridge->switchEvents.size(), 2u);
    EXPECT_EQ(bridge->switchEvents[0], std::make_pair(std::string("connected"), uint64_t{1}));
    EXPECT_EQ(bridge->switchEvents[1], std::make_pair(std::string("connected"), uint64_t{4}));
    EXPECT_TRUE(registry->isActive(4));
}

TEST_F(ControllerCoreTests, SwitchDownForgetsFlowSamples)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});
    core->dispatch(StatsReply{1, {flowEntry(H1_MAC, H2_MAC, 10, 640)}, Clock::now()});
    EXPECT_EQ(statsEngine->sampleCount(), 1u);

    core->dispatch(SwitchDown{1});
    EXPECT_EQ(statsEngine->sampleCount(), 0u);
    EXPECT_FALSE(registry->isActive(1));
    EXPECT_EQ(bridge->switchEvents.back(),
              std::make_pair(std::string("disconnected"), uint64_t{1}));

    // A second disconnect of the same switch is not reported again.
    core->dispatch(SwitchDown{1});
    EXPECT_EQ(bridge->switchEvents.size(), 2u);
}

TEST_F(ControllerCoreTests, StatsFromInactiveSwitchAreDropped)
{
    auto core = makeCore(false);
    core->dispatch(StatsReply{2, {flowEntry(H1_MAC, H2_MAC, 10, 640)}, Clock::now()});

    EXPECT_EQ(statsEngine->sampleCount(), 0u);
    EXPECT_TRUE(bridge->stats.empty());
}

TEST_F(ControllerCoreTests, FloodInStatsReplyIsBlockedAndAlerted)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});
    core->dispatch(SwitchUp{4});

    const TimePoint t0 = Clock::now();
    core->dispatch(StatsReply{1, {flowEntry(H1_MAC, H2_MAC, 0, 0)}, t0});
    EXPECT_TRUE(bridge->alerts.empty());

    core->dispatch(StatsReply{1, {flowEntry(H1_MAC, H2_MAC, 2000, 128000)}, t0 + 1s});

    ASSERT_EQ(bridge->stats.size(), 2u);
    EXPECT_EQ(bridge->stats[1].switchId, "s1");
    EXPECT_NEAR(bridge->stats[1].records.at(0).pps, 2000.0, 1e-6);

    ASSERT_EQ(bridge->alerts.size(), 1u);
    EXPECT_EQ(bridge->alerts[0].attackType, "Threshold Breach");
    EXPECT_TRUE(mitigation->isBlocked(H1_MAC, H2_MAC));
    EXPECT_EQ(channel->jobsWithPriority(AppConfig::DROP_PRIORITY).size(), 2u);
}

TEST_F(ControllerCoreTests, StatsReplyFeedsNavigatorWhenActive)
{
    auto core = makeCore(true);
    core->dispatch(SwitchUp{1});
    core->dispatch(StatsReply{1, {flowEntry(H1_MAC, H2_MAC, 0, 0, 2)}, Clock::now()});

    auto status = core->status();
    EXPECT_TRUE(status.at("navigator").at("active").get<bool>());
    auto links = core->navigatorLinks();
    ASSERT_TRUE(links.has_value());
    EXPECT_FALSE(links->empty());

    // One weight refresh decays epsilon once.
    EXPECT_NEAR(status.at("navigator").at("epsilon").get<double>(), 0.1 * 0.995, 1e-4);
}

TEST_F(ControllerCoreTests, SubmittedPacketInResolvesOnEventContext)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});

    PacketIn event;
    event.packet = PacketInfo{1, 1, H1_MAC, H2_MAC, 0x0800};
    auto future = core->submit(event);
    EXPECT_EQ(future.wait_for(0s), std::future_status::timeout);

    ioc.run();
    auto decision = future.get();
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->action, ForwardingAction::Flood);
    EXPECT_EQ(registry->lookupPort(1, H1_MAC), 1u);
}

TEST_F(ControllerCoreTests, AbandonedPacketInIsNotHandled)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});
    PacketIn reverse;
    reverse.packet = PacketInfo{1, 2, H2_MAC, H1_MAC, 0x0800};
    core->dispatch(reverse);
    const size_t rulesBefore = channel->installed.size();

    PacketIn event;
    event.packet = PacketInfo{1, 1, H1_MAC, H2_MAC, 0x0800};
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    auto future = core->submit(event, abandoned);
    abandoned->store(true);

    ioc.run();
    EXPECT_FALSE(future.get().has_value());
    EXPECT_EQ(channel->installed.size(), rulesBefore);
    EXPECT_FALSE(registry->lookupPort(1, H1_MAC).has_value());
}

TEST_F(ControllerCoreTests, PostedEventsRunInOrder)
{
    auto core = makeCore(false);
    core->post(SwitchUp{1});
    core->post(SwitchDown{1});
    EXPECT_TRUE(bridge->switchEvents.empty());

    ioc.run();
    ASSERT_EQ(bridge->switchEvents.size(), 2u);
    EXPECT_EQ(bridge->switchEvents[0].first, "connected");
    EXPECT_EQ(bridge->switchEvents[1].first, "disconnected");
}

TEST_F(ControllerCoreTests, BlockCommandByIpBlocksTowardOtherHosts)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});

    PendingCommand command;
    command.command = "block";
    command.targetIp = "10.0.0.2";
    command.durationSec = 30;
    bridge->commands.push_back(command);

    core->runMonitorCycle();

    EXPECT_EQ(bridge->polls, 1);
    EXPECT_TRUE(mitigation->isBlocked(H2_MAC, H1_MAC));
    EXPECT_FALSE(mitigation->isBlocked(H1_MAC, H2_MAC));
}

TEST_F(ControllerCoreTests, BlockCommandWithExplicitPair)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});

    PendingCommand command;
    command.command = "block";
    command.srcMac = H1_MAC;
    command.dstMac = H2_MAC;
    command.durationSec = 20;
    core->applyCommand(command);

    EXPECT_TRUE(mitigation->isBlocked(H1_MAC, H2_MAC));
    scheduler->advance(20s);
    EXPECT_FALSE(mitigation->isBlocked(H1_MAC, H2_MAC));
}

TEST_F(ControllerCoreTests, UnknownCommandsAndTargetsAreIgnored)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});

    PendingCommand reroute;
    reroute.command = "reroute";
    reroute.srcMac = H1_MAC;
    reroute.dstMac = H2_MAC;
    core->applyCommand(reroute);

    PendingCommand stranger;
    stranger.command = "block";
    stranger.targetIp = "192.168.1.50";
    stranger.durationSec = 30;
    core->applyCommand(stranger);

    EXPECT_TRUE(mitigation->blockedFlows().empty());
    EXPECT_TRUE(channel->jobsWithPriority(AppConfig::DROP_PRIORITY).empty());
}

TEST_F(ControllerCoreTests, CooldownSweepReschedulesUntilStopped)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});
    model->signals = ModelSignals{false, "SYN Flood", 0.9};

    FlowRecord flood;
    flood.srcMac = H1_MAC;
    flood.dstMac = H2_MAC;
    flood.pps = 5000.0;
    ASSERT_TRUE(detector->evaluate(flood));
    EXPECT_EQ(detector->activeAlerts().size(), 1u);

    core->startCooldownSweep();
    EXPECT_TRUE(scheduler->hasTask("cooldown-sweep"));

    scheduler->advance(15s);
    EXPECT_TRUE(scheduler->hasTask("cooldown-sweep"));
    EXPECT_EQ(detector->sweepExpiredCooldowns(), 0u);

    core->stopCooldownSweep();
    EXPECT_FALSE(scheduler->hasTask("cooldown-sweep"));
}

TEST_F(ControllerCoreTests, StatusSummarisesComponents)
{
    auto core = makeCore(false);
    core->dispatch(SwitchUp{1});
    core->dispatch(SwitchUp{4});

    PendingCommand command;
    command.command = "block";
    command.srcMac = H1_MAC;
    command.dstMac = H2_MAC;
    command.durationSec = 45;
    core->applyCommand(command);

    auto status = core->status();
    EXPECT_EQ(status.at("switches").size(), 2u);
    ASSERT_EQ(status.at("blocked_flows").size(), 1u);
    EXPECT_EQ(status.at("blocked_flows")[0].at("remaining_sec"), 45);
    EXPECT_TRUE(status.at("active_alerts").empty());
    EXPECT_EQ(status.at("flow_samples"), 0);
    EXPECT_FALSE(status.at("navigator").at("active").get<bool>());
    EXPECT_FALSE(core->navigatorLinks().has_value());
    EXPECT_EQ(status.at("link_utilization").size(), topology->links().size() * 2);
}

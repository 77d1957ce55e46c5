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
#include "sentinet_core/event_handling/SentinetService.hpp"
#include "utils/Utils.hpp"
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

using namespace std::chrono_literals;
using json = nlohmann::json;
namespace http = boost::beast::http;

namespace
{

constexpr unsigned short TEST_PORT = 18100;

} // namespace

class EventServerTests : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ForwardingSettings settings;
        settings.navigatorEnabled = false;
        auto forwarding = std::make_shared<ForwardingEngine>(topology,
                                                             registry,
                                                             mitigation,
                                                             channel,
                                                             nullptr,
                                                             settings);
        CoreComponents c;
        c.topology = topology;
        c.registry = registry;
        c.statsEngine = std::make_shared<FlowStatsEngine>(topology);
        c.detector = std::make_shared<ThreatDetector>(std::make_shared<FakeThreatModel>(),
                                                      mitigation,
                                                      bridge,
                                                      scheduler,
                                                      topology);
        c.mitigation = mitigation;
        c.forwarding = forwarding;
        c.scheduler = scheduler;
        c.bridge = bridge;
        core = std::make_shared<ControllerCore>(eventIoc, std::move(c), 5s);

        // The event context is only run where a test needs queued events handled.
        service = std::make_shared<SentinetService>(httpIoc, core, nullptr, TEST_PORT, 100ms);
        service->start();
    }

    void TearDown() override { service->stop(); }

    utils::HttpResult request(http::verb verb, const std::string& target, const std::string& body = "")
    {
        return utils::httpRequest("127.0.0.1", std::to_string(TEST_PORT), verb, target, body, 2s);
    }

    boost::asio::io_context eventIoc;
    boost::asio::io_context httpIoc;
    std::shared_ptr<const TopologyModel> topology = testdata::diamond();
    std::shared_ptr<FakeSwitchChannel> channel = std::make_shared<FakeSwitchChannel>();
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<SwitchRegistry> registry = std::make_shared<SwitchRegistry>(topology, channel);
    std::shared_ptr<MitigationManager> mitigation =
        std::make_shared<MitigationManager>(registry, channel, scheduler);
    std::shared_ptr<FakeBridge> bridge = std::make_shared<FakeBridge>();
    std::shared_ptr<ControllerCore> core;
    std::shared_ptr<SentinetService> service;
};

TEST_F(EventServerTests, MalformedBodyIsBadRequest)
{
    auto result = request(http::verb::post, "/sentinet/switch_up", R"({"dpid": "one"})");
    EXPECT_EQ(result.status, 400u);
    EXPECT_EQ(json::parse(result.body).at("error"), "Invalid switch_up payload");

    result = request(http::verb::post, "/sentinet/packet_in", "not json");
    EXPECT_EQ(result.status, 400u);

    eventIoc.run();
    EXPECT_TRUE(bridge->switchEvents.empty());
}

TEST_F(EventServerTests, UnknownRouteIsNotFound)
{
    EXPECT_EQ(request(http::verb::get, "/sentinet/unknown").status, 404u);
    // Known target, wrong method.
    EXPECT_EQ(request(http::verb::get, "/sentinet/switch_up").status, 404u);
    // Routing runs without a Navigator here.
    auto result = request(http::verb::get, "/sentinet/navigator/links");
    EXPECT_EQ(result.status, 404u);
    EXPECT_EQ(json::parse(result.body).at("error"), "Navigator disabled");
}

TEST_F(EventServerTests, SwitchUpIsAcceptedAndQueued)
{
    auto result = request(http::verb::post, "/sentinet/switch_up", R"({"dpid": 1})");
    EXPECT_EQ(result.status, 200u);
    EXPECT_EQ(json::parse(result.body).at("status"), "accepted");
    EXPECT_FALSE(registry->isActive(1));

    eventIoc.run();
    EXPECT_TRUE(registry->isActive(1));
    ASSERT_EQ(bridge->switchEvents.size(), 1u);
    EXPECT_EQ(bridge->switchEvents[0].first, "connected");
}

TEST_F(EventServerTests, StatusReportsCore)
{
    auto result = request(http::verb::get, "/sentinet/status");
    EXPECT_EQ(result.status, 200u);
    auto status = json::parse(result.body);
    EXPECT_EQ(status.at("flow_samples"), 0);
    EXPECT_TRUE(status.at("switches").empty());
    EXPECT_EQ(status.at("navigator").at("active"), false);
    EXPECT_FALSE(status.contains("bridge"));
}

TEST_F(EventServerTests, UnansweredPacketInTimesOutAndIsDropped)
{
    core->dispatch(SwitchUp{1});
    const size_t rulesBefore = channel->installed.size();

    auto result = request(http::verb::post,
                          "/sentinet/packet_in",
                          R"({"dpid": 1, "in_port": 1,
                              "eth_src": "00:00:00:00:00:01", "eth_dst": "00:00:00:00:00:02",
                              "eth_type": 2048})");
    EXPECT_EQ(result.status, 503u);

    eventIoc.run();
    EXPECT_EQ(channel->installed.size(), rulesBefore);
    EXPECT_FALSE(registry->lookupPort(1, testdata::H1_MAC).has_value());
}

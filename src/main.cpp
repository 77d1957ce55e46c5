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

#include "common_types/AppTypes.hpp"
#include "sentinet_core/bridge/BridgeGateway.hpp"
#include "sentinet_core/bridge/HttpBridgeTransport.hpp"
#include "sentinet_core/collection/FlowCsvLogger.hpp"
#include "sentinet_core/collection/FlowStatsEngine.hpp"
#include "sentinet_core/collection/FlowStatsPoller.hpp"
#include "sentinet_core/event_handling/ControllerCore.hpp"
#include "sentinet_core/event_handling/SentinetService.hpp"
#include "sentinet_core/forwarding/ForwardingEngine.hpp"
#include "sentinet_core/routing/Navigator.hpp"
#include "sentinet_core/scheduling/AsioTaskScheduler.hpp"
#include "sentinet_core/security/MitigationManager.hpp"
#include "sentinet_core/security/ThreatDetector.hpp"
#include "sentinet_core/security/ThreatModel.hpp"
#include "sentinet_core/southbound/RyuRestChannel.hpp"
#include "sentinet_core/switching/SwitchRegistry.hpp"
#include "sentinet_core/topology/TopologyModel.hpp"
#include "utils/AppConfig.hpp"
#include "utils/Logger.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> gShutdownRequested{false};

void
handleSigint(int)
{
    gShutdownRequested.store(true);
}

void
printUsage(const char* prog)
{
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --topology <file>      topology descriptor (default: built-in tree)\n"
              << "  --ryu-url <url>        Ryu ofctl_rest endpoint (default "
              << AppConfig::RYU_REST_URL << ")\n"
              << "  --bridge-host <host>   dashboard bridge host\n"
              << "  --bridge-port <port>   dashboard bridge port\n"
              << "  --no-bridge            do not talk to the dashboard bridge\n"
              << "  --no-navigator         learning-switch forwarding only\n"
              << "  --csv <file>           flow statistics CSV path\n"
              << "  --no-csv               disable CSV recording\n"
              << "  --port <port>          event server port (default " << SENTINET_PORT << ")\n"
              << "  --log-level <level>    trace|debug|info|warn|err|critical|off\n"
              << "  --log-file <file>      also log to a rotating file\n";
}

/**
 * @brief Fill the runtime configuration from the command line.
 * @return false when the program should exit (help requested or invalid flag).
 */
bool
parseControllerConfig(int argc, char* argv[], ControllerConfig& cfg)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--topology")
        {
            cfg.topologyFile = next();
        }
        else if (arg == "--ryu-url")
        {
            cfg.ryuRestUrl = next();
        }
        else if (arg == "--bridge-host")
        {
            cfg.bridgeHost = next();
        }
        else if (arg == "--bridge-port")
        {
            cfg.bridgePort = next();
        }
        else if (arg == "--no-bridge")
        {
            cfg.bridgeEnabled = false;
        }
        else if (arg == "--no-navigator")
        {
            cfg.navigatorEnabled = false;
        }
        else if (arg == "--csv")
        {
            cfg.csvEnabled = true;
            cfg.csvFile = next();
        }
        else if (arg == "--no-csv")
        {
            cfg.csvEnabled = false;
        }
        else if (arg == "--port")
        {
            cfg.eventServerPort = static_cast<unsigned short>(std::stoul(next()));
        }
        else if (arg == "--log-level" || arg == "--log-file")
        {
            // Consumed by Logger::parse_cli_args.
            next();
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return false;
        }
        else
        {
            throw std::invalid_argument("Unknown option " + arg);
        }
    }
    return true;
}

int
main(int argc, char* argv[])
{
    auto logCfg = Logger::parse_cli_args(argc, argv);
    Logger::init(logCfg);

    ControllerConfig cfg;
    try
    {
        if (!parseControllerConfig(argc, argv, cfg))
        {
            return 0;
        }
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "{}", e.what());
        printUsage(argv[0]);
        return 2;
    }

    std::shared_ptr<const TopologyModel> topology;
    try
    {
        if (cfg.topologyFile.empty())
        {
            SPDLOG_LOGGER_INFO(Logger::instance(), "No topology file given, using the built-in five-switch tree");
            topology = std::make_shared<TopologyModel>(TopologyModel::defaultTopology());
        }
        else
        {
            topology =
                std::make_shared<TopologyModel>(TopologyModel::loadFromFile(cfg.topologyFile));
        }
    }
    catch (const TopologyError& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Invalid topology: {}", e.what());
        return 1;
    }

    std::signal(SIGINT, handleSigint);
    std::signal(SIGTERM, handleSigint);

    boost::asio::io_context httpIoc;
    boost::asio::io_context eventIoc{1};
    auto eventWork = boost::asio::make_work_guard(eventIoc);

    auto channel = std::make_shared<RyuRestChannel>(cfg.ryuRestUrl);
    auto scheduler = std::make_shared<AsioTaskScheduler>(eventIoc);
    auto registry = std::make_shared<SwitchRegistry>(topology, channel);
    auto statsEngine = std::make_shared<FlowStatsEngine>(topology);
    auto mitigation = std::make_shared<MitigationManager>(registry, channel, scheduler);

    std::shared_ptr<Navigator> navigator;
    if (cfg.navigatorEnabled)
    {
        navigator = std::make_shared<Navigator>(cfg.navigator);
        navigator->initializeFromTopology(*topology);
        navigator->loadQTable(cfg.qTableFile);
    }

    std::shared_ptr<BridgeGateway> bridge;
    if (cfg.bridgeEnabled)
    {
        BridgeSettings bridgeSettings;
        bridgeSettings.defaultBlockDurationSec = cfg.blockDurationSec;
        bridge = std::make_shared<BridgeGateway>(
            std::make_shared<HttpBridgeTransport>(
                cfg.bridgeHost,
                cfg.bridgePort,
                std::chrono::milliseconds(AppConfig::BRIDGE_TIMEOUT_MS)),
            bridgeSettings);
    }

    std::shared_ptr<FlowCsvLogger> csvLogger;
    if (cfg.csvEnabled)
    {
        csvLogger = std::make_shared<FlowCsvLogger>(cfg.csvFile);
    }

    DetectorSettings detectorSettings;
    detectorSettings.cooldown = cfg.alertCooldown;
    detectorSettings.blockDurationSec = cfg.blockDurationSec;
    detectorSettings.ppsThreshold = cfg.ppsThreshold;
    detectorSettings.bpsThreshold = cfg.bpsThreshold;
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "No classification model loaded, using threshold detection "
                       "(pps > {}, bps > {})",
                       cfg.ppsThreshold,
                       cfg.bpsThreshold);
    auto detector = std::make_shared<ThreatDetector>(std::make_shared<NullThreatModel>(),
                                                     mitigation,
                                                     bridge,
                                                     scheduler,
                                                     topology,
                                                     detectorSettings);

    ForwardingSettings forwardingSettings;
    forwardingSettings.navigatorEnabled = cfg.navigatorEnabled;
    forwardingSettings.idleTimeoutSec = cfg.flowIdleTimeoutSec;
    forwardingSettings.hardTimeoutSec = cfg.flowHardTimeoutSec;
    forwardingSettings.navigatorIdleTimeoutSec = cfg.navigatorIdleTimeoutSec;
    auto forwarding = std::make_shared<ForwardingEngine>(topology,
                                                         registry,
                                                         mitigation,
                                                         channel,
                                                         navigator,
                                                         forwardingSettings);

    CoreComponents components;
    components.topology = topology;
    components.registry = registry;
    components.statsEngine = statsEngine;
    components.detector = detector;
    components.mitigation = mitigation;
    components.forwarding = forwarding;
    components.scheduler = scheduler;
    components.navigator = navigator;
    components.bridge = bridge;
    components.csvLogger = csvLogger;
    auto core = std::make_shared<ControllerCore>(eventIoc, components, cfg.cooldownSweepInterval);

    auto poller = std::make_shared<FlowStatsPoller>(
        registry,
        channel,
        cfg.pollInterval,
        [core]() { core->postMonitorCycle(); },
        [core](uint64_t dpid, std::vector<FlowStatEntry> entries, TimePoint at) {
            core->post(StatsReply{dpid, std::move(entries), at});
        });

    auto service =
        std::make_shared<SentinetService>(httpIoc, core, bridge, cfg.eventServerPort);

    std::thread eventThread([&eventIoc]() { eventIoc.run(); });

    channel->start();
    if (bridge)
    {
        bridge->start();
    }
    if (csvLogger)
    {
        csvLogger->start();
    }
    core->startCooldownSweep();

    int exitCode = 0;
    try
    {
        service->start();
        poller->start();
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Sentinet running (navigator {}, bridge {}, CSV {})",
                           cfg.navigatorEnabled ? "on" : "off",
                           cfg.bridgeEnabled ? cfg.bridgeHost + ":" + cfg.bridgePort : "off",
                           cfg.csvEnabled ? cfg.csvFile : "off");

        while (!gShutdownRequested.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        SPDLOG_LOGGER_INFO(Logger::instance(), "Shutdown requested. Cleaning up");
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Startup failed: {}", e.what());
        exitCode = 1;
    }

    poller->stop();
    service->stop();
    core->stopCooldownSweep();
    eventWork.reset();
    eventIoc.stop();
    if (eventThread.joinable())
    {
        eventThread.join();
    }
    if (bridge)
    {
        bridge->stop();
    }
    if (csvLogger)
    {
        csvLogger->stop();
    }
    channel->stop();

    if (navigator)
    {
        navigator->saveQTable(cfg.qTableFile);
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "All subsystems stopped. Exiting.");
    return exitCode;
}

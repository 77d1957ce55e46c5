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
#include "event_system/ControllerEvents.hpp"
#include "sentinet_core/bridge/BridgeCapabilities.hpp"
#include "sentinet_core/collection/FlowCsvLogger.hpp"
#include "sentinet_core/collection/FlowStatsEngine.hpp"
#include "sentinet_core/forwarding/ForwardingEngine.hpp"
#include "sentinet_core/routing/Navigator.hpp"
#include "sentinet_core/scheduling/TaskScheduler.hpp"
#include "sentinet_core/security/MitigationManager.hpp"
#include "sentinet_core/security/ThreatDetector.hpp"
#include "sentinet_core/switching/SwitchRegistry.hpp"
#include "sentinet_core/topology/TopologyModel.hpp"
#include "utils/AppConfig.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>

/**
 * @brief The components the controller core routes events through.
 *
 * navigator, bridge and csvLogger may be null (feature disabled).
 */
struct CoreComponents
{
    std::shared_ptr<const TopologyModel> topology;
    std::shared_ptr<SwitchRegistry> registry;
    std::shared_ptr<FlowStatsEngine> statsEngine;
    std::shared_ptr<ThreatDetector> detector;
    std::shared_ptr<MitigationManager> mitigation;
    std::shared_ptr<ForwardingEngine> forwarding;
    std::shared_ptr<TaskScheduler> scheduler;
    std::shared_ptr<Navigator> navigator;
    std::shared_ptr<BridgeCapabilities> bridge;
    std::shared_ptr<FlowCsvLogger> csvLogger;
};

/**
 * @brief Protocol state machine of the controller.
 *
 * Every ControllerEvent is handled by dispatch(); in production the events are posted to a
 * single-threaded io_context so handlers never run concurrently. dispatch() may also be
 * called directly (tests), as each component guards its own state.
 */
class ControllerCore : public std::enable_shared_from_this<ControllerCore>
{
  public:
    ControllerCore(boost::asio::io_context& eventContext,
                   CoreComponents components,
                   std::chrono::seconds cooldownSweepInterval =
                       std::chrono::seconds(AppConfig::COOLDOWN_SWEEP_INTERVAL_SEC));

    /**
     * @brief Handle one event on the calling thread.
     * @return The forwarding decision for PacketIn events, std::nullopt otherwise.
     */
    std::optional<ForwardingDecision> dispatch(const ControllerEvent& event);

    // Queue an event on the event context.
    void post(ControllerEvent event);
    /**
     * @brief Queue an event and obtain its result once the event context has handled it.
     *
     * If @p abandoned is set by the time the event reaches the front of the queue, the event
     * is discarded unhandled and the future yields std::nullopt. An event already being
     * handled runs to completion.
     */
    std::future<std::optional<ForwardingDecision>> submit(
        ControllerEvent event,
        std::shared_ptr<std::atomic<bool>> abandoned = nullptr);

    /**
     * @brief Once per polling cycle: fetch and apply an operator command from the bridge.
     */
    void runMonitorCycle();
    void postMonitorCycle();

    void applyCommand(const PendingCommand& command);

    // Periodically remove expired alert cooldowns via the scheduler.
    void startCooldownSweep();
    void stopCooldownSweep();

    nlohmann::json status() const;
    // Per-edge Navigator state, std::nullopt when routing runs without a Navigator.
    std::optional<nlohmann::json> navigatorLinks() const;

  private:
    std::optional<ForwardingDecision> handle(const SwitchUp& event);
    std::optional<ForwardingDecision> handle(const SwitchDown& event);
    std::optional<ForwardingDecision> handle(const PacketIn& event);
    std::optional<ForwardingDecision> handle(const StatsReply& event);

    void scheduleCooldownSweep();

    boost::asio::io_context& m_eventContext;
    CoreComponents m_c;
    std::chrono::seconds m_cooldownSweepInterval;
    std::atomic<bool> m_sweepActive{false};
};

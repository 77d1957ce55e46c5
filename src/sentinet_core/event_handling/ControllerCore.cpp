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

#include "sentinet_core/event_handling/ControllerCore.hpp"
#include "utils/Logger.hpp"                                // for Logger
#include "utils/Utils.hpp"                                 // for macToString
#include <boost/asio/post.hpp>                             // for post
#include <exception>                                       // for exception, ...

using json = nlohmann::json;

namespace
{
const char* const kCooldownSweepKey = "cooldown-sweep";
} // namespace

ControllerCore::ControllerCore(boost::asio::io_context& eventContext,
                               CoreComponents components,
                               std::chrono::seconds cooldownSweepInterval)
    : m_eventContext(eventContext),
      m_c(std::move(components)),
      m_cooldownSweepInterval(cooldownSweepInterval)
{
}

std::optional<ForwardingDecision>
ControllerCore::dispatch(const ControllerEvent& event)
{
    return std::visit([this](const auto& e) { return handle(e); }, event);
}

void
ControllerCore::post(ControllerEvent event)
{
    boost::asio::post(m_eventContext, [self = shared_from_this(), event = std::move(event)]() {
        try
        {
            self->dispatch(event);
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Event handling failed: {}", e.what());
        }
    });
}

std::future<std::optional<ForwardingDecision>>
ControllerCore::submit(ControllerEvent event, std::shared_ptr<std::atomic<bool>> abandoned)
{
    auto promise = std::make_shared<std::promise<std::optional<ForwardingDecision>>>();
    auto future = promise->get_future();
    boost::asio::post(
        m_eventContext,
        [self = shared_from_this(), promise, abandoned = std::move(abandoned), event = std::move(event)]() {
            if (abandoned && abandoned->load())
            {
                SPDLOG_LOGGER_DEBUG(Logger::instance(), "Discarding event abandoned by its caller");
                promise->set_value(std::nullopt);
                return;
            }
            try
            {
                promise->set_value(self->dispatch(event));
            }
            catch (const std::exception& e)
            {
                SPDLOG_LOGGER_ERROR(Logger::instance(), "Event handling failed: {}", e.what());
                promise->set_exception(std::current_exception());
            }
        });
    return future;
}

std::optional<ForwardingDecision>
ControllerCore::handle(const SwitchUp& event)
{
    const bool firstSwitch = m_c.registry->handleConnect(event.dpid);
    if (m_c.bridge)
    {
        if (firstSwitch)
        {
            m_c.bridge->publishTopology(m_c.topology->toJson());
        }
        m_c.bridge->publishSwitchEvent("connected", event.dpid);
    }
    return std::nullopt;
}

std::optional<ForwardingDecision>
ControllerCore::handle(const SwitchDown& event)
{
    if (!m_c.registry->handleDisconnect(event.dpid))
    {
        return std::nullopt;
    }
    m_c.statsEngine->forgetSwitch(event.dpid);
    if (m_c.bridge)
    {
        m_c.bridge->publishSwitchEvent("disconnected", event.dpid);
    }
    return std::nullopt;
}

std::optional<ForwardingDecision>
ControllerCore::handle(const PacketIn& event)
{
    return m_c.forwarding->handlePacketIn(event.packet);
}

std::optional<ForwardingDecision>
ControllerCore::handle(const StatsReply& event)
{
    if (!m_c.registry->isActive(event.dpid))
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Dropping stats reply from inactive dpid {}",
                            event.dpid);
        return std::nullopt;
    }

    const std::string switchId = m_c.registry->switchIdFor(event.dpid);
    auto records =
        m_c.statsEngine->processReply(event.dpid, switchId, event.entries, event.receivedAt);

    if (m_c.csvLogger)
    {
        m_c.csvLogger->record(records);
    }
    if (m_c.bridge)
    {
        m_c.bridge->publishStats(switchId, event.dpid, records);
    }

    m_c.detector->evaluate(records);

    if (m_c.forwarding->navigatorActive())
    {
        m_c.navigator->updateLinkWeights(m_c.statsEngine->linkUtilization());
    }
    return std::nullopt;
}

void
ControllerCore::runMonitorCycle()
{
    if (!m_c.bridge)
    {
        return;
    }
    if (auto command = m_c.bridge->pollPendingCommand())
    {
        applyCommand(*command);
    }
}

void
ControllerCore::postMonitorCycle()
{
    boost::asio::post(m_eventContext, [self = shared_from_this()]() {
        try
        {
            self->runMonitorCycle();
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Monitor cycle failed: {}", e.what());
        }
    });
}

void
ControllerCore::applyCommand(const PendingCommand& command)
{
    if (command.command != "block")
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Ignoring unknown command '{}'", command.command);
        return;
    }

    if (command.srcMac && command.dstMac)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Operator block {} -> {}",
                           utils::macToString(*command.srcMac),
                           utils::macToString(*command.dstMac));
        m_c.mitigation->block(*command.srcMac, *command.dstMac, command.durationSec);
        return;
    }

    std::optional<uint64_t> target = command.targetMac;
    if (!target && !command.targetIp.empty())
    {
        if (auto host = m_c.topology->hostByIp(command.targetIp))
        {
            target = host->mac;
        }
    }
    if (!target)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Block command target '{}' does not resolve to a known host",
                           command.targetIp);
        return;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Operator block of host {} for {}s",
                       utils::macToString(*target),
                       command.durationSec);
    for (const auto& host : m_c.topology->hosts())
    {
        if (host.mac != *target)
        {
            m_c.mitigation->block(*target, host.mac, command.durationSec);
        }
    }
}

void
ControllerCore::startCooldownSweep()
{
    m_sweepActive = true;
    scheduleCooldownSweep();
}

void
ControllerCore::stopCooldownSweep()
{
    m_sweepActive = false;
    m_c.scheduler->cancel(kCooldownSweepKey);
}

void
ControllerCore::scheduleCooldownSweep()
{
    m_c.scheduler->scheduleAfter(
        kCooldownSweepKey,
        std::chrono::duration_cast<std::chrono::milliseconds>(m_cooldownSweepInterval),
        [this]() {
            const size_t removed = m_c.detector->sweepExpiredCooldowns();
            if (removed > 0)
            {
                SPDLOG_LOGGER_DEBUG(Logger::instance(), "Expired {} alert cooldowns", removed);
            }
            if (m_sweepActive)
            {
                scheduleCooldownSweep();
            }
        });
}

json
ControllerCore::status() const
{
    json j;
    j["switches"] = m_c.registry->toJson();
    j["blocked_flows"] = m_c.mitigation->toJson();
    j["active_alerts"] = m_c.detector->activeAlerts();
    j["flow_samples"] = m_c.statsEngine->sampleCount();

    json utilization = json::array();
    for (const auto& [link, bps] : m_c.statsEngine->linkUtilization())
    {
        utilization.push_back({{"from", link.first}, {"to", link.second}, {"bps", bps}});
    }
    j["link_utilization"] = utilization;

    if (m_c.navigator)
    {
        j["navigator"] = m_c.navigator->status();
        j["navigator"]["active"] = m_c.forwarding->navigatorActive();
    }
    else
    {
        j["navigator"] = {{"active", false}};
    }
    return j;
}

std::optional<json>
ControllerCore::navigatorLinks() const
{
    if (!m_c.navigator)
    {
        return std::nullopt;
    }
    return m_c.navigator->linkInfo();
}

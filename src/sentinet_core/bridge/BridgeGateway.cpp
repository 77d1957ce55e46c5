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

#include "sentinet_core/bridge/BridgeGateway.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;

namespace
{
constexpr const char* TOPOLOGY_TARGET = "/api/topology";
constexpr const char* STATS_TARGET = "/api/stats";
constexpr const char* ALERT_TARGET = "/api/alert";
constexpr const char* SWITCH_EVENT_TARGET = "/api/switch_event";
constexpr const char* PENDING_COMMAND_TARGET = "/api/control/pending";

double
nowSeconds()
{
    return utils::getCurrentTimeMillisSystemClock() / 1000.0;
}

std::optional<uint64_t>
optionalMac(const json& j, const char* key)
{
    if (j.contains(key) && j.at(key).is_string())
    {
        return utils::macToUint64(j.at(key).get<std::string>());
    }
    return std::nullopt;
}
} // namespace

std::optional<PendingCommand>
parsePendingCommand(const json& j, int defaultDurationSec)
{
    if (!j.is_object() || !j.contains("command") || !j.at("command").is_string())
    {
        return std::nullopt;
    }

    PendingCommand command;
    command.command = j.at("command").get<std::string>();
    command.srcMac = optionalMac(j, "src_mac");
    command.dstMac = optionalMac(j, "dst_mac");
    command.targetMac = optionalMac(j, "mac");
    if (j.contains("ip") && j.at("ip").is_string())
    {
        command.targetIp = j.at("ip").get<std::string>();
    }
    command.durationSec = defaultDurationSec;
    if (j.contains("duration") && j.at("duration").is_number())
    {
        command.durationSec = j.at("duration").get<int>();
    }
    return command;
}

BridgeGateway::BridgeGateway(std::shared_ptr<BridgeTransport> transport, BridgeSettings settings)
    : m_transport(std::move(transport)),
      m_settings(settings)
{
    if (m_settings.queueCapacity == 0)
    {
        m_settings.queueCapacity = 1;
    }
    if (m_settings.inboxCapacity == 0)
    {
        m_settings.inboxCapacity = 1;
    }
}

BridgeGateway::~BridgeGateway()
{
    stop();
}

void
BridgeGateway::start()
{
    if (m_running.exchange(true))
    {
        return;
    }
    m_thread = std::thread(&BridgeGateway::run, this);
    SPDLOG_LOGGER_INFO(Logger::instance(), "BridgeGateway started.");
}

void
BridgeGateway::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.exchange(false))
        {
            return;
        }
    }
    m_cv.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
    }
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "BridgeGateway stopped ({} sent, {} failed, {} dropped, {} unsent).",
                       m_sent.load(),
                       m_failed.load(),
                       m_dropped.load(),
                       queueSize());
}

void
BridgeGateway::publishTopology(const json& topology)
{
    enqueue(BridgeMessage{MessageKind::Publish, TOPOLOGY_TARGET, topology});
    SPDLOG_LOGGER_INFO(Logger::instance(), "[BRIDGE] Topology queued for sending");
}

void
BridgeGateway::publishStats(const std::string& switchId,
                            uint64_t dpid,
                            const std::vector<FlowRecord>& records)
{
    json body{{"type", "stats_update"},
              {"timestamp", nowSeconds()},
              {"data", {{"dpid", dpid}, {"switch", switchId}, {"flows", records}}}};
    enqueue(BridgeMessage{MessageKind::Publish, STATS_TARGET, std::move(body)});
}

void
BridgeGateway::publishAlert(const SecurityAlert& alert)
{
    enqueue(BridgeMessage{MessageKind::Publish, ALERT_TARGET, json(alert)});
    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "[BRIDGE] Alert queued: {} {} -> {}",
                       alert.attackType,
                       utils::macToString(alert.attackerMac),
                       utils::macToString(alert.targetMac));
}

void
BridgeGateway::publishSwitchEvent(const std::string& event, uint64_t dpid)
{
    json body{{"type", "switch_event"}, {"timestamp", nowSeconds()}, {"event", event}, {"dpid", dpid}};
    enqueue(BridgeMessage{MessageKind::Publish, SWITCH_EVENT_TARGET, std::move(body)});
}

std::optional<PendingCommand>
BridgeGateway::pollPendingCommand()
{
    std::optional<PendingCommand> command;
    bool requestPoll = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_inbox.empty())
        {
            command = std::move(m_inbox.front());
            m_inbox.pop_front();
        }
        if (!m_pollPending)
        {
            m_pollPending = true;
            requestPoll = true;
        }
    }
    if (requestPoll)
    {
        enqueue(BridgeMessage{MessageKind::PollCommand, PENDING_COMMAND_TARGET, json()});
    }
    return command;
}

void
BridgeGateway::enqueue(BridgeMessage message)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.size() >= m_settings.queueCapacity)
        {
            if (m_queue.front().kind == MessageKind::PollCommand)
            {
                m_pollPending = false;
            }
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "[BRIDGE] Queue full, dropping oldest message for {}",
                               m_queue.front().target);
            m_queue.pop_front();
            ++m_dropped;
        }
        m_queue.push_back(std::move(message));
    }
    m_cv.notify_one();
}

bool
BridgeGateway::processNext()
{
    BridgeMessage message;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty())
        {
            return false;
        }
        message = std::move(m_queue.front());
        m_queue.pop_front();
    }

    deliver(message);

    if (message.kind == MessageKind::PollCommand)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pollPending = false;
    }
    return true;
}

bool
BridgeGateway::deliver(const BridgeMessage& message)
{
    auto backoff = m_settings.initialBackoff;
    for (int attempt = 0; attempt <= m_settings.maxRetries; ++attempt)
    {
        try
        {
            if (message.kind == MessageKind::PollCommand)
            {
                handleCommandReply(m_transport->get(message.target));
            }
            else
            {
                m_transport->post(message.target, message.body);
            }
            ++m_sent;
            return true;
        }
        catch (const BridgeRejectedError& e)
        {
            ++m_failed;
            SPDLOG_LOGGER_WARN(Logger::instance(), "[BRIDGE] {} rejected: {}", message.target, e.what());
            return false;
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "[BRIDGE] {} attempt {} failed: {}",
                                message.target,
                                attempt + 1,
                                e.what());
        }

        if (attempt < m_settings.maxRetries && m_running.load())
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_for(lock, backoff, [this] { return !m_running.load(); }))
            {
                break;
            }
            backoff *= 2;
        }
    }

    ++m_failed;
    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "[BRIDGE] Giving up on {} after {} attempts",
                       message.target,
                       m_settings.maxRetries + 1);
    return false;
}

void
BridgeGateway::handleCommandReply(const json& reply)
{
    std::optional<PendingCommand> command;
    try
    {
        command = parsePendingCommand(reply, m_settings.defaultBlockDurationSec);
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "[BRIDGE] Malformed pending command: {}", e.what());
        return;
    }
    if (!command.has_value())
    {
        return;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "[BRIDGE] Received command '{}'", command->command);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inbox.size() >= m_settings.inboxCapacity)
    {
        m_inbox.pop_front();
        ++m_dropped;
    }
    m_inbox.push_back(std::move(command.value()));
}

void
BridgeGateway::run()
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_running.load() || !m_queue.empty(); });
            if (!m_running.load())
            {
                break;
            }
        }
        processNext();
    }
}

size_t
BridgeGateway::queueSize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

json
BridgeGateway::status() const
{
    return json{{"queue_size", queueSize()},
                {"sent", m_sent.load()},
                {"failed", m_failed.load()},
                {"dropped", m_dropped.load()},
                {"running", m_running.load()}};
}

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
#include "sentinet_core/bridge/BridgeCapabilities.hpp"
#include "sentinet_core/bridge/HttpBridgeTransport.hpp"
#include "utils/AppConfig.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

struct BridgeSettings
{
    size_t queueCapacity = AppConfig::BRIDGE_QUEUE_CAPACITY;
    size_t inboxCapacity = AppConfig::BRIDGE_INBOX_CAPACITY;
    int maxRetries = AppConfig::BRIDGE_MAX_RETRIES;
    std::chrono::milliseconds initialBackoff{AppConfig::BRIDGE_INITIAL_BACKOFF_MS};
    int defaultBlockDurationSec = AppConfig::BLOCK_DURATION_SEC;
};

/**
 * @brief Non-blocking BridgeCapabilities: a bounded outbound queue drained by one worker.
 *
 * When the queue is full the oldest message is dropped and counted. Failed deliveries are
 * retried with exponential backoff up to maxRetries times, then discarded. Command polls are
 * coalesced (at most one pending) and their results land in a bounded inbox that
 * pollPendingCommand() drains.
 */
class BridgeGateway : public BridgeCapabilities
{
  public:
    BridgeGateway(std::shared_ptr<BridgeTransport> transport, BridgeSettings settings = {});
    ~BridgeGateway() override;

    void start();
    void stop();

    void publishTopology(const nlohmann::json& topology) override;
    void publishStats(const std::string& switchId,
                      uint64_t dpid,
                      const std::vector<FlowRecord>& records) override;
    void publishAlert(const SecurityAlert& alert) override;
    void publishSwitchEvent(const std::string& event, uint64_t dpid) override;
    std::optional<PendingCommand> pollPendingCommand() override;

    /**
     * @brief Deliver the oldest queued message on the calling thread.
     * @return false when the queue was empty.
     */
    bool processNext();

    size_t queueSize() const;
    uint64_t droppedCount() const { return m_dropped.load(); }
    uint64_t failedCount() const { return m_failed.load(); }
    uint64_t sentCount() const { return m_sent.load(); }
    nlohmann::json status() const;

  private:
    enum class MessageKind
    {
        Publish,
        PollCommand
    };

    struct BridgeMessage
    {
        MessageKind kind = MessageKind::Publish;
        std::string target;
        nlohmann::json body;
    };

    void enqueue(BridgeMessage message);
    bool deliver(const BridgeMessage& message);
    void handleCommandReply(const nlohmann::json& reply);
    void run();

    std::shared_ptr<BridgeTransport> m_transport;
    BridgeSettings m_settings;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<BridgeMessage> m_queue;
    std::deque<PendingCommand> m_inbox;
    bool m_pollPending = false;

    std::atomic<bool> m_running{false};
    std::thread m_thread;

    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_sent{0};
};

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
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class ControllerCore;
class BridgeGateway;

#define SENTINET_PORT 8100

/**
 * @brief HTTP event server the Ryu shim posts southbound events to.
 *
 * Owns the acceptor and a pool of threads running the HTTP io_context. Each accepted
 * connection is served by an OpenFlowEventSession.
 */
class SentinetService : public std::enable_shared_from_this<SentinetService>
{
  public:
    SentinetService(boost::asio::io_context& ioc,
                    std::shared_ptr<ControllerCore> core,
                    std::shared_ptr<BridgeGateway> bridge,
                    unsigned short port = SENTINET_PORT,
                    std::chrono::milliseconds decisionTimeout = std::chrono::milliseconds(2000));
    ~SentinetService();

    void start();
    void stop();

  private:
    void runServer();
    void doAccept();
    void pokeAcceptor();

    std::atomic<bool> m_serverRunning{false};
    boost::asio::io_context& m_ioContext;
    unsigned short m_port;
    std::chrono::milliseconds m_decisionTimeout;

    std::unique_ptr<boost::asio::ip::tcp::acceptor> m_serverAcceptor;
    std::thread m_serverThread;

    std::shared_ptr<ControllerCore> m_core;
    std::shared_ptr<BridgeGateway> m_bridge;
};

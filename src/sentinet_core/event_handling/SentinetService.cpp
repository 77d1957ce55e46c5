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

#include "sentinet_core/event_handling/SentinetService.hpp"
#include "sentinet_core/http/OpenFlowEventSession.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <exception>

namespace net = boost::asio;
using tcp = net::ip::tcp;

SentinetService::SentinetService(boost::asio::io_context& ioc,
                                 std::shared_ptr<ControllerCore> core,
                                 std::shared_ptr<BridgeGateway> bridge,
                                 unsigned short port,
                                 std::chrono::milliseconds decisionTimeout)
    : m_ioContext(ioc),
      m_port(port),
      m_decisionTimeout(decisionTimeout),
      m_core(std::move(core)),
      m_bridge(std::move(bridge))
{
}

SentinetService::~SentinetService()
{
    stop();
}

void
SentinetService::start()
{
    if (m_serverRunning.exchange(true))
    {
        return;
    }
    // Throws boost::system::system_error when the port is taken.
    m_serverAcceptor = std::make_unique<tcp::acceptor>(m_ioContext, tcp::endpoint{tcp::v4(), m_port});
    m_serverThread = std::thread(&SentinetService::runServer, this);
}

void
SentinetService::stop()
{
    if (!m_serverRunning.exchange(false))
    {
        return;
    }

    m_ioContext.stop();

    if (m_serverAcceptor)
    {
        boost::system::error_code ec;
        m_serverAcceptor->close(ec);
        if (ec && ec != net::error::operation_aborted && ec != net::error::bad_descriptor)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(), "acceptor close error: {}", ec.message());
        }
    }

    pokeAcceptor();

    if (m_serverThread.joinable())
    {
        m_serverThread.join();
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "SentinetService stopped.");
}

void
SentinetService::pokeAcceptor()
{
    // A blocked accept() on some platforms only returns once a connection arrives.
    try
    {
        net::io_context pokeIoContext;
        tcp::socket pokeSocket(pokeIoContext);
        tcp::endpoint endPoint(net::ip::make_address("127.0.0.1"), m_port);
        boost::system::error_code ec;
        pokeSocket.connect(endPoint, ec);
        if (!ec)
        {
            pokeSocket.close(ec);
        }
        else if (ec != net::error::connection_refused)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(), "Poke connection failed: {}", ec.message());
        }
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Exception during poke attempt: {}", e.what());
    }
}

void
SentinetService::runServer()
{
    SPDLOG_LOGGER_INFO(Logger::instance(), "Event server listening on port {}", m_port);

    doAccept();

    // packet_in requests block a pool thread until the core answers, so keep at least two.
    const unsigned threadCount = std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> threadPool;
    for (unsigned i = 0; i < threadCount; ++i)
    {
        threadPool.emplace_back([this]() { m_ioContext.run(); });
    }
    for (auto& t : threadPool)
    {
        t.join();
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Event server loop exited");
}

void
SentinetService::doAccept()
{
    auto sock = std::make_shared<tcp::socket>(m_ioContext);

    m_serverAcceptor->async_accept(*sock, [this, sock](boost::system::error_code ec) {
        if (!ec && m_serverRunning.load())
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Accepted new connection");
            std::make_shared<OpenFlowEventSession>(std::move(*sock),
                                                   m_core,
                                                   m_bridge,
                                                   m_decisionTimeout)
                ->start();
        }
        else if (ec && ec != net::error::operation_aborted)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(), "Accept failed: {}", ec.message());
        }

        if (m_serverRunning.load())
        {
            doAccept();
        }
    });
}

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

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

class ControllerCore;
class BridgeGateway;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @class OpenFlowEventSession
 * @brief One HTTP connection from the Ryu shim (or an operator) to the event server.
 *
 * Reads requests with Boost.Beast, turns the southbound ones into ControllerEvents for the
 * ControllerCore and writes a JSON reply. Keeps itself alive through shared_from_this()
 * during asynchronous operations.
 */
class OpenFlowEventSession : public std::enable_shared_from_this<OpenFlowEventSession>
{
  public:
    OpenFlowEventSession(tcp::socket socket,
                         std::shared_ptr<ControllerCore> core,
                         std::shared_ptr<BridgeGateway> bridge,
                         std::chrono::milliseconds decisionTimeout);

    void start();

  private:
    void readRequest();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void writeResponse();
    void onWrite(beast::error_code ec, std::size_t bytesTransferred);
    void closeSocket();

    void handleRequest();

    void handleSwitchUp(http::response<http::string_body>& res);
    void handleSwitchDown(http::response<http::string_body>& res);
    void handlePacketIn(http::response<http::string_body>& res);
    void handleStatsReply(http::response<http::string_body>& res);
    void handleGetStatus(http::response<http::string_body>& res);
    void handleGetNavigatorLinks(http::response<http::string_body>& res);
    void handleNotFound(http::response<http::string_body>& res);

    tcp::socket m_socket;
    beast::flat_buffer m_buffer;
    http::request<http::string_body> m_req;
    std::shared_ptr<http::response<http::string_body>> m_res;

    std::shared_ptr<ControllerCore> m_core;
    std::shared_ptr<BridgeGateway> m_bridge;
    std::chrono::milliseconds m_decisionTimeout;
};

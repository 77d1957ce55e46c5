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

#include "sentinet_core/http/OpenFlowEventSession.hpp"
#include "event_system/EventParser.hpp"
#include "sentinet_core/bridge/BridgeGateway.hpp"
#include "sentinet_core/event_handling/ControllerCore.hpp"
#include "utils/Logger.hpp"
#include <string_view>

using json = nlohmann::json;

OpenFlowEventSession::OpenFlowEventSession(tcp::socket socket,
                                           std::shared_ptr<ControllerCore> core,
                                           std::shared_ptr<BridgeGateway> bridge,
                                           std::chrono::milliseconds decisionTimeout)
    : m_socket(std::move(socket)),
      m_core(std::move(core)),
      m_bridge(std::move(bridge)),
      m_decisionTimeout(decisionTimeout)
{
}

void
OpenFlowEventSession::start()
{
    readRequest();
}

void
OpenFlowEventSession::readRequest()
{
    m_req = {};
    http::async_read(
        m_socket,
        m_buffer,
        m_req,
        beast::bind_front_handler(&OpenFlowEventSession::onRead, shared_from_this()));
}

void
OpenFlowEventSession::onRead(beast::error_code ec, std::size_t bytesTransferred)
{
    boost::ignore_unused(bytesTransferred);

    if (ec == http::error::end_of_stream)
    {
        return closeSocket();
    }
    if (ec)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Read error: {}", ec.message());
        return;
    }

    handleRequest();
}

void
OpenFlowEventSession::handleRequest()
{
    SPDLOG_LOGGER_TRACE(Logger::instance(),
                        "Got request: {} {}",
                        std::string_view(m_req.method_string().data(), m_req.method_string().size()),
                        std::string_view(m_req.target().data(), m_req.target().size()));

    auto response =
        std::make_shared<http::response<http::string_body>>(http::status::ok, m_req.version());
    response->keep_alive(m_req.keep_alive());
    response->set(http::field::server, "sentinet");
    response->set(http::field::access_control_allow_origin, "*");
    response->set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    response->set(http::field::access_control_allow_headers, "Content-Type");
    response->set(http::field::content_type, "application/json");

    try
    {
        const auto method = m_req.method();
        const std::string_view target(m_req.target().data(), m_req.target().size());

        if (method == http::verb::options)
        {
            response->result(http::status::no_content);
        }
        else if (method == http::verb::post && target == "/sentinet/switch_up")
        {
            handleSwitchUp(*response);
        }
        else if (method == http::verb::post && target == "/sentinet/switch_down")
        {
            handleSwitchDown(*response);
        }
        else if (method == http::verb::post && target == "/sentinet/packet_in")
        {
            handlePacketIn(*response);
        }
        else if (method == http::verb::post && target == "/sentinet/stats_reply")
        {
            handleStatsReply(*response);
        }
        else if (method == http::verb::get && target == "/sentinet/status")
        {
            handleGetStatus(*response);
        }
        else if (method == http::verb::get && target == "/sentinet/navigator/links")
        {
            handleGetNavigatorLinks(*response);
        }
        else
        {
            handleNotFound(*response);
        }
    }
    catch (const json::exception& e)
    {
        response->result(http::status::bad_request);
        response->body() = json{{"error", "JSON parsing error"}, {"details", e.what()}}.dump();
        SPDLOG_LOGGER_ERROR(Logger::instance(), "JSON exception in request handler: {}", e.what());
    }
    catch (const std::exception& e)
    {
        response->result(http::status::internal_server_error);
        response->body() = json{{"error", "Internal server error"}, {"details", e.what()}}.dump();
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Exception in request handler: {}", e.what());
    }

    m_res = response;
    writeResponse();
}

void
OpenFlowEventSession::writeResponse()
{
    m_res->prepare_payload();
    SPDLOG_LOGGER_TRACE(Logger::instance(),
                        "Server reply with status {}: {}",
                        m_res->result_int(),
                        m_res->body());
    http::async_write(
        m_socket,
        *m_res,
        beast::bind_front_handler(&OpenFlowEventSession::onWrite, shared_from_this()));
}

void
OpenFlowEventSession::onWrite(beast::error_code ec, std::size_t bytesTransferred)
{
    boost::ignore_unused(bytesTransferred);

    if (ec)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Write error: {}", ec.message());
        return;
    }

    if (!m_res->keep_alive())
    {
        closeSocket();
        return;
    }

    m_res.reset();
    readRequest();
}

void
OpenFlowEventSession::closeSocket()
{
    beast::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_send, ec);
}

void
OpenFlowEventSession::handleSwitchUp(http::response<http::string_body>& res)
{
    auto event = parseSwitchUp(m_req.body());
    if (!event)
    {
        res.result(http::status::bad_request);
        res.body() = json{{"error", "Invalid switch_up payload"}}.dump();
        return;
    }
    m_core->post(*event);
    res.body() = json{{"status", "accepted"}}.dump();
}

void
OpenFlowEventSession::handleSwitchDown(http::response<http::string_body>& res)
{
    auto event = parseSwitchDown(m_req.body());
    if (!event)
    {
        res.result(http::status::bad_request);
        res.body() = json{{"error", "Invalid switch_down payload"}}.dump();
        return;
    }
    m_core->post(*event);
    res.body() = json{{"status", "accepted"}}.dump();
}

void
OpenFlowEventSession::handlePacketIn(http::response<http::string_body>& res)
{
    auto event = parsePacketIn(m_req.body());
    if (!event)
    {
        res.result(http::status::bad_request);
        res.body() = json{{"error", "Invalid packet_in payload"}}.dump();
        return;
    }

    // The shim waits for the decision to emit the packet-out.
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    auto future = m_core->submit(*event, abandoned);
    if (future.wait_for(m_decisionTimeout) != std::future_status::ready)
    {
        abandoned->store(true);
        res.result(http::status::service_unavailable);
        res.body() = json{{"error", "Forwarding decision timed out"}}.dump();
        return;
    }

    auto decision = future.get();
    res.body() = json(decision.value_or(ForwardingDecision::ignore())).dump();
}

void
OpenFlowEventSession::handleStatsReply(http::response<http::string_body>& res)
{
    auto event = parseStatsReply(m_req.body());
    if (!event)
    {
        res.result(http::status::bad_request);
        res.body() = json{{"error", "Invalid stats_reply payload"}}.dump();
        return;
    }
    m_core->post(std::move(*event));
    res.body() = json{{"status", "accepted"}}.dump();
}

void
OpenFlowEventSession::handleGetStatus(http::response<http::string_body>& res)
{
    json status = m_core->status();
    if (m_bridge)
    {
        status["bridge"] = m_bridge->status();
    }
    res.body() = status.dump();
}

void
OpenFlowEventSession::handleGetNavigatorLinks(http::response<http::string_body>& res)
{
    auto links = m_core->navigatorLinks();
    if (!links)
    {
        res.result(http::status::not_found);
        res.body() = json{{"error", "Navigator disabled"}}.dump();
        return;
    }
    res.body() = links->dump();
}

void
OpenFlowEventSession::handleNotFound(http::response<http::string_body>& res)
{
    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "Received unsupported request: method={}, target={}",
                       std::string_view(m_req.method_string().data(), m_req.method_string().size()),
                       std::string_view(m_req.target().data(), m_req.target().size()));
    res.result(http::status::not_found);
    res.body() = json{{"error", "Not Found"}}.dump();
}

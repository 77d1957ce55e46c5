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

#include "sentinet_core/bridge/HttpBridgeTransport.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <stdexcept>

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace
{

void
throwOnStatus(const char* method, const std::string& target, int status)
{
    std::string what = std::string(method) + " " + target + " returned HTTP " + std::to_string(status);
    if (status >= 400 && status < 500)
    {
        throw BridgeRejectedError(what, status);
    }
    throw std::runtime_error(what);
}

} // namespace

HttpBridgeTransport::HttpBridgeTransport(std::string host,
                                         std::string port,
                                         std::chrono::milliseconds timeout)
    : m_host(std::move(host)),
      m_port(std::move(port)),
      m_timeout(timeout)
{
}

void
HttpBridgeTransport::post(const std::string& target, const json& body)
{
    auto result = utils::httpRequest(m_host, m_port, http::verb::post, target, body.dump(), m_timeout);
    if (result.status >= 300)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Bridge reply body: {}", result.body);
        throwOnStatus("POST", target, result.status);
    }
}

json
HttpBridgeTransport::get(const std::string& target)
{
    auto result = utils::httpRequest(m_host, m_port, http::verb::get, target, "", m_timeout);
    if (result.status >= 300)
    {
        throwOnStatus("GET", target, result.status);
    }
    return json::parse(result.body);
}

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
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @brief The backend answered with a 4xx status; repeating the request will not help.
 */
class BridgeRejectedError : public std::runtime_error
{
  public:
    BridgeRejectedError(const std::string& what, int status)
        : std::runtime_error(what),
          m_status(status)
    {
    }

    int status() const { return m_status; }

  private:
    int m_status;
};

/**
 * @brief Blocking request/response transport used by the BridgeGateway worker.
 *
 * Both calls throw BridgeRejectedError on a 4xx reply, and std::runtime_error on
 * connection failures, timeouts or any other non-2xx reply.
 */
class BridgeTransport
{
  public:
    virtual ~BridgeTransport() = default;

    virtual void post(const std::string& target, const nlohmann::json& body) = 0;
    virtual nlohmann::json get(const std::string& target) = 0;
};

/**
 * @brief BridgeTransport over plain HTTP/1.1 (Boost.Beast), one connection per request.
 */
class HttpBridgeTransport : public BridgeTransport
{
  public:
    HttpBridgeTransport(std::string host, std::string port, std::chrono::milliseconds timeout);

    void post(const std::string& target, const nlohmann::json& body) override;
    nlohmann::json get(const std::string& target) override;

    const std::string& host() const { return m_host; }
    const std::string& port() const { return m_port; }

  private:
    std::string m_host;
    std::string m_port;
    std::chrono::milliseconds m_timeout;
};

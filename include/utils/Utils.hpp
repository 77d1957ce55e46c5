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

// utils/Utils.hpp
#pragma once

#include "utils/Logger.hpp"
#include <arpa/inet.h>
#include <array>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Common utility helpers used across Sentinet.
 *
 * This header provides small, header-only helpers for:
 *  - IPv4 and MAC address conversions,
 *  - shell command execution (popen), used to drive the Ryu REST API through curl,
 *  - a plain HTTP request helper (Boost.Beast) with a deadline,
 *  - timestamp helpers and formatting.
 *
 * @warning Some functions (execCommand, httpRequest) perform I/O and may throw.
 */
namespace utils
{

/**
 * @brief Convert an IPv4 address to dotted-decimal string.
 *
 * @param ip IPv4 address in network byte order (in_addr.s_addr format).
 * @throws std::runtime_error if conversion fails.
 */
inline std::string
ipToString(uint32_t ip)
{
    struct in_addr addr;
    addr.s_addr = ip;
    char buffer[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)))
    {
        throw std::runtime_error("inet_ntop failed");
    }
    return std::string(buffer);
}

/**
 * @brief Parse dotted IPv4 string into uint32_t.
 *
 * @return IPv4 address in network byte order (in_addr.s_addr).
 * @throws std::invalid_argument if the string is not a valid IPv4 address.
 */
inline uint32_t
ipStringToUint32(const std::string& ipStr)
{
    struct in_addr addr;
    if (inet_aton(ipStr.c_str(), &addr) == 0)
    {
        throw std::invalid_argument("Invalid IP address: " + ipStr);
    }
    return addr.s_addr;
}

/**
 * @brief Execute a shell command and capture its stdout.
 *
 * @param cmd Shell command string passed to popen().
 * @return Captured stdout output.
 * @throws std::runtime_error if popen() fails or the command exits non-zero.
 *
 * @warning This function executes via the shell. Do not pass untrusted input
 *          into @p cmd unless properly escaped/sanitized.
 */
inline std::string
execCommand(const std::string& cmd)
{
    std::array<char, 256> buffer;
    std::string result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe)
    {
        throw std::runtime_error("popen() failed!");
    }
    while (fgets(buffer.data(), buffer.size(), pipe))
    {
        result += buffer.data();
    }
    int rc = pclose(pipe);
    if (rc != 0)
    {
        throw std::runtime_error("Command exited with code " + std::to_string(rc));
    }
    return result;
}

/**
 * @brief Result of a plain HTTP exchange.
 */
struct HttpResult
{
    unsigned status = 0;
    std::string body;
};

/**
 * @brief Perform a plain HTTP/1.1 request and return status and body.
 *
 * @param host Server host name or address.
 * @param port Server port.
 * @param verb GET or POST.
 * @param target Request target (e.g. "/api/stats").
 * @param payload Request body, sent only when non-empty.
 * @param timeout Deadline applied to connect, write and read.
 *
 * @throws boost::system::system_error on resolve/connect/IO failures and timeouts.
 */
inline HttpResult
httpRequest(const std::string& host,
            const std::string& port,
            boost::beast::http::verb verb,
            const std::string& target,
            const std::string& payload,
            std::chrono::milliseconds timeout)
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace asio = boost::asio;

    asio::io_context ioc;
    asio::ip::tcp::resolver resolver{ioc};
    beast::tcp_stream stream{ioc};

    auto results = resolver.resolve(host, port);
    stream.expires_after(timeout);
    stream.connect(results);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!payload.empty())
    {
        req.set(http::field::content_type, "application/json");
        req.body() = payload;
    }
    req.prepare_payload();

    stream.expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buf;
    http::response<http::string_body> res;
    stream.expires_after(timeout);
    http::read(stream, buf, res);

    beast::error_code ec;
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);

    return HttpResult{res.result_int(), std::move(res.body())};
}

/**
 * @brief Current time in milliseconds since epoch (system_clock).
 */
inline int64_t
getCurrentTimeMillisSystemClock()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Format an epoch timestamp in milliseconds as local "YYYY-mm-dd HH:MM:SS".
 */
inline std::string
formatTime(int64_t timestamp_ms)
{
    time_t timestamp_s = timestamp_ms / 1000;
    struct tm localTime;
    localtime_r(&timestamp_s, &localTime);
    char buffer[80];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &localTime);
    return std::string(buffer);
}

/**
 * @brief Convert MAC address string ("aa:bb:cc:dd:ee:ff") to a 48-bit integer.
 *
 * @throws std::invalid_argument if parsing fails.
 */
inline uint64_t
macToUint64(const std::string& mac)
{
    if (mac.size() != 17)
    {
        throw std::invalid_argument("Invalid MAC address: " + mac);
    }

    uint64_t result = 0;
    auto parse_hex_byte = [&](const char* ptr) {
        uint8_t byte = 0;
        auto [p, ec] = std::from_chars(ptr, ptr + 2, byte, 16);
        if (ec != std::errc() || p != ptr + 2)
        {
            throw std::invalid_argument("Invalid MAC address: " + mac);
        }
        return byte;
    };

    const char* p = mac.data();
    for (int i = 0; i < 6; ++i)
    {
        if (i > 0 && p[i * 3 - 1] != ':')
        {
            throw std::invalid_argument("Invalid MAC address: " + mac);
        }
        result <<= 8;
        result |= parse_hex_byte(p + i * 3);
    }
    return result;
}

/**
 * @brief Convert a 48-bit MAC stored in uint64_t to string form ("aa:bb:cc:dd:ee:ff").
 */
inline std::string
macToString(uint64_t mac)
{
    std::ostringstream oss;

    for (int i = 5; i >= 0; --i)
    {
        uint8_t byte = (mac >> (i * 8)) & 0xFF;
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
        if (i > 0)
        {
            oss << ":";
        }
    }

    return oss.str();
}
} // namespace utils

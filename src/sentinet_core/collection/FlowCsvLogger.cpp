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

#include "sentinet_core/collection/FlowCsvLogger.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <filesystem>
#include <fstream>

FlowCsvLogger::FlowCsvLogger(std::string filePath)
    : m_filePath(std::move(filePath))
{
}

FlowCsvLogger::~FlowCsvLogger()
{
    stop();
}

void
FlowCsvLogger::start()
{
    if (m_running.exchange(true))
    {
        return;
    }
    m_thread = std::thread(&FlowCsvLogger::run, this);
    SPDLOG_LOGGER_INFO(Logger::instance(), "FlowCsvLogger started, writing {}", m_filePath);
}

void
FlowCsvLogger::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running.store(false);
    }
    m_cv.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
        SPDLOG_LOGGER_INFO(Logger::instance(), "FlowCsvLogger stopped.");
    }
}

void
FlowCsvLogger::setLoggingState(bool enable)
{
    m_loggingEnabled.store(enable);
}

void
FlowCsvLogger::record(const std::vector<FlowRecord>& records)
{
    if (records.empty() || !m_loggingEnabled.load() || !m_running.load())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(records);
    }
    m_cv.notify_one();
}

std::string
FlowCsvLogger::formatRow(const FlowRecord& r)
{
    return fmt::format("{:.3f},{},{},{},{},{},{:.4f},{:.2f},{:.2f},{:.2f}",
                       r.timestampMs / 1000.0,
                       r.dpid,
                       utils::macToString(r.srcMac),
                       utils::macToString(r.dstMac),
                       r.packetCount,
                       r.byteCount,
                       r.durationSec,
                       r.pps,
                       r.bps,
                       r.avgPktSize);
}

void
FlowCsvLogger::run()
{
    while (true)
    {
        std::vector<FlowRecord> batch;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_running.load() || !m_pending.empty(); });
            if (m_pending.empty())
            {
                break;
            }
            batch = std::move(m_pending.front());
            m_pending.pop_front();
        }
        writeBatch(batch);
    }
}

void
FlowCsvLogger::writeBatch(const std::vector<FlowRecord>& batch)
{
    std::error_code ec;
    const bool exists = std::filesystem::exists(m_filePath, ec);
    std::ofstream ofs(m_filePath, std::ios::app);
    if (!ofs.is_open())
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Cannot open {} for appending", m_filePath);
        return;
    }
    if (!exists)
    {
        ofs << CSV_HEADER << "\n";
    }
    for (const auto& record : batch)
    {
        ofs << formatRow(record) << "\n";
    }
}

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
#include "common_types/FlowTypes.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Appends per-flow rate records to a CSV file for offline model training.
 *
 * record() only queues; a background thread does the file I/O. The header row is written
 * when the file does not exist yet.
 */
class FlowCsvLogger
{
  public:
    static constexpr const char* CSV_HEADER =
        "timestamp,dpid,src,dst,packet_count,byte_count,duration_sec,pps,bps,avg_pkt_size";

    explicit FlowCsvLogger(std::string filePath);
    ~FlowCsvLogger();

    void start();
    void stop();
    void setLoggingState(bool enable);

    void record(const std::vector<FlowRecord>& records);

    static std::string formatRow(const FlowRecord& record);

  private:
    void run();
    void writeBatch(const std::vector<FlowRecord>& batch);

    std::string m_filePath;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_loggingEnabled{true};
    std::thread m_thread;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::vector<FlowRecord>> m_pending;
};

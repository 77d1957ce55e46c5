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
#include "sentinet_core/scheduling/TaskScheduler.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <memory>
#include <unordered_map>

/**
 * @brief TaskScheduler on boost::asio steady timers.
 *
 * All timer bookkeeping happens on the io_context thread: scheduleAfter and cancel only post
 * work to it, so they may be called from any thread. Tasks run on the io_context thread.
 */
class AsioTaskScheduler : public TaskScheduler
{
  public:
    explicit AsioTaskScheduler(boost::asio::io_context& ioc);

    TimePoint now() const override;
    void scheduleAfter(const std::string& key, std::chrono::milliseconds delay, Task task) override;
    void cancel(const std::string& key) override;

  private:
    struct PendingTimer
    {
        std::shared_ptr<boost::asio::steady_timer> timer;
        uint64_t generation = 0;
    };

    boost::asio::io_context& m_ioContext;
    std::unordered_map<std::string, PendingTimer> m_timers;
    uint64_t m_nextGeneration = 0;
};

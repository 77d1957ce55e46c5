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

#include "sentinet_core/scheduling/AsioTaskScheduler.hpp"
#include "utils/Logger.hpp"
#include <boost/asio/post.hpp>

namespace net = boost::asio;

AsioTaskScheduler::AsioTaskScheduler(net::io_context& ioc)
    : m_ioContext(ioc)
{
}

TimePoint
AsioTaskScheduler::now() const
{
    return Clock::now();
}

void
AsioTaskScheduler::scheduleAfter(const std::string& key, std::chrono::milliseconds delay, Task task)
{
    net::post(m_ioContext, [this, key, delay, task = std::move(task)]() mutable {
        auto existing = m_timers.find(key);
        if (existing != m_timers.end())
        {
            existing->second.timer->cancel();
        }

        auto timer = std::make_shared<net::steady_timer>(m_ioContext, delay);
        const uint64_t generation = ++m_nextGeneration;
        m_timers[key] = PendingTimer{timer, generation};

        timer->async_wait([this, key, generation, timer, task = std::move(task)](
                              const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted)
            {
                return;
            }
            auto it = m_timers.find(key);
            if (it == m_timers.end() || it->second.generation != generation)
            {
                return;
            }
            m_timers.erase(it);

            try
            {
                task();
            }
            catch (const std::exception& e)
            {
                SPDLOG_LOGGER_ERROR(Logger::instance(), "Scheduled task {} failed: {}", key, e.what());
            }
        });
    });
}

void
AsioTaskScheduler::cancel(const std::string& key)
{
    net::post(m_ioContext, [this, key]() {
        auto it = m_timers.find(key);
        if (it != m_timers.end())
        {
            it->second.timer->cancel();
            m_timers.erase(it);
        }
    });
}

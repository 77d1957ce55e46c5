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

#include "sentinet_core/southbound/FlowDispatcher.hpp"
#include "utils/Logger.hpp"

FlowDispatcher::FlowDispatcher(SenderFn sender, size_t burstSize)
    : sender_(std::move(sender)),
      burstSize_(burstSize == 0 ? 1 : burstSize)
{
}

FlowDispatcher::~FlowDispatcher()
{
    stop();
}

void
FlowDispatcher::start()
{
    running_ = true;
}

void
FlowDispatcher::stop()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
    }
    cv_.notify_all();

    std::unordered_map<uint64_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        workers.swap(workers_);
    }
    for (auto& [dpid, th] : workers)
    {
        if (th.joinable())
        {
            th.join();
        }
    }
}

void
FlowDispatcher::enqueue(const FlowJob& job)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "FlowDispatcher stopped, discarding {} job for dpid {}",
                               to_string(job.op),
                               job.dpid);
            return;
        }
        queues_[job.dpid].push_back(job);
        spawnWorkerLocked_(job.dpid);
    }
    cv_.notify_all();
}

void
FlowDispatcher::enqueue(std::vector<FlowJob> jobs)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "FlowDispatcher stopped, discarding {} jobs",
                               jobs.size());
            return;
        }
        for (auto& job : jobs)
        {
            const uint64_t dpid = job.dpid;
            queues_[dpid].push_back(std::move(job));
            spawnWorkerLocked_(dpid);
        }
    }
    cv_.notify_all();
}

void
FlowDispatcher::purge(uint64_t dpid)
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = queues_.find(dpid);
    if (it != queues_.end() && !it->second.empty())
    {
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Purging {} pending flow jobs for dpid {}",
                           it->second.size(),
                           dpid);
        it->second.clear();
    }
}

size_t
FlowDispatcher::pending(uint64_t dpid)
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = queues_.find(dpid);
    return it == queues_.end() ? 0 : it->second.size();
}

void
FlowDispatcher::spawnWorkerLocked_(uint64_t dpid)
{
    if (!workers_.count(dpid))
    {
        workers_[dpid] = std::thread(&FlowDispatcher::workerLoop_, this, dpid);
    }
}

void
FlowDispatcher::workerLoop_(uint64_t dpid)
{
    std::vector<FlowJob> burst;
    burst.reserve(burstSize_);

    while (true)
    {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] { return !running_ || !queues_[dpid].empty(); });
            if (!running_ && queues_[dpid].empty())
            {
                break;
            }

            burst.clear();
            auto& q = queues_[dpid];
            while (!q.empty() && burst.size() < burstSize_)
            {
                burst.push_back(std::move(q.front()));
                q.pop_front();
            }
        }

        if (!burst.empty())
        {
            try
            {
                sender_(burst);
            }
            catch (const std::exception& e)
            {
                SPDLOG_LOGGER_ERROR(Logger::instance(),
                                    "Failed to push {} flow jobs to dpid {}: {}",
                                    burst.size(),
                                    dpid,
                                    e.what());
            }
        }
    }
}

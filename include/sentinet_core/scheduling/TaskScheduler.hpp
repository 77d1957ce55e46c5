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
#include "common_types/TopologyTypes.hpp"
#include <chrono>
#include <functional>
#include <string>

/**
 * @brief Keyed, cancellable delayed tasks.
 *
 * Scheduling a key that already has a pending task replaces it. A task runs at most once and
 * its key is free again by the time it runs, so a task may reschedule its own key.
 */
class TaskScheduler
{
  public:
    using Task = std::function<void()>;

    virtual ~TaskScheduler() = default;

    virtual TimePoint now() const = 0;
    virtual void scheduleAfter(const std::string& key,
                               std::chrono::milliseconds delay,
                               Task task) = 0;
    virtual void cancel(const std::string& key) = 0;
};

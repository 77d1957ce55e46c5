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
#include <cstddef>
#include <string>

// Compile-time defaults. ControllerConfig (common_types/AppTypes.hpp) copies these and main()
// overrides them from the command line.
namespace AppConfig {
    static const std::string TOPOLOGY_FILE = "";
    static const std::string RYU_REST_URL = "http://127.0.0.1:8080";
    static const std::string BRIDGE_HOST = "127.0.0.1";
    static const std::string BRIDGE_PORT = "8000";
    static const std::string FLOW_CSV_FILE = "traffic_data.csv";
    static const std::string QTABLE_FILE = "navigator_qtable.json";

    static constexpr unsigned short EVENT_SERVER_PORT = 8100;

    static constexpr int POLL_INTERVAL_SEC = 2;
    static constexpr int FLOW_IDLE_TIMEOUT_SEC = 30;
    static constexpr int FLOW_HARD_TIMEOUT_SEC = 300;
    static constexpr int NAVIGATOR_IDLE_TIMEOUT_SEC = 5;

    static constexpr int FORWARDING_PRIORITY = 1;
    static constexpr int TABLE_MISS_PRIORITY = 0;
    static constexpr int DROP_PRIORITY = 100;

    static constexpr int ALERT_COOLDOWN_SEC = 10;
    static constexpr int COOLDOWN_SWEEP_INTERVAL_SEC = 5;
    static constexpr int BLOCK_DURATION_SEC = 60;
    static constexpr double ATTACK_PPS_THRESHOLD = 1000.0;
    static constexpr double ATTACK_BPS_THRESHOLD = 100000.0;

    // A flow sample is evicted after its key is missing from this many consecutive polls.
    static constexpr int FLOW_SAMPLE_MISS_LIMIT = 2;

    static constexpr size_t BRIDGE_QUEUE_CAPACITY = 1024;
    static constexpr size_t BRIDGE_INBOX_CAPACITY = 16;
    static constexpr int BRIDGE_MAX_RETRIES = 3;
    static constexpr int BRIDGE_INITIAL_BACKOFF_MS = 200;
    static constexpr int BRIDGE_TIMEOUT_MS = 2000;
}

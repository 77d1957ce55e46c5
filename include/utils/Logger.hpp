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

/*
 * spdlog Log Levels:
 *   trace     - Per-packet decisions and raw southbound payloads.
 *   debug     - Per-flow rates, navigator paths, bridge retries.
 *   info      - Switch lifecycle, subsystem start/stop.
 *   warn      - Blocks, dropped bridge messages, recoverable southbound failures.
 *   err       - Failures that skip a message or an operation.
 *   critical  - Startup failures that terminate the controller.
 *   off       - Disables logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

/**
 * @brief Runtime logging configuration options for the global logger.
 *
 * enableFile controls whether logs are also written to a rotating file sink at filePath.
 * level selects the minimum log severity that will be emitted.
 */
struct LogConfig
{
    bool enableFile = false;
    std::string filePath = "logs/sentinet.log";
    spdlog::level::level_enum level = spdlog::level::info;
};

/**
 * @brief Centralized spdlog wrapper providing a process-wide logger instance.
 *
 * Usage:
 *  - Call Logger::init(cfg) once at program startup.
 *  - Use Logger::instance() anywhere to log via SPDLOG_LOGGER_* macros.
 *
 * instance() lazily creates a console logger when init() was never called, so unit tests
 * can exercise components without any logging setup.
 */
class Logger
{
  public:
    /**
     * @brief Convert a textual log level into a spdlog level enum.
     *
     * @param name Log level name ("trace", "debug", "info", "warn", "err", "critical", "off").
     * @return Corresponding spdlog level. Unknown values default to info.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);
    /**
     * @brief Parse the logging flags (--log-level <name>, --log-file <path>) from argv.
     *
     * Unrelated flags are ignored so the remaining arguments can be parsed by main().
     */
    static LogConfig parse_cli_args(int argc, char* argv[]);
    /**
     * @brief Initialize the global logger instance.
     */
    static void init(const LogConfig& cfg);
    /**
     * @brief Access the global logger instance.
     */
    static std::shared_ptr<spdlog::logger> instance();

  private:
    static std::shared_ptr<spdlog::logger> m_logger;
};

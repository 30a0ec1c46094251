/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace ktab {

/**
 * RAII manager for the logging subsystem.
 *
 * Usage:
 *   - Tests: LogRuntimeGuard in a fixture
 *   - Kernel host: LogRuntime::getInstance() once at startup
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;  // Empty = $TMPDIR or /tmp
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , initial_level(LOG_WARNING) {}

        static Config fromEnv() {
            Config config;
            if (const char* enable = std::getenv("KTAB_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }
            if (const char* dir = std::getenv("KTAB_LOG_DIR")) {
                config.log_dir = dir;
            }
            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {
        logLevel.store(config_.initial_level, std::memory_order_relaxed);

        // LOG_LEVEL overrides the configured level
        initLoggingFromEnv();

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Returns logging to stderr. Safe to call multiple times.
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        Logger::setLogFile(nullptr);
        log_manager_.reset();
    }

    const LogManager* logManager() const { return log_manager_.get(); }

    /**
     * Process-wide instance configured from the environment. Never
     * destroyed, like the table it serves.
     */
    static LogRuntime* getInstance() {
        static LogRuntime* instance = nullptr;
        static std::once_flag init_flag;

        std::call_once(init_flag, []() {
            instance = new LogRuntime(Config::fromEnv());
        });

        return instance;
    }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: RAII guard that restores the previous level on exit
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace ktab

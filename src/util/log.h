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

#include "../pch.h"
#include <cctype>
#include <cstdlib>
#include <algorithm>
#include <type_traits>
#include <atomic>

namespace ktab {

    enum LogLevel {
        LOG_TRACE,    // Support engineering: per-operation table tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions (e.g. out of pages)
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors, protocol violations
    };

    const char* logLevelToString(LogLevel l);

    class Logger {
        static boost::mutex sm;
        stringstream ss;
        LogLevel logLevel;
        static FILE* logfile;
        string _threadName;
    public:

        friend class LogManager;
        /**
         * set the log file; nullptr restores stderr
         */
        static void setLogFile(FILE* f);

        void flush();

        inline string getThreadName() { return _threadName; }

        /**
         * set the log level
         */
        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        Logger& operator<<(const char *x) { ss << x; return *this; }
        Logger& operator<<(const string& x) { ss << x; return *this; }
        Logger& operator<<(char *x)       { ss << x; return *this; }
        Logger& operator<<(char x)        { ss << x; return *this; }
        Logger& operator<<(int x)         { ss << x; return *this; }
        Logger& operator<<(long x)          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) { ss << x; return *this; }
        Logger& operator<<(unsigned x)      { ss << x; return *this; }
        Logger& operator<<(unsigned short x){ ss << x; return *this; }
        Logger& operator<<(double x)        { ss << x; return *this; }
        Logger& operator<<(void *x)         { ss << x; return *this; }
        Logger& operator<<(const void *x)   { ss << x; return *this; }
        Logger& operator<<(long long x)     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { ss << x; return *this; }
        Logger& operator<<(bool x)               { ss << x; return *this; }

        /**
         * converts time_t to a string
         */
        static string time_t_to_String(time_t t = time(0)) {
            char buf[26];
            ctime_r(&t, buf);
            buf[24] = 0; // don't want the \n
            return buf;
        }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() {
            _threadName = "KTAB";
            _init();
        }
        void _init() {
            ss.str("");
            logLevel = LOG_INFO;
        }
    public:
        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }
    };

    extern std::atomic<int> logLevel;

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
    public:
        __attribute__((always_inline))
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}

        LoggerWrapper(LoggerWrapper&& o) noexcept : logger_(o.logger_) {
            o.logger_ = nullptr;
        }
        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
            // Filtered messages carry no logger
            if (logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }
    };

    __attribute__((always_inline))
    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )
            return LoggerWrapper(nullptr);
        return LoggerWrapper(&Logger::get().setLogLevel( l ));
    }

    __attribute__((always_inline))
    inline LoggerWrapper error() {
        return log(LOG_ERROR);
    }

    __attribute__((always_inline))
    inline LoggerWrapper warn() {
        return log(LOG_WARNING);
    }

    __attribute__((always_inline))
    inline LoggerWrapper warning() {
        return warn();
    }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // Helper functions for specific log levels
    // These return lightweight wrappers that compiler can optimize away
    __attribute__((always_inline))
    inline LoggerWrapper trace() {
        return log(LOG_TRACE);
    }

    __attribute__((always_inline))
    inline LoggerWrapper debug() {
        return log(LOG_DEBUG);
    }

    __attribute__((always_inline))
    inline LoggerWrapper info() {
        return log(LOG_INFO);
    }

    __attribute__((always_inline))
    inline LoggerWrapper severe() {
        return log(LOG_SEVERE);
    }

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")   { logLevel.store(LOG_TRACE, std::memory_order_relaxed); return true; }
        if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG, std::memory_order_relaxed); return true; }
        if (upper == "INFO")    { logLevel.store(LOG_INFO, std::memory_order_relaxed); return true; }
        if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
        if (upper == "ERROR")   { logLevel.store(LOG_ERROR, std::memory_order_relaxed); return true; }
        if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

        return false;
    }

    // Initialize logging from environment variable
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level) {
            if (!setLogLevelFromString(env_level)) {
                std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                         << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }
        }
    }

}

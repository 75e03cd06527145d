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
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <type_traits>
#include <filesystem>

namespace textvault {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // per-chunk and cache-hit detail
        LOG_DEBUG,    // stream lifecycle, retries, cache drops
        LOG_INFO,     // opens, saves, recoveries
        LOG_WARNING,  // degraded but continuing
        LOG_ERROR,    // operation failed
        LOG_SEVERE    // data at risk
    };

    const char* logLevelToString( LogLevel l );

    // Parses TRACE, DEBUG, INFO, WARNING/WARN, ERROR, SEVERE/FATAL in any case.
    std::optional<LogLevel> logLevelFromString( const std::string& level );

    /**
     * Per-thread line builder. Text accumulates until flush(), which writes
     * one prefixed line to the shared sink (stderr, or the file installed by
     * LogManager) under a process-wide lock.
     */
    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        std::ostringstream ss;
        LogLevel level;

    public:
        friend class LogManager;

        /**
         * set the log file, nullptr restores stderr
         */
        static void setLogFile(FILE* f);

        static Logger& get() {
            Logger *p = tsp.get();
            if( p == nullptr )
                tsp.reset( p = new Logger() );
            return *p;
        }

        void flush();

        Logger& setLevel(LogLevel l) {
            level = l;
            return *this;
        }

        template<typename T>
        Logger& operator<<(const T& x) {
            if constexpr (std::is_same<T, bool>::value) {
                ss << (x ? "true" : "false");
            } else if constexpr (std::is_same<T, std::filesystem::path>::value) {
                ss << x.string();
            } else {
                ss << x;
            }
            return *this;
        }

        Logger& operator<< (std::ostream& ( *)(std::ostream&)) {
            ss << '\n';
            flush();
            return *this;
        }

    private:
        static boost::thread_specific_ptr<Logger> tsp;

        Logger() : level(LOG_INFO) {}

        void reset() {
            ss.str("");
            ss.clear();
            level = LOG_INFO;
        }

        static std::string timestamp(time_t t = time(nullptr)) {
            char buf[26];
#if defined(_WIN32)
            ctime_s(buf, sizeof(buf), &t);
#else
            ctime_r(&t, buf);
#endif
            buf[24] = 0; // drop the \n
            return buf;
        }
    };

    extern std::atomic<int> logLevel;

    // Flushes the line when the statement ends. Filtered levels carry no logger.
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        __attribute__((always_inline))
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        ~LoggerWrapper() {
            if (should_flush_ && logger_) {
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

        LoggerWrapper& operator<<(std::ostream& (*endl)(std::ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushed
            }
            return *this;
        }
    };

    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().setLevel( l ), true);
    }

    // "errno:<n> <message>"; thread-safe, unlike strerror
    inline std::string errnoWithDescription(int x = errno) {
        std::ostringstream s;
        s << "errno:" << x << ' ' << std::generic_category().message(x);
        return s.str();
    }

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
    inline LoggerWrapper warning() {
        return log(LOG_WARNING);
    }

    __attribute__((always_inline))
    inline LoggerWrapper error() {
        return log(LOG_ERROR);
    }

    __attribute__((always_inline))
    inline LoggerWrapper severe() {
        return log(LOG_SEVERE);
    }

    inline bool setLogLevelFromString(const std::string& level) {
        std::optional<LogLevel> l = logLevelFromString(level);
        if (!l) {
            return false;
        }
        logLevel.store(*l, std::memory_order_relaxed);
        return true;
    }

    // LOG_LEVEL=<level>; an unknown value is reported and ignored
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level && !setLogLevelFromString(env_level)) {
            std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }

}

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

#include "log.h"

namespace textvault {

    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    std::atomic<int> logLevel{LOG_INFO};

    const char* logLevelToString( LogLevel l ) {
        switch(l) {
        case LOG_TRACE:
            return "TRACE";
        case LOG_DEBUG:
            return "DEBUG";
        case LOG_INFO:
            return "INFO";
        case LOG_WARNING:
            return "WARNING";
        case LOG_ERROR:
            return "ERROR";
        case LOG_SEVERE:
            return "SEVERE";
        }
        return "UNKNOWN";
    }

    std::optional<LogLevel> logLevelFromString( const std::string& level ) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")                       return LOG_TRACE;
        if (upper == "DEBUG")                       return LOG_DEBUG;
        if (upper == "INFO")                        return LOG_INFO;
        if (upper == "WARNING" || upper == "WARN")  return LOG_WARNING;
        if (upper == "ERROR")                       return LOG_ERROR;
        if (upper == "SEVERE" || upper == "FATAL")  return LOG_SEVERE;
        return std::nullopt;
    }

    void Logger::flush() {
        std::string msg = ss.str();
        if ( msg.empty() ) {
            reset();
            return;
        }

        std::string out = timestamp() + " [textvault] [" + logLevelToString(level) + "] " + msg;
        if ( out.back() != '\n' )
            out += '\n';

        {
            boost::mutex::scoped_lock lk(sm);
            FILE* f = logfile ? logfile : stderr;
            if ( fputs(out.c_str(), f) >= 0 ) {
                fflush(f);
            }
            else {
                int x = errno;
                std::cerr << "Failed to write to log: " << errnoWithDescription(x) << ": " << out;
            }
        }
        reset();
    }

    void Logger::setLogFile( FILE* f ) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }
}

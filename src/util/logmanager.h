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
#include <stdexcept>

#include <boost/filesystem.hpp>

namespace textvault {

    /**
     * Routes log output to a file instead of stderr.
     *
     *   LogManager lm("/var/log/textvault");   // writes textvault.log there
     *   lm.rotate();                           // renames to a timestamped file
     *
     * The file is released and stderr restored when the manager is destroyed.
     */
    class LogManager {
    public:

        explicit LogManager(const std::string& logdir, bool append = true)
            : _append(append), _file(nullptr) {
            boost::filesystem::path dir(logdir);
            if (logdir.empty() || !boost::filesystem::is_directory(dir)) {
                throw std::invalid_argument("log directory does not exist: " + logdir);
            }
            _path = (dir / "textvault.log").string();
            start();
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if ( _file ) {
                fclose( _file );
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        std::string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            size_t n = strftime(buf, sizeof(buf), fmt, &t);
            return std::string(buf, n);
        }

        void rotate() {
            FILE* old = _file;
            if ( old ) {
#ifdef POSIX_FADV_DONTNEED
                posix_fadvise(fileno(old), 0, 0, POSIX_FADV_DONTNEED);
#endif
                // Rename the (open) existing log file to a timestamped name
                std::string rotated = _path + "." + terseCurrentTime( false );
                if ( rename( _path.c_str() , rotated.c_str() ) != 0 ) {
                    std::cerr << "can't rotate " << _path << ": " << errnoWithDescription() << std::endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open " + _path + " for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( old ) {
                fclose( old );
            }
            _file = tmp;
        }

    private:
        void start() {
            bool exists = boost::filesystem::exists(_path);
            if (boost::filesystem::is_directory(_path)) {
                throw std::invalid_argument("logpath [" + _path + "] should be a file name not a directory");
            }

            rotate();

            if (_append && exists) {
                const std::string msg = "\n\n***** ENGINE RESTARTED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), _file) != msg.size()) {
                    std::cerr << "can't write restart marker to " << _path << std::endl;
                }
                fflush(_file);
            }
        }

        bool _append;
        std::string _path;
        FILE *_file;
    };
}

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

namespace ktab {

    /**
     * Redirects Logger output to a file. The file is opened in append
     * mode; rotate() renames the current file to a timestamped name and
     * reopens the original path.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir) : _enabled(false), _append(true), _file(0) {
            string dir = logdir;
            if (dir.empty()) {
                const char* tmp = getenv("TMPDIR");
                dir = tmp ? tmp : "/tmp";
            }
            boost::filesystem::path lp = boost::filesystem::path(dir) / "ktab.log";
            start(lp.string(), true);
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        void time_t_to_Struct(time_t t, struct tm *buf, bool local=false) {
            if ( local )
                localtime_r(&t, buf);
            else
                gmtime_r(&t, buf);
        }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t_to_Struct( time(0), &t );

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0)
                return "unknown-time";
            return buf;
        }

        void start( const string& lp, bool append) {
            _append = append;

            boost::filesystem::path p(lp);
            if (boost::filesystem::is_directory(p)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }
            if (p.has_parent_path()) {
                boost::system::error_code ec;
                boost::filesystem::create_directories(p.parent_path(), ec);
                if (ec) {
                    throw std::runtime_error("can't create log directory [" +
                                             p.parent_path().string() + "]: " + ec.message());
                }
            }

            _path = lp;
            _enabled = true;
            rotate();
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file && boost::filesystem::exists(_path) ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                boost::system::error_code ec;
                boost::filesystem::rename(_path, ss.str(), ec);
                if (ec) {
                    cerr << "can't rotate " << _path << ": " << ec.message() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " +
                                         errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;
        }

    private:
        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}

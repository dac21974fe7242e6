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

namespace plsync {

    /**
     * Routes all Logger output into <log_dir>/plsync.log.
     *
     * The previous file is kept across runs (append mode) with a restart
     * banner; rotate() moves the current file aside under a timestamped
     * name and reopens a fresh one.
     */
    class LogManager {
    public:

        explicit LogManager(const string& log_dir, bool append = true)
            : _enabled(false), _append(append), _file(nullptr) {
            if (log_dir.empty()) {
                throw std::invalid_argument("LogManager: empty log directory");
            }
            boost::filesystem::path dir(log_dir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + log_dir + "]: " + ec.message());
            }
            start((dir / "plsync.log").string());
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
                _file = nullptr;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0) {
                return "unknown-time";
            }
            return buf;
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            FILE* old = _file;
            if ( old ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                if (::rename( _path.c_str() , s.c_str() ) != 0) {
                    cerr << "can't rotate log file [" << _path << "]: " << errnoWithDescription() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file
            if ( old ) {
                fclose( old );
            }
            _file = tmp;
        }

    private:
        void start( const string& lp ) {
            if (boost::filesystem::is_directory(lp)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }
            bool exists = boost::filesystem::exists(lp);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (_append && exists) {
                const string msg = "\n\n***** PLSYNC RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), test);
            }
            fclose( test );

            _path = lp;
            _enabled = true;
            rotate_open();
        }

        void rotate_open() {
            FILE* tmp = fopen(_path.c_str(), "a");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file: " + errnoWithDescription());
            }
            Logger::setLogFile(tmp);
            _file = tmp;
        }

        bool _enabled;
        bool _append;
        string _path;
        FILE *_file;
    };
}

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

namespace plsync {

    enum LogLevel {
        LOG_TRACE,    // per-file and per-process detail
        LOG_DEBUG,    // plan sizes, phase transitions
        LOG_INFO,     // one line per item added, removed, committed
        LOG_WARNING,  // skipped items, leftovers found
        LOG_ERROR,    // aborted transactions
        LOG_SEVERE    // restore failures, manual action required
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Per-thread line builder. A line is formatted as
     *
     *   <ctime> [<thread name>] [<LEVEL>] <message>
     *
     * and written under a process wide mutex to the log file if one is set,
     * stderr otherwise.
     */
    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        stringstream ss;
        LogLevel level;
        string _threadName;

    public:
        friend class LogManager;

        // nullptr routes output back to stderr
        static void setLogFile(FILE* f);

        void flush();

        inline const string& getThreadName() const { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            level = l;
            return *this;
        }

        Logger& operator<<(const char *x)   { ss << x; return *this; }
        Logger& operator<<(const string& x) { ss << x; return *this; }
        Logger& operator<<(char x)          { ss << x; return *this; }
        Logger& operator<<(int x)           { ss << x; return *this; }
        Logger& operator<<(long x)          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) { ss << x; return *this; }
        Logger& operator<<(unsigned x)      { ss << x; return *this; }
        Logger& operator<<(double x)        { ss << x; return *this; }
        Logger& operator<<(long long x)     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { ss << x; return *this; }
        Logger& operator<<(bool x)               { ss << (x ? "true" : "false"); return *this; }
        Logger& operator<<(const void* x)        { ss << x; return *this; }
        Logger& operator<<(const std::filesystem::path& p) { ss << p.string(); return *this; }

        static Logger& get() {
            Logger *p = tsp.get();
            if (p == 0)
                tsp.reset(p = new Logger());
            return *p;
        }

    private:
        Logger() : level(LOG_INFO), _threadName("plsync") {}

        static string timestamp();
    };

    // Minimum level written; lower levels cost one relaxed load
    extern std::atomic<int> logLevel;

    // Flushes its line when the statement ends
    class LoggerWrapper {
        Logger* logger_;
    public:
        __attribute__((always_inline))
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}

        LoggerWrapper(LoggerWrapper&& o) noexcept : logger_(o.logger_) { o.logger_ = nullptr; }
        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
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
    inline LoggerWrapper log(LogLevel l) {
        if (l < logLevel.load(std::memory_order_relaxed))
            return LoggerWrapper(nullptr);
        return LoggerWrapper(&Logger::get().setLogLevel(l));
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // TRACE, DEBUG, INFO, WARNING (WARN), ERROR, SEVERE (FATAL); case-insensitive
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = std::toupper(static_cast<unsigned char>(c));

        if (upper == "TRACE")   { logLevel.store(LOG_TRACE, std::memory_order_relaxed); return true; }
        if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG, std::memory_order_relaxed); return true; }
        if (upper == "INFO")    { logLevel.store(LOG_INFO, std::memory_order_relaxed); return true; }
        if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
        if (upper == "ERROR")   { logLevel.store(LOG_ERROR, std::memory_order_relaxed); return true; }
        if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

        return false;
    }

    // LOG_LEVEL from the environment, if set
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

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

#include <gtest/gtest.h>
#include "util/log.h"
#include "util/logmanager.h"
#include <fstream>
#include <filesystem>
#include <functional>
#include <thread>
#include <regex>
#include <sstream>
#include <vector>
#include <unistd.h>  // for dup, dup2
#include <cstdio>    // for fileno

namespace plsync {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;

    void SetUp() override {
        original_log_level = logLevel;
        test_log_dir = "/tmp/plsync_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        logLevel = original_log_level;
        std::filesystem::remove_all(test_log_dir);
        unsetenv("LOG_LEVEL");
    }

    bool containsLogMessage(const std::string& log_content, const std::string& level, const std::string& message) {
        // [LEVEL] ... message
        std::regex re("\\[" + level + "\\].*" + message);
        return std::regex_search(log_content, re);
    }

    std::string readFile(const std::string& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    // Logger writes with fprintf(stderr), so capture at the descriptor
    std::string captureLogOutput(std::function<void()> func) {
        std::string tmp_file = test_log_dir + "/capture.log";

        int saved_stderr = dup(STDERR_FILENO);
        FILE* temp = fopen(tmp_file.c_str(), "w");
        if (!temp) return "";
        dup2(fileno(temp), STDERR_FILENO);

        func();

        fflush(stderr);
        fclose(temp);
        dup2(saved_stderr, STDERR_FILENO);
        close(saved_stderr);

        std::string content = readFile(tmp_file);
        std::filesystem::remove(tmp_file);
        return content;
    }
};

TEST_F(LoggingTest, LogLevelFiltering) {
    logLevel = LOG_INFO;

    auto output = captureLogOutput([]() {
        trace() << "trace message";
        debug() << "debug message";
        info() << "info message";
        warning() << "warning message";
        error() << "error message";
    });

    EXPECT_EQ(output.find("trace message"), std::string::npos);
    EXPECT_EQ(output.find("debug message"), std::string::npos);
    EXPECT_TRUE(containsLogMessage(output, "INFO", "info message"));
    EXPECT_TRUE(containsLogMessage(output, "WARNING", "warning message"));
    EXPECT_TRUE(containsLogMessage(output, "ERROR", "error message"));
}

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("TRACE"));
    EXPECT_EQ(logLevel, LOG_TRACE);

    EXPECT_TRUE(setLogLevelFromString("debug"));
    EXPECT_EQ(logLevel, LOG_DEBUG);

    EXPECT_TRUE(setLogLevelFromString("WARN")); // Alias
    EXPECT_EQ(logLevel, LOG_WARNING);

    EXPECT_TRUE(setLogLevelFromString("FATAL")); // Alias
    EXPECT_EQ(logLevel, LOG_SEVERE);

    EXPECT_FALSE(setLogLevelFromString("LOUD"));
    EXPECT_EQ(logLevel, LOG_SEVERE); // unchanged
}

TEST_F(LoggingTest, SetLogLevelFromEnvironment) {
    setenv("LOG_LEVEL", "DEBUG", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_DEBUG);

    setenv("LOG_LEVEL", "ERROR", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_ERROR);

    // Invalid level leaves the current one in place
    int current_level = logLevel;
    setenv("LOG_LEVEL", "INVALID_LEVEL", 1);
    auto output = captureLogOutput([&]() {
        initLoggingFromEnv();
    });
    EXPECT_EQ(logLevel, current_level);
    EXPECT_TRUE(output.find("Invalid LOG_LEVEL") != std::string::npos);
}

TEST_F(LoggingTest, PathsAndNumbers) {
    logLevel = LOG_INFO;
    auto output = captureLogOutput([]() {
        info() << "Removed leftover " << std::filesystem::path("/music/Mix/.plsync-staging");
        info() << "Committed " << 3 << " items, " << 2u << " failed, flag " << true;
    });
    EXPECT_TRUE(containsLogMessage(output, "INFO", "Removed leftover /music/Mix/.plsync-staging"));
    EXPECT_TRUE(containsLogMessage(output, "INFO", "Committed 3 items, 2 failed, flag true"));
}

TEST_F(LoggingTest, ThreadNameInPrefix) {
    logLevel = LOG_INFO;
    auto output = captureLogOutput([]() {
        std::thread worker([]() {
            Logger::get().setThreadName("sync-7");
            warning() << "from the worker";
        });
        worker.join();
    });
    EXPECT_NE(output.find("[sync-7] [WARNING] from the worker"), std::string::npos);
}

TEST_F(LoggingTest, ThreadSafety) {
    logLevel = LOG_INFO;
    const int threads = 4;
    const int per_thread = 50;

    auto output = captureLogOutput([&]() {
        std::vector<std::thread> pool;
        for (int t = 0; t < threads; t++) {
            pool.emplace_back([t, per_thread]() {
                for (int i = 0; i < per_thread; i++) {
                    info() << "thread " << t << " message " << i;
                }
            });
        }
        for (auto& th : pool) th.join();
    });

    // Every line is whole
    int lines = 0;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        EXPECT_TRUE(std::regex_search(line, std::regex("\\[INFO\\] thread \\d message \\d+$"))) << line;
        lines++;
    }
    EXPECT_EQ(lines, threads * per_thread);
}

TEST_F(LoggingTest, LogManagerFileOutput) {
    logLevel = LOG_INFO;
    std::string log_path;
    {
        LogManager log_mgr(test_log_dir);
        log_path = log_mgr.path();
        EXPECT_EQ(std::filesystem::path(log_path).filename(), "plsync.log");

        info() << "written to the file";
        error() << "an error for the file";
    }

    std::string content = readFile(log_path);
    EXPECT_TRUE(containsLogMessage(content, "INFO", "written to the file"));
    EXPECT_TRUE(containsLogMessage(content, "ERROR", "an error for the file"));

    // Back on stderr once the manager is gone
    auto output = captureLogOutput([]() { info() << "after the manager"; });
    EXPECT_NE(output.find("after the manager"), std::string::npos);
    EXPECT_EQ(readFile(log_path).find("after the manager"), std::string::npos);
}

TEST_F(LoggingTest, LogManagerAppendsWithBanner) {
    logLevel = LOG_INFO;
    {
        LogManager first(test_log_dir);
        info() << "first run";
    }
    std::string path;
    {
        LogManager second(test_log_dir);
        path = second.path();
        info() << "second run";
    }

    std::string content = readFile(path);
    size_t first = content.find("first run");
    size_t banner = content.find("PLSYNC RESTARTED");
    size_t second = content.find("second run");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(banner, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, banner);
    EXPECT_LT(banner, second);
}

TEST_F(LoggingTest, LogManagerRotate) {
    logLevel = LOG_INFO;
    LogManager log_mgr(test_log_dir);
    info() << "before rotation";
    log_mgr.rotate();
    info() << "after rotation";

    int files = 0;
    std::string rotated;
    for (const auto& entry : std::filesystem::directory_iterator(test_log_dir)) {
        files++;
        if (entry.path().filename() != "plsync.log") {
            rotated = entry.path().string();
        }
    }
    EXPECT_EQ(files, 2);
    EXPECT_NE(readFile(rotated).find("before rotation"), std::string::npos);
    EXPECT_NE(readFile(log_mgr.path()).find("after rotation"), std::string::npos);
    EXPECT_EQ(readFile(log_mgr.path()).find("before rotation"), std::string::npos);
}

TEST_F(LoggingTest, LogManagerRejectsBadDirectory) {
    EXPECT_THROW(LogManager(""), std::invalid_argument);

    std::string file = test_log_dir + "/not_a_dir";
    std::ofstream(file) << "x";
    EXPECT_THROW(LogManager(file + "/logs"), std::runtime_error);
}

TEST_F(LoggingTest, ErrnoDescription) {
    std::string text = errnoWithDescription(ENOENT);
    EXPECT_NE(text.find("errno:2"), std::string::npos);
}

} // namespace plsync

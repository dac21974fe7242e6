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
#include "util/process.h"
#include "../persistence/test_helpers.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace plsync;
using namespace std::chrono;

TEST(ProcessTest, CollectsStdoutAndStderr) {
    ExecResult r = exec_command({"sh", "-c", "echo out; echo err >&2; exit 0"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_str, "out\n");
    EXPECT_EQ(r.stderr_str, "err\n");
    EXPECT_FALSE(r.timed_out);
    EXPECT_FALSE(r.cancelled);
}

TEST(ProcessTest, ReportsExitCode) {
    ExecResult r = exec_command({"sh", "-c", "exit 3"});
    EXPECT_EQ(r.exit_code, 3);
}

TEST(ProcessTest, ArgumentsAreNotReinterpreted) {
    ExecResult r = exec_command({"printf", "%s|", "a b", "$HOME", "*"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_str, "a b|$HOME|*|");
}

TEST(ProcessTest, LargeOutputIsNotTruncated) {
    ExecResult r = exec_command({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' x"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_str.size(), 200000u);
}

TEST(ProcessTest, MissingProgramExits127) {
    ExecResult r = exec_command({"/nonexistent/plsync-no-such-binary"});
    EXPECT_EQ(r.exit_code, 127);
}

TEST(ProcessTest, EmptyCommandThrows) {
    EXPECT_THROW(exec_command({}), std::system_error);
}

TEST(ProcessTest, RunsInWorkdir) {
    std::string dir = persist::test::create_temp_dir("plsync_process_test");
    ExecResult r = exec_command({"pwd"}, dir);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(std::filesystem::canonical(r.stdout_str.substr(0, r.stdout_str.size() - 1)),
              std::filesystem::canonical(dir));

    ExecResult missing = exec_command({"pwd"}, dir + "/missing");
    EXPECT_EQ(missing.exit_code, 127);
    std::filesystem::remove_all(dir);
}

TEST(ProcessTest, TimeoutKillsWholeGroup) {
    auto start = steady_clock::now();
    // The background sleep holds the pipes open; it has to die too
    ExecResult r = exec_command({"sh", "-c", "sleep 30 & sleep 30"}, "", milliseconds(300));
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_LT(steady_clock::now() - start, seconds(10));
}

TEST(ProcessTest, CancelStopsChild) {
    std::atomic<bool> cancel{false};
    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(milliseconds(200));
        cancel.store(true);
    });

    auto start = steady_clock::now();
    ExecResult r = exec_command({"sleep", "30"}, "", milliseconds(0), &cancel);
    canceller.join();

    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.timed_out);
    EXPECT_LT(steady_clock::now() - start, seconds(10));
}

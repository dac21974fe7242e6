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
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace plsync {

    struct ExecResult {
        int exit_code = -1;          // -1 when the child did not exit normally
        std::string stdout_str;
        std::string stderr_str;
        bool timed_out = false;
        bool cancelled = false;
    };

    /**
     * Runs args[0] (PATH lookup) with the rest as arguments and collects its
     * output. The child's process group is killed with SIGKILL once `timeout` elapses
     * (zero = no limit) or `cancel` turns true.
     * Throws std::system_error if the child cannot be started.
     * Exit code 127 means exec failed in the child.
     */
    ExecResult exec_command(const std::vector<std::string>& args,
                            const std::string& workdir = std::string(),
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(0),
                            const std::atomic<bool>* cancel = nullptr);

} // namespace plsync

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

#include "process.h"
#include "log.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace plsync {

    namespace {
        const int kPollIntervalMs = 100;

        void close_pipe(int p[2]) {
            if (p[0] >= 0) ::close(p[0]);
            if (p[1] >= 0) ::close(p[1]);
        }
    }

    ExecResult exec_command(const std::vector<std::string>& args, const std::string& workdir,
                            std::chrono::milliseconds timeout, const std::atomic<bool>* cancel) {
        ExecResult result;
        if (args.empty()) {
            throw std::system_error(EINVAL, std::generic_category(), "exec_command: no program");
        }

        int stdout_pipe[2] = {-1, -1};
        int stderr_pipe[2] = {-1, -1};
        if (::pipe2(stdout_pipe, O_CLOEXEC) != 0 || ::pipe2(stderr_pipe, O_CLOEXEC) != 0) {
            int e = errno;
            close_pipe(stdout_pipe);
            close_pipe(stderr_pipe);
            throw std::system_error(e, std::generic_category(), "pipe");
        }

        // Build argv before forking; nothing may allocate in the child
        std::vector<char*> c_args;
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            int e = errno;
            close_pipe(stdout_pipe);
            close_pipe(stderr_pipe);
            throw std::system_error(e, std::generic_category(), "fork");
        }

        if (pid == 0) {
            // Child process, own group so helpers it spawns die with it
            ::setpgid(0, 0);
            ::dup2(stdout_pipe[1], STDOUT_FILENO);
            ::dup2(stderr_pipe[1], STDERR_FILENO);
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
            if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
                _exit(127);
            }
            ::execvp(c_args[0], c_args.data());
            _exit(127);
        }

        // Parent process. Also set the group here; whichever side runs first wins
        // and EACCES after the child's exec is harmless.
        (void)::setpgid(pid, pid);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        auto deadline = std::chrono::steady_clock::now() + timeout;
        struct pollfd fds[2];
        fds[0] = {stdout_pipe[0], POLLIN, 0};
        fds[1] = {stderr_pipe[0], POLLIN, 0};
        int open_fds = 2;
        bool killed = false;
        char buf[4096];

        while (open_fds > 0) {
            if (!killed) {
                if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
                    result.cancelled = true;
                } else if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                    result.timed_out = true;
                }
                if (result.cancelled || result.timed_out) {
                    debug() << "Killing " << args[0] << " (pid " << pid << ")";
                    if (::kill(-pid, SIGKILL) != 0) {
                        ::kill(pid, SIGKILL);
                    }
                    killed = true;
                }
            }

            int rc = ::poll(fds, 2, kPollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (int i = 0; i < 2; i++) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
                if (n > 0) {
                    (i == 0 ? result.stdout_str : result.stderr_str).append(buf, static_cast<size_t>(n));
                } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                    ::close(fds[i].fd);
                    fds[i].fd = -1;
                    open_fds--;
                }
            }
        }
        for (auto& f : fds) {
            if (f.fd >= 0) ::close(f.fd);
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        return result;
    }

} // namespace plsync

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

#include "platform_fs.h"
#include "config.h"

#ifdef PLSYNC_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/syscall.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include <cerrno>
#include <cstring>
#include <cstdio>

#ifndef RENAME_NOREPLACE
#define RENAME_NOREPLACE (1 << 0)
#endif

namespace plsync {
    namespace persist {

        namespace fs = std::filesystem;

        std::string describe_failure(const std::string& op, const std::string& path, const FSResult& r) {
            std::ostringstream oss;
            oss << op << " " << path << ": " << std::strerror(r.err) << " (errno " << r.err << ")";
            return oss.str();
        }

        static std::string parent_of(const std::string& path) {
            std::string parent = fs::path(path).parent_path().string();
            return parent.empty() ? "." : parent;
        }

        static FSResult write_all(int fd, const char* data, size_t len) {
            while (len > 0) {
                ssize_t n = ::write(fd, data, len);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return {false, errno};
                }
                data += n;
                len -= static_cast<size_t>(n);
            }
            return {true, 0};
        }

        FSResult PlatformFS::fsync_file(const std::string& path) {
            int fd = ::open(path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);
            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            // Open directory for reading
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
            if (fd < 0) {
                return {false, errno};
            }

            // Fsync the directory to ensure metadata changes are persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            // Use atomic rename with directory fsync for durability
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }
            return fsync_directory(parent_of(dst));
        }

        FSResult PlatformFS::rename_no_replace(const std::string& src, const std::string& dst) {
#ifdef SYS_renameat2
            long rc = ::syscall(SYS_renameat2, AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(),
                                RENAME_NOREPLACE);
            if (rc == 0) {
                return {true, 0};
            }
            if (errno != ENOSYS && errno != EINVAL) {
                return {false, errno};
            }
#endif
            // Filesystem without renameat2 flags: check-then-rename. The directory
            // lock keeps other writers of this engine out of the window.
            struct stat st{};
            if (::lstat(dst.c_str(), &st) == 0) {
                return {false, EEXIST};
            }
            if (::rename(src.c_str(), dst.c_str()) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::write_file_atomic(const std::string& path, const std::string& content,
                                               bool durable) {
            std::string temp_path = path + reserved::kTempSuffix;

            int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            FSResult res = write_all(fd, content.data(), content.size());
            if (res.ok && durable && ::fsync(fd) != 0) {
                res = {false, errno};
            }
            if (::close(fd) != 0 && res.ok) {
                res = {false, errno};
            }
            if (!res.ok) {
                ::unlink(temp_path.c_str());
                return res;
            }

            if (!durable) {
                if (::rename(temp_path.c_str(), path.c_str()) != 0) {
                    int e = errno;
                    ::unlink(temp_path.c_str());
                    return {false, e};
                }
                return {true, 0};
            }

            res = atomic_replace(temp_path, path);
            if (!res.ok) {
                ::unlink(temp_path.c_str());
            }
            return res;
        }

        FSResult PlatformFS::read_file(const std::string& path, std::string* out) {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                return {false, errno ? errno : ENOENT};
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            if (file.bad()) {
                return {false, EIO};
            }
            *out = buffer.str();
            return {true, 0};
        }

        FSResult PlatformFS::copy_file(const std::string& src, const std::string& dst, bool durable) {
            int in = ::open(src.c_str(), O_RDONLY);
            if (in < 0) {
                return {false, errno};
            }
            struct stat st{};
            if (::fstat(in, &st) != 0) {
                int e = errno;
                ::close(in);
                return {false, e};
            }

            fs::path dst_path(dst);
            std::string temp_path = (dst_path.parent_path() /
                (std::string(reserved::kPrefix) + "-copy-" + dst_path.filename().string())).string();

            int out = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, st.st_mode & 07777);
            if (out < 0) {
                int e = errno;
                ::close(in);
                return {false, e};
            }

            std::vector<char> buf(copy::kBufferSize);
            FSResult res{true, 0};
            for (;;) {
                ssize_t n = ::read(in, buf.data(), buf.size());
                if (n < 0) {
                    if (errno == EINTR) continue;
                    res = {false, errno};
                    break;
                }
                if (n == 0) break;
                res = write_all(out, buf.data(), static_cast<size_t>(n));
                if (!res.ok) break;
            }
            ::close(in);

            if (res.ok && durable && ::fsync(out) != 0) {
                res = {false, errno};
            }
            if (::close(out) != 0 && res.ok) {
                res = {false, errno};
            }
            if (!res.ok) {
                ::unlink(temp_path.c_str());
                return res;
            }

            if (durable) {
                res = atomic_replace(temp_path, dst);
            } else if (::rename(temp_path.c_str(), dst.c_str()) != 0) {
                res = {false, errno};
            }
            if (!res.ok) {
                ::unlink(temp_path.c_str());
            }
            return res;
        }

        FSResult PlatformFS::copy_tree(const std::string& src, const std::string& dst,
                                       bool durable, const SkipEntry& skip) {
            FSResult res = ensure_directory(dst);
            if (!res.ok) {
                return res;
            }

            std::error_code ec;
            fs::directory_iterator it(src, ec);
            if (ec) {
                return {false, ec.value()};
            }

            for (fs::directory_iterator end; it != end; it.increment(ec)) {
                if (ec) {
                    return {false, ec.value()};
                }
                const fs::path& from = it->path();
                std::string name = from.filename().string();
                if (skip && skip(name)) {
                    continue;
                }
                fs::path to = fs::path(dst) / name;

                fs::file_status status = fs::symlink_status(from, ec);
                if (ec) {
                    return {false, ec.value()};
                }

                if (fs::is_directory(status)) {
                    res = copy_tree(from.string(), to.string(), durable, nullptr);
                } else if (fs::is_regular_file(status)) {
                    res = copy_file(from.string(), to.string(), durable);
                } else if (fs::is_symlink(status)) {
                    fs::path target = fs::read_symlink(from, ec);
                    if (!ec) {
                        fs::remove(to, ec);
                        ec.clear();
                        fs::create_symlink(target, to, ec);
                    }
                    res = ec ? FSResult{false, ec.value()} : FSResult{true, 0};
                } else {
                    // sockets, fifos, devices: nothing a media directory should hold
                    continue;
                }
                if (!res.ok) {
                    return res;
                }
            }
            if (ec) {
                return {false, ec.value()};
            }

            return durable ? fsync_directory(dst) : FSResult{true, 0};
        }

        FSResult PlatformFS::remove_tree(const std::string& path) {
            std::error_code ec;
            fs::remove_all(path, ec);
            if (ec) {
                return {false, ec.value()};
            }
            return {true, 0};
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            // stat
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            fs::create_directories(path, ec);
            if (ec) {
                return {false, ec.value()};
            }
            if (!fs::is_directory(path, ec)) {
                return {false, ENOTDIR};
            }
            return {true, 0};
        }

    } // namespace persist
} // namespace plsync
#endif

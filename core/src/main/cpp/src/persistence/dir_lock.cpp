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

#include "dir_lock.h"
#include "platform_fs.h"
#include "config.h"
#include "../sync_error.h"
#include "../util/log.h"
#include <filesystem>
#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace plsync {
namespace persist {

DirectoryLock::DirectoryLock(const std::string& directory)
    : path_((std::filesystem::path(directory) / reserved::kLockFile).string()), fd_(-1) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        FSResult r{false, errno};
        throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot open lock file", path_, r));
    }

    int rc;
    do {
        rc = ::flock(fd_, LOCK_EX | LOCK_NB);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        int e = errno;
        ::close(fd_);
        fd_ = -1;
        if (e == EWOULDBLOCK) {
            throw SyncError(ErrorKind::Locked,
                            "another transaction is running on " + directory);
        }
        throw SyncError(ErrorKind::FilesystemFailure,
                        describe_failure("cannot lock", path_, FSResult{false, e}));
    }
    trace() << "Locked " << directory;
}

DirectoryLock::~DirectoryLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace persist
} // namespace plsync

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
#include <string>

namespace plsync {
namespace persist {

/**
 * DirectoryLock - exclusive single-writer lock on a collection directory.
 *
 * flock(LOCK_EX | LOCK_NB) on <dir>/.plsync.lock, held for the object's
 * lifetime. The lock belongs to the open file description, so a second
 * DirectoryLock on the same directory fails even inside one process.
 * The lock file itself is left in place on release.
 */
class DirectoryLock {
public:
    // Throws SyncError(Locked) on contention, SyncError(FilesystemFailure)
    // if the lock file cannot be opened.
    explicit DirectoryLock(const std::string& directory);
    ~DirectoryLock();

    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_;
};

} // namespace persist
} // namespace plsync

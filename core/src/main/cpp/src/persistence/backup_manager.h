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
#include <vector>

namespace plsync {
namespace persist {

class BackupManager;

// A live snapshot of one working directory. Inactive once committed or restored.
class BackupHandle {
public:
    BackupHandle() = default;

    const std::string& working_dir() const { return working_dir_; }
    const std::string& backup_dir() const { return backup_dir_; }
    bool active() const { return active_; }

private:
    friend class BackupManager;
    std::string working_dir_;
    std::string backup_dir_;
    bool active_ = false;
};

/**
 * BackupManager - full-copy snapshots of a collection directory
 *
 * The snapshot is a hidden sibling of the working directory:
 *   <parent>/.<dirname>.plsync-backup-<unique>
 * It is copied under a ".partial" name and renamed into place once complete,
 * so a backup directory without the suffix is always a whole snapshot.
 * Discards go through a ".discard" rename for the same reason.
 *
 * The lock file and staging area are transaction local: never copied,
 * never touched by restore.
 */
class BackupManager {
public:
    explicit BackupManager(bool durable = true);

    // Throws SyncError(FilesystemFailure); nothing is left behind on failure.
    BackupHandle snapshot(const std::string& directory);

    // Discards the backup. Throws SyncError(FilesystemFailure) if the backup
    // could not be retired; a failed delete after retirement only logs.
    void commit(BackupHandle& handle);

    // Makes the working directory match the backup exactly, then discards it.
    // No-op on an inactive handle. Throws SyncError(RestoreFailed) naming the
    // backup path, which is left in place.
    void restore(BackupHandle& handle);

    // Complete backups of `directory` left behind by a crashed run, sorted by name
    static std::vector<std::string> find_stale(const std::string& directory);

    // Removes half-written (".partial") and half-deleted (".discard") backups.
    // Returns how many were removed.
    static size_t discard_incomplete(const std::string& directory);

    static BackupHandle adopt(const std::string& directory, const std::string& backup_dir);

    // "<parent>/.<dirname>.plsync-backup-"
    static std::string backup_prefix(const std::string& directory);

private:
    void discard(const std::string& backup_dir);

    bool durable_;
};

} // namespace persist
} // namespace plsync

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

#include "backup_manager.h"
#include "platform_fs.h"
#include "config.h"
#include "../sync_error.h"
#include "../util/log.h"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <filesystem>
#include <set>

namespace plsync {
namespace persist {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string unique_suffix() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

// Absolute so that "." and ".." still have a parent to hold the backup
std::string normalized(const std::string& directory) {
    std::error_code ec;
    fs::path p = fs::absolute(directory, ec);
    if (ec) {
        throw SyncError(ErrorKind::FilesystemFailure,
                        "cannot resolve " + directory + ": " + ec.message());
    }
    p = p.lexically_normal();
    if (p.has_filename()) {
        return p.string();
    }
    return p.parent_path().string();   // strip trailing separator
}

bool skip_transaction_local(const std::string& name) {
    return reserved::is_transaction_local(name);
}

} // namespace

BackupManager::BackupManager(bool durable) : durable_(durable) {
}

std::string BackupManager::backup_prefix(const std::string& directory) {
    fs::path dir(normalized(directory));
    fs::path parent = dir.parent_path();
    std::string name = "." + dir.filename().string() + reserved::kBackupInfix;
    return (parent / name).string();
}

BackupHandle BackupManager::snapshot(const std::string& directory) {
    std::string final_path = backup_prefix(directory) + unique_suffix();
    std::string partial_path = final_path + reserved::kPartialSuffix;

    info() << "Snapshotting " << directory << " to " << final_path;

    FSResult res = PlatformFS::copy_tree(directory, partial_path, durable_, skip_transaction_local);
    if (res.ok) {
        res = durable_ ? PlatformFS::atomic_replace(partial_path, final_path)
                       : PlatformFS::rename_no_replace(partial_path, final_path);
    }
    if (!res.ok) {
        std::string msg = describe_failure("snapshot failed copying", directory, res);
        FSResult cleanup = PlatformFS::remove_tree(partial_path);
        if (!cleanup.ok) {
            warning() << describe_failure("cannot remove partial backup", partial_path, cleanup);
        }
        throw SyncError(ErrorKind::FilesystemFailure, msg);
    }

    BackupHandle handle;
    handle.working_dir_ = directory;
    handle.backup_dir_ = final_path;
    handle.active_ = true;
    return handle;
}

void BackupManager::discard(const std::string& backup_dir) {
    std::string doomed = backup_dir + reserved::kDiscardSuffix;
    FSResult res = durable_ ? PlatformFS::atomic_replace(backup_dir, doomed)
                            : PlatformFS::rename_no_replace(backup_dir, doomed);
    if (!res.ok) {
        throw SyncError(ErrorKind::FilesystemFailure,
                        describe_failure("cannot retire backup", backup_dir, res));
    }
    res = PlatformFS::remove_tree(doomed);
    if (!res.ok) {
        // Retired backups are never restored; the next run sweeps it up
        warning() << describe_failure("cannot delete retired backup", doomed, res);
    }
}

void BackupManager::commit(BackupHandle& handle) {
    if (!handle.active_) {
        return;
    }
    discard(handle.backup_dir_);
    handle.active_ = false;
    debug() << "Discarded backup " << handle.backup_dir_;
}

void BackupManager::restore(BackupHandle& handle) {
    if (!handle.active_) {
        return;
    }
    const std::string& work = handle.working_dir_;
    const std::string& backup = handle.backup_dir_;

    auto fail = [&](const std::string& what) {
        severe() << "Restore of " << work << " failed: " << what << "; backup kept at " << backup;
        throw SyncError(ErrorKind::RestoreFailed,
                        "restore of " + work + " failed (" + what + "); backup kept at " + backup);
    };

    std::error_code ec;
    if (!fs::is_directory(backup, ec)) {
        fail("backup directory is missing");
    }

    warning() << "Restoring " << work << " from " << backup;

    FSResult res = PlatformFS::ensure_directory(work);
    if (!res.ok) {
        fail(describe_failure("cannot create", work, res));
    }

    std::set<std::string> backed_up;
    for (fs::directory_iterator it(backup, ec), end; !ec && it != end; it.increment(ec)) {
        backed_up.insert(it->path().filename().string());
    }
    if (ec) {
        fail("cannot list backup: " + ec.message());
    }

    // Entries created after the snapshot go; directories are replaced whole
    std::vector<fs::path> doomed;
    for (fs::directory_iterator it(work, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (reserved::is_transaction_local(name)) {
            continue;
        }
        std::error_code sec;
        bool is_dir = fs::is_directory(fs::symlink_status(it->path(), sec));
        if (!backed_up.count(name) || is_dir) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        fail("cannot list working directory: " + ec.message());
    }
    for (const auto& p : doomed) {
        res = PlatformFS::remove_tree(p.string());
        if (!res.ok) {
            fail(describe_failure("cannot remove", p.string(), res));
        }
    }

    res = PlatformFS::copy_tree(backup, work, durable_, skip_transaction_local);
    if (!res.ok) {
        fail(describe_failure("cannot copy back into", work, res));
    }

    handle.active_ = false;
    try {
        discard(backup);
    } catch (const SyncError& e) {
        // The working directory already matches the snapshot
        error() << "Restored " << work << " but " << e.what();
        throw SyncError(ErrorKind::RestoreFailed,
                        std::string("restored ") + work + " but " + e.what() + "; remove " + backup + " by hand");
    }
    info() << "Restored " << work;
}

std::vector<std::string> BackupManager::find_stale(const std::string& directory) {
    std::vector<std::string> found;
    fs::path prefix(backup_prefix(directory));
    std::string stem = prefix.filename().string();

    std::error_code ec;
    fs::path parent = prefix.parent_path();
    for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.compare(0, stem.size(), stem) != 0) continue;
        if (ends_with(name, reserved::kPartialSuffix) || ends_with(name, reserved::kDiscardSuffix)) continue;
        std::error_code sec;
        if (!fs::is_directory(it->path(), sec)) continue;
        found.push_back(it->path().string());
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw SyncError(ErrorKind::FilesystemFailure,
                        "cannot scan " + parent.string() + " for backups: " + ec.message());
    }
    std::sort(found.begin(), found.end());
    return found;
}

size_t BackupManager::discard_incomplete(const std::string& directory) {
    fs::path prefix(backup_prefix(directory));
    std::string stem = prefix.filename().string();
    fs::path parent = prefix.parent_path();

    std::vector<fs::path> doomed;
    std::error_code ec;
    for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.compare(0, stem.size(), stem) != 0) continue;
        if (ends_with(name, reserved::kPartialSuffix) || ends_with(name, reserved::kDiscardSuffix)) {
            doomed.push_back(it->path());
        }
    }

    size_t removed = 0;
    for (const auto& p : doomed) {
        FSResult res = PlatformFS::remove_tree(p.string());
        if (!res.ok) {
            throw SyncError(ErrorKind::FilesystemFailure,
                            describe_failure("cannot remove incomplete backup", p.string(), res));
        }
        info() << "Removed incomplete backup " << p;
        removed++;
    }
    return removed;
}

BackupHandle BackupManager::adopt(const std::string& directory, const std::string& backup_dir) {
    BackupHandle handle;
    handle.working_dir_ = directory;
    handle.backup_dir_ = backup_dir;
    handle.active_ = true;
    return handle;
}

} // namespace persist
} // namespace plsync

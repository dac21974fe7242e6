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
#include "persistence/backup_manager.h"
#include "persistence/config.h"
#include "sync_error.h"
#include "test_helpers.h"
#include <filesystem>

namespace plsync {
namespace persist {
namespace test {

namespace fs = std::filesystem;

// Runs the rest of a test from inside `dir`
class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const std::string& dir) : saved_(fs::current_path()) {
        fs::current_path(dir);
    }
    ~ScopedWorkingDirectory() {
        std::error_code ec;
        fs::current_path(saved_, ec);
    }

private:
    fs::path saved_;
};

class BackupManagerTest : public ::testing::Test {
protected:
    std::string root_;
    std::string work_;

    void SetUp() override {
        root_ = create_temp_dir("backup_manager_test");
        work_ = (fs::path(root_) / "Playlist").string();
        fs::create_directories(work_);
        put("1 - A.mp3", "aaaa");
        put("2 - B.mp3", "bbbb");
        put(reserved::kStateFile, "{\"state\": 1}");
        put(reserved::kLockFile, "");
        fs::create_directories(fs::path(work_) / reserved::kStagingDir);
        put(std::string(reserved::kStagingDir) + "/partial.part", "pp");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void put(const std::string& name, const std::string& content) {
        write_file((fs::path(work_) / name).string(), content);
    }

    std::string at(const std::string& name) const {
        return (fs::path(work_) / name).string();
    }

    std::vector<std::string> siblings() const {
        return list_names(root_);
    }
};

TEST_F(BackupManagerTest, SnapshotIsHiddenSiblingWithoutTransactionFiles) {
    BackupManager mgr(false);
    BackupHandle h = mgr.snapshot(work_);

    ASSERT_TRUE(h.active());
    EXPECT_EQ(fs::path(h.backup_dir()).parent_path(), fs::path(root_));
    EXPECT_EQ(fs::path(h.backup_dir()).filename().string().rfind(".Playlist.plsync-backup-", 0), 0u);

    EXPECT_EQ(read_file((fs::path(h.backup_dir()) / "1 - A.mp3").string()), "aaaa");
    EXPECT_TRUE(fs::exists(fs::path(h.backup_dir()) / reserved::kStateFile));
    EXPECT_FALSE(fs::exists(fs::path(h.backup_dir()) / reserved::kLockFile));
    EXPECT_FALSE(fs::exists(fs::path(h.backup_dir()) / reserved::kStagingDir));
}

TEST_F(BackupManagerTest, CommitDiscardsBackup) {
    BackupManager mgr(false);
    BackupHandle h = mgr.snapshot(work_);
    std::string backup = h.backup_dir();

    mgr.commit(h);
    EXPECT_FALSE(h.active());
    EXPECT_FALSE(fs::exists(backup));
    EXPECT_EQ(siblings(), std::vector<std::string>{"Playlist"});

    // Second commit is a no-op
    EXPECT_NO_THROW(mgr.commit(h));
}

TEST_F(BackupManagerTest, RestoreReproducesSnapshotExactly) {
    BackupManager mgr(true);
    auto before = snapshot_tree(work_);
    BackupHandle h = mgr.snapshot(work_);

    // Damage: delete, rename, rewrite, add
    fs::remove(at("1 - A.mp3"));
    fs::rename(at("2 - B.mp3"), at("1 - B.mp3"));
    put(reserved::kStateFile, "{\"state\": 2}");
    put(".plsync-rename-0-42", "tmp");
    put("3 - C.mp3", "cccc");
    put(std::string(reserved::kStagingDir) + "/other.part", "oo");

    std::string backup = h.backup_dir();
    mgr.restore(h);

    EXPECT_FALSE(h.active());
    EXPECT_FALSE(fs::exists(backup));

    auto after = snapshot_tree(work_);
    // The staging area is transaction local and left as is
    before.erase(std::string(reserved::kStagingDir) + "/partial.part");
    after.erase(std::string(reserved::kStagingDir) + "/partial.part");
    after.erase(std::string(reserved::kStagingDir) + "/other.part");
    EXPECT_EQ(after, before);
    EXPECT_TRUE(fs::exists(at(reserved::kLockFile)));
}

TEST_F(BackupManagerTest, RestoreIsIdempotent) {
    BackupManager mgr(false);
    BackupHandle h = mgr.snapshot(work_);
    fs::remove(at("1 - A.mp3"));

    mgr.restore(h);
    EXPECT_NO_THROW(mgr.restore(h));
    EXPECT_EQ(read_file(at("1 - A.mp3")), "aaaa");
}

TEST_F(BackupManagerTest, RestoreWithMissingBackupFailsLoudly) {
    BackupManager mgr(false);
    BackupHandle h = mgr.snapshot(work_);
    fs::remove_all(h.backup_dir());

    try {
        mgr.restore(h);
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RestoreFailed);
        EXPECT_NE(std::string(e.what()).find(h.backup_dir()), std::string::npos);
    }
}

TEST_F(BackupManagerTest, FindStaleAndAdopt) {
    EXPECT_TRUE(BackupManager::find_stale(work_).empty());

    BackupManager mgr(false);
    BackupHandle h = mgr.snapshot(work_);

    // Leftovers that are not whole backups, and a backup of another directory
    fs::create_directories(h.backup_dir() + "x" + reserved::kPartialSuffix);
    fs::create_directories(h.backup_dir() + "y" + reserved::kDiscardSuffix);
    fs::create_directories(fs::path(root_) / ".Other.plsync-backup-1");

    auto stale = BackupManager::find_stale(work_);
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0], h.backup_dir());

    EXPECT_EQ(BackupManager::discard_incomplete(work_), 2u);
    EXPECT_FALSE(fs::exists(h.backup_dir() + "x" + reserved::kPartialSuffix));

    fs::remove(at("2 - B.mp3"));
    BackupHandle adopted = BackupManager::adopt(work_, stale[0]);
    mgr.restore(adopted);
    EXPECT_EQ(read_file(at("2 - B.mp3")), "bbbb");
    EXPECT_TRUE(BackupManager::find_stale(work_).empty());
}

TEST_F(BackupManagerTest, TrailingSlashNamesSameBackup) {
    EXPECT_EQ(BackupManager::backup_prefix(work_ + "/"), BackupManager::backup_prefix(work_));
}

TEST_F(BackupManagerTest, RelativeDirectoryBacksUpBesideIt) {
    auto before = snapshot_tree(work_);
    ScopedWorkingDirectory cwd(work_);

    BackupManager mgr(false);
    BackupHandle h = mgr.snapshot(".");
    fs::path backup(h.backup_dir());
    std::vector<std::string> stale = BackupManager::find_stale(".");
    EXPECT_EQ(BackupManager::backup_prefix("."), BackupManager::backup_prefix(work_));
    EXPECT_EQ(BackupManager::find_stale("../Playlist"), stale);

    fs::remove(at("1 - A.mp3"));
    put("9 - Z.mp3", "zz");
    mgr.restore(h);

    EXPECT_EQ(backup.parent_path(), fs::path(root_));
    EXPECT_EQ(backup.filename().string().rfind(".Playlist.plsync-backup-", 0), 0u);
    EXPECT_EQ(stale, std::vector<std::string>{h.backup_dir()});
    EXPECT_FALSE(fs::exists(backup));
    EXPECT_EQ(snapshot_tree(work_), before);
    EXPECT_EQ(siblings(), std::vector<std::string>{"Playlist"});
}

TEST_F(BackupManagerTest, SnapshotOfMissingDirectoryFails) {
    BackupManager mgr(false);
    try {
        mgr.snapshot((fs::path(root_) / "missing").string());
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FilesystemFailure);
    }
    EXPECT_TRUE(BackupManager::find_stale((fs::path(root_) / "missing").string()).empty());
    EXPECT_EQ(siblings(), std::vector<std::string>{"Playlist"});
}

} // namespace test
} // namespace persist
} // namespace plsync

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
#include "sync/diff_engine.h"
#include "sync_error.h"
#include <algorithm>
#include <map>
#include <random>
#include <set>

using namespace plsync;

namespace {

std::vector<ItemRecord> records(const std::vector<std::string>& ids) {
    std::vector<ItemRecord> out;
    for (size_t i = 0; i < ids.size(); i++) {
        out.push_back({ids[i], "Title " + ids[i], std::to_string(i + 1) + " - " + ids[i] + ".mp3", "mp3"});
    }
    return out;
}

std::vector<RemoteEntry> entries(const std::vector<std::string>& ids) {
    std::vector<RemoteEntry> out;
    for (const auto& id : ids) {
        out.push_back({id, "Remote " + id});
    }
    return out;
}

// Each previous id in exactly one of removals/moves/unchanged,
// each remote id in exactly one of additions/moves/unchanged
void expect_partition(const Plan& plan, const std::vector<std::string>& prev,
                      const std::vector<std::string>& remote) {
    std::multiset<std::string> from_prev, from_remote;
    for (const auto& r : plan.removals) from_prev.insert(r.record.item_id);
    for (const auto& m : plan.moves) {
        from_prev.insert(m.item_id);
        from_remote.insert(m.item_id);
    }
    for (const auto& u : plan.unchanged) {
        from_prev.insert(u.item_id);
        from_remote.insert(u.item_id);
    }
    for (const auto& a : plan.additions) from_remote.insert(a.item_id);

    EXPECT_EQ(from_prev, std::multiset<std::string>(prev.begin(), prev.end()));
    EXPECT_EQ(from_remote, std::multiset<std::string>(remote.begin(), remote.end()));
}

} // namespace

TEST(DiffEngineTest, ReorderWithAdditionAndRemoval) {
    std::vector<std::string> prev = {"A", "B", "C"};
    std::vector<std::string> remote = {"C", "A", "D"};
    Plan plan = DiffEngine::compute(records(prev), entries(remote));

    ASSERT_EQ(plan.additions.size(), 1u);
    EXPECT_EQ(plan.additions[0].item_id, "D");
    EXPECT_EQ(plan.additions[0].position, 2u);
    EXPECT_EQ(plan.additions[0].display_title, "Remote D");

    ASSERT_EQ(plan.removals.size(), 1u);
    EXPECT_EQ(plan.removals[0].record.item_id, "B");
    EXPECT_EQ(plan.removals[0].old_position, 1u);

    ASSERT_EQ(plan.moves.size(), 2u);
    EXPECT_EQ(plan.moves[0].item_id, "C");
    EXPECT_EQ(plan.moves[0].from, 2u);
    EXPECT_EQ(plan.moves[0].to, 0u);
    EXPECT_EQ(plan.moves[1].item_id, "A");
    EXPECT_EQ(plan.moves[1].from, 0u);
    EXPECT_EQ(plan.moves[1].to, 1u);

    EXPECT_TRUE(plan.unchanged.empty());
    EXPECT_TRUE(plan.destructive());
    expect_partition(plan, prev, remote);
}

TEST(DiffEngineTest, FirstDownloadIsAllAdditions) {
    Plan plan = DiffEngine::compute({}, entries({"X", "Y"}));
    ASSERT_EQ(plan.additions.size(), 2u);
    EXPECT_EQ(plan.additions[0].item_id, "X");
    EXPECT_EQ(plan.additions[1].item_id, "Y");
    EXPECT_EQ(plan.additions[1].position, 1u);
    EXPECT_FALSE(plan.destructive());
    EXPECT_FALSE(plan.empty());
}

TEST(DiffEngineTest, EmptyRemoteRemovesEverything) {
    Plan plan = DiffEngine::compute(records({"A", "B"}), {});
    EXPECT_EQ(plan.removals.size(), 2u);
    EXPECT_TRUE(plan.additions.empty());
    EXPECT_TRUE(plan.moves.empty());
    EXPECT_TRUE(plan.destructive());
}

TEST(DiffEngineTest, IdenticalListingIsEmptyPlan) {
    Plan plan = DiffEngine::compute(records({"A", "B", "C"}), entries({"A", "B", "C"}));
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(plan.unchanged.size(), 3u);
    // The remote title is carried even for unchanged items
    EXPECT_EQ(plan.unchanged[0].display_title, "Remote A");
}

TEST(DiffEngineTest, AppendKeepsExistingPositions) {
    Plan plan = DiffEngine::compute(records({"A", "B"}), entries({"A", "B", "C"}));
    EXPECT_EQ(plan.unchanged.size(), 2u);
    EXPECT_TRUE(plan.moves.empty());
    ASSERT_EQ(plan.additions.size(), 1u);
    EXPECT_FALSE(plan.destructive());
}

TEST(DiffEngineTest, RemovalShiftsFollowersIntoMoves) {
    std::vector<std::string> prev = {"A", "B", "C", "D"};
    std::vector<std::string> remote = {"A", "C", "D"};
    Plan plan = DiffEngine::compute(records(prev), entries(remote));
    EXPECT_EQ(plan.unchanged.size(), 1u);
    EXPECT_EQ(plan.moves.size(), 2u);
    EXPECT_EQ(plan.removals.size(), 1u);
    expect_partition(plan, prev, remote);
}

TEST(DiffEngineTest, DuplicateRemoteIdsRejected) {
    try {
        DiffEngine::compute({}, entries({"A", "B", "A"}));
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }
    EXPECT_THROW(DiffEngine::compute({}, {{"", "nameless"}}), SyncError);
}

TEST(DiffEngineTest, DuplicateLocalIdsAreCorruptState) {
    std::vector<ItemRecord> prev = records({"A", "B"});
    prev[1].item_id = "A";
    try {
        DiffEngine::compute(prev, entries({"A"}));
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptState);
    }
}

TEST(DiffEngineTest, RandomListingsPartitionAndPlaceEveryItem) {
    std::mt19937 rng(20260518);
    std::vector<std::string> pool;
    for (int i = 0; i < 24; i++) {
        pool.push_back("id" + std::to_string(i));
    }
    auto random_listing = [&]() {
        std::vector<std::string> ids = pool;
        std::shuffle(ids.begin(), ids.end(), rng);
        ids.resize(std::uniform_int_distribution<size_t>(0, pool.size())(rng));
        return ids;
    };

    for (int round = 0; round < 300; round++) {
        std::vector<std::string> prev = random_listing();
        std::vector<std::string> remote = random_listing();
        Plan plan = DiffEngine::compute(records(prev), entries(remote));
        SCOPED_TRACE("round " + std::to_string(round));

        expect_partition(plan, prev, remote);

        std::map<std::string, size_t> prev_pos, remote_pos;
        for (size_t i = 0; i < prev.size(); i++) prev_pos[prev[i]] = i;
        for (size_t i = 0; i < remote.size(); i++) remote_pos[remote[i]] = i;

        for (const auto& a : plan.additions) {
            EXPECT_EQ(prev_pos.count(a.item_id), 0u);
            EXPECT_EQ(a.position, remote_pos.at(a.item_id));
        }
        for (const auto& r : plan.removals) {
            EXPECT_EQ(remote_pos.count(r.record.item_id), 0u);
            EXPECT_EQ(r.old_position, prev_pos.at(r.record.item_id));
        }
        for (const auto& m : plan.moves) {
            EXPECT_EQ(m.from, prev_pos.at(m.item_id));
            EXPECT_EQ(m.to, remote_pos.at(m.item_id));
            EXPECT_NE(m.from, m.to);
        }
        for (const auto& u : plan.unchanged) {
            EXPECT_EQ(prev_pos.at(u.item_id), remote_pos.at(u.item_id));
        }
        EXPECT_EQ(plan.empty(), prev == remote);
    }
}

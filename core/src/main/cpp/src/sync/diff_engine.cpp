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

#include "diff_engine.h"
#include "../sync_error.h"
#include "../util/log.h"
#include <unordered_map>

namespace plsync {

    Plan DiffEngine::compute(const std::vector<ItemRecord>& previous,
                             const std::vector<RemoteEntry>& remote) {
        std::unordered_map<std::string, size_t> old_pos;
        old_pos.reserve(previous.size());
        for (size_t i = 0; i < previous.size(); i++) {
            if (!old_pos.emplace(previous[i].item_id, i).second) {
                throw SyncError(ErrorKind::CorruptState,
                                "item " + previous[i].item_id + " recorded twice in the local state");
            }
        }

        std::unordered_map<std::string, size_t> new_pos;
        new_pos.reserve(remote.size());
        for (size_t i = 0; i < remote.size(); i++) {
            if (remote[i].item_id.empty()) {
                throw SyncError(ErrorKind::InvalidArgument,
                                "remote entry at position " + std::to_string(i) + " has no id");
            }
            if (!new_pos.emplace(remote[i].item_id, i).second) {
                throw SyncError(ErrorKind::InvalidArgument,
                                "item " + remote[i].item_id + " listed twice by the remote");
            }
        }

        Plan plan;
        for (size_t i = 0; i < remote.size(); i++) {
            const RemoteEntry& e = remote[i];
            auto it = old_pos.find(e.item_id);
            if (it == old_pos.end()) {
                plan.additions.push_back({e.item_id, e.display_title, i});
            } else if (it->second != i) {
                plan.moves.push_back({e.item_id, e.display_title, it->second, i});
            } else {
                plan.unchanged.push_back({e.item_id, e.display_title, i});
            }
        }
        for (size_t i = 0; i < previous.size(); i++) {
            if (!new_pos.count(previous[i].item_id)) {
                plan.removals.push_back({previous[i], i});
            }
        }

        debug() << "Plan: " << plan.additions.size() << " additions, " << plan.removals.size()
                << " removals, " << plan.moves.size() << " moves, " << plan.unchanged.size() << " unchanged";
        return plan;
    }

} // namespace plsync

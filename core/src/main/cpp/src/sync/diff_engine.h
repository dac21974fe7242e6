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
#include "../collection_state.h"
#include "../remote/remote_interface.h"

namespace plsync {

    struct PlannedAddition {
        std::string item_id;
        std::string display_title;
        size_t position;              // in the remote order
    };

    struct PlannedRemoval {
        ItemRecord record;
        size_t old_position;
    };

    struct PlannedMove {
        std::string item_id;
        std::string display_title;    // remote title
        size_t from;
        size_t to;
    };

    struct PlannedKeep {
        std::string item_id;
        std::string display_title;
        size_t position;
    };

    /**
     * Plan - additions, moves and unchanged follow the remote order,
     * removals follow the previous order. Every previous id is in exactly one
     * of removals/moves/unchanged, every remote id in exactly one of
     * additions/moves/unchanged.
     */
    struct Plan {
        std::vector<PlannedAddition> additions;
        std::vector<PlannedRemoval> removals;
        std::vector<PlannedMove> moves;
        std::vector<PlannedKeep> unchanged;

        bool empty() const { return additions.empty() && removals.empty() && moves.empty(); }
        bool destructive() const { return !removals.empty() || !moves.empty(); }
    };

    class DiffEngine {
    public:
        // Duplicate previous ids -> SyncError(CorruptState),
        // duplicate remote ids or empty ids -> SyncError(InvalidArgument).
        static Plan compute(const std::vector<ItemRecord>& previous,
                            const std::vector<RemoteEntry>& remote);
    };

} // namespace plsync

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
#include <utility>
#include <vector>
#include "../sync_error.h"

namespace plsync {

    enum class UpdateStatus {
        Committed,   // state document describes the directory after the update
        Aborted      // committed state unchanged, directory restored if it was touched
    };

    inline const char* update_status_name(UpdateStatus s) {
        return s == UpdateStatus::Committed ? "Committed" : "Aborted";
    }

    struct ItemFailure {
        std::string item_id;
        std::string display_title;
        ErrorKind kind;
        std::string message;
    };

    struct ItemMove {
        std::string item_id;
        size_t from;
        size_t to;
    };

    struct UpdateReport {
        std::string collection_id;
        UpdateStatus status = UpdateStatus::Committed;

        std::vector<std::string> added;      // in committed order
        std::vector<std::string> removed;
        std::vector<ItemMove> moved;         // committed positions
        std::vector<ItemFailure> failed;
        std::vector<std::string> excluded;   // newly excluded this run

        // previously committed files that changed name, (from, to)
        std::vector<std::pair<std::string, std::string>> renamed;

        // landed on disk but not part of any committed state (aborted runs)
        std::vector<std::string> uncommitted_additions;

        bool backup_created = false;
        bool cancelled = false;
        std::string error;

        bool committed() const { return status == UpdateStatus::Committed; }

        bool changed() const {
            return !added.empty() || !removed.empty() || !moved.empty() ||
                   !renamed.empty() || !excluded.empty();
        }
    };

    // Outcome of a single item fetched outside any collection
    struct FetchResult {
        std::string item_id;
        std::string title;       // empty when the backend could not tell
        std::string path;        // where the file was placed
        bool replaced = false;   // an earlier copy of the same item was overwritten
    };

} // namespace plsync

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
#include "../collection_state.h"

namespace plsync {
namespace persist {

/**
 * StateStore - JSON document recording a collection directory's committed state
 *
 * Contains:
 * - Collection id and title
 * - Ordered item records (position = array index)
 * - Items excluded from retrieval for good
 *
 * Lives inside the collection directory under a reserved hidden name.
 * Written atomically via temp + rename pattern.
 */
class StateStore {
public:
    explicit StateStore(const std::string& directory, bool durable = true);
    ~StateStore() = default;

    // Missing document -> false. Present but unreadable, malformed or
    // self-inconsistent -> SyncError(CorruptState).
    bool load(CollectionState* out) const;

    // Atomic replace of the document; SyncError(FilesystemFailure) on failure.
    // Stamps updated_unix on the stored copy.
    void store(const CollectionState& state) const;

    bool exists() const;

    // Every record's file must be present in the directory.
    // Throws SyncError(CorruptState) naming the first missing file.
    void verify_files(const CollectionState& state) const;

    const std::string& get_directory() const { return directory_; }
    std::string get_state_path() const;

    // JSON serialization, public for diagnostics and tests
    static std::string to_json(const CollectionState& state);
    static CollectionState from_json(const std::string& json_str);

private:
    std::string directory_;
    bool durable_;
};

} // namespace persist
} // namespace plsync

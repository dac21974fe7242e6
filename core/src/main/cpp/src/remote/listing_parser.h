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
#include "remote_interface.h"

namespace plsync {

    /**
     * Parses a flat playlist document as printed by `yt-dlp --flat-playlist -J`:
     *
     *   { "id": "...", "title": "...", "entries": [ {"id": "...", "title": "..."}, ... ] }
     *
     * Entries that are null, not objects, without an id, with a placeholder
     * title ("[Deleted video]", "[Private video]") or repeating an earlier id
     * are dropped. A document that is not a JSON object, or has no entries
     * array, throws SyncError(RemoteUnavailable).
     */
    class ListingParser {
    public:
        static RemoteListing parse(const std::string& json, const std::string& collection_id);

        static bool is_placeholder_title(const std::string& title);
    };

} // namespace plsync

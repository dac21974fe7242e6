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
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "../sync/media_format.h"

namespace plsync {

    // One listed item, in remote order
    struct RemoteEntry {
        std::string item_id;
        std::string display_title;
    };

    // Validated listing: non-empty unique ids, placeholders already dropped
    struct RemoteListing {
        std::string collection_id;
        std::string title;
        std::vector<RemoteEntry> entries;
    };

    /**
     * Lists the items of a remote collection.
     * Implementations throw SyncError(RemoteUnavailable) when the listing
     * cannot be obtained or parsed.
     */
    class RemoteEnumerator {
    public:
        virtual ~RemoteEnumerator() = default;
        virtual RemoteListing list_items(const std::string& collection_id) = 0;
    };

    struct RetrievalRequest {
        std::string item_id;
        std::string display_title;
        MediaFormat format = MediaFormat::MP3;
        uint32_t quality_ceiling = 0;        // max video height, 0 = best
        std::string staging_dir;             // artifact must land here
        const std::atomic<bool>* cancel = nullptr;
    };

    /**
     * Fetches one item and converts it to the requested format.
     * Returns the path of the finished artifact inside the staging dir.
     * Throws SyncError with kind RetrievalFailed, AgeRestricted or Unavailable.
     */
    class Retriever {
    public:
        virtual ~Retriever() = default;
        virtual std::string materialize(const RetrievalRequest& request) = 0;

        // Display title of a single item, empty when the backend cannot tell.
        // Throws SyncError like materialize().
        virtual std::string lookup_title(const std::string& item_id) {
            (void)item_id;
            return std::string();
        }
    };

} // namespace plsync

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
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace plsync {

    // One downloaded item; its position is its index in CollectionState::items
    struct ItemRecord {
        std::string item_id;
        std::string display_title;
        std::string local_filename;   // includes the ordering prefix
        std::string format;           // output extension, e.g. "mp3"

        bool operator==(const ItemRecord& o) const {
            return item_id == o.item_id && display_title == o.display_title &&
                   local_filename == o.local_filename && format == o.format;
        }
        bool operator!=(const ItemRecord& o) const { return !(*this == o); }
    };

    // Item the retrieval service will never deliver (age gate, removed, private)
    struct ExcludedItem {
        std::string item_id;
        std::string reason;

        bool operator==(const ExcludedItem& o) const {
            return item_id == o.item_id && reason == o.reason;
        }
    };

    struct CollectionState {
        uint32_t version = 1;
        std::string collection_id;
        std::string title;
        std::vector<ItemRecord> items;
        std::vector<ExcludedItem> excluded;
        time_t updated_unix = 0;

        bool empty() const { return items.empty(); }

        const ItemRecord* find(const std::string& item_id) const {
            for (const auto& it : items) {
                if (it.item_id == item_id) return &it;
            }
            return nullptr;
        }

        bool is_excluded(const std::string& item_id) const {
            for (const auto& ex : excluded) {
                if (ex.item_id == item_id) return true;
            }
            return false;
        }

        // Content equality, ignoring the commit timestamp
        bool same_content(const CollectionState& o) const {
            return version == o.version && collection_id == o.collection_id &&
                   title == o.title && items == o.items && excluded == o.excluded;
        }
    };

} // namespace plsync

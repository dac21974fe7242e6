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

#include "listing_parser.h"
#include "../sync_error.h"
#include "../util/log.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <set>
#include <sstream>

namespace plsync {

    bool ListingParser::is_placeholder_title(const std::string& title) {
        return title == "[Deleted video]" || title == "[Private video]" || title == "[Unavailable video]";
    }

    RemoteListing ListingParser::parse(const std::string& json, const std::string& collection_id) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());

        if (doc.HasParseError()) {
            std::ostringstream oss;
            oss << "listing of " << collection_id << " is not valid JSON (offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError()) << ")";
            throw SyncError(ErrorKind::RemoteUnavailable, oss.str());
        }
        if (!doc.IsObject()) {
            throw SyncError(ErrorKind::RemoteUnavailable, "listing of " + collection_id + " is not a JSON object");
        }
        if (!doc.HasMember("entries") || !doc["entries"].IsArray()) {
            throw SyncError(ErrorKind::RemoteUnavailable, "listing of " + collection_id + " has no entries array");
        }

        RemoteListing listing;
        listing.collection_id = collection_id;
        if (doc.HasMember("title") && doc["title"].IsString()) {
            listing.title = doc["title"].GetString();
        }

        std::set<std::string> seen;
        size_t dropped = 0;
        const auto& entries = doc["entries"];
        for (rapidjson::SizeType i = 0; i < entries.Size(); i++) {
            const auto& e = entries[i];
            if (!e.IsObject() || !e.HasMember("id") || !e["id"].IsString()) {
                dropped++;
                continue;
            }
            RemoteEntry entry;
            entry.item_id = e["id"].GetString();
            if (e.HasMember("title") && e["title"].IsString()) {
                entry.display_title = e["title"].GetString();
            }
            if (entry.item_id.empty() || is_placeholder_title(entry.display_title)) {
                dropped++;
                continue;
            }
            if (!seen.insert(entry.item_id).second) {
                debug() << "Dropping repeated entry " << entry.item_id << " in " << collection_id;
                dropped++;
                continue;
            }
            if (entry.display_title.empty()) {
                entry.display_title = entry.item_id;
            }
            listing.entries.push_back(std::move(entry));
        }

        if (dropped > 0) {
            info() << "Listing of " << collection_id << ": dropped " << dropped << " unavailable or malformed entries";
        }
        return listing;
    }

} // namespace plsync

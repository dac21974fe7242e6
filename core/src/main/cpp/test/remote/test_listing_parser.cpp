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
#include "remote/listing_parser.h"
#include "sync_error.h"

using namespace plsync;

namespace {

ErrorKind parse_error_kind(const std::string& json) {
    try {
        ListingParser::parse(json, "PL1");
    } catch (const SyncError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "parse did not throw";
    return ErrorKind::InvalidArgument;
}

} // namespace

TEST(ListingParserTest, ParsesFlatPlaylist) {
    RemoteListing listing = ListingParser::parse(R"({
        "_type": "playlist",
        "id": "PL1",
        "title": "Road Trip",
        "entries": [
            {"_type": "url", "id": "aaa", "title": "First", "duration": 201},
            {"_type": "url", "id": "bbb", "title": "Second"}
        ]
    })", "PL1");

    EXPECT_EQ(listing.collection_id, "PL1");
    EXPECT_EQ(listing.title, "Road Trip");
    ASSERT_EQ(listing.entries.size(), 2u);
    EXPECT_EQ(listing.entries[0].item_id, "aaa");
    EXPECT_EQ(listing.entries[0].display_title, "First");
    EXPECT_EQ(listing.entries[1].item_id, "bbb");
}

TEST(ListingParserTest, DropsUnusableEntries) {
    RemoteListing listing = ListingParser::parse(R"({
        "title": "Mixed",
        "entries": [
            null,
            42,
            {"title": "no id"},
            {"id": "", "title": "empty id"},
            {"id": 7, "title": "numeric id"},
            {"id": "del", "title": "[Deleted video]"},
            {"id": "priv", "title": "[Private video]"},
            {"id": "keep", "title": "Keep"},
            {"id": "keep", "title": "Keep again"}
        ]
    })", "PL1");

    ASSERT_EQ(listing.entries.size(), 1u);
    EXPECT_EQ(listing.entries[0].item_id, "keep");
    EXPECT_EQ(listing.entries[0].display_title, "Keep");
}

TEST(ListingParserTest, MissingTitleFallsBackToId) {
    RemoteListing listing = ListingParser::parse(R"({"entries": [{"id": "xyz"}, {"id": "uvw", "title": ""}]})", "PL1");
    ASSERT_EQ(listing.entries.size(), 2u);
    EXPECT_EQ(listing.entries[0].display_title, "xyz");
    EXPECT_EQ(listing.entries[1].display_title, "uvw");
    EXPECT_TRUE(listing.title.empty());
}

TEST(ListingParserTest, EmptyEntriesIsEmptyListing) {
    RemoteListing listing = ListingParser::parse(R"({"title": "Gone", "entries": []})", "PL1");
    EXPECT_TRUE(listing.entries.empty());
}

TEST(ListingParserTest, MalformedDocumentsAreRemoteUnavailable) {
    EXPECT_EQ(parse_error_kind(""), ErrorKind::RemoteUnavailable);
    EXPECT_EQ(parse_error_kind("{\"entries\": ["), ErrorKind::RemoteUnavailable);
    EXPECT_EQ(parse_error_kind("[]"), ErrorKind::RemoteUnavailable);
    EXPECT_EQ(parse_error_kind("{\"title\": \"x\"}"), ErrorKind::RemoteUnavailable);
    EXPECT_EQ(parse_error_kind("{\"entries\": {}}"), ErrorKind::RemoteUnavailable);
}

TEST(ListingParserTest, Placeholders) {
    EXPECT_TRUE(ListingParser::is_placeholder_title("[Deleted video]"));
    EXPECT_TRUE(ListingParser::is_placeholder_title("[Unavailable video]"));
    EXPECT_FALSE(ListingParser::is_placeholder_title("Deleted video"));
}

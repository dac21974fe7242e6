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
#include "sync/media_format.h"
#include "sync_error.h"

using namespace plsync;

TEST(MediaFormatTest, ParsesKnownNamesCaseInsensitively) {
    MediaFormat f = MediaFormat::WAV;
    ASSERT_TRUE(parse_media_format("mp3", &f));
    EXPECT_EQ(f, MediaFormat::MP3);
    ASSERT_TRUE(parse_media_format("  FLAC ", &f));
    EXPECT_EQ(f, MediaFormat::FLAC);
    ASSERT_TRUE(parse_media_format("WebM", &f));
    EXPECT_EQ(f, MediaFormat::WEBM);
}

TEST(MediaFormatTest, RejectsUnknownNames) {
    MediaFormat f = MediaFormat::MP3;
    EXPECT_FALSE(parse_media_format("", &f));
    EXPECT_FALSE(parse_media_format("mp33", &f));
    EXPECT_FALSE(parse_media_format(".mp3", &f));
    EXPECT_EQ(f, MediaFormat::MP3);

    try {
        media_format_from_string("avi");
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
        EXPECT_NE(std::string(e.what()).find("mkv"), std::string::npos);
    }
}

TEST(MediaFormatTest, NamesMatchExtensions) {
    for (MediaFormat f : {MediaFormat::MP3, MediaFormat::M4A, MediaFormat::FLAC, MediaFormat::OPUS,
                          MediaFormat::WAV, MediaFormat::MP4, MediaFormat::MKV, MediaFormat::WEBM}) {
        EXPECT_EQ(media_format_from_string(to_string(f)), f);
    }
    EXPECT_STREQ(to_string(MediaFormat::M4A), "m4a");
}

TEST(MediaFormatTest, AudioVersusVideo) {
    EXPECT_TRUE(is_audio(MediaFormat::MP3));
    EXPECT_TRUE(is_audio(MediaFormat::OPUS));
    EXPECT_FALSE(is_audio(MediaFormat::MP4));
    EXPECT_FALSE(is_audio(MediaFormat::MKV));
}

TEST(MediaFormatTest, CoverArtContainers) {
    EXPECT_TRUE(supports_cover_art(MediaFormat::MP3));
    EXPECT_TRUE(supports_cover_art(MediaFormat::FLAC));
    EXPECT_TRUE(supports_cover_art(MediaFormat::MKV));
    EXPECT_FALSE(supports_cover_art(MediaFormat::WAV));
    EXPECT_FALSE(supports_cover_art(MediaFormat::WEBM));
}

TEST(MediaFormatTest, SupportedFormatsListsAll) {
    EXPECT_EQ(supported_formats(), "mp3, m4a, flac, opus, wav, mp4, mkv, webm");
}

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

namespace plsync {

    enum class MediaFormat {
        MP3, M4A, FLAC, OPUS, WAV,   // audio only
        MP4, MKV, WEBM               // video + audio
    };

    // Case-insensitive, surrounding whitespace ignored. False for anything else.
    bool parse_media_format(const std::string& text, MediaFormat* out);

    // Same as parse_media_format but throws SyncError(InvalidArgument)
    MediaFormat media_format_from_string(const std::string& text);

    // Lower-case extension, e.g. "mp3"
    const char* to_string(MediaFormat format);

    bool is_audio(MediaFormat format);

    // Containers the downloader can attach a cover image to (not WAV or WEBM)
    bool supports_cover_art(MediaFormat format);

    // "mp3, m4a, ..." for help and error texts
    std::string supported_formats();

} // namespace plsync

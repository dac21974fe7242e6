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

#include "media_format.h"
#include "../sync_error.h"
#include <boost/algorithm/string.hpp>

namespace plsync {

    namespace {
        struct FormatName {
            MediaFormat format;
            const char* name;
        };

        const FormatName kFormats[] = {
            {MediaFormat::MP3, "mp3"},
            {MediaFormat::M4A, "m4a"},
            {MediaFormat::FLAC, "flac"},
            {MediaFormat::OPUS, "opus"},
            {MediaFormat::WAV, "wav"},
            {MediaFormat::MP4, "mp4"},
            {MediaFormat::MKV, "mkv"},
            {MediaFormat::WEBM, "webm"},
        };
    }

    bool parse_media_format(const std::string& text, MediaFormat* out) {
        std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
        for (const auto& f : kFormats) {
            if (key == f.name) {
                *out = f.format;
                return true;
            }
        }
        return false;
    }

    MediaFormat media_format_from_string(const std::string& text) {
        MediaFormat format;
        if (!parse_media_format(text, &format)) {
            throw SyncError(ErrorKind::InvalidArgument,
                            "unsupported format '" + text + "' (expected one of " + supported_formats() + ")");
        }
        return format;
    }

    const char* to_string(MediaFormat format) {
        for (const auto& f : kFormats) {
            if (f.format == format) {
                return f.name;
            }
        }
        return "unknown";
    }

    bool is_audio(MediaFormat format) {
        switch (format) {
            case MediaFormat::MP3:
            case MediaFormat::M4A:
            case MediaFormat::FLAC:
            case MediaFormat::OPUS:
            case MediaFormat::WAV:
                return true;
            default:
                return false;
        }
    }

    bool supports_cover_art(MediaFormat format) {
        return format != MediaFormat::WAV && format != MediaFormat::WEBM;
    }

    std::string supported_formats() {
        std::string out;
        for (const auto& f : kFormats) {
            if (!out.empty()) out += ", ";
            out += f.name;
        }
        return out;
    }

} // namespace plsync

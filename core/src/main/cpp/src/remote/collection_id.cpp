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

#include "collection_id.h"
#include "../sync_error.h"
#include <boost/algorithm/string.hpp>
#include <cctype>

namespace plsync {

    bool is_valid_remote_id(const std::string& id) {
        if (id.empty()) {
            return false;
        }
        for (unsigned char c : id) {
            if (!std::isalnum(c) && c != '-' && c != '_') {
                return false;
            }
        }
        return true;
    }

    std::string collection_id_from_input(const std::string& input) {
        std::string text = boost::algorithm::trim_copy(input);

        std::string id;
        if (text.find("https://") != std::string::npos) {
            size_t at = text.find("list=");
            if (at == std::string::npos) {
                throw SyncError(ErrorKind::InvalidArgument, "'" + text + "' is not a playlist URL (no list= parameter)");
            }
            id = text.substr(at + 5);
            size_t end = id.find_first_of("&#");
            if (end != std::string::npos) {
                id.resize(end);
            }
        } else if (text.find("://") != std::string::npos || text.find("list=") != std::string::npos) {
            throw SyncError(ErrorKind::InvalidArgument, "'" + text + "' is not an https:// playlist URL");
        } else {
            id = text;
        }

        if (!is_valid_remote_id(id)) {
            throw SyncError(ErrorKind::InvalidArgument, "'" + text + "' does not name a playlist");
        }
        return id;
    }

    std::string video_id_from_input(const std::string& input) {
        static const std::string kShortHost = "https://youtu.be/";
        std::string text = boost::algorithm::trim_copy(input);

        std::string id;
        if (boost::algorithm::starts_with(text, kShortHost)) {
            id = text.substr(kShortHost.size());
        } else if (text.find("https://") != std::string::npos) {
            size_t at = text.find("watch?v=");
            if (at == std::string::npos) {
                throw SyncError(ErrorKind::InvalidArgument, "'" + text + "' is not a video URL (no watch?v=)");
            }
            id = text.substr(at + 8);
        } else if (text.find("://") != std::string::npos || text.find('=') != std::string::npos) {
            throw SyncError(ErrorKind::InvalidArgument, "'" + text + "' is not an https:// video URL");
        } else {
            id = text;
        }
        size_t end = id.find_first_of("&?#/");
        if (end != std::string::npos) {
            id.resize(end);
        }

        if (!is_valid_remote_id(id)) {
            throw SyncError(ErrorKind::InvalidArgument, "'" + text + "' does not name a video");
        }
        return id;
    }

    std::string playlist_url(const std::string& collection_id) {
        return std::string(kPlaylistUrlPrefix) + collection_id;
    }

    std::string video_url(const std::string& item_id) {
        return std::string(kVideoUrlPrefix) + item_id;
    }

} // namespace plsync

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

    constexpr const char* kPlaylistUrlPrefix = "https://www.youtube.com/playlist?list=";
    constexpr const char* kVideoUrlPrefix = "https://www.youtube.com/watch?v=";

    // Letters, digits, '-' and '_'
    bool is_valid_remote_id(const std::string& id);

    /**
     * Collection id from user input. Accepts any https:// URL carrying a
     * list= parameter (watch?v=...&list=..., playlist?list=..., share links)
     * or an already bare id. Throws SyncError(InvalidArgument) otherwise.
     */
    std::string collection_id_from_input(const std::string& input);

    /**
     * Video id from user input: an https:// watch?v= URL (other parameters,
     * list= included, are ignored), a https://youtu.be/<id> short link or a
     * bare id. Throws SyncError(InvalidArgument) otherwise.
     */
    std::string video_id_from_input(const std::string& input);

    // https://www.youtube.com/playlist?list=<id>
    std::string playlist_url(const std::string& collection_id);

    // https://www.youtube.com/watch?v=<id>
    std::string video_url(const std::string& item_id);

} // namespace plsync

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
#include <chrono>
#include <string>
#include "remote_interface.h"

namespace plsync {

    /**
     * Reads listings from <root>/<collection_id>.json, same document shape as
     * the downloader prints. Offline mirrors and tests.
     */
    class FileListingEnumerator : public RemoteEnumerator {
    public:
        explicit FileListingEnumerator(const std::string& root);

        RemoteListing list_items(const std::string& collection_id) override;

    private:
        std::string root_;
    };

    /**
     * Runs `<downloader> --flat-playlist -J <playlist url>` and parses its output.
     */
    class CommandEnumerator : public RemoteEnumerator {
    public:
        CommandEnumerator(const std::string& downloader_binary, std::chrono::seconds timeout);

        RemoteListing list_items(const std::string& collection_id) override;

    private:
        std::string binary_;
        std::chrono::seconds timeout_;
    };

} // namespace plsync

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

#include "enumerators.h"
#include "collection_id.h"
#include "listing_parser.h"
#include "../persistence/platform_fs.h"
#include "../sync_error.h"
#include "../util/log.h"
#include "../util/process.h"
#include <boost/algorithm/string.hpp>
#include <filesystem>
#include <system_error>

namespace plsync {

    namespace {
        // Last non-empty stderr line, the downloader's actual complaint
        std::string last_line(const std::string& text) {
            std::string trimmed = boost::algorithm::trim_copy(text);
            size_t nl = trimmed.rfind('\n');
            return nl == std::string::npos ? trimmed : trimmed.substr(nl + 1);
        }
    }

    FileListingEnumerator::FileListingEnumerator(const std::string& root) : root_(root) {
    }

    RemoteListing FileListingEnumerator::list_items(const std::string& collection_id) {
        if (!is_valid_remote_id(collection_id)) {
            throw SyncError(ErrorKind::RemoteUnavailable, "no listing for '" + collection_id + "'");
        }
        std::string path = (std::filesystem::path(root_) / (collection_id + ".json")).string();
        std::string json;
        persist::FSResult res = persist::PlatformFS::read_file(path, &json);
        if (!res.ok) {
            throw SyncError(ErrorKind::RemoteUnavailable, persist::describe_failure("cannot read listing", path, res));
        }
        return ListingParser::parse(json, collection_id);
    }

    CommandEnumerator::CommandEnumerator(const std::string& downloader_binary, std::chrono::seconds timeout)
        : binary_(downloader_binary), timeout_(timeout) {
    }

    RemoteListing CommandEnumerator::list_items(const std::string& collection_id) {
        std::vector<std::string> args = {
            binary_, "--flat-playlist", "-J", "--no-warnings", playlist_url(collection_id)
        };

        debug() << "Running " << boost::algorithm::join(args, " ");
        ExecResult result;
        try {
            result = exec_command(args, std::string(), timeout_);
        } catch (const std::system_error& e) {
            throw SyncError(ErrorKind::RemoteUnavailable, "cannot run " + binary_ + ": " + e.what());
        }

        if (result.timed_out) {
            throw SyncError(ErrorKind::RemoteUnavailable,
                            "listing " + collection_id + " timed out after " + std::to_string(timeout_.count()) + "s");
        }
        if (result.exit_code == 127) {
            throw SyncError(ErrorKind::RemoteUnavailable, "cannot run " + binary_);
        }
        if (result.exit_code != 0) {
            throw SyncError(ErrorKind::RemoteUnavailable,
                            "listing " + collection_id + " failed (exit " + std::to_string(result.exit_code) +
                            "): " + last_line(result.stderr_str));
        }
        return ListingParser::parse(result.stdout_str, collection_id);
    }

} // namespace plsync

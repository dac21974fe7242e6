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

#include "command_retriever.h"
#include "collection_id.h"
#include "../util/log.h"
#include "../util/process.h"
#include <boost/algorithm/string.hpp>
#include <filesystem>
#include <system_error>

namespace plsync {

    namespace fs = std::filesystem;

    CommandRetriever::CommandRetriever(const std::string& downloader_binary, std::chrono::seconds timeout)
        : binary_(downloader_binary), timeout_(timeout) {
    }

    std::vector<std::string> CommandRetriever::build_command(const RetrievalRequest& request) const {
        const std::string ext = to_string(request.format);
        std::vector<std::string> args = {binary_, "--no-playlist", "--no-warnings", "--no-progress"};

        if (is_audio(request.format)) {
            args.insert(args.end(), {"-x", "--audio-format", ext, "--audio-quality", "0"});
        } else {
            std::string selector = request.quality_ceiling > 0
                ? "bv*[height<=" + std::to_string(request.quality_ceiling) + "]+ba/b[height<=" +
                  std::to_string(request.quality_ceiling) + "]"
                : "bv*+ba/b";
            args.insert(args.end(), {"-f", selector, "--merge-output-format", ext});
        }

        args.push_back("--embed-metadata");
        if (supports_cover_art(request.format)) {
            args.push_back("--embed-thumbnail");
        }
        args.insert(args.end(), {"-o", (fs::path(request.staging_dir) / (request.item_id + ".%(ext)s")).string(),
                                 video_url(request.item_id)});
        return args;
    }

    ErrorKind CommandRetriever::classify_failure(const std::string& stderr_text) {
        std::string text = boost::algorithm::to_lower_copy(stderr_text);
        if (text.find("confirm your age") != std::string::npos ||
            text.find("age-restricted") != std::string::npos ||
            text.find("age restricted") != std::string::npos) {
            return ErrorKind::AgeRestricted;
        }
        if (text.find("video unavailable") != std::string::npos ||
            text.find("private video") != std::string::npos ||
            text.find("has been removed") != std::string::npos ||
            text.find("account associated with this video has been terminated") != std::string::npos) {
            return ErrorKind::Unavailable;
        }
        return ErrorKind::RetrievalFailed;
    }

    ExecResult CommandRetriever::run(const std::vector<std::string>& args, const std::string& workdir,
                                     const std::atomic<bool>* cancel) const {
        debug() << "Running " << boost::algorithm::join(args, " ");

        ExecResult result;
        try {
            result = exec_command(args, workdir,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(timeout_), cancel);
        } catch (const std::system_error& e) {
            throw SyncError(ErrorKind::RetrievalFailed, "cannot run " + binary_ + ": " + e.what());
        }

        if (result.cancelled) {
            throw SyncError(ErrorKind::RetrievalFailed, "cancelled");
        }
        if (result.timed_out) {
            throw SyncError(ErrorKind::RetrievalFailed,
                            "timed out after " + std::to_string(timeout_.count()) + "s");
        }
        if (result.exit_code != 0) {
            std::string detail = boost::algorithm::trim_copy(result.stderr_str);
            size_t nl = detail.rfind('\n');
            if (nl != std::string::npos) {
                detail = detail.substr(nl + 1);
            }
            throw SyncError(classify_failure(result.stderr_str),
                            "exit " + std::to_string(result.exit_code) + ": " + detail);
        }
        return result;
    }

    std::string CommandRetriever::lookup_title(const std::string& item_id) {
        if (!is_valid_remote_id(item_id)) {
            throw SyncError(ErrorKind::RetrievalFailed, "refusing malformed item id '" + item_id + "'");
        }
        ExecResult result = run({binary_, "--no-playlist", "--no-warnings", "--skip-download",
                                 "--print", "title", video_url(item_id)},
                                std::string(), nullptr);
        std::string title = result.stdout_str;
        size_t nl = title.find('\n');
        if (nl != std::string::npos) {
            title.resize(nl);
        }
        return boost::algorithm::trim_copy(title);
    }

    std::string CommandRetriever::materialize(const RetrievalRequest& request) {
        if (!is_valid_remote_id(request.item_id)) {
            throw SyncError(ErrorKind::RetrievalFailed, "refusing malformed item id '" + request.item_id + "'");
        }

        run(build_command(request), request.staging_dir, request.cancel);

        fs::path artifact = fs::path(request.staging_dir) / (request.item_id + "." + to_string(request.format));
        std::error_code ec;
        if (!fs::is_regular_file(artifact, ec)) {
            throw SyncError(ErrorKind::RetrievalFailed,
                            "downloader finished but " + artifact.string() + " was not produced");
        }
        return artifact.string();
    }

} // namespace plsync

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
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "remote_interface.h"
#include "../sync_error.h"
#include "../util/process.h"

namespace plsync {

    /**
     * Retriever backed by the external downloader.
     *
     * Audio formats extract and convert (-x --audio-format), video formats
     * pick the best streams under the quality ceiling and merge into the
     * requested container. Output goes to <staging>/<item_id>.<ext>.
     */
    class CommandRetriever : public Retriever {
    public:
        CommandRetriever(const std::string& downloader_binary, std::chrono::seconds timeout);

        std::string materialize(const RetrievalRequest& request) override;

        // Asks the downloader for the title without fetching the media
        std::string lookup_title(const std::string& item_id) override;

        // Command line for a request, exposed for diagnostics and tests
        std::vector<std::string> build_command(const RetrievalRequest& request) const;

        // Maps downloader error output to RetrievalFailed, AgeRestricted or Unavailable
        static ErrorKind classify_failure(const std::string& stderr_text);

    private:
        // Runs the downloader; failures become SyncError via classify_failure()
        ExecResult run(const std::vector<std::string>& args, const std::string& workdir,
                       const std::atomic<bool>* cancel) const;

        std::string binary_;
        std::chrono::seconds timeout_;
    };

} // namespace plsync

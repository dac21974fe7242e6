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
#include <optional>
#include <string>
#include <vector>
#include "executor.h"
#include "sync_config.h"
#include "update_report.h"
#include "../remote/remote_interface.h"

namespace plsync {

    struct SyncJob {
        std::string directory;
        std::string collection_id;
        SyncOptions options;
        bool initial_download = false;   // download() instead of synchronize()
    };

    struct BatchOutcome {
        bool ok = false;
        UpdateReport report;                 // valid when ok
        std::optional<ErrorKind> kind;       // set for SyncError failures
        std::string error;
    };

    /**
     * SyncEngine - keeps collection directories in step with their remote
     * collections.
     *
     * Every call on a directory runs under that directory's lock and first
     * resolves anything a crashed run left behind: a complete backup is
     * restored, half-written backups and transient engine files are removed.
     */
    class SyncEngine {
    public:
        // Throws SyncError(InvalidArgument) for a config that fails validate()
        SyncEngine(RemoteEnumerator& enumerator, Retriever& retriever,
                   const SyncConfig& config = SyncConfig::defaults());

        // Brings `directory` in line with the remote listing of `collection_id`.
        // Per-item failures are in the report; RemoteUnavailable, CorruptState,
        // Locked, EmptyRemoteRefused, InvalidArgument, FilesystemFailure and
        // RestoreFailed are thrown as SyncError.
        UpdateReport synchronize(const std::string& directory, const std::string& collection_id,
                                 const SyncOptions& options = SyncOptions());

        // synchronize() against an empty prior state; AlreadyInitialized if the
        // directory already holds a state document. Requires options.format.
        UpdateReport download(const std::string& directory, const std::string& collection_id,
                              const SyncOptions& options);

        // Fetches one item into a plain directory (not a collection directory,
        // AlreadyInitialized otherwise) as "<title>.<format>". A name taken by
        // another file becomes "<title> [<item_id>].<format>", which is replaced
        // if present. Requires options.format; retrieval errors are thrown.
        FetchResult fetch_item(const std::string& directory, const std::string& item_id,
                               const SyncOptions& options);

        // Restores a stale backup and clears transient files.
        // Returns true if anything had to be cleaned up.
        bool recover(const std::string& directory);

        // Independent transactions on up to `parallelism` threads
        // (0 = config().max_parallel_collections). One outcome per job, in job order.
        std::vector<BatchOutcome> synchronize_batch(const std::vector<SyncJob>& jobs, size_t parallelism = 0);

        void set_phase_hook(Executor::PhaseHook hook) { hook_ = std::move(hook); }

        const SyncConfig& config() const { return config_; }

    private:
        UpdateReport run(const std::string& directory, const std::string& collection_id,
                         const SyncOptions& options, bool initial);

        // Caller holds the lock. Returns true if anything was cleaned up.
        bool resolve_leftovers(const std::string& directory, bool allow_restore);

        RemoteEnumerator& enumerator_;
        Retriever& retriever_;
        SyncConfig config_;
        Executor::PhaseHook hook_;
    };

} // namespace plsync

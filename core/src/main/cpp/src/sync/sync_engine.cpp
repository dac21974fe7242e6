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

#include "sync_engine.h"
#include "diff_engine.h"
#include "renumbering.h"
#include "../persistence/backup_manager.h"
#include "../persistence/config.h"
#include "../persistence/dir_lock.h"
#include "../persistence/platform_fs.h"
#include "../persistence/state_store.h"
#include "../remote/collection_id.h"
#include "../util/log.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <set>
#include <thread>

namespace plsync {

    namespace fs = std::filesystem;
    using namespace persist;

    namespace {

        // Engine files that only exist while a transaction runs
        bool is_transient(const std::string& name) {
            return reserved::is_reserved(name) && name != reserved::kLockFile &&
                   name != reserved::kStateFile;
        }

        size_t clear_transients(const std::string& directory) {
            std::vector<fs::path> doomed;
            std::error_code ec;
            for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
                if (is_transient(it->path().filename().string())) {
                    doomed.push_back(it->path());
                }
            }
            if (ec) {
                throw SyncError(ErrorKind::FilesystemFailure, "cannot list " + directory + ": " + ec.message());
            }
            for (const auto& p : doomed) {
                FSResult res = PlatformFS::remove_tree(p.string());
                if (!res.ok) {
                    throw SyncError(ErrorKind::FilesystemFailure,
                                    describe_failure("cannot remove leftover", p.string(), res));
                }
                info() << "Removed leftover " << p;
            }
            return doomed.size();
        }

        // Leftovers are cleared by the next call on the directory
        void drop_staging(const std::string& staging) {
            FSResult res = PlatformFS::remove_tree(staging);
            if (!res.ok) {
                warning() << describe_failure("cannot remove staging area", staging, res);
            }
        }

        MediaFormat recorded_format(const CollectionState& state, const std::string& collection_id) {
            MediaFormat format;
            for (const auto& item : state.items) {
                if (!item.format.empty()) {
                    if (!parse_media_format(item.format, &format)) {
                        throw SyncError(ErrorKind::CorruptState,
                                        "state document records unknown format '" + item.format + "'");
                    }
                    return format;
                }
            }
            throw SyncError(ErrorKind::InvalidArgument,
                            "no format recorded for " + collection_id + "; one must be given");
        }

    } // namespace

    SyncEngine::SyncEngine(RemoteEnumerator& enumerator, Retriever& retriever, const SyncConfig& config)
        : enumerator_(enumerator), retriever_(retriever), config_(config) {
        if (!config_.validate()) {
            throw SyncError(ErrorKind::InvalidArgument, "invalid sync configuration");
        }
    }

    UpdateReport SyncEngine::synchronize(const std::string& directory, const std::string& collection_id,
                                         const SyncOptions& options) {
        return run(directory, collection_id, options, false);
    }

    UpdateReport SyncEngine::download(const std::string& directory, const std::string& collection_id,
                                      const SyncOptions& options) {
        if (!options.format) {
            throw SyncError(ErrorKind::InvalidArgument, "download requires a format");
        }
        return run(directory, collection_id, options, true);
    }

    FetchResult SyncEngine::fetch_item(const std::string& directory, const std::string& item_id,
                                       const SyncOptions& options) {
        if (directory.empty()) {
            throw SyncError(ErrorKind::InvalidArgument, "empty directory");
        }
        if (!is_valid_remote_id(item_id)) {
            throw SyncError(ErrorKind::InvalidArgument, "'" + item_id + "' is not an item id");
        }
        if (!options.format) {
            throw SyncError(ErrorKind::InvalidArgument, "fetching an item requires a format");
        }
        const bool durable = config_.fsync_enabled;
        const std::string ext = to_string(*options.format);

        FSResult res = PlatformFS::ensure_directory(directory);
        if (!res.ok) {
            throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot create", directory, res));
        }

        DirectoryLock lock(directory);
        StateStore store(directory, durable);
        if (store.exists()) {
            throw SyncError(ErrorKind::AlreadyInitialized,
                            directory + " holds a synchronized playlist; fetch into another directory");
        }
        clear_transients(directory);

        FetchResult result;
        result.item_id = item_id;
        try {
            result.title = retriever_.lookup_title(item_id);
        } catch (const SyncError& e) {
            // materialize() reports the same problem with more detail
            warning() << "No title for " << item_id << ": " << e.what();
        }

        const std::string staging = (fs::path(directory) / reserved::kStagingDir).string();
        res = PlatformFS::ensure_directory(staging);
        if (!res.ok) {
            throw SyncError(ErrorKind::FilesystemFailure,
                            describe_failure("cannot create staging area", staging, res));
        }

        std::string artifact;
        try {
            if (options.cancel && options.cancel->cancelled()) {
                throw SyncError(ErrorKind::RetrievalFailed, "cancelled");
            }
            RetrievalRequest request;
            request.item_id = item_id;
            request.display_title = result.title;
            request.format = *options.format;
            request.quality_ceiling = options.quality_ceiling;
            request.staging_dir = staging;
            request.cancel = options.cancel ? options.cancel->flag() : nullptr;

            info() << "Fetching " << item_id << " into " << directory;
            artifact = retriever_.materialize(request);

            std::error_code ec;
            if (!fs::is_regular_file(artifact, ec)) {
                throw SyncError(ErrorKind::RetrievalFailed, "no artifact at " + artifact);
            }
            if (durable) {
                res = PlatformFS::fsync_file(artifact);
                if (!res.ok) {
                    throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot sync", artifact, res));
                }
            }

            std::string stem = RenumberingPolicy::sanitize_stem(result.title.empty() ? item_id : result.title);
            fs::path target = fs::path(directory) / (stem + "." + ext);
            res = PlatformFS::rename_no_replace(artifact, target.string());
            if (!res.ok && res.err == EEXIST) {
                // Someone else's file keeps its name; a copy of this item is ours to replace
                target = fs::path(directory) / (stem + " [" + item_id + "]." + ext);
                result.replaced = fs::exists(target, ec);
                res = PlatformFS::atomic_replace(artifact, target.string());
            } else if (res.ok && durable) {
                res = PlatformFS::fsync_directory(directory);
            }
            if (!res.ok) {
                throw SyncError(ErrorKind::FilesystemFailure,
                                describe_failure("cannot place " + artifact + " at", target.string(), res));
            }
            result.path = target.string();
        } catch (const SyncError&) {
            drop_staging(staging);
            throw;
        }

        drop_staging(staging);
        info() << "Fetched " << item_id << " to " << result.path;
        return result;
    }

    bool SyncEngine::resolve_leftovers(const std::string& directory, bool allow_restore) {
        bool cleaned = false;

        std::vector<std::string> stale = BackupManager::find_stale(directory);
        if (stale.size() > 1) {
            std::string names;
            for (const auto& s : stale) names += " " + s;
            throw SyncError(ErrorKind::CorruptState,
                            "several unfinished transactions for " + directory + ", resolve by hand:" + names);
        }
        if (!stale.empty()) {
            if (!allow_restore) {
                throw SyncError(ErrorKind::CorruptState,
                                "unfinished transaction on " + directory + " (backup at " + stale[0] +
                                "); run recover first");
            }
            warning() << "Found backup of an interrupted update at " << stale[0];
            BackupManager backups(config_.fsync_enabled);
            BackupHandle handle = BackupManager::adopt(directory, stale[0]);
            backups.restore(handle);
            cleaned = true;
        }

        if (BackupManager::discard_incomplete(directory) > 0) {
            cleaned = true;
        }
        if (clear_transients(directory) > 0) {
            cleaned = true;
        }
        return cleaned;
    }

    bool SyncEngine::recover(const std::string& directory) {
        std::error_code ec;
        if (!fs::exists(directory, ec) && BackupManager::find_stale(directory).empty()) {
            return false;
        }
        FSResult res = PlatformFS::ensure_directory(directory);
        if (!res.ok) {
            throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot create", directory, res));
        }

        DirectoryLock lock(directory);
        bool cleaned = resolve_leftovers(directory, true);
        info() << (cleaned ? "Recovered " : "Nothing to recover in ") << directory;
        return cleaned;
    }

    UpdateReport SyncEngine::run(const std::string& directory, const std::string& collection_id,
                                 const SyncOptions& options, bool initial) {
        if (directory.empty()) {
            throw SyncError(ErrorKind::InvalidArgument, "empty directory");
        }
        if (collection_id.empty()) {
            throw SyncError(ErrorKind::InvalidArgument, "empty collection id");
        }

        FSResult res = PlatformFS::ensure_directory(directory);
        if (!res.ok) {
            throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot create", directory, res));
        }

        DirectoryLock lock(directory);
        resolve_leftovers(directory, config_.recover_stale_backup);

        StateStore store(directory, config_.fsync_enabled);
        CollectionState previous;
        bool exists = store.load(&previous);
        if (exists) {
            if (initial) {
                throw SyncError(ErrorKind::AlreadyInitialized,
                                directory + " already holds " + previous.collection_id + "; synchronize instead");
            }
            if (previous.collection_id != collection_id) {
                throw SyncError(ErrorKind::InvalidArgument,
                                directory + " belongs to " + previous.collection_id + ", not " + collection_id);
            }
            store.verify_files(previous);
        }

        MediaFormat format = options.format ? *options.format : recorded_format(previous, collection_id);

        info() << "Listing " << collection_id;
        RemoteListing listing;
        try {
            listing = enumerator_.list_items(collection_id);
        } catch (const SyncError& e) {
            if (e.kind() == ErrorKind::RemoteUnavailable) {
                throw;
            }
            throw SyncError(ErrorKind::RemoteUnavailable, e.what());
        } catch (const std::exception& e) {
            throw SyncError(ErrorKind::RemoteUnavailable, std::string("listing failed: ") + e.what());
        }

        if (listing.entries.empty() && !previous.items.empty() &&
            options.empty_remote == EmptyRemotePolicy::Refuse) {
            throw SyncError(ErrorKind::EmptyRemoteRefused,
                            "remote listing of " + collection_id + " is empty; refusing to remove " +
                            std::to_string(previous.items.size()) + " local items");
        }

        // Excluded items stay out until the remote drops them
        std::set<std::string> listed;
        for (const auto& e : listing.entries) {
            listed.insert(e.item_id);
        }
        std::vector<ExcludedItem> excluded;
        for (const auto& ex : previous.excluded) {
            if (listed.count(ex.item_id)) {
                excluded.push_back(ex);
            }
        }
        std::vector<RemoteEntry> wanted;
        wanted.reserve(listing.entries.size());
        for (const auto& e : listing.entries) {
            if (!previous.is_excluded(e.item_id)) {
                wanted.push_back(e);
            }
        }

        Plan plan = DiffEngine::compute(previous.items, wanted);

        ExecutionContext ctx;
        ctx.directory = directory;
        ctx.previous = previous;
        ctx.state_exists = exists;
        ctx.excluded = std::move(excluded);
        ctx.collection_id = collection_id;
        if (!listing.title.empty()) {
            ctx.title = listing.title;
        } else if (!previous.title.empty()) {
            ctx.title = previous.title;
        } else {
            ctx.title = collection_id;
        }
        ctx.format = format;
        ctx.quality_ceiling = options.quality_ceiling;
        ctx.cancel = options.cancel ? options.cancel->flag() : nullptr;

        Executor executor(retriever_, config_);
        if (hook_) {
            executor.set_phase_hook(hook_);
        }
        return executor.execute(ctx, plan);
    }

    std::vector<BatchOutcome> SyncEngine::synchronize_batch(const std::vector<SyncJob>& jobs, size_t parallelism) {
        std::vector<BatchOutcome> outcomes(jobs.size());
        if (jobs.empty()) {
            return outcomes;
        }
        if (parallelism == 0) {
            parallelism = config_.max_parallel_collections;
        }
        parallelism = std::min(parallelism, jobs.size());

        std::atomic<size_t> next{0};
        auto worker = [&](size_t worker_id) {
            Logger::get().setThreadName("sync-" + std::to_string(worker_id));
            for (size_t i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1)) {
                const SyncJob& job = jobs[i];
                BatchOutcome& out = outcomes[i];
                try {
                    out.report = job.initial_download
                        ? download(job.directory, job.collection_id, job.options)
                        : synchronize(job.directory, job.collection_id, job.options);
                    out.ok = true;
                } catch (const SyncError& e) {
                    error() << "Sync of " << job.directory << " failed: " << e.what();
                    out.kind = e.kind();
                    out.error = e.what();
                } catch (const std::exception& e) {
                    error() << "Sync of " << job.directory << " failed: " << e.what();
                    out.error = e.what();
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(parallelism);
        for (size_t t = 0; t < parallelism; t++) {
            threads.emplace_back(worker, t);
        }
        for (auto& t : threads) {
            t.join();
        }
        return outcomes;
    }

} // namespace plsync

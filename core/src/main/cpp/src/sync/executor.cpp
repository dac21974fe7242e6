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

#include "executor.h"
#include "renumbering.h"
#include "../persistence/backup_manager.h"
#include "../persistence/config.h"
#include "../persistence/platform_fs.h"
#include "../persistence/state_store.h"
#include "../util/log.h"
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <set>
#include <unordered_map>
#include <unistd.h>

namespace plsync {

    namespace fs = std::filesystem;
    using namespace persist;

    const char* phase_name(Phase phase) {
        switch (phase) {
            case Phase::Additions:     return "additions";
            case Phase::Backup:        return "backup";
            case Phase::Removals:      return "removals";
            case Phase::Renames:       return "renames";
            case Phase::StateCommit:   return "state commit";
            case Phase::BackupDiscard: return "backup discard";
        }
        return "unknown";
    }

    namespace {

        struct RemoteSlot {
            const std::string* item_id = nullptr;
            const std::string* display_title = nullptr;
        };

        // One item of the layout about to be committed
        struct FinalItem {
            ItemRecord record;          // local_filename is the target name
            std::string current_name;
            bool existing = false;
            size_t old_position = 0;
        };

        std::string join(const std::string& dir, const std::string& name) {
            return (fs::path(dir) / name).string();
        }

        // Overwrites dst
        void move_file(const std::string& from, const std::string& to, bool durable) {
            FSResult res;
            if (durable) {
                res = PlatformFS::atomic_replace(from, to);
            } else {
                res = ::rename(from.c_str(), to.c_str()) == 0 ? FSResult{true, 0} : FSResult{false, errno};
            }
            if (!res.ok) {
                throw SyncError(ErrorKind::FilesystemFailure,
                                describe_failure("cannot move " + from + " to", to, res));
            }
        }

        void rename_or_throw(const std::string& dir, const std::string& from, const std::string& to) {
            FSResult res = PlatformFS::rename_no_replace(join(dir, from), join(dir, to));
            if (!res.ok) {
                throw SyncError(ErrorKind::FilesystemFailure,
                                describe_failure("cannot rename " + from + " to", join(dir, to), res));
            }
        }

        void remove_staging(const std::string& staging) {
            std::error_code ec;
            if (!fs::exists(staging, ec)) {
                return;
            }
            FSResult res = PlatformFS::remove_tree(staging);
            if (!res.ok) {
                warning() << describe_failure("cannot remove staging area", staging, res);
            }
        }

    } // namespace

    Executor::Executor(Retriever& retriever, const SyncConfig& config)
        : retriever_(retriever), config_(config) {
    }

    void Executor::enter(Phase phase) {
        debug() << "Entering phase: " << phase_name(phase);
        if (hook_) {
            hook_(phase);
        }
    }

    UpdateReport Executor::execute(const ExecutionContext& ctx, const Plan& plan) {
        UpdateReport report;
        report.collection_id = ctx.collection_id;

        const bool durable = config_.fsync_enabled;
        const std::string& dir = ctx.directory;
        const std::string staging = join(dir, reserved::kStagingDir);
        const std::string format = to_string(ctx.format);
        const std::vector<ItemRecord>& previous = ctx.previous.items;
        const size_t remote_size = plan.additions.size() + plan.moves.size() + plan.unchanged.size();

        std::set<std::string> committed_names;
        std::unordered_map<std::string, size_t> old_pos;
        for (size_t i = 0; i < previous.size(); i++) {
            committed_names.insert(previous[i].local_filename);
            old_pos[previous[i].item_id] = i;
        }

        // Phase 1: additions. Nothing committed can be lost here.
        std::unordered_map<std::string, std::string> landed;   // item id -> current name
        std::vector<std::string> landed_order;
        std::vector<ExcludedItem> newly_excluded;

        auto record_failure = [&](const PlannedAddition& a, ErrorKind kind, const std::string& message) {
            warning() << "Skipping " << a.item_id << " (" << a.display_title << "): "
                      << error_kind_name(kind) << ": " << message;
            report.failed.push_back({a.item_id, a.display_title, kind, message});
            if (is_permanent_exclusion(kind)) {
                newly_excluded.push_back({a.item_id, error_kind_name(kind)});
                report.excluded.push_back(a.item_id);
            }
        };
        auto cancelled = [&]() {
            return ctx.cancel != nullptr && ctx.cancel->load(std::memory_order_acquire);
        };

        if (!plan.additions.empty()) {
            enter(Phase::Additions);
            FSResult res = PlatformFS::ensure_directory(staging);
            if (!res.ok) {
                throw SyncError(ErrorKind::FilesystemFailure,
                                describe_failure("cannot create staging area", staging, res));
            }

            size_t pending_seq = 0;
            for (const auto& a : plan.additions) {
                if (cancelled()) {
                    report.cancelled = true;
                    break;
                }

                RetrievalRequest request;
                request.item_id = a.item_id;
                request.display_title = a.display_title;
                request.format = ctx.format;
                request.quality_ceiling = ctx.quality_ceiling;
                request.staging_dir = staging;
                request.cancel = ctx.cancel;

                std::string artifact;
                try {
                    artifact = retriever_.materialize(request);
                } catch (const SyncError& e) {
                    if (cancelled()) {
                        report.cancelled = true;
                        break;
                    }
                    record_failure(a, e.kind(), e.what());
                    continue;
                } catch (const std::exception& e) {
                    record_failure(a, ErrorKind::RetrievalFailed, e.what());
                    continue;
                }

                std::error_code ec;
                if (!fs::is_regular_file(artifact, ec)) {
                    record_failure(a, ErrorKind::RetrievalFailed, "no artifact at " + artifact);
                    continue;
                }

                // Names still owned by committed items are not ours to take yet
                std::string target = RenumberingPolicy::filename(
                    a.position, remote_size, RenumberingPolicy::sanitize_stem(a.display_title), format);
                if (committed_names.count(target)) {
                    target = std::string(reserved::kPendingPrefix) + std::to_string(pending_seq++) + "-" +
                             RenumberingPolicy::sanitize_stem(a.item_id) + "." + format;
                }

                try {
                    move_file(artifact, join(dir, target), durable);
                } catch (const SyncError& e) {
                    record_failure(a, e.kind(), e.what());
                    continue;
                }
                landed[a.item_id] = target;
                landed_order.push_back(a.item_id);
                info() << "Added " << a.item_id << " as " << target;
            }
            if (report.cancelled) {
                warning() << "Update of " << dir << " cancelled, " << landed.size() << " of "
                          << plan.additions.size() << " additions landed";
            }
        }

        // Final layout: remote order, restricted to items that exist on disk
        std::vector<RemoteSlot> slots(remote_size);
        for (const auto& a : plan.additions) slots[a.position] = {&a.item_id, &a.display_title};
        for (const auto& m : plan.moves) slots[m.to] = {&m.item_id, &m.display_title};
        for (const auto& u : plan.unchanged) slots[u.position] = {&u.item_id, &u.display_title};

        std::vector<FinalItem> layout;
        layout.reserve(remote_size);
        for (const auto& slot : slots) {
            FinalItem item;
            auto op = old_pos.find(*slot.item_id);
            if (op != old_pos.end()) {
                item.record = previous[op->second];
                item.current_name = item.record.local_filename;
                item.existing = true;
                item.old_position = op->second;
            } else {
                auto lp = landed.find(*slot.item_id);
                if (lp == landed.end()) {
                    continue;
                }
                item.record.item_id = *slot.item_id;
                item.record.format = format;
                item.current_name = lp->second;
            }
            item.record.display_title = *slot.display_title;
            if (item.record.format.empty()) {
                item.record.format = format;
            }
            layout.push_back(std::move(item));
        }

        std::vector<const FinalItem*> renames;
        for (size_t i = 0; i < layout.size(); i++) {
            FinalItem& item = layout[i];
            std::string stem = item.existing ? RenumberingPolicy::stem_of(item.current_name)
                                             : RenumberingPolicy::sanitize_stem(item.record.display_title);
            item.record.local_filename = RenumberingPolicy::filename(i, layout.size(), stem, item.record.format);
            if (item.record.local_filename != item.current_name) {
                renames.push_back(&item);
            }

            if (item.existing) {
                if (item.old_position != i) {
                    report.moved.push_back({item.record.item_id, item.old_position, i});
                }
                if (item.record.local_filename != item.current_name) {
                    report.renamed.emplace_back(item.current_name, item.record.local_filename);
                }
            } else {
                report.added.push_back(item.record.item_id);
            }
        }
        for (const auto& r : plan.removals) {
            report.removed.push_back(r.record.item_id);
        }

        auto aborted = [&](const std::string& why) {
            report.status = UpdateStatus::Aborted;
            report.error = why;
            report.added.clear();
            report.removed.clear();
            report.moved.clear();
            report.renamed.clear();
            report.excluded.clear();
            report.uncommitted_additions = landed_order;
            remove_staging(staging);
            return report;
        };

        // Phase 2: snapshot before anything committed is touched
        BackupManager backups(durable);
        BackupHandle backup;
        if (!plan.removals.empty() || !renames.empty()) {
            enter(Phase::Backup);
            try {
                backup = backups.snapshot(dir);
            } catch (const SyncError& e) {
                error() << "Aborting update of " << dir << ": " << e.what();
                return aborted(e.what());
            }
            report.backup_created = true;
        }

        CollectionState next;
        next.collection_id = ctx.collection_id;
        next.title = ctx.title;
        next.excluded = ctx.excluded;
        next.excluded.insert(next.excluded.end(), newly_excluded.begin(), newly_excluded.end());
        for (const auto& item : layout) {
            next.items.push_back(item.record);
        }

        // Phases 3 to 5: any failure restores the snapshot
        try {
            if (!plan.removals.empty()) {
                enter(Phase::Removals);
                for (const auto& r : plan.removals) {
                    std::error_code ec;
                    fs::remove(join(dir, r.record.local_filename), ec);
                    if (ec) {
                        throw SyncError(ErrorKind::FilesystemFailure,
                                        "cannot remove " + join(dir, r.record.local_filename) + ": " + ec.message());
                    }
                    info() << "Removed " << r.record.item_id << " (" << r.record.local_filename << ")";
                }
            }

            if (!renames.empty()) {
                enter(Phase::Renames);
                std::vector<std::string> temps;
                temps.reserve(renames.size());
                std::string tag = "-" + std::to_string(::getpid());
                for (size_t i = 0; i < renames.size(); i++) {
                    temps.push_back(std::string(reserved::kRenamePrefix) + std::to_string(i) + tag);
                    rename_or_throw(dir, renames[i]->current_name, temps[i]);
                }
                for (size_t i = 0; i < renames.size(); i++) {
                    rename_or_throw(dir, temps[i], renames[i]->record.local_filename);
                    debug() << "Renamed " << renames[i]->current_name << " -> " << renames[i]->record.local_filename;
                }
            }

            if (durable && (!plan.removals.empty() || !renames.empty())) {
                FSResult res = PlatformFS::fsync_directory(dir);
                if (!res.ok) {
                    throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot fsync", dir, res));
                }
            }

            if (!(ctx.state_exists && next.same_content(ctx.previous))) {
                enter(Phase::StateCommit);
                StateStore(dir, durable).store(next);
            }
        } catch (const std::exception& e) {
            error() << "Update of " << dir << " failed, restoring: " << e.what();
            backups.restore(backup);
            return aborted(e.what());
        }

        // Phase 6: committed from here on
        if (backup.active()) {
            enter(Phase::BackupDiscard);
            try {
                backups.commit(backup);
            } catch (const SyncError& e) {
                error() << "Update of " << dir << " committed but the backup was not discarded: " << e.what();
            }
        }

        remove_staging(staging);

        info() << "Committed " << ctx.collection_id << ": " << report.added.size() << " added, "
               << report.removed.size() << " removed, " << report.moved.size() << " moved, "
               << report.failed.size() << " failed";
        return report;
    }

} // namespace plsync

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
#include <functional>
#include <string>
#include "diff_engine.h"
#include "sync_config.h"
#include "update_report.h"
#include "../collection_state.h"
#include "../remote/remote_interface.h"

namespace plsync {

    enum class Phase {
        Additions,
        Backup,
        Removals,
        Renames,
        StateCommit,
        BackupDiscard
    };

    const char* phase_name(Phase phase);

    struct ExecutionContext {
        std::string directory;

        // Committed state the plan was computed from, as loaded.
        // Empty for a first download.
        CollectionState previous;
        bool state_exists = false;

        // Exclusions still relevant to the remote listing
        std::vector<ExcludedItem> excluded;

        std::string collection_id;
        std::string title;

        MediaFormat format = MediaFormat::MP3;
        uint32_t quality_ceiling = 0;
        const std::atomic<bool>* cancel = nullptr;
    };

    /**
     * Executor - applies a Plan to a collection directory in strict phase order:
     *
     *   1. additions   retrieve into staging, move into the directory
     *   2. backup      snapshot, only when files are removed or renamed
     *   3. removals
     *   4. renames     two passes through unique temporary names
     *   5. state       atomic replace of the state document
     *   6. discard     drop the backup
     *
     * Per-item failures in phase 1 are reported and skipped. Any failure in
     * phases 3 to 5 restores the snapshot and yields an Aborted report; a
     * failing restore throws SyncError(RestoreFailed).
     *
     * The caller holds the directory lock.
     */
    class Executor {
    public:
        // Invoked at the start of every phase that runs
        using PhaseHook = std::function<void(Phase)>;

        Executor(Retriever& retriever, const SyncConfig& config);

        void set_phase_hook(PhaseHook hook) { hook_ = std::move(hook); }

        UpdateReport execute(const ExecutionContext& ctx, const Plan& plan);

    private:
        void enter(Phase phase);

        Retriever& retriever_;
        SyncConfig config_;
        PhaseHook hook_;
    };

} // namespace plsync

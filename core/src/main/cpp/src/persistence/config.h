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
#include <cstdint>
#include <cstddef>
#include <string>

namespace plsync {
namespace persist {

// Names the engine owns inside (and next to) a collection directory.
// Everything starting with kPrefix belongs to the engine.
namespace reserved {
    constexpr const char* kPrefix        = ".plsync";
    constexpr const char* kStateFile     = ".plsync-state.json";
    constexpr const char* kStagingDir    = ".plsync-staging";
    constexpr const char* kLockFile      = ".plsync.lock";
    constexpr const char* kPendingPrefix = ".plsync-pending-";
    constexpr const char* kRenamePrefix  = ".plsync-rename-";
    constexpr const char* kTempSuffix    = ".tmp";

    // Backup lives beside the directory: <parent>/.<dirname><kBackupInfix><unique>
    constexpr const char* kBackupInfix   = ".plsync-backup-";
    constexpr const char* kPartialSuffix = ".partial";   // snapshot still copying
    constexpr const char* kDiscardSuffix = ".discard";   // committed, being deleted

    inline bool is_reserved(const std::string& name) {
        return name.compare(0, std::char_traits<char>::length(kPrefix), kPrefix) == 0;
    }

    // Engine files that never take part in snapshot/restore
    inline bool is_transaction_local(const std::string& name) {
        return name == kLockFile || name == kStagingDir;
    }
}

namespace state_doc {
    constexpr uint32_t kVersion = 1;
}

namespace naming {
    constexpr const char* kSeparator = " - ";
    constexpr size_t kMaxStemLength = 120;
    constexpr const char* kFallbackStem = "untitled";
}

namespace copy {
    constexpr size_t kBufferSize = 1 << 20;   // 1MB copy buffer
}

} // namespace persist
} // namespace plsync

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
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include "media_format.h"

namespace plsync {

/**
 * Runtime configuration for the sync engine, shared by every collection
 * processed with one engine instance.
 */
struct SyncConfig {
    // fsync files and directories on every durable step (tests may turn it off)
    bool fsync_enabled = true;

    // A backup left by a crashed run is restored before the next update.
    // When false the update refuses to run (CorruptState) until recover() is called.
    bool recover_stale_backup = true;

    // Per item retrieval limit, 0 = unlimited
    std::chrono::seconds retrieval_timeout{600};

    size_t max_parallel_collections = 2;

    std::string downloader_binary = "yt-dlp";

    /**
     * Create config with defaults, optionally reading from environment
     */
    static SyncConfig defaults() {
        SyncConfig cfg;

        if (const char* env = std::getenv("PLSYNC_FSYNC")) {
            cfg.fsync_enabled = std::string(env) != "0";
        }

        if (const char* env = std::getenv("PLSYNC_RECOVER_STALE_BACKUP")) {
            cfg.recover_stale_backup = std::string(env) != "0";
        }

        if (const char* env = std::getenv("PLSYNC_RETRIEVAL_TIMEOUT")) {
            cfg.retrieval_timeout = std::chrono::seconds(std::stoll(env));
        }

        if (const char* env = std::getenv("PLSYNC_MAX_PARALLEL")) {
            cfg.max_parallel_collections = std::stoull(env);
        }

        if (const char* env = std::getenv("PLSYNC_DOWNLOADER")) {
            cfg.downloader_binary = env;
        }

        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (retrieval_timeout.count() < 0) {
            return false;
        }
        if (max_parallel_collections < 1) {
            return false;
        }
        if (downloader_binary.empty()) {
            return false;
        }
        return true;
    }
};

// What to do when the remote listing comes back empty
enum class EmptyRemotePolicy {
    Refuse,   // fail with EmptyRemoteRefused, directory untouched
    Wipe      // remove every local item
};

/**
 * Cooperative cancellation shared between the caller and a running update.
 * Only additions observe it; once the destructive phase starts the update
 * runs to commit or restore.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    const std::atomic<bool>* flag() const { return &cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

// Per call parameters
struct SyncOptions {
    // Unset: keep the format recorded in the state document
    std::optional<MediaFormat> format;

    // Maximum video height, 0 = best available. Ignored for audio.
    uint32_t quality_ceiling = 0;

    EmptyRemotePolicy empty_remote = EmptyRemotePolicy::Refuse;

    std::shared_ptr<CancellationToken> cancel;
};

} // namespace plsync

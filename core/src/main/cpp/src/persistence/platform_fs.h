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
#include <functional>
#include <string>
#include <utility>

namespace plsync {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Human readable "<op> <path>: <strerror>" for error messages
        std::string describe_failure(const std::string& op, const std::string& path, const FSResult& r);

        // Filter for tree copies: return true to leave an entry (by file name) out
        using SkipEntry = std::function<bool(const std::string& name)>;

        class PlatformFS {
        public:
            static FSResult fsync_file(const std::string& path);
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(2) + fsync of the destination's parent directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            // Fails with EEXIST instead of overwriting dst
            static FSResult rename_no_replace(const std::string& src, const std::string& dst);

            // temp + fsync + rename; durable=false skips the fsyncs
            static FSResult write_file_atomic(const std::string& path, const std::string& content,
                                              bool durable = true);
            static FSResult read_file(const std::string& path, std::string* out);

            // Byte copy through a temporary sibling, then atomic_replace onto dst
            static FSResult copy_file(const std::string& src, const std::string& dst,
                                      bool durable = true);
            // Recursive copy of src's contents into dst (created if missing)
            static FSResult copy_tree(const std::string& src, const std::string& dst,
                                      bool durable = true, const SkipEntry& skip = nullptr);
            static FSResult remove_tree(const std::string& path);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
        };

    }
} // namespace plsync::persist

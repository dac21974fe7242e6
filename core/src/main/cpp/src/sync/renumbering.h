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
#include <cstddef>
#include <string>

namespace plsync {

    /**
     * Positional filename prefixes.
     *
     *   "<token> - <stem>.<format>"
     *
     * The token is the 1-based position zero-padded to the number of digits
     * of the collection size, so the directory lists in collection order.
     * A size crossing a power of ten changes every token.
     */
    class RenumberingPolicy {
    public:
        static size_t width_for(size_t collection_size);

        static std::string token(size_t position, size_t collection_size);

        static std::string filename(size_t position, size_t collection_size,
                                    const std::string& stem, const std::string& format);

        // Title -> portable file name stem; never empty, never reserved
        static std::string sanitize_stem(const std::string& title);

        // Inverse of filename() for the stem: drops the token and the extension
        static std::string stem_of(const std::string& filename);
    };

} // namespace plsync

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

#include "renumbering.h"
#include "../persistence/config.h"
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <cstring>

namespace plsync {

    using namespace persist;

    size_t RenumberingPolicy::width_for(size_t collection_size) {
        size_t width = 1;
        while (collection_size >= 10) {
            collection_size /= 10;
            width++;
        }
        return width;
    }

    std::string RenumberingPolicy::token(size_t position, size_t collection_size) {
        std::string digits = std::to_string(position + 1);
        size_t width = width_for(collection_size);
        if (digits.size() < width) {
            digits.insert(0, width - digits.size(), '0');
        }
        return digits;
    }

    std::string RenumberingPolicy::filename(size_t position, size_t collection_size,
                                            const std::string& stem, const std::string& format) {
        return token(position, collection_size) + naming::kSeparator + stem + "." + format;
    }

    std::string RenumberingPolicy::sanitize_stem(const std::string& title) {
        static const char* kInvalid = "/\\:*?\"<>|";

        std::string out;
        out.reserve(title.size());
        bool pending_space = false;
        for (unsigned char c : title) {
            if (c < 0x20 || c == 0x7f || std::strchr(kInvalid, c) != nullptr) {
                continue;
            }
            if (std::isspace(c)) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(static_cast<char>(c));
        }

        // Cap without cutting a UTF-8 sequence in half
        if (out.size() > naming::kMaxStemLength) {
            size_t cut = naming::kMaxStemLength;
            while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
                cut--;
            }
            out.resize(cut);
        }

        // Hidden names belong to the engine, trailing dots confuse the extension
        boost::algorithm::trim_left_if(out, boost::algorithm::is_any_of(". "));
        boost::algorithm::trim_right_if(out, boost::algorithm::is_any_of(". "));

        if (out.empty()) {
            return naming::kFallbackStem;
        }
        return out;
    }

    std::string RenumberingPolicy::stem_of(const std::string& filename) {
        std::string stem = filename;
        size_t dot = stem.rfind('.');
        if (dot != std::string::npos && dot > 0) {
            stem.resize(dot);
        }

        size_t digits = 0;
        while (digits < stem.size() && std::isdigit(static_cast<unsigned char>(stem[digits]))) {
            digits++;
        }
        const std::string sep = naming::kSeparator;
        if (digits > 0 && stem.compare(digits, sep.size(), sep) == 0) {
            stem.erase(0, digits + sep.size());
        }

        if (stem.empty()) {
            return naming::kFallbackStem;
        }
        return stem;
    }

} // namespace plsync

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

#include "state_store.h"
#include "platform_fs.h"
#include "config.h"
#include "../sync_error.h"
#include "../util/log.h"
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <filesystem>
#include <set>
#include <sstream>

namespace plsync {
namespace persist {

namespace fs = std::filesystem;

StateStore::StateStore(const std::string& directory, bool durable)
    : directory_(directory), durable_(durable) {
}

std::string StateStore::get_state_path() const {
    fs::path p(directory_);
    p /= reserved::kStateFile;
    return p.string();
}

bool StateStore::exists() const {
    std::error_code ec;
    return fs::exists(get_state_path(), ec);
}

bool StateStore::load(CollectionState* out) const {
    std::string state_path = get_state_path();

    std::error_code ec;
    if (!fs::exists(state_path, ec)) {
        return false;
    }

    std::string json_str;
    FSResult res = PlatformFS::read_file(state_path, &json_str);
    if (!res.ok) {
        throw SyncError(ErrorKind::CorruptState, describe_failure("cannot read state document", state_path, res));
    }
    if (json_str.empty()) {
        throw SyncError(ErrorKind::CorruptState, "state document " + state_path + " is empty");
    }

    *out = from_json(json_str);
    debug() << "Loaded state for " << out->collection_id << " with " << out->items.size() << " items";
    return true;
}

void StateStore::store(const CollectionState& state) const {
    FSResult res = PlatformFS::ensure_directory(directory_);
    if (!res.ok) {
        throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot create", directory_, res));
    }

    CollectionState stamped = state;
    stamped.version = state_doc::kVersion;
    stamped.updated_unix = std::time(nullptr);

    std::string state_path = get_state_path();
    res = PlatformFS::write_file_atomic(state_path, to_json(stamped), durable_);
    if (!res.ok) {
        throw SyncError(ErrorKind::FilesystemFailure, describe_failure("cannot write state document", state_path, res));
    }
}

void StateStore::verify_files(const CollectionState& state) const {
    for (size_t i = 0; i < state.items.size(); i++) {
        const ItemRecord& rec = state.items[i];
        fs::path p = fs::path(directory_) / rec.local_filename;
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            std::ostringstream oss;
            oss << "state document lists '" << rec.local_filename << "' (item " << rec.item_id
                << " at position " << i << ") but the file is missing from " << directory_;
            throw SyncError(ErrorKind::CorruptState, oss.str());
        }
    }
}

std::string StateStore::to_json(const CollectionState& state) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("version");
    writer.Uint(state.version);

    writer.Key("collection_id");
    writer.String(state.collection_id.c_str());

    writer.Key("title");
    writer.String(state.title.c_str());

    writer.Key("updated_unix");
    writer.Int64(static_cast<int64_t>(state.updated_unix));

    writer.Key("items");
    writer.StartArray();
    for (const auto& item : state.items) {
        writer.StartObject();
        writer.Key("item_id");
        writer.String(item.item_id.c_str());
        writer.Key("display_title");
        writer.String(item.display_title.c_str());
        writer.Key("local_filename");
        writer.String(item.local_filename.c_str());
        writer.Key("format");
        writer.String(item.format.c_str());
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("excluded");
    writer.StartArray();
    for (const auto& ex : state.excluded) {
        writer.StartObject();
        writer.Key("item_id");
        writer.String(ex.item_id.c_str());
        writer.Key("reason");
        writer.String(ex.reason.c_str());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    return buffer.GetString();
}

namespace {

[[noreturn]] void corrupt(const std::string& what) {
    throw SyncError(ErrorKind::CorruptState, "state document: " + what);
}

std::string required_string(const rapidjson::Value& obj, const char* key, const std::string& where) {
    if (!obj.HasMember(key) || !obj[key].IsString()) {
        corrupt(where + " lacks string field '" + key + "'");
    }
    return obj[key].GetString();
}

// A local filename must name a plain entry of the collection directory
bool is_plain_filename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos) return false;
    return !reserved::is_reserved(name);
}

} // namespace

CollectionState StateStore::from_json(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str());

    // Check for parse errors
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "JSON parse error at offset " << doc.GetErrorOffset()
            << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        error() << oss.str();
        corrupt(oss.str());
    }

    if (!doc.IsObject()) {
        corrupt("top level is not an object");
    }

    CollectionState state;

    if (doc.HasMember("version")) {
        if (!doc["version"].IsUint()) {
            corrupt("'version' is not an unsigned integer");
        }
        state.version = doc["version"].GetUint();
        if (state.version > state_doc::kVersion) {
            corrupt("unsupported version " + std::to_string(state.version));
        }
    }

    state.collection_id = required_string(doc, "collection_id", "document");
    if (state.collection_id.empty()) {
        corrupt("empty collection_id");
    }
    state.title = required_string(doc, "title", "document");

    if (doc.HasMember("updated_unix") && doc["updated_unix"].IsInt64()) {
        state.updated_unix = static_cast<time_t>(doc["updated_unix"].GetInt64());
    }

    if (!doc.HasMember("items") || !doc["items"].IsArray()) {
        corrupt("missing 'items' array");
    }

    std::set<std::string> seen_ids;
    std::set<std::string> seen_files;
    const auto& items = doc["items"];
    for (rapidjson::SizeType i = 0; i < items.Size(); i++) {
        std::string where = "items[" + std::to_string(i) + "]";
        if (!items[i].IsObject()) {
            corrupt(where + " is not an object");
        }
        const auto& obj = items[i];

        ItemRecord rec;
        rec.item_id = required_string(obj, "item_id", where);
        rec.display_title = required_string(obj, "display_title", where);
        rec.local_filename = required_string(obj, "local_filename", where);
        rec.format = required_string(obj, "format", where);

        if (rec.item_id.empty()) {
            corrupt(where + " has an empty item_id");
        }
        if (!is_plain_filename(rec.local_filename)) {
            corrupt(where + " has an invalid local_filename '" + rec.local_filename + "'");
        }
        if (!seen_ids.insert(rec.item_id).second) {
            corrupt("duplicate item_id " + rec.item_id);
        }
        if (!seen_files.insert(rec.local_filename).second) {
            corrupt("duplicate local_filename " + rec.local_filename);
        }

        state.items.push_back(std::move(rec));
    }

    if (doc.HasMember("excluded")) {
        if (!doc["excluded"].IsArray()) {
            corrupt("'excluded' is not an array");
        }
        const auto& excluded = doc["excluded"];
        for (rapidjson::SizeType i = 0; i < excluded.Size(); i++) {
            std::string where = "excluded[" + std::to_string(i) + "]";
            if (!excluded[i].IsObject()) {
                corrupt(where + " is not an object");
            }
            ExcludedItem ex;
            ex.item_id = required_string(excluded[i], "item_id", where);
            if (excluded[i].HasMember("reason") && excluded[i]["reason"].IsString()) {
                ex.reason = excluded[i]["reason"].GetString();
            }
            if (seen_ids.count(ex.item_id)) {
                corrupt("item " + ex.item_id + " is both present and excluded");
            }
            state.excluded.push_back(std::move(ex));
        }
    }

    return state;
}

} // namespace persist
} // namespace plsync

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * In-memory remote collaborators for engine tests
 */

#pragma once

#include <gmock/gmock.h>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "remote/remote_interface.h"
#include "sync_error.h"
#include "../persistence/test_helpers.h"

namespace plsync::test {

// Serves listings set up by the test; unknown ids are RemoteUnavailable
class FakeEnumerator : public RemoteEnumerator {
public:
    void set(const std::string& collection_id, const std::vector<RemoteEntry>& entries,
             const std::string& title = "Mix") {
        std::lock_guard<std::mutex> lock(mutex_);
        listings_[collection_id] = RemoteListing{collection_id, title, entries};
    }

    RemoteListing list_items(const std::string& collection_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_++;
        auto it = listings_.find(collection_id);
        if (it == listings_.end()) {
            throw SyncError(ErrorKind::RemoteUnavailable, "no listing for " + collection_id);
        }
        return it->second;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, RemoteListing> listings_;
    int calls_ = 0;
};

// Content a retrieved item carries, so tests can tell files apart
inline std::string content_of(const std::string& item_id) {
    return "media:" + item_id;
}

/**
 * Retriever mock. By default every request succeeds and writes
 * <staging>/<id>.<format> holding content_of(id); ids registered with
 * fail_with() throw instead.
 */
class MockRetriever : public Retriever {
public:
    MockRetriever() {
        ON_CALL(*this, materialize(::testing::_))
            .WillByDefault([this](const RetrievalRequest& r) { return fake(r); });
    }

    MOCK_METHOD(std::string, materialize, (const RetrievalRequest& request), (override));
    MOCK_METHOD(std::string, lookup_title, (const std::string& item_id), (override));

    void fail_with(const std::string& item_id, ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[item_id] = kind;
    }

    void clear_failures() {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.clear();
    }

    std::string fake(const RetrievalRequest& r) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = failures_.find(r.item_id);
            if (it != failures_.end()) {
                throw SyncError(it->second, "simulated failure for " + r.item_id);
            }
        }
        std::string path = r.staging_dir + "/" + r.item_id + "." + to_string(r.format);
        persist::test::write_file(path, content_of(r.item_id));
        return path;
    }

private:
    std::mutex mutex_;
    std::map<std::string, ErrorKind> failures_;
};

// Thrown from a phase hook to stop a transaction the way a crash would:
// not a std::exception, so no restore runs on the way out
struct SimulatedCrash {
    const char* phase;
};

} // namespace plsync::test

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

#include "../src/persistence/state_store.h"
#include "../src/remote/collection_id.h"
#include "../src/remote/command_retriever.h"
#include "../src/remote/enumerators.h"
#include "../src/sync/sync_engine.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"
#include <getopt.h>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>

using namespace plsync;

namespace {

    enum ExitCode {
        kExitOk = 0,          // committed, nothing failed
        kExitFailed = 1,      // aborted, or the update was refused
        kExitUsage = 2,
        kExitPartial = 3      // committed, some items could not be retrieved
    };

    std::shared_ptr<CancellationToken> g_cancel = std::make_shared<CancellationToken>();

    extern "C" void on_interrupt(int) {
        g_cancel->cancel();
    }

    void print_usage() {
        std::printf(
            "usage: plsync [options] download <dir> <playlist-url> --format <fmt>\n"
            "       plsync [options] sync <dir> [<playlist-url>]\n"
            "       plsync [options] sync-all <dir>...\n"
            "       plsync [options] recover <dir>\n"
            "       plsync [options] get <dir> <video-url>... --format <fmt>\n"
            "\n"
            "options:\n"
            "  -f, --format FMT        %s\n"
            "  -q, --quality HEIGHT    maximum video height (video formats)\n"
            "      --allow-empty       an empty remote playlist removes every local item\n"
            "      --no-recover        stop instead of restoring an interrupted update\n"
            "      --no-fsync          skip fsync (faster, not crash safe)\n"
            "  -j, --jobs N            playlists synchronized in parallel (sync-all)\n"
            "      --downloader BIN    downloader executable (default yt-dlp)\n"
            "      --listing-dir DIR   read listings from DIR/<id>.json instead of the network\n"
            "      --timeout SEC       per item download limit\n"
            "      --log-dir DIR       write the log to DIR/plsync.log\n"
            "  -l, --log-level LEVEL   TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n"
            "  -h, --help\n"
            "\n"
            "exit status: 0 ok, 1 failed or aborted, 2 usage, 3 committed with failed items\n",
            supported_formats().c_str());
    }

    int print_report(const std::string& directory, const UpdateReport& r) {
        std::cout << directory << ": " << update_status_name(r.status) << "\n";
        if (!r.committed()) {
            std::cout << "  error: " << r.error << "\n";
            if (!r.uncommitted_additions.empty()) {
                std::cout << "  " << r.uncommitted_additions.size()
                          << " downloaded items were not committed and will be retried\n";
            }
            return kExitFailed;
        }
        std::cout << "  added " << r.added.size() << ", removed " << r.removed.size()
                  << ", moved " << r.moved.size() << ", renamed " << r.renamed.size() << "\n";
        for (const auto& f : r.failed) {
            std::cout << "  failed " << f.item_id << " (" << f.display_title << "): "
                      << error_kind_name(f.kind) << ": " << f.message << "\n";
        }
        if (r.cancelled) {
            std::cout << "  interrupted, remaining items will be retrieved next time\n";
        }
        return r.failed.empty() ? kExitOk : kExitPartial;
    }

    // Collection id recorded in an already synchronized directory
    std::string recorded_collection(const std::string& directory) {
        persist::StateStore store(directory);
        CollectionState state;
        if (!store.load(&state)) {
            throw SyncError(ErrorKind::InvalidArgument,
                            directory + " has not been downloaded yet; give a playlist URL");
        }
        return state.collection_id;
    }

} // namespace

int main(int argc, char** argv) {
    initLoggingFromEnv();
    SyncConfig config;
    try {
        config = SyncConfig::defaults();
    } catch (const std::exception& e) {
        std::cerr << "plsync: bad PLSYNC_* environment value: " << e.what() << "\n";
        return kExitUsage;
    }

    SyncOptions options;
    options.cancel = g_cancel;
    std::string listing_dir;
    std::string log_dir;
    size_t jobs = 0;

    enum { OPT_ALLOW_EMPTY = 256, OPT_NO_RECOVER, OPT_NO_FSYNC, OPT_DOWNLOADER, OPT_LISTING_DIR,
           OPT_TIMEOUT, OPT_LOG_DIR };
    static struct option long_options[] = {{"format", required_argument, 0, 'f'},
                                           {"quality", required_argument, 0, 'q'},
                                           {"jobs", required_argument, 0, 'j'},
                                           {"log-level", required_argument, 0, 'l'},
                                           {"help", no_argument, 0, 'h'},
                                           {"allow-empty", no_argument, 0, OPT_ALLOW_EMPTY},
                                           {"no-recover", no_argument, 0, OPT_NO_RECOVER},
                                           {"no-fsync", no_argument, 0, OPT_NO_FSYNC},
                                           {"downloader", required_argument, 0, OPT_DOWNLOADER},
                                           {"listing-dir", required_argument, 0, OPT_LISTING_DIR},
                                           {"timeout", required_argument, 0, OPT_TIMEOUT},
                                           {"log-dir", required_argument, 0, OPT_LOG_DIR},
                                           {0, 0, 0, 0}};

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, "f:q:j:l:h", long_options, nullptr)) != -1) {
            switch (opt) {
            case 'f':
                options.format = media_format_from_string(optarg);
                break;
            case 'q':
                options.quality_ceiling = static_cast<uint32_t>(std::stoul(optarg));
                break;
            case 'j':
                jobs = std::stoul(optarg);
                break;
            case 'l':
                if (!setLogLevelFromString(optarg)) {
                    std::cerr << "plsync: unknown log level '" << optarg << "'\n";
                    return kExitUsage;
                }
                break;
            case 'h':
                print_usage();
                return kExitOk;
            case OPT_ALLOW_EMPTY:
                options.empty_remote = EmptyRemotePolicy::Wipe;
                break;
            case OPT_NO_RECOVER:
                config.recover_stale_backup = false;
                break;
            case OPT_NO_FSYNC:
                config.fsync_enabled = false;
                break;
            case OPT_DOWNLOADER:
                config.downloader_binary = optarg;
                break;
            case OPT_LISTING_DIR:
                listing_dir = optarg;
                break;
            case OPT_TIMEOUT:
                config.retrieval_timeout = std::chrono::seconds(std::stoll(optarg));
                break;
            case OPT_LOG_DIR:
                log_dir = optarg;
                break;
            default:
                print_usage();
                return kExitUsage;
            }
        }
    } catch (const SyncError& e) {
        std::cerr << "plsync: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::logic_error& e) {
        // std::stoul and friends
        std::cerr << "plsync: bad numeric option: " << e.what() << "\n";
        return kExitUsage;
    }

    if (optind >= argc) {
        print_usage();
        return kExitUsage;
    }
    std::string command = argv[optind++];
    std::vector<std::string> operands(argv + optind, argv + argc);

    if (!config.validate()) {
        std::cerr << "plsync: invalid configuration\n";
        return kExitUsage;
    }

    std::unique_ptr<LogManager> log_manager;
    if (!log_dir.empty()) {
        try {
            log_manager = std::make_unique<LogManager>(log_dir);
        } catch (const std::exception& e) {
            std::cerr << "plsync: " << e.what() << "\n";
            return kExitFailed;
        }
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    std::unique_ptr<RemoteEnumerator> enumerator;
    if (!listing_dir.empty()) {
        enumerator = std::make_unique<FileListingEnumerator>(listing_dir);
    } else {
        enumerator = std::make_unique<CommandEnumerator>(config.downloader_binary, config.retrieval_timeout);
    }
    CommandRetriever retriever(config.downloader_binary, config.retrieval_timeout);

    try {
        SyncEngine engine(*enumerator, retriever, config);

        if (command == "download") {
            if (operands.size() != 2 || !options.format) {
                print_usage();
                return kExitUsage;
            }
            UpdateReport r = engine.download(operands[0], collection_id_from_input(operands[1]), options);
            return print_report(operands[0], r);
        }

        if (command == "sync") {
            if (operands.empty() || operands.size() > 2) {
                print_usage();
                return kExitUsage;
            }
            std::string id = operands.size() == 2 ? collection_id_from_input(operands[1])
                                                  : recorded_collection(operands[0]);
            UpdateReport r = engine.synchronize(operands[0], id, options);
            return print_report(operands[0], r);
        }

        if (command == "sync-all") {
            if (operands.empty()) {
                print_usage();
                return kExitUsage;
            }
            std::vector<SyncJob> batch;
            for (const auto& dir : operands) {
                SyncJob job;
                job.directory = dir;
                job.collection_id = recorded_collection(dir);
                job.options = options;
                batch.push_back(job);
            }
            std::vector<BatchOutcome> outcomes = engine.synchronize_batch(batch, jobs);
            int status = kExitOk;
            for (size_t i = 0; i < outcomes.size(); i++) {
                int rc;
                if (outcomes[i].ok) {
                    rc = print_report(batch[i].directory, outcomes[i].report);
                } else {
                    std::cout << batch[i].directory << ": "
                              << (outcomes[i].kind ? error_kind_name(*outcomes[i].kind) : "Error")
                              << ": " << outcomes[i].error << "\n";
                    rc = kExitFailed;
                }
                if (rc == kExitFailed || status == kExitOk) {
                    status = rc;
                }
            }
            return status;
        }

        if (command == "get") {
            if (operands.size() < 2 || !options.format) {
                print_usage();
                return kExitUsage;
            }
            // Every URL is attempted; failures are listed at the end
            std::vector<std::string> errors;
            size_t fetched = 0;
            for (size_t i = 1; i < operands.size(); i++) {
                try {
                    FetchResult r = engine.fetch_item(operands[0], video_id_from_input(operands[i]), options);
                    std::cout << (r.replaced ? "replaced " : "saved ") << r.path << "\n";
                    fetched++;
                } catch (const SyncError& e) {
                    if (e.kind() == ErrorKind::AlreadyInitialized || e.kind() == ErrorKind::Locked) {
                        throw;
                    }
                    errors.push_back(operands[i] + ": " + error_kind_name(e.kind()) + ": " + e.what());
                }
            }
            for (const auto& err : errors) {
                std::cout << "  failed " << err << "\n";
            }
            if (errors.empty()) {
                return kExitOk;
            }
            return fetched > 0 ? kExitPartial : kExitFailed;
        }

        if (command == "recover") {
            if (operands.size() != 1) {
                print_usage();
                return kExitUsage;
            }
            bool recovered = engine.recover(operands[0]);
            std::cout << operands[0] << ": " << (recovered ? "recovered" : "nothing to recover") << "\n";
            return kExitOk;
        }
    } catch (const SyncError& e) {
        std::cerr << "plsync: " << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return e.kind() == ErrorKind::InvalidArgument ? kExitUsage : kExitFailed;
    }

    std::cerr << "plsync: unknown command '" << command << "'\n";
    print_usage();
    return kExitUsage;
}

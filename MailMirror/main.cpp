//
//  main.cpp
//  MailMirror
//
//  Copyright © 2017 Foundry 376. All rights reserved.
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the MailMirror package.
//

#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <time.h>
#include <sqlite3.h>

#include "MailCore/MailCore.h"
#include "SQLiteCpp/SQLiteCpp.h"
#include "StanfordCPPLib/exceptions.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "mailmirror/models/account.hpp"
#include "mailmirror/account_config_cache.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/mail_store.hpp"
#include "mailmirror/mail_processor.hpp"
#include "mailmirror/mutation_coordinator.hpp"
#include "mailmirror/sync_worker.hpp"
#include "mailmirror/thread_resolver.hpp"
#include "mailmirror/sync_exception.hpp"
#include "mailmirror/thread_utils.hpp"
#include "mailmirror/constants.hpp"
#include "mailmirror/spd_log_extensions.hpp"

using namespace std;
using namespace mailcore;
using nlohmann::json;
using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

shared_ptr<SyncWorker> bgWorker = nullptr;
std::thread * bgThread = nullptr;

std::mutex bgMtx;
std::condition_variable bgCv;
bool bgSyncRequested = false;
vector<string> bgSyncFolders{};

std::mutex coutMtx;

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
    static ArgStatus Empty(const Option& option, bool)
    {
        return (option.arg == 0 || option.arg[0] == 0) ? option::ARG_OK : option::ARG_IGNORE;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path mailmirror [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, ACCOUNT, MODE, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {ACCOUNT, 0,"a", "account", CArg::Optional,  "  --account, -a  \tRequired: Account JSON with credentials." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: sync, once, reset, or migrate." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: allow the process to run without a parent bound to stdin." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log all IMAP traffic for debugging purposes." },
    {0,0,0,0,0,0}
};

void emit(json packet) {
    lock_guard<mutex> lck(coutMtx);
    cout << "\n" << packet.dump() << "\n";
    cout.flush();
}

void runBackgroundSyncWorker(AccountConfigCache * configs, string accountId) {
    while (true) {
        vector<string> folders{};
        {
            unique_lock<mutex> lck(bgMtx);
            bgCv.wait(lck, []{ return bgSyncRequested; });
            bgSyncRequested = false;
            folders = bgSyncFolders;
        }

        json resp = {{"type", "sync-result"}};
        try {
            // pick up configuration changes made since the last cycle
            bgWorker->setAccount(configs->get(accountId));
            bgWorker->configure();
            SyncCycleResult result = bgWorker->syncNow(folders);
            resp["result"] = result.toJSON();
        } catch (SyncException & ex) {
            spdlog::get("logger")->error("Sync cycle failed: {}", ex.toJSON().dump());
            resp["error"] = ex.toJSON();
        } catch (SQLite::Exception & ex) {
            spdlog::get("logger")->error("Sync cycle failed: {}", ex.what());
            resp["error"] = {{"what", ex.what()}};
        } catch (json::exception & ex) {
            spdlog::get("logger")->error("Sync cycle failed: {}", ex.what());
            resp["error"] = {{"what", ex.what()}};
        }
        emit(resp);
    }
}

int runSingleFunctionAndExit(std::function<void()> fn) {
    json resp = {{"error", nullptr}};
    int code = 0;
    try {
        fn();
    } catch (std::exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    cout << "\n" << resp.dump();
    return code;
}

void runListenOnMainThread(AccountConfigCache * configs, string accountId) {
    MailStore store;
    IMAPSession fgSession;

    time_t lostCINAt = 0;

    while(true) {
        AutoreleasePool pool;
        json packet = {};
        string inputLine;
        getline(cin, inputLine);

        // cin is interrupted when the debugger attaches, and that's ok. If cin is
        // disconnected for more than 30 seconds, it means we have been oprhaned and
        // we should exit.
        if (cin.good()) {
            lostCINAt = 0;
        } else {
            if (lostCINAt == 0) {
                lostCINAt = time(0);
            }
            if (time(0) - lostCINAt > 30) {
                // note: don't run termination / stack trace handlers,
                // just exit.
                std::exit(141);
            }
            cin.clear();
            std::this_thread::sleep_for(std::chrono::microseconds(1000));
            continue;
        }

        if (inputLine == "") {
            continue;
        }

        try {
            packet = json::parse(inputLine);
        } catch (json::parse_error & ex) {
            json resp = {{"error", ex.what()}};
            spdlog::get("logger")->error(resp.dump());
            emit(resp);
            continue;
        }

        string type = packet.count("type") && packet["type"].is_string() ? packet["type"].get<string>() : "";

        try {
            // these never need the account, and must work even when its
            // configuration can't be loaded
            if (type == "cancel") {
                if (bgWorker) bgWorker->cancel();
                continue;
            }

            if (type == "invalidate-config") {
                string target = packet.count("accountId") && packet["accountId"].is_string() ? packet["accountId"].get<string>() : "";
                configs->invalidate(target);
                if (packet.count("account") && packet["account"].is_object()) {
                    auto replacement = make_shared<Account>(packet["account"]);
                    if (replacement->valid() != "") {
                        throw SyncException("account-invalid", "Account is missing required fields: " + replacement->valid(), false);
                    }
                    configs->put(replacement);
                }
                continue;
            }

            if (type == "sync-now") {
                lock_guard<mutex> lck(bgMtx);
                bgSyncFolders = {};
                if (packet.count("folders") && packet["folders"].is_array()) {
                    bgSyncFolders = packet["folders"].get<vector<string>>();
                }
                bgSyncRequested = true;
                bgCv.notify_one();
                continue;
            }

            auto account = configs->get(accountId);

            if (type == "insert-fetched") {
                MailProcessor processor{account, &store};
                string localId = processor.insertFetched(FetchedMessage::fromJSON(packet["message"]));
                emit({{"type", "insert-fetched-result"}, {"localId", localId}});
            }

            if (type == "apply-mutation") {
                MailUtils::configureSessionForAccount(fgSession, account);
                MutationCoordinator coordinator{account, &store, &fgSession};
                if (BulkMutationRequest::isBulkJSON(packet["mutation"])) {
                    BulkMutationResult result = coordinator.applyBulkMutation(BulkMutationRequest::fromJSON(packet["mutation"]));
                    emit({{"type", "bulk-mutation-result"}, {"result", result.toJSON()}});
                } else {
                    MutationResult result = coordinator.applyMutation(MutationRequest::fromJSON(packet["mutation"]));
                    emit({{"type", "mutation-result"}, {"result", result.toJSON()}});
                }
            }

            if (type == "resolve-threads") {
                MailUtils::configureSessionForAccount(fgSession, account);
                GmailThreadSource source{&fgSession};
                ThreadResolver resolver{account, &store, &source};
                auto threads = resolver.resolveThreads();
                json errors = json::array();
                for (auto & error : resolver.errors()) {
                    errors.push_back(error.toJSON());
                }
                emit({{"type", "threads-result"}, {"threads", ThreadResolver::assignmentsToJSON(threads)}, {"headerChainsOnly", resolver.headerChainsOnly()}, {"errors", errors}});
            }

        } catch (SyncException & ex) {
            spdlog::get("logger")->error("Unable to handle {} packet: {}", type, ex.toJSON().dump());
            emit({{"type", type + "-result"}, {"error", ex.toJSON()}});
        } catch (SQLite::Exception & ex) {
            spdlog::get("logger")->error("Unable to handle {} packet: {}", type, ex.what());
            emit({{"type", type + "-result"}, {"error", {{"what", ex.what()}}}});
        } catch (json::exception & ex) {
            spdlog::get("logger")->error("Unable to handle {} packet: {}", type, ex.what());
            emit({{"type", type + "-result"}, {"error", {{"what", ex.what()}}}});
        }
    }
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

    // initialize the stanford exception handler
    exceptions::setProgramNameForStackTrace(argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || argc == 0 || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // check required environment
    string eConfigDirPath = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");

    if (eConfigDirPath == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // initialize SQLite3 cache directory to the config dir path, ensuring we store
    // /everything/ in the place the user has specified in case it's symlinked, on
    // another volume, etc.
    sqlite3_temp_directory = sqlite3_mprintf("%s", eConfigDirPath.c_str());

    // handle --mode migrate early for speed
    string mode(options[MODE].arg);

    if (mode == "migrate") {
        return runSingleFunctionAndExit([](){
            MailStore store;
            store.migrate();
        });
    }

    // get the account via param or stdin
    shared_ptr<Account> account = nullptr;
    try {
        if (options[ACCOUNT].count() > 0 && options[ACCOUNT].arg != nullptr) {
            account = make_shared<Account>(json::parse(options[ACCOUNT].arg));
        } else {
            cout << "\nWaiting for Account JSON:\n";
            string inputLine;
            getline(cin, inputLine);
            account = make_shared<Account>(json::parse(inputLine.c_str()));
        }
    } catch (std::exception & ex) {
        json resp = { { "error", string("Account JSON could not be parsed: ") + ex.what() } };
        cout << "\n" << resp.dump();
        return 1;
    }

    if (account->valid() != "") {
        json resp = { { "error", "Account is missing required fields:" + account->valid() } };
        cout << "\n" << resp.dump();
        return 1;
    }

    // setup logging to file or console
    std::vector<shared_ptr<spdlog::sinks::sink>> sinks;

    if (!options[ORPHAN]) {
        // If we're attached to the host process, log everything to a
        // rotating log file with the default logger format.
        spdlog::set_formatter(SPDFormatterWithThreadNames("%P [%N] %+"));
        string logPath = eConfigDirPath + FS_PATH_SEP + "mailmirror-" + account->id() + ".log";
        sinks.push_back(make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
        sinks.push_back(make_shared<SPDFlusherSink>());
    } else {
        // If we're attached to a debugger / console, log everything to
        // stdout in an abbreviated format.
        spdlog::set_formatter(SPDFormatterWithThreadNames("%l [%N]: %v"));
        sinks.push_back(make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    }

    // Always log critical errors to the stderr as well as a log file / stdout.
    // When attached to the client, these are saved and if we terminates, reported.
    auto stderr_sink = make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    spdlog::create("logger", std::begin(sinks), std::end(sinks));

    if (options[VERBOSE]) {
        MailUtils::enableVerboseLogging();
    }

    if (mode == "reset") {
        return runSingleFunctionAndExit([&](){
            MailStore store;
            store.resetForAccount(account->id());
        });
    }

    AccountConfigCache configs{eConfigDirPath};
    configs.put(account);

    if (mode == "once") {
        return runSingleFunctionAndExit([&](){
            SyncWorker worker{account};
            worker.configure();
            SyncCycleResult result = worker.syncNow({});
            cout << "\n" << result.toJSON().dump();
        });
    }

    if (mode == "sync") {
        spdlog::get("logger")->info("------------- Starting Sync ({}) ---------------", account->emailAddress());

        string accountId = account->id();
        bgWorker = make_shared<SyncWorker>(account);
        bgThread = new std::thread([&configs, accountId]() {
            SetThreadName("background");
            runBackgroundSyncWorker(&configs, accountId);
        });

        if (!options[ORPHAN]) {
            runListenOnMainThread(&configs, accountId);
        } else {
            {
                lock_guard<mutex> lck(bgMtx);
                bgSyncRequested = true;
                bgCv.notify_one();
            }
            bgThread->join(); // will block forever.
        }
    }

    return 0;
}

#include "mailmirror/sync_worker.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/sync_exception.hpp"
#include "mailmirror/constants.hpp"

#include <algorithm>

using namespace std;
using namespace mailcore;

nlohmann::json SyncCycleResult::toJSON() const {
    nlohmann::json errorsJSON = nlohmann::json::array();
    for (const auto & error : errors) {
        errorsJSON.push_back(error.toJSON());
    }
    return {
        {"folders", folders},
        {"mirror", mirror.toJSON()},
        {"delta", DeltaPlanner::deltaToJSON(delta)},
        {"reconcile", reconcile.toJSON()},
        {"threads", ThreadResolver::assignmentsToJSON(threads)},
        {"threadsFromHeadersOnly", threadsFromHeadersOnly},
        {"errors", errorsJSON},
        {"cancelled", cancelled},
    };
}

SyncWorker::SyncWorker(shared_ptr<Account> account, IMAPSession * session) :
    session(session != nullptr ? session : &ownSession),
    store(new MailStore()),
    logger(spdlog::get("logger")),
    cancelled(false),
    account(account)
{
}

void SyncWorker::configure() {
    if (session == &ownSession) {
        MailUtils::configureSessionForAccount(ownSession, currentAccount());
    }
}

void SyncWorker::setAccount(shared_ptr<Account> next) {
    lock_guard<mutex> lock(accountMtx);
    account = next;
}

shared_ptr<Account> SyncWorker::currentAccount() {
    lock_guard<mutex> lock(accountMtx);
    return account;
}

void SyncWorker::cancel() {
    logger->info("Cancelling sync...");
    cancelled = true;
}

bool SyncWorker::isCancelled() {
    return cancelled.load();
}

vector<string> SyncWorker::syncFolderList() {
    auto acct = currentAccount();
    if (acct->includeFolders().size() > 0) {
        return acct->includeFolders();
    }

    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    Array * remoteFolders = session->fetchAllFolders(&err);
    if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "syncFolderList - fetchAllFolders");
    }

    // Excluded folders are still scanned: a message moved into one must be
    // recognized as moved, not deleted.
    vector<string> folders{};
    for (unsigned int ii = 0; ii < remoteFolders->count(); ii++) {
        IMAPFolder * remote = (IMAPFolder *)remoteFolders->objectAtIndex(ii);
        if (remote->flags() & IMAPFolderFlagNoSelect) {
            continue;
        }
        folders.push_back(string(remote->path()->UTF8Characters()));
    }
    sort(folders.begin(), folders.end());
    return folders;
}

SyncCycleResult SyncWorker::syncNow(vector<string> folders) {
    SyncCycleResult result{};
    cancelled = false;

    auto acct = currentAccount();
    logger->info("------------- Sync cycle ({}) ---------------", acct->emailAddress());

    // Phase 1: folder listing
    if (folders.size() == 0) {
        try {
            folders = syncFolderList();
        } catch (SyncException & ex) {
            // fall back to the folders the mirror already knows about
            logger->warn("syncNow - unable to list folders: {}", ex.toJSON().dump());
            result.errors.push_back(SyncErrorFromException(ex, acct->id()));
        }
    }
    result.folders = folders;

    // Phase 2: mirror
    ServerMirror mirror{acct, store.get(), session};
    mirror.setCancelFlag(&cancelled);
    result.mirror = mirror.syncFolders(folders);
    if (isCancelled()) {
        result.cancelled = true;
        return result;
    }

    // Phase 3: fetch planning. The delta is handed to the host, which fetches.
    DeltaPlanner planner{acct, store.get()};
    result.delta = planner.computeFetchDelta(FetchFilter::forAccount(acct));
    if (isCancelled()) {
        result.cancelled = true;
        return result;
    }

    // Phase 4: reconcile
    Reconciler reconciler{acct, store.get()};
    result.reconcile = reconciler.reconcile();
    if (isCancelled()) {
        result.cancelled = true;
        return result;
    }

    // Phase 5: threads
    GmailThreadSource source{session};
    ThreadResolver resolver{acct, store.get(), &source};
    result.threads = resolver.resolveThreads();
    result.threadsFromHeadersOnly = resolver.headerChainsOnly();
    for (auto & error : resolver.errors()) {
        result.errors.push_back(error);
    }

    return result;
}

/** SyncWorker [MailMirror]
 *
 * Author(s): Ben Gotow
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SyncWorker_hpp
#define SyncWorker_hpp

#include <stdio.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "MailCore/MailCore.h"

#include "mailmirror/models/account.hpp"
#include "mailmirror/mail_store.hpp"
#include "mailmirror/server_mirror.hpp"
#include "mailmirror/delta_planner.hpp"
#include "mailmirror/reconciler.hpp"
#include "mailmirror/thread_resolver.hpp"

struct SyncCycleResult {
    std::vector<std::string> folders;
    MirrorSyncStats mirror;
    std::map<std::string, std::vector<uint32_t>> delta;
    ReconcileStats reconcile;
    std::map<std::string, ThreadAssignment> threads;
    bool threadsFromHeadersOnly = false;
    std::vector<SyncError> errors;
    bool cancelled = false;

    nlohmann::json toJSON() const;
};

/**
 Runs one account's sync phases in strict order: folder listing, mirror
 scan, fetch planning, reconcile, thread resolution. Each phase commits
 before the next begins. The fetch itself happens in the host process,
 which receives the planned delta and reports each download back through
 MailProcessor::insertFetched.
 */
class SyncWorker {
    mailcore::IMAPSession ownSession;
    mailcore::IMAPSession * session;

    std::unique_ptr<MailStore> store;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<bool> cancelled;
    std::mutex accountMtx;
    std::shared_ptr<Account> account;

public:
    SyncWorker(std::shared_ptr<Account> account, mailcore::IMAPSession * session = nullptr);

    void configure();
    void setAccount(std::shared_ptr<Account> account);
    std::shared_ptr<Account> currentAccount();

    void cancel();
    bool isCancelled();

    SyncCycleResult syncNow(std::vector<std::string> folders);

    std::vector<std::string> syncFolderList();
};

#endif /* SyncWorker_hpp */

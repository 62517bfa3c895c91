/** ServerMirror [MailMirror]
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

#ifndef ServerMirror_hpp
#define ServerMirror_hpp

#include <stdio.h>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"

#include "mailmirror/models/account.hpp"
#include "mailmirror/models/server_mail_record.hpp"
#include "mailmirror/mail_store.hpp"
#include "mailmirror/sync_exception.hpp"

struct MirrorSyncStats {
    int scanned = 0;
    int onServer = 0;
    int inserted = 0;
    int removed = 0;
    std::vector<SyncError> errors;

    nlohmann::json toJSON() const;
};

/**
 Rebuilds the per-folder snapshot of what exists on the server. Each folder
 is replaced wholesale (delete + insert) inside its own transaction, so a
 failure or a concurrent scan of one folder never affects the others.
 */
class ServerMirror {
    mailcore::IMAPSession * session;
    MailStore * store;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<bool> * cancelled;

public:
    ServerMirror(std::shared_ptr<Account> account, MailStore * store, mailcore::IMAPSession * session);

    void setCancelFlag(std::atomic<bool> * flag);

    MirrorSyncStats syncFolders(std::vector<std::string> folders);

    void syncFolder(std::string folderPath, MirrorSyncStats & stats);

private:
    std::vector<std::shared_ptr<ServerMailRecord>> observeFolder(std::string folderPath);
};

#endif /* ServerMirror_hpp */

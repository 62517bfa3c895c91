/** Reconciler [MailMirror]
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

#ifndef Reconciler_hpp
#define Reconciler_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "mailmirror/models/account.hpp"
#include "mailmirror/models/local_mail_record.hpp"
#include "mailmirror/models/server_mail_record.hpp"
#include "mailmirror/mail_store.hpp"
#include "mailmirror/sync_exception.hpp"

struct ReconcileStats {
    int updated = 0;
    int deleted = 0;
    int linked = 0;
    std::vector<SyncError> errors;

    nlohmann::json toJSON() const;
};

typedef std::map<std::string, std::vector<std::shared_ptr<ServerMailRecord>>> MirrorIdentityMap;

/**
 Aligns the account's LocalMailRecords with the Server Mirror. The pass runs
 in three ordered steps (duplicate resolution, move/flag propagation,
 deletion) inside a single transaction, and only while holding the account's
 "reconcile" lock.

 The pass is idempotent: running it twice against the same mirror changes
 nothing the second time.
 */
class Reconciler {
    MailStore * store;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;

public:
    Reconciler(std::shared_ptr<Account> account, MailStore * store);

    ReconcileStats reconcile();

private:
    std::vector<std::shared_ptr<LocalMailRecord>> resolveDuplicates(std::vector<std::shared_ptr<LocalMailRecord>> & locals, MirrorIdentityMap & mirror, ReconcileStats & stats, time_t now);
    void propagateToLocal(std::vector<std::shared_ptr<LocalMailRecord>> & survivors, MirrorIdentityMap & mirror, ReconcileStats & stats, time_t now);
    void applyMirrorRow(LocalMailRecord * local, ServerMailRecord * row, ReconcileStats & stats);
};

#endif /* Reconciler_hpp */

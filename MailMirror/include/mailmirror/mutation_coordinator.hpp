/** MutationCoordinator [MailMirror]
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

#ifndef MutationCoordinator_hpp
#define MutationCoordinator_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"
#include "nlohmann/json.hpp"

#include "mailmirror/models/account.hpp"
#include "mailmirror/models/local_mail_record.hpp"
#include "mailmirror/mail_store.hpp"

enum MutationState {
    MutationStateRequested,
    MutationStateSentToServer,
    MutationStateConfirmedNewUID,
    MutationStateConfirmedUIDUnknown,
    MutationStateFailed,
};

std::string MutationStateName(MutationState state);

struct MutationRequest {
    std::string action;     // move, move_to_trash, delete, mark_read, mark_unread, flag, unflag
    std::string folder;
    uint32_t uid = 0;
    std::string target;

    static MutationRequest fromJSON(const nlohmann::json & json);
};

/**
 One action over many messages. UIDs are grouped by the folder they live in;
 each folder is sent to the server as one UID set per command.

 Accepted JSON: {"action", "target"?, "folders": {"<folder>": [uid, ...]}}, or
 {"action", "target"?, "folder", "uids": [uid, ...]}.
 */
struct BulkMutationRequest {
    std::string action;
    std::string target;
    std::map<std::string, std::vector<uint32_t>> uidsByFolder;

    static bool isBulkJSON(const nlohmann::json & json);
    static BulkMutationRequest fromJSON(const nlohmann::json & json);
};

struct MutationResult {
    std::string folder;
    uint32_t uid = 0;

    bool success = false;
    MutationState state = MutationStateRequested;
    std::string newFolder;
    uint32_t newUID = 0;
    uint32_t newUIDValidity = 0;
    std::string message;

    nlohmann::json toJSON() const;
};

struct BulkMutationResult {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    std::vector<MutationResult> results;

    void add(MutationResult result);
    bool allSuccess() const;
    bool partialSuccess() const;

    nlohmann::json toJSON() const;
};

/**
 Records the raw bytes the server sends while installed on a session, so
 response codes mailcore does not surface (COPYUID without UIDPLUS parsing)
 can be read back afterwards.
 */
class ResponseCaptureLogger : public mailcore::ConnectionLogger {
public:
    std::string accumulated;

    void log(void * sender, mailcore::ConnectionLogType logType, mailcore::Data * buffer);
};

/**
 Applies user mutations to the server, and to the local store only once the
 server has confirmed them.
 */
class MutationCoordinator {
    mailcore::IMAPSession * session;
    MailStore * store;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;

public:
    MutationCoordinator(std::shared_ptr<Account> account, MailStore * store, mailcore::IMAPSession * session);

    MutationResult applyMutation(MutationRequest request);
    BulkMutationResult applyBulkMutation(BulkMutationRequest request);

private:
    void performMove(std::string folder, std::string target, std::vector<MutationResult> & results);
    void performDelete(std::string folder, std::vector<MutationResult> & results);
    void performFlagChange(std::string folder, std::vector<MutationResult> & results, mailcore::MessageFlag flag, bool add);

    std::string trashFolderPath();
    std::shared_ptr<LocalMailRecord> findLocalRecord(std::string folder, uint32_t uid);
};

#endif /* MutationCoordinator_hpp */

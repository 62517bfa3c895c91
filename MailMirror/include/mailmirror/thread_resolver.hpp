/** ThreadResolver [MailMirror]
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

#ifndef ThreadResolver_hpp
#define ThreadResolver_hpp

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
#include "mailmirror/sync_exception.hpp"

/**
 Supplies the server's view of conversation structure for a folder, as a
 JSON array with one element per thread. An integer element is a message
 (by UID) with no replies. An array element is an RFC 5256 thread list:
 consecutive integers form a reply chain and a nested array branches off
 the integer preceding it, e.g. [1, [2, 3, [4], [5]]].

 Returns false when the server cannot provide thread structure.
 */
class ServerThreadSource {
public:
    virtual ~ServerThreadSource() {}
    virtual bool fetchThreads(std::string folderPath, nlohmann::json & nested) = 0;
};

/**
 Builds thread structure from Gmail's X-GM-THRID. Gmail does not expose
 reply structure, so each Gmail thread is rendered as a chain in UID order.
 */
class GmailThreadSource : public ServerThreadSource {
    mailcore::IMAPSession * session;

public:
    GmailThreadSource(mailcore::IMAPSession * session);
    bool fetchThreads(std::string folderPath, nlohmann::json & nested) override;
};

struct ThreadAssignment {
    std::string folder;
    uint32_t uid;
    std::string threadId;
    uint32_t parentUID;     // 0 when the message is a root
    std::string parentId;   // "" when the message is a root

    nlohmann::json toJSON() const;
};

// Arena node. Nodes reference each other by index and only point upwards.
struct ThreadNode {
    std::string localId;
    std::string folder;
    uint32_t uid = 0;
    std::string messageId;
    std::string inReplyTo;
    std::string previousThreadId;

    int parent = -1;
    int serverParent = -1;
    int serverThread = -1;
    bool brokenChain = false;
};

class ThreadResolver {
    MailStore * store;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;
    ServerThreadSource * source;
    std::vector<SyncError> _errors;
    bool _headerChainsOnly = false;

public:
    ThreadResolver(std::shared_ptr<Account> account, MailStore * store, ServerThreadSource * source = nullptr);

    std::map<std::string, ThreadAssignment> resolveThreads();

    // Errors collected by the last call to resolveThreads.
    const std::vector<SyncError> & errors();

    // True when the last call had no server thread structure to work from
    // and grouped messages by Message-ID chains alone.
    bool headerChainsOnly() const;

    static nlohmann::json assignmentsToJSON(const std::map<std::string, ThreadAssignment> & assignments);

private:
    void applyServerStructure(std::vector<ThreadNode> & nodes);
    void walkThreadList(const nlohmann::json & list, int parent, int thread, std::map<uint32_t, int> & byUID, std::vector<ThreadNode> & nodes);
    void linkReplyChains(std::vector<ThreadNode> & nodes);
    std::vector<std::string> assignThreadIds(std::vector<ThreadNode> & nodes);
};

#endif /* ThreadResolver_hpp */

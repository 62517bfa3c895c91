/** ServerMailRecord [MailMirror]
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

#ifndef ServerMailRecord_hpp
#define ServerMailRecord_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

#include "mailmirror/models/mail_model.hpp"
#include "mailmirror/envelope.hpp"

/**
 One message as last observed on the server, keyed by
 (accountId, folder, uidvalidity, uid). Rows for a folder are deleted and
 recreated on every scan of that folder; only the Reconciler writes the
 link to a LocalMailRecord.
 */
class ServerMailRecord : public MailModel {

public:
    static std::string TABLE_NAME;

    ServerMailRecord(std::string accountId, std::string folder, uint32_t uidvalidity, uint32_t uid, const Envelope & envelope, time_t seenAt);
    ServerMailRecord(SQLite::Statement & query);
    ServerMailRecord(nlohmann::json json);

    std::string folder();
    uint32_t uidvalidity();
    uint32_t uid();

    bool hasMessageId();
    std::string messageId();
    std::string contentHash();
    std::string stableIdentity();
    std::string flags();
    int messageFlags();

    std::string envelopeFrom();
    std::string envelopeSubject();
    time_t envelopeDate();

    time_t firstSeenAt();
    time_t lastSeenAt();

    bool isDeleted();
    void setIsDeleted(bool deleted);

    std::string linkedLocalId();
    void setLinkedLocalId(std::string localId);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* ServerMailRecord_hpp */

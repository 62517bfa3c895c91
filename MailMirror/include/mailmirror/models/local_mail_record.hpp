/** LocalMailRecord [MailMirror]
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

#ifndef LocalMailRecord_hpp
#define LocalMailRecord_hpp

#include <stdio.h>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

#include "mailmirror/models/mail_model.hpp"
#include "mailmirror/envelope.hpp"

/**
 A materialized message. The payload is an object of opaque, already
 encrypted strings handed over by the fetcher; it is stored verbatim and
 never interpreted here.

 Records are soft-deleted (deletedAt != 0) and never removed from the table.
 */
class LocalMailRecord : public MailModel {

public:
    static std::string TABLE_NAME;

    LocalMailRecord(std::string accountId, std::string folder, uint32_t uidvalidity, uint32_t uid, const Envelope & envelope, std::string contentHash, nlohmann::json payload, time_t fetchedAt);
    LocalMailRecord(SQLite::Statement & query);
    LocalMailRecord(nlohmann::json json);

    std::string folder();
    void setFolder(std::string folder);
    uint32_t uidvalidity();
    void setUIDValidity(uint32_t uidvalidity);
    uint32_t uid();
    void setUID(uint32_t uid);

    bool hasMessageId();
    std::string messageId();
    std::string contentHash();
    std::string stableIdentity();

    std::string from();
    std::string subject();
    time_t date();
    std::string inReplyTo();
    std::vector<std::string> references();

    bool isSeen();
    bool isAnswered();
    bool isFlagged();
    bool isDeletedOnServer();
    bool isDraft();
    int messageFlags();
    bool applyMessageFlags(int flags);

    nlohmann::json & payload();
    time_t fetchedAt();

    bool isSoftDeleted();
    time_t deletedAt();
    void softDelete(time_t at);

    std::string threadId();
    uint32_t parentUID();
    std::string parentId();
    void setThread(std::string threadId, uint32_t parentUID, std::string parentId);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* LocalMailRecord_hpp */

/** Constants [MailMirror]
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

#ifndef Constants_hpp
#define Constants_hpp

#include <map>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#ifdef _WIN32
#define FS_PATH_SEP "\\"
#else
#define FS_PATH_SEP "/"
#endif

// Server Mirror fetches envelopes+flags in chunks of this many UIDs.
#define MIRROR_FETCH_BATCH_SIZE 500

// SQLite refuses statements with more than 999 bound variables.
#define SQLITE_MAX_IN_CHUNK 900

#define ACCOUNT_LOCK_TTL 300
#define DEFAULT_NETWORK_TIMEOUT 30

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS `_State` (id VARCHAR(40) PRIMARY KEY, value TEXT)",

    "CREATE TABLE IF NOT EXISTS `_Lock` (id VARCHAR(255) PRIMARY KEY, owner VARCHAR(40), expiresAt INTEGER)",

    "CREATE TABLE IF NOT EXISTS ServerMailRecord ("
        "id VARCHAR(64) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "folder VARCHAR(255),"
        "uidvalidity INTEGER,"
        "uid INTEGER,"
        "messageId VARCHAR(255),"
        "stableIdentity VARCHAR(255),"
        "flags VARCHAR(255),"
        "envelopeDate INTEGER,"
        "isDeleted INTEGER DEFAULT 0,"
        "linkedLocalId VARCHAR(40))",

    "CREATE UNIQUE INDEX IF NOT EXISTS ServerMailRecordKeyIndex ON ServerMailRecord(accountId, folder, uidvalidity, uid)",
    "CREATE INDEX IF NOT EXISTS ServerMailRecordIdentityIndex ON ServerMailRecord(accountId, stableIdentity)",
    "CREATE INDEX IF NOT EXISTS ServerMailRecordMessageIdIndex ON ServerMailRecord(accountId, messageId)",
    "CREATE INDEX IF NOT EXISTS ServerMailRecordLinkIndex ON ServerMailRecord(accountId, linkedLocalId)",

    "CREATE TABLE IF NOT EXISTS LocalMailRecord ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(40),"
        "version INTEGER,"
        "data TEXT,"
        "folder VARCHAR(255),"
        "uidvalidity INTEGER,"
        "uid INTEGER,"
        "messageId VARCHAR(255),"
        "stableIdentity VARCHAR(255),"
        "threadId VARCHAR(40),"
        "deletedAt INTEGER DEFAULT 0)",

    "CREATE INDEX IF NOT EXISTS LocalMailRecordKeyIndex ON LocalMailRecord(accountId, folder, uidvalidity, uid)",
    "CREATE INDEX IF NOT EXISTS LocalMailRecordIdentityIndex ON LocalMailRecord(accountId, stableIdentity)",
    "CREATE INDEX IF NOT EXISTS LocalMailRecordMessageIdIndex ON LocalMailRecord(accountId, messageId)",
    "CREATE INDEX IF NOT EXISTS LocalMailRecordThreadIndex ON LocalMailRecord(threadId)",
};

static std::map<std::string, std::string> COMMON_FOLDER_NAMES = {
    {"gel\xc3\xb6scht", "trash"},
    {"papierkorb", "trash"},
    {"\xd0\x9a\xd0\xbe\xd1\x80\xd0\xb7\xd0\xb8\xd0\xbd\xd0\xb0", "trash"},
    {"[imap]/trash", "trash"},
    {"papelera", "trash"},
    {"deleted items", "trash"},
    {"gel\xc3\xb6schte elemente", "trash"},
    {"deleted messages", "trash"},
    {"[gmail]/trash", "trash"},
    {"[gmail]/papierkorb", "trash"},
    {"inbox/trash", "trash"},
    {"trash", "trash"},
    {"mail/trash", "trash"},
    {"inbox.trash", "trash"},
    {"inbox.papierkorb", "trash"},

    {"spam", "spam"},
    {"junk", "spam"},
    {"junk e-mail", "spam"},
    {"[gmail]/spam", "spam"},
    {"inbox.spam", "spam"},

    {"inbox", "inbox"},
    {"archive", "archive"},

    {"sent", "sent"},
    {"sent items", "sent"},
    {"sent messages", "sent"},
    {"gesendet", "sent"},
    {"[gmail]/sent mail", "sent"},

    {"drafts", "drafts"},
    {"entw\xc3\xbcrfe", "drafts"},
};

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"},
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"},
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorRename, "ErrorRename"},
    {mailcore::ErrorDelete, "ErrorDelete"},
    {mailcore::ErrorCreate, "ErrorCreate"},
    {mailcore::ErrorSubscribe, "ErrorSubscribe"},
    {mailcore::ErrorAppend, "ErrorAppend"},
    {mailcore::ErrorCopy, "ErrorCopy"},
    {mailcore::ErrorExpunge, "ErrorExpunge"},
    {mailcore::ErrorFetch, "ErrorFetch"},
    {mailcore::ErrorIdle, "ErrorIdle"},
    {mailcore::ErrorIdentity, "ErrorIdentity"},
    {mailcore::ErrorNamespace, "ErrorNamespace"},
    {mailcore::ErrorStore, "ErrorStore"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorFetchMessageList, "ErrorFetchMessageList"},
    {mailcore::ErrorDeleteMessage, "ErrorDeleteMessage"},
    {mailcore::ErrorInvalidAccount, "ErrorInvalidAccount"},
    {mailcore::ErrorFile, "ErrorFile"},
    {mailcore::ErrorCompression, "ErrorCompression"},
    {mailcore::ErrorNoop, "ErrorNoop"},
    {mailcore::ErrorServerDate, "ErrorServerDate"},
    {mailcore::ErrorCustomCommand, "ErrorCustomCommand"},
    {mailcore::ErrorNeedsConnectToWebmail, "ErrorNeedsConnectToWebmail"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
};

#endif /* Constants_hpp */

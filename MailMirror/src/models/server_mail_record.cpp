#include "mailmirror/models/server_mail_record.hpp"
#include "mailmirror/mail_utils.hpp"

std::string ServerMailRecord::TABLE_NAME = "ServerMailRecord";

ServerMailRecord::ServerMailRecord(std::string accountId, std::string folder, uint32_t uidvalidity, uint32_t uid, const Envelope & envelope, time_t seenAt) :
    MailModel(MailUtils::idForServerRecord(accountId, folder, uidvalidity, uid), accountId, 0)
{
    _data["folder"] = folder;
    _data["uidvalidity"] = uidvalidity;
    _data["uid"] = uid;
    _data["messageId"] = envelope.hasMessageId() ? nlohmann::json(envelope.messageId) : nlohmann::json(nullptr);
    _data["contentHash"] = envelope.contentHash();
    _data["stableIdentity"] = envelope.stableIdentity();
    _data["flags"] = envelope.flagsString();
    _data["envelopeFrom"] = envelope.from;
    _data["envelopeSubject"] = envelope.subject;
    _data["envelopeDate"] = envelope.date;
    _data["firstSeenAt"] = seenAt;
    _data["lastSeenAt"] = seenAt;
    _data["isDeleted"] = false;
    _data["linkedLocalId"] = nullptr;
}

ServerMailRecord::ServerMailRecord(SQLite::Statement & query) :
    MailModel(query)
{
}

ServerMailRecord::ServerMailRecord(nlohmann::json json) :
    MailModel(json)
{
}

std::string ServerMailRecord::folder() {
    return _data["folder"].get<std::string>();
}

uint32_t ServerMailRecord::uidvalidity() {
    return _data["uidvalidity"].get<uint32_t>();
}

uint32_t ServerMailRecord::uid() {
    return _data["uid"].get<uint32_t>();
}

bool ServerMailRecord::hasMessageId() {
    return _data["messageId"].is_string();
}

std::string ServerMailRecord::messageId() {
    return hasMessageId() ? _data["messageId"].get<std::string>() : "";
}

std::string ServerMailRecord::contentHash() {
    return _data["contentHash"].get<std::string>();
}

std::string ServerMailRecord::stableIdentity() {
    return _data["stableIdentity"].get<std::string>();
}

std::string ServerMailRecord::flags() {
    return _data["flags"].get<std::string>();
}

int ServerMailRecord::messageFlags() {
    return MailUtils::messageFlagsForFlagsString(flags());
}

std::string ServerMailRecord::envelopeFrom() {
    return _data["envelopeFrom"].get<std::string>();
}

std::string ServerMailRecord::envelopeSubject() {
    return _data["envelopeSubject"].get<std::string>();
}

time_t ServerMailRecord::envelopeDate() {
    return _data["envelopeDate"].get<time_t>();
}

time_t ServerMailRecord::firstSeenAt() {
    return _data["firstSeenAt"].get<time_t>();
}

time_t ServerMailRecord::lastSeenAt() {
    return _data["lastSeenAt"].get<time_t>();
}

bool ServerMailRecord::isDeleted() {
    return _data["isDeleted"].get<bool>();
}

void ServerMailRecord::setIsDeleted(bool deleted) {
    _data["isDeleted"] = deleted;
}

std::string ServerMailRecord::linkedLocalId() {
    return _data["linkedLocalId"].is_string() ? _data["linkedLocalId"].get<std::string>() : "";
}

void ServerMailRecord::setLinkedLocalId(std::string localId) {
    if (localId == "") {
        _data["linkedLocalId"] = nullptr;
    } else {
        _data["linkedLocalId"] = localId;
    }
}

std::string ServerMailRecord::tableName() {
    return ServerMailRecord::TABLE_NAME;
}

std::vector<std::string> ServerMailRecord::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "folder", "uidvalidity", "uid", "messageId", "stableIdentity", "flags", "envelopeDate", "isDeleted", "linkedLocalId"};
}

void ServerMailRecord::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":folder", folder());
    query->bind(":uidvalidity", (long long)uidvalidity());
    query->bind(":uid", (long long)uid());
    if (hasMessageId()) {
        query->bind(":messageId", messageId());
    } else {
        query->bind(":messageId");
    }
    query->bind(":stableIdentity", stableIdentity());
    query->bind(":flags", flags());
    query->bind(":envelopeDate", (long long)envelopeDate());
    query->bind(":isDeleted", isDeleted() ? 1 : 0);
    if (linkedLocalId() != "") {
        query->bind(":linkedLocalId", linkedLocalId());
    } else {
        query->bind(":linkedLocalId");
    }
}

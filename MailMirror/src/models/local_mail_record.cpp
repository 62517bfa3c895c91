#include "mailmirror/models/local_mail_record.hpp"
#include "mailmirror/mail_utils.hpp"

std::string LocalMailRecord::TABLE_NAME = "LocalMailRecord";

LocalMailRecord::LocalMailRecord(std::string accountId, std::string folder, uint32_t uidvalidity, uint32_t uid, const Envelope & envelope, std::string contentHash, nlohmann::json payload, time_t fetchedAt) :
    MailModel(MailUtils::idRandomlyGenerated(), accountId, 0)
{
    _data["folder"] = folder;
    _data["uidvalidity"] = uidvalidity;
    _data["uid"] = uid;
    _data["messageId"] = envelope.hasMessageId() ? nlohmann::json(envelope.messageId) : nlohmann::json(nullptr);
    _data["contentHash"] = contentHash;
    _data["stableIdentity"] = MailUtils::stableIdentity(envelope.messageId, contentHash);
    _data["from"] = envelope.from;
    _data["subject"] = envelope.subject;
    _data["date"] = envelope.date;
    _data["inReplyTo"] = envelope.inReplyTo;
    _data["references"] = envelope.references;
    _data["payload"] = payload.is_object() ? payload : nlohmann::json::object();
    _data["fetchedAt"] = fetchedAt;
    _data["deletedAt"] = 0;
    _data["threadId"] = "";
    _data["parentUID"] = 0;
    _data["parentId"] = "";
    applyMessageFlags(envelope.flags);
}

LocalMailRecord::LocalMailRecord(SQLite::Statement & query) :
    MailModel(query)
{
}

LocalMailRecord::LocalMailRecord(nlohmann::json json) :
    MailModel(json)
{
}

std::string LocalMailRecord::folder() {
    return _data["folder"].get<std::string>();
}

void LocalMailRecord::setFolder(std::string folder) {
    _data["folder"] = folder;
}

uint32_t LocalMailRecord::uidvalidity() {
    return _data["uidvalidity"].get<uint32_t>();
}

void LocalMailRecord::setUIDValidity(uint32_t uidvalidity) {
    _data["uidvalidity"] = uidvalidity;
}

uint32_t LocalMailRecord::uid() {
    return _data["uid"].get<uint32_t>();
}

void LocalMailRecord::setUID(uint32_t uid) {
    _data["uid"] = uid;
}

bool LocalMailRecord::hasMessageId() {
    return _data["messageId"].is_string();
}

std::string LocalMailRecord::messageId() {
    return hasMessageId() ? _data["messageId"].get<std::string>() : "";
}

std::string LocalMailRecord::contentHash() {
    return _data["contentHash"].get<std::string>();
}

std::string LocalMailRecord::stableIdentity() {
    return _data["stableIdentity"].get<std::string>();
}

std::string LocalMailRecord::from() {
    return _data["from"].get<std::string>();
}

std::string LocalMailRecord::subject() {
    return _data["subject"].get<std::string>();
}

time_t LocalMailRecord::date() {
    return _data["date"].get<time_t>();
}

std::string LocalMailRecord::inReplyTo() {
    return _data["inReplyTo"].get<std::string>();
}

std::vector<std::string> LocalMailRecord::references() {
    return _data["references"].get<std::vector<std::string>>();
}

bool LocalMailRecord::isSeen() {
    return _data["seen"].get<bool>();
}

bool LocalMailRecord::isAnswered() {
    return _data["answered"].get<bool>();
}

bool LocalMailRecord::isFlagged() {
    return _data["flagged"].get<bool>();
}

bool LocalMailRecord::isDeletedOnServer() {
    return _data["deleted"].get<bool>();
}

bool LocalMailRecord::isDraft() {
    return _data["draft"].get<bool>();
}

int LocalMailRecord::messageFlags() {
    int flags = 0;
    if (isSeen()) flags |= mailcore::MessageFlagSeen;
    if (isAnswered()) flags |= mailcore::MessageFlagAnswered;
    if (isFlagged()) flags |= mailcore::MessageFlagFlagged;
    if (isDeletedOnServer()) flags |= mailcore::MessageFlagDeleted;
    if (isDraft()) flags |= mailcore::MessageFlagDraft;
    return flags;
}

// Returns true if any of the boolean flags changed.
bool LocalMailRecord::applyMessageFlags(int flags) {
    bool changed = !_data.count("seen") || (messageFlags() != (flags & (mailcore::MessageFlagSeen | mailcore::MessageFlagAnswered | mailcore::MessageFlagFlagged | mailcore::MessageFlagDeleted | mailcore::MessageFlagDraft)));
    _data["seen"] = (flags & mailcore::MessageFlagSeen) != 0;
    _data["answered"] = (flags & mailcore::MessageFlagAnswered) != 0;
    _data["flagged"] = (flags & mailcore::MessageFlagFlagged) != 0;
    _data["deleted"] = (flags & mailcore::MessageFlagDeleted) != 0;
    _data["draft"] = (flags & mailcore::MessageFlagDraft) != 0;
    return changed;
}

nlohmann::json & LocalMailRecord::payload() {
    return _data["payload"];
}

time_t LocalMailRecord::fetchedAt() {
    return _data["fetchedAt"].get<time_t>();
}

bool LocalMailRecord::isSoftDeleted() {
    return deletedAt() != 0;
}

time_t LocalMailRecord::deletedAt() {
    return _data["deletedAt"].get<time_t>();
}

void LocalMailRecord::softDelete(time_t at) {
    _data["deletedAt"] = at;
}

std::string LocalMailRecord::threadId() {
    return _data["threadId"].get<std::string>();
}

uint32_t LocalMailRecord::parentUID() {
    return _data["parentUID"].get<uint32_t>();
}

std::string LocalMailRecord::parentId() {
    return _data["parentId"].get<std::string>();
}

void LocalMailRecord::setThread(std::string threadId, uint32_t parentUID, std::string parentId) {
    _data["threadId"] = threadId;
    _data["parentUID"] = parentUID;
    _data["parentId"] = parentId;
}

std::string LocalMailRecord::tableName() {
    return LocalMailRecord::TABLE_NAME;
}

std::vector<std::string> LocalMailRecord::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "folder", "uidvalidity", "uid", "messageId", "stableIdentity", "threadId", "deletedAt"};
}

void LocalMailRecord::bindToQuery(SQLite::Statement * query) {
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
    query->bind(":threadId", threadId());
    query->bind(":deletedAt", (long long)deletedAt());
}

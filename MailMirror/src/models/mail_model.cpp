#include "mailmirror/models/mail_model.hpp"
#include "mailmirror/mail_store.hpp"
#include "mailmirror/sync_exception.hpp"

std::string MailModel::TABLE_NAME = "MailModel";

/* Note: If creating a brand new object, pass version = 0. */
MailModel::MailModel(std::string id, std::string accountId, int version) :
    _data({{"id", id},{"aid", accountId}, {"v", version}})
{
}

MailModel::MailModel(SQLite::Statement & query) :
    _data(nlohmann::json::parse(query.getColumn("data").getString()))
{
}

MailModel::MailModel(nlohmann::json json) :
    _data(json)
{
    if (!_data.is_object()) {
        throw SyncException("invalid-model", "MailModel requires a JSON object, got: " + _data.dump(), false);
    }
}

std::string MailModel::id()
{
    return _data["id"].get<std::string>();
}

std::string MailModel::accountId()
{
    return _data["aid"].get<std::string>();
}

int MailModel::version()
{
    return _data["v"].get<int>();
}

void MailModel::incrementVersion()
{
    _data["v"] = _data["v"].get<int>() + 1;
}

std::string MailModel::tableName()
{
    return TABLE_NAME;
}

nlohmann::json MailModel::toJSON()
{
    if (!_data.count("__cls")) {
        _data["__cls"] = this->tableName();
    }
    return _data;
}

void MailModel::bindToQuery(SQLite::Statement * query) {
    query->bind(":id", id());
    query->bind(":data", this->toJSON().dump());
    query->bind(":accountId", accountId());
    query->bind(":version", version());
}

void MailModel::beforeSave(MailStore * store) {
}

void MailModel::afterSave(MailStore * store) {
}

void MailModel::afterRemove(MailStore * store) {
}

#include "mailmirror/mail_store.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/constants.hpp"
#include "mailmirror/sync_exception.hpp"

#include "spdlog/spdlog.h"

MailStore::MailStore() :
    _db(MailUtils::getEnvUTF8("CONFIG_DIR_PATH") + FS_PATH_SEP + "mailmirror.db", SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
    _stmtBeginTransaction(_db, "BEGIN IMMEDIATE TRANSACTION"),
    _stmtRollbackTransaction(_db, "ROLLBACK"),
    _stmtCommitTransaction(_db, "COMMIT"),
    _transactionOpen(false)
{
    _db.setBusyTimeout(10 * 1000);

    // Note: These are properties of the connection, so they must be set regardless
    // of whether the database setup queries are run.
    SQLite::Statement(_db, "PRAGMA journal_mode = WAL").executeStep();
    SQLite::Statement(_db, "PRAGMA main.page_size = 4096").exec();
    SQLite::Statement(_db, "PRAGMA main.cache_size = 10000").exec();
    SQLite::Statement(_db, "PRAGMA main.synchronous = NORMAL").exec();
}

void MailStore::migrate() {
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version == 0) {
        for (std::string sql : SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }

    SQLite::Statement(_db, "PRAGMA user_version = 1").exec();
}

SQLite::Database & MailStore::db()
{
    return this->_db;
}

void MailStore::resetForAccount(std::string accountId) {
    std::vector<std::string> tables = {"ServerMailRecord", "LocalMailRecord"};
    for (auto & table : tables) {
        SQLite::Statement statement(_db, "DELETE FROM " + table + " WHERE accountId = ?");
        statement.bind(1, accountId);
        statement.exec();
    }
    SQLite::Statement locks(_db, "DELETE FROM _Lock WHERE id LIKE ?");
    locks.bind(1, "%:" + accountId);
    locks.exec();
    SQLite::Statement state(_db, "DELETE FROM _State WHERE id LIKE ?");
    state.bind(1, "%:" + accountId + ":%");
    state.exec();

    spdlog::get("logger")->info("Reset all mirror and local records for account {}", accountId);
}

std::string MailStore::getKeyValue(std::string key) {
    SQLite::Statement query(this->_db, "SELECT value FROM _State WHERE id = ?");
    query.bind(1, key);
    if (query.executeStep()) {
        return query.getColumn(0).getString();
    }
    return "";
}

void MailStore::saveKeyValue(std::string key, std::string value) {
    SQLite::Statement query(this->_db, "REPLACE INTO _State (id, value) VALUES (?, ?)");
    query.bind(1, key);
    query.bind(2, value);
    query.exec();
}

void MailStore::beginTransaction() {
    _stmtBeginTransaction.exec();
    _stmtBeginTransaction.reset();
    _transactionOpen = true;
}

void MailStore::rollbackTransaction() {
    // Cached statements may reference the aborted transaction's state.
    _saveUpdateQueries = {};
    _saveInsertQueries = {};
    _removeQueries = {};
    _transactionOpen = false;
    _stmtRollbackTransaction.exec();
    _stmtRollbackTransaction.reset();
}

void MailStore::commitTransaction() {
    _stmtCommitTransaction.exec();
    _stmtCommitTransaction.reset();
    _transactionOpen = false;
}

bool MailStore::transactionOpen() {
    return _transactionOpen;
}

void MailStore::save(MailModel * model) {
    model->incrementVersion();
    model->beforeSave(this);

    auto tableName = model->tableName();

    if (model->version() > 1) {
        if (!_saveUpdateQueries.count(tableName)) {
            std::string pairs{""};
            for (const auto & col : model->columnsForQuery()) {
                if (col == "id") {
                    continue;
                }
                pairs += (col + " = :" + col + ",");
            }
            pairs.pop_back();

            auto stmt = std::make_shared<SQLite::Statement>(this->_db, "UPDATE " + tableName + " SET " + pairs + " WHERE id = :id");
            _saveUpdateQueries[tableName] = stmt;
        }
        auto query = _saveUpdateQueries[tableName];
        query->reset();
        query->clearBindings();
        model->bindToQuery(query.get());
        query->exec();

    } else {
        if (!_saveInsertQueries.count(tableName)) {
            std::string cols{""};
            std::string values{""};
            for (const auto & col : model->columnsForQuery()) {
                cols += col + ",";
                values += ":" + col + ",";
            }
            cols.pop_back();
            values.pop_back();

            auto stmt = std::make_shared<SQLite::Statement>(this->_db, "INSERT INTO " + tableName + " (" + cols + ") VALUES (" + values + ")");
            _saveInsertQueries[tableName] = stmt;
        }

        auto query = _saveInsertQueries[tableName];
        query->reset();
        query->clearBindings();
        model->bindToQuery(query.get());
        query->exec();
    }

    model->afterSave(this);
}

void MailStore::remove(MailModel * model) {
    auto tableName = model->tableName();
    if (!_removeQueries.count(tableName)) {
        _removeQueries[tableName] = std::make_shared<SQLite::Statement>(this->_db, "DELETE FROM " + tableName + " WHERE id = ?");
    }
    auto query = _removeQueries[tableName];
    query->reset();
    query->bind(1, model->id());
    query->exec();

    model->afterRemove(this);
}

int MailStore::removeServerRecordsInFolder(std::string accountId, std::string folder) {
    SQLite::Statement statement(_db, "DELETE FROM ServerMailRecord WHERE accountId = ? AND folder = ?");
    statement.bind(1, accountId);
    statement.bind(2, folder);
    return statement.exec();
}

std::vector<std::string> MailStore::knownFolders(std::string accountId) {
    SQLite::Statement statement(_db, "SELECT DISTINCT folder FROM ServerMailRecord WHERE accountId = ? UNION SELECT DISTINCT folder FROM LocalMailRecord WHERE accountId = ? AND deletedAt = 0 ORDER BY folder");
    statement.bind(1, accountId);
    statement.bind(2, accountId);

    std::vector<std::string> folders{};
    while (statement.executeStep()) {
        folders.push_back(statement.getColumn(0).getString());
    }
    return folders;
}

/** MailStore [MailMirror]
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

#ifndef MailStore_hpp
#define MailStore_hpp

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "mailmirror/models/mail_model.hpp"
#include "mailmirror/query.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/constants.hpp"

class MailStore {
    SQLite::Database _db;
    SQLite::Statement _stmtBeginTransaction;
    SQLite::Statement _stmtRollbackTransaction;
    SQLite::Statement _stmtCommitTransaction;

    bool _transactionOpen;

    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveUpdateQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _saveInsertQueries;
    std::map<std::string, std::shared_ptr<SQLite::Statement>> _removeQueries;

public:
    MailStore();

    void migrate();

    SQLite::Database & db();

    void resetForAccount(std::string accountId);

    std::string getKeyValue(std::string key);

    void saveKeyValue(std::string key, std::string value);

    void beginTransaction();

    void rollbackTransaction();

    void commitTransaction();

    bool transactionOpen();

    void save(MailModel * model);

    void remove(MailModel * model);

    // Mirror / local record helpers

    int removeServerRecordsInFolder(std::string accountId, std::string folder);

    std::vector<std::string> knownFolders(std::string accountId);

    // Find - Template methods which must be defined in header file

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL() + " LIMIT 1");
        query.bind(statement);
        if (statement.executeStep()) {
            return std::make_shared<ModelClass>(statement);
        }
        return nullptr;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        std::string sql = "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL();
        if (query.getLimit() != 0) {
            sql = sql + " LIMIT " + std::to_string(query.getLimit());
        }
        SQLite::Statement statement(this->_db, sql);
        query.bind(statement);

        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }

        return results;
    }

    /**
     Handles dividing a large set into small chunks of <1000 and re-aggregating the results so SQLite can handle it.
     */
    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findLargeSet(std::string colname, std::vector<std::string> set) {
        std::vector<std::shared_ptr<ModelClass>> all;

        auto chunks = MailUtils::chunksOfVector(set, SQLITE_MAX_IN_CHUNK);
        for (auto & chunk : chunks) {
            auto results = this->findAll<ModelClass>(Query().equal(colname, chunk));
            all.insert(all.end(), results.begin(), results.end());
        }

        return all;
    }

    template<typename ModelClass>
    std::map<std::string, std::shared_ptr<ModelClass>> findAllMap(Query & query, std::string keyField) {
        SQLite::Statement statement(this->_db, "SELECT " + keyField + ", data FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);

        std::map<std::string, std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results[statement.getColumn(keyField.c_str()).getString()] = std::make_shared<ModelClass>(statement);
        }

        return results;
    }
};


#endif /* MailStore_hpp */

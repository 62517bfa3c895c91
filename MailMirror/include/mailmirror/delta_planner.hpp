/** DeltaPlanner [MailMirror]
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

#ifndef DeltaPlanner_hpp
#define DeltaPlanner_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "mailmirror/models/account.hpp"
#include "mailmirror/mail_store.hpp"

struct FetchFilter {
    std::vector<std::string> includeFolders;
    std::vector<std::string> excludeFolders;
    time_t since = 0;
    bool unseenOnly = false;

    static FetchFilter forAccount(std::shared_ptr<Account> account);
    static FetchFilter fromJSON(const nlohmann::json & json, std::shared_ptr<Account> account);
};

/**
 Decides which messages the fetcher should download next: mirror rows that
 are not linked yet and whose identity is not already materialized anywhere
 in the account.
 */
class DeltaPlanner {
    MailStore * store;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;

public:
    DeltaPlanner(std::shared_ptr<Account> account, MailStore * store);

    std::map<std::string, std::vector<uint32_t>> computeFetchDelta(FetchFilter filter);

    static nlohmann::json deltaToJSON(const std::map<std::string, std::vector<uint32_t>> & delta);
};

#endif /* DeltaPlanner_hpp */

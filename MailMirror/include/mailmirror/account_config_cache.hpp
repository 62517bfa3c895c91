/** AccountConfigCache [MailMirror]
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

#ifndef AccountConfigCache_hpp
#define AccountConfigCache_hpp

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "mailmirror/models/account.hpp"

/**
 Per-session cache of account configuration, keyed by account id. Owned by
 whoever drives a sync session (the main loop, a SyncWorker); there is no
 process-wide instance.

 Entries missing from the cache are loaded from
 <CONFIG_DIR_PATH>/accounts/<accountId>.json. An account handed to put()
 (for example the one given with --account) is kept as the fallback for its
 id when no file exists, so invalidating it never leaves the session without
 a configuration.
 */
class AccountConfigCache {
    std::map<std::string, std::shared_ptr<Account>> _accounts;
    std::map<std::string, std::shared_ptr<Account>> _seeds;
    std::mutex _mtx;
    std::string _configDir;

public:
    AccountConfigCache(std::string configDir);

    std::shared_ptr<Account> get(std::string accountId);
    void put(std::shared_ptr<Account> account);
    bool contains(std::string accountId);

    // Drops the entry for accountId, or every entry when accountId is empty.
    void invalidate(std::string accountId = "");

    size_t size();
};

#endif /* AccountConfigCache_hpp */

/** MailProcessor [MailMirror]
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

#ifndef MailProcessor_hpp
#define MailProcessor_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "MailCore/MailCore.h"
#include "SQLiteCpp/SQLiteCpp.h"
#include "spdlog/spdlog.h"
#include "nlohmann/json.hpp"

#include "mailmirror/models/account.hpp"
#include "mailmirror/models/local_mail_record.hpp"
#include "mailmirror/envelope.hpp"
#include "mailmirror/mail_store.hpp"

/**
 A message downloaded by the fetcher. `payload` is an object of opaque,
 already encrypted strings; `contentHash` may be left empty, in which case
 it is computed from the envelope.
 */
struct FetchedMessage {
    std::string folder;
    uint32_t uid = 0;
    uint32_t uidvalidity = 0;
    Envelope envelope;
    std::string contentHash;
    nlohmann::json payload;

    static FetchedMessage fromJSON(const nlohmann::json & json);
};

class MailProcessor {
    MailStore * store;
    std::shared_ptr<Account> account;
    std::shared_ptr<spdlog::logger> logger;

public:
    MailProcessor(std::shared_ptr<Account> account, MailStore * store);

    // Returns the id of the new record, or of the live record already stored
    // at the same (folder, uidvalidity, uid). Never touches the mirror.
    std::string insertFetched(const FetchedMessage & message);
};

#endif /* MailProcessor_hpp */

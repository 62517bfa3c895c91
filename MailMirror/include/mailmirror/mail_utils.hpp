/** MailUtils [MailMirror]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <stdio.h>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

class Account;

/**
 A UID-remapping hint as reported by a COPYUID response code (RFC 4315):
 the destination folder's UIDVALIDITY and the UID the copied message was
 assigned there.
 */
struct UIDRemap {
    uint32_t uidvalidity;
    uint32_t oldUID;
    uint32_t newUID;
};

class MailUtils {

public:
    static std::string getEnvUTF8(std::string key);

    static std::string timestampForTime(time_t time);
    static std::string dateStringForTime(time_t time);

    // Identity

    static std::string sha256Hex(std::string src);
    static std::string contentHash(std::string dateString, std::string from, std::string subject);
    static std::string stableIdentity(std::string messageId, std::string contentHash);
    static std::string normalizeMessageID(std::string messageId);

    static std::string idRandomlyGenerated();
    static std::string idForServerRecord(std::string accountId, std::string folder, uint32_t uidvalidity, uint32_t uid);

    // Flags

    static std::string flagsStringForMessageFlags(int flags);
    static int messageFlagsForFlagsString(std::string flags);

    // UID sets

    static std::vector<uint32_t> uidsOfIndexSet(mailcore::IndexSet * set);
    static std::vector<uint32_t> uidsOfArray(mailcore::Array * array);
    static std::vector<uint32_t> parseUIDSet(std::string set);

    /**
     Extracts the UID-remapping hint from raw server response text. Accepts the
     bracketed response-code form `[COPYUID 38505 304 3956]`, the bare form
     `COPYUID 38505 304 3956`, any letter case, and multi-line responses. Input
     that is nothing but the three tokens `38505 304 3956` (the untagged COPYUID
     payload) is accepted too. When the sets contain several UIDs, the first
     pair is returned.
     */
    static bool parseUIDRemap(std::string raw, UIDRemap & out);
    static bool parseUIDRemapSets(std::string raw, uint32_t & uidvalidity, std::map<uint32_t, uint32_t> & mapping);

    // Folders and sessions

    static std::string roleForFolder(mailcore::IMAPFolder * folder);
    static std::string roleForFolderPath(std::string path);

    static void enableVerboseLogging();
    static void configureSessionForAccount(mailcore::IMAPSession & session, std::shared_ptr<Account> account);

    static std::string qmarks(size_t count);

    template<typename T>
    static std::vector<std::vector<T>> chunksOfVector(std::vector<T> & v, size_t chunkSize) {
        std::vector<std::vector<T>> results{};

        while (v.size() > 0) {
            auto from = v.begin();
            auto to = v.size() > chunkSize ? from + chunkSize : v.end();

            results.push_back(std::vector<T>{std::make_move_iterator(from), std::make_move_iterator(to)});
            v.erase(from, to);
        }
        return results;
    }
};

#endif /* MailUtils_hpp */

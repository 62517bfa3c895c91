/** SyncException [MailMirror]
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

#ifndef SyncException_hpp
#define SyncException_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"
#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"
#include "mailmirror/generic_exception.hpp"

enum SyncErrorKind {
    SyncErrorKindTransientNetwork,
    SyncErrorKindConcurrencyConflict,
    SyncErrorKindDataIntegrityAnomaly,
    SyncErrorKindProtocolCapabilityMissing,
    SyncErrorKindOther,
};

std::string SyncErrorKindName(SyncErrorKind kind);

class SyncException : public GenericException {
    bool retryable = false;
    bool offline = false;

public:
    SyncException(std::string key, std::string di, bool retryable);
    SyncException(mailcore::ErrorCode c, std::string di);
    std::string key;
    std::string debuginfo;
    bool isRetryable();
    bool isOffline();
    SyncErrorKind kind();
    nlohmann::json toJSON();
};

/**
 One entry in a per-folder / per-message error list. Operations that work
 through many items collect these instead of throwing, so one bad folder or
 message never aborts its siblings.
 */
struct SyncError {
    SyncErrorKind kind;
    std::string scope;
    std::string message;

    nlohmann::json toJSON() const;
};

SyncError SyncErrorFromException(SyncException & ex, std::string scope);
SyncError SyncErrorFromException(SQLite::Exception & ex, std::string scope);

bool IsUniqueConstraintViolation(SQLite::Exception & ex);

#endif /* SyncException_hpp */

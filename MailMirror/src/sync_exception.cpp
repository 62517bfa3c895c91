#include "mailmirror/sync_exception.hpp"
#include "mailmirror/constants.hpp"

#include <sqlite3.h>

std::string SyncErrorKindName(SyncErrorKind kind) {
    switch (kind) {
        case SyncErrorKindTransientNetwork:
            return "TransientNetworkError";
        case SyncErrorKindConcurrencyConflict:
            return "ConcurrencyConflict";
        case SyncErrorKindDataIntegrityAnomaly:
            return "DataIntegrityAnomaly";
        case SyncErrorKindProtocolCapabilityMissing:
            return "ProtocolCapabilityMissing";
        default:
            return "Other";
    }
}

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    GenericException(), retryable(retryable), key(key), debuginfo(di)
{

}

SyncException::SyncException(mailcore::ErrorCode c, std::string di) :
    GenericException(), key(""), debuginfo(di)
{
    if (ErrorCodeToTypeMap.count(c)) {
        key = ErrorCodeToTypeMap[c];
    }
    if (c == mailcore::ErrorConnection) {
        retryable = true;
        offline = true;
    }
    if (c == mailcore::ErrorParse) {
        // Parse errors are usually caused by an abrupt connection termination.
        retryable = true;
    }
    if (c == mailcore::ErrorFetch) {
        retryable = true;
    }
}

bool SyncException::isRetryable() {
    return retryable;
}

bool SyncException::isOffline() {
    return offline;
}

SyncErrorKind SyncException::kind() {
    if (key == "concurrency-conflict") {
        return SyncErrorKindConcurrencyConflict;
    }
    if (key == "data-integrity") {
        return SyncErrorKindDataIntegrityAnomaly;
    }
    if (key == "capability-missing") {
        return SyncErrorKindProtocolCapabilityMissing;
    }
    if (retryable || offline) {
        return SyncErrorKindTransientNetwork;
    }
    return SyncErrorKindOther;
}

nlohmann::json SyncException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}

nlohmann::json SyncError::toJSON() const {
    return {
        {"kind", SyncErrorKindName(kind)},
        {"scope", scope},
        {"message", message},
    };
}

SyncError SyncErrorFromException(SyncException & ex, std::string scope) {
    std::string message = ex.key;
    if (ex.debuginfo != "") {
        message = message + ": " + ex.debuginfo;
    }
    return SyncError{ex.kind(), scope, message};
}

SyncError SyncErrorFromException(SQLite::Exception & ex, std::string scope) {
    SyncErrorKind kind = IsUniqueConstraintViolation(ex) ? SyncErrorKindConcurrencyConflict : SyncErrorKindOther;
    return SyncError{kind, scope, ex.what()};
}

bool IsUniqueConstraintViolation(SQLite::Exception & ex) {
    return (ex.getErrorCode() == SQLITE_CONSTRAINT) ||
           (ex.getExtendedErrorCode() == SQLITE_CONSTRAINT_UNIQUE) ||
           (ex.getExtendedErrorCode() == SQLITE_CONSTRAINT_PRIMARYKEY);
}

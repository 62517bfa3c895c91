#include "mailmirror/account_lock.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/sync_exception.hpp"

#include "spdlog/spdlog.h"

AccountLock::AccountLock(MailStore * store, std::string purpose, std::string accountId, int ttl) :
    mStore(store), mName(purpose + ":" + accountId), mOwner(MailUtils::idRandomlyGenerated()), mAcquired(false)
{
    if (mStore->transactionOpen()) {
        throw SyncException("invalid-lock", "AccountLock " + mName + " cannot be acquired inside a transaction", false);
    }

    time_t now = time(0);

    SQLite::Statement expire(mStore->db(), "DELETE FROM _Lock WHERE id = ? AND expiresAt < ?");
    expire.bind(1, mName);
    expire.bind(2, (long long)now);
    if (expire.exec() > 0) {
        spdlog::get("logger")->warn("Lock {} expired and was taken over.", mName);
    }

    SQLite::Statement insert(mStore->db(), "INSERT OR IGNORE INTO _Lock (id, owner, expiresAt) VALUES (?, ?, ?)");
    insert.bind(1, mName);
    insert.bind(2, mOwner);
    insert.bind(3, (long long)(now + ttl));
    mAcquired = insert.exec() == 1;
}

AccountLock::~AccountLock() noexcept
{
    if (!mAcquired) {
        return;
    }
    try {
        SQLite::Statement release(mStore->db(), "DELETE FROM _Lock WHERE id = ? AND owner = ?");
        release.bind(1, mName);
        release.bind(2, mOwner);
        release.exec();
    } catch (SQLite::Exception & ex) {
        spdlog::get("logger")->error("Unable to release lock {}: {}", mName, ex.what());
    }
}

bool AccountLock::acquired() {
    return mAcquired;
}

std::string AccountLock::name() {
    return mName;
}

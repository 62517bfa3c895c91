#include "MailMirrorTest.hpp"

#include "mailmirror/account_lock.hpp"
#include "mailmirror/mail_store_transaction.hpp"
#include "mailmirror/sync_exception.hpp"

class AccountLockTest : public MailMirrorTest {
};

TEST_F(AccountLockTest, SecondHolderIsRefused) {
    AccountLock first(store, "reconcile", "acct", 300);
    EXPECT_TRUE(first.acquired());
    EXPECT_EQ("reconcile:acct", first.name());

    AccountLock second(store, "reconcile", "acct", 300);
    EXPECT_FALSE(second.acquired());
}

TEST_F(AccountLockTest, ReleasedOnDestruction) {
    {
        AccountLock first(store, "reconcile", "acct", 300);
        ASSERT_TRUE(first.acquired());
    }
    AccountLock second(store, "reconcile", "acct", 300);
    EXPECT_TRUE(second.acquired());
}

TEST_F(AccountLockTest, ScopedByPurposeAndAccount) {
    AccountLock a(store, "reconcile", "acct", 300);
    AccountLock b(store, "reconcile", "other", 300);
    AccountLock c(store, "threads", "acct", 300);
    EXPECT_TRUE(a.acquired());
    EXPECT_TRUE(b.acquired());
    EXPECT_TRUE(c.acquired());
}

TEST_F(AccountLockTest, ExpiredLockIsTakenOver) {
    AccountLock stale(store, "reconcile", "acct", -1);
    ASSERT_TRUE(stale.acquired());

    AccountLock next(store, "reconcile", "acct", 300);
    EXPECT_TRUE(next.acquired());
}

TEST_F(AccountLockTest, RefusedInsideATransaction) {
    MailStoreTransaction transaction{store, "test"};
    EXPECT_THROW(AccountLock(store, "reconcile", "acct", 300), SyncException);
}

TEST_F(AccountLockTest, ResetForAccountClearsLocks) {
    AccountLock held(store, "reconcile", "acct", 300);
    store->resetForAccount("acct");

    AccountLock next(store, "reconcile", "acct", 300);
    EXPECT_TRUE(next.acquired());
}

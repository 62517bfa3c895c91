#include "MailMirrorTest.hpp"

#include <fstream>

#include "mailmirror/account_config_cache.hpp"
#include "mailmirror/sync_exception.hpp"

using namespace std;

class AccountConfigCacheTest : public MailMirrorTest {
protected:
    void writeAccountFile(string id, string contents) {
        ASSERT_EQ(0, system("mkdir -p " MAILMIRROR_TEST_DIR "/accounts"));
        ofstream file(string(MAILMIRROR_TEST_DIR) + "/accounts/" + id + ".json");
        file << contents;
    }
};

TEST_F(AccountConfigCacheTest, PutAndGet) {
    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    cache.put(account);

    EXPECT_TRUE(cache.contains("test-account"));
    EXPECT_EQ(account, cache.get("test-account"));
    EXPECT_EQ(1u, cache.size());
}

TEST_F(AccountConfigCacheTest, LoadsMissingEntriesFromDisk) {
    writeAccountFile("disk", testAccountJSON("disk").dump());

    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    EXPECT_FALSE(cache.contains("disk"));

    auto loaded = cache.get("disk");
    ASSERT_NE(nullptr, loaded);
    EXPECT_EQ("disk", loaded->id());
    EXPECT_EQ("imap.example.com", loaded->IMAPHost());
    EXPECT_EQ(loaded, cache.get("disk"));
}

TEST_F(AccountConfigCacheTest, InvalidateDropsEntries) {
    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    cache.put(account);
    cache.put(make_shared<Account>(testAccountJSON("second")));

    cache.invalidate("second");
    EXPECT_FALSE(cache.contains("second"));
    EXPECT_TRUE(cache.contains("test-account"));

    cache.invalidate();
    EXPECT_EQ(0u, cache.size());
}

TEST_F(AccountConfigCacheTest, ReloadsAfterInvalidation) {
    writeAccountFile("disk", testAccountJSON("disk").dump());
    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    EXPECT_EQ(30, cache.get("disk")->networkTimeout());

    nlohmann::json updated = testAccountJSON("disk");
    updated["sync"] = {{"network_timeout", 90}};
    writeAccountFile("disk", updated.dump());

    EXPECT_EQ(30, cache.get("disk")->networkTimeout());
    cache.invalidate("disk");
    EXPECT_EQ(90, cache.get("disk")->networkTimeout());
}

TEST_F(AccountConfigCacheTest, MissingOrBrokenFilesThrow) {
    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    EXPECT_THROW(cache.get("nobody"), SyncException);

    writeAccountFile("broken", "{not json");
    EXPECT_THROW(cache.get("broken"), SyncException);

    writeAccountFile("partial", "{\"id\": \"partial\"}");
    EXPECT_THROW(cache.get("partial"), SyncException);
    EXPECT_EQ(0u, cache.size());
}

TEST_F(AccountConfigCacheTest, InvalidatedSeedIsServedWithoutAFile) {
    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    cache.put(account);

    cache.invalidate();
    EXPECT_FALSE(cache.contains("test-account"));

    auto reloaded = cache.get("test-account");
    ASSERT_NE(nullptr, reloaded);
    EXPECT_EQ("test-account", reloaded->id());
    EXPECT_TRUE(cache.contains("test-account"));
}

TEST_F(AccountConfigCacheTest, FileOnDiskWinsOverSeed) {
    AccountConfigCache cache(MAILMIRROR_TEST_DIR);
    cache.put(account);

    nlohmann::json updated = testAccountJSON("test-account");
    updated["sync"] = {{"network_timeout", 90}};
    writeAccountFile("test-account", updated.dump());

    cache.invalidate("test-account");
    EXPECT_EQ(90, cache.get("test-account")->networkTimeout());
}

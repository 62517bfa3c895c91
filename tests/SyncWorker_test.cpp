#include "MailMirrorTest.hpp"

#include "mailmirror/sync_worker.hpp"

using namespace std;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;

class SyncWorkerTest : public MailMirrorTest {
protected:
    void SetUp() override {
        MailMirrorTest::SetUp();
        server.addFolder("INBOX", 100);
        server.addFolder("Archive", 200);
        server.addFolder("[Gmail]", 1, mailcore::IMAPFolderFlagNoSelect);

        FakeMessage m;
        m.messageId = "a@x";
        server.append("INBOX", m);
        m.messageId = "b@x";
        m.inReplyTo = "a@x";
        server.append("INBOX", m);
        m.messageId = "c@x";
        m.inReplyTo = "";
        server.append("Archive", m);
    }
};

TEST_F(SyncWorkerTest, FirstCyclePlansEveryMessage) {
    SyncWorker worker(account, session);
    SyncCycleResult result = worker.syncNow({});

    EXPECT_EQ((vector<string>{"Archive", "INBOX"}), result.folders);
    EXPECT_EQ(3, result.mirror.onServer);
    EXPECT_EQ((vector<uint32_t>{1, 2}), result.delta["INBOX"]);
    EXPECT_EQ((vector<uint32_t>{1}), result.delta["Archive"]);
    EXPECT_EQ(0, result.reconcile.linked);
    EXPECT_TRUE(result.threads.empty());
    EXPECT_FALSE(result.cancelled);
}

TEST_F(SyncWorkerTest, SecondCycleLinksAndThreadsFetchedMessages) {
    SyncWorker worker(account, session);
    worker.syncNow({});

    string a = materialize("INBOX", 1);
    string b = materialize("INBOX", 2);

    SyncCycleResult result = worker.syncNow({});
    EXPECT_EQ(0u, result.delta.count("INBOX"));
    EXPECT_EQ((vector<uint32_t>{1}), result.delta["Archive"]);
    EXPECT_EQ(2, result.reconcile.linked);

    ASSERT_EQ(2u, result.threads.size());
    EXPECT_EQ(result.threads[a].threadId, result.threads[b].threadId);
    EXPECT_EQ(1u, result.threads[b].parentUID);

    // no X-GM-THRID support on this server
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.threadsFromHeadersOnly);
    EXPECT_TRUE(result.toJSON()["threadsFromHeadersOnly"].get<bool>());
}

TEST_F(SyncWorkerTest, IncludeFoldersLimitsTheScan) {
    nlohmann::json json = testAccountJSON("test-account");
    json["sync"] = {{"include_folders", {"INBOX"}}};
    SyncWorker worker(make_shared<Account>(json), session);

    SyncCycleResult result = worker.syncNow({});
    EXPECT_EQ((vector<string>{"INBOX"}), result.folders);
    EXPECT_EQ(0u, result.delta.count("Archive"));
}

TEST_F(SyncWorkerTest, FolderListErrorFallsBackToKnownFolders) {
    SyncWorker worker(account, session);
    worker.syncNow({"INBOX"});

    ON_CALL(*session, fetchAllFolders(_)).WillByDefault(DoAll(SetArgPointee<0>(mailcore::ErrorConnection), Return(nullptr)));
    SyncCycleResult result = worker.syncNow({});

    EXPECT_TRUE(result.folders.empty());
    EXPECT_EQ(1, result.mirror.scanned);
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_EQ(SyncErrorKindTransientNetwork, result.errors[0].kind);
}

TEST_F(SyncWorkerTest, ResultSerializes) {
    SyncWorker worker(account, session);
    nlohmann::json json = worker.syncNow({"INBOX"}).toJSON();

    EXPECT_EQ(nlohmann::json::parse("[\"INBOX\"]"), json["folders"]);
    EXPECT_EQ(2, json["mirror"]["on_server"].get<int>());
    EXPECT_EQ(nlohmann::json::parse("[1, 2]"), json["delta"]["INBOX"]);
    EXPECT_FALSE(json["cancelled"].get<bool>());
}

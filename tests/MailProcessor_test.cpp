#include "MailMirrorTest.hpp"

#include "mailmirror/mail_processor.hpp"
#include "mailmirror/server_mirror.hpp"
#include "mailmirror/sync_exception.hpp"

using namespace std;

class MailProcessorTest : public MailMirrorTest {
protected:
    FetchedMessage fetched(string folder, uint32_t uid, string messageId) {
        FetchedMessage m;
        m.folder = folder;
        m.uid = uid;
        m.uidvalidity = 100;
        m.envelope.messageId = messageId;
        m.envelope.from = "alice@example.com";
        m.envelope.subject = "Hello";
        m.envelope.date = 1700000000;
        m.payload = {{"body", "ENC(body)"}, {"snippet", nullptr}};
        return m;
    }
};

TEST_F(MailProcessorTest, StoresPayloadVerbatim) {
    MailProcessor processor(account, store);
    string id = processor.insertFetched(fetched("INBOX", 7, "a@x"));

    auto record = local(id);
    ASSERT_NE(nullptr, record);
    EXPECT_EQ("INBOX", record->folder());
    EXPECT_EQ(7u, record->uid());
    EXPECT_EQ(100u, record->uidvalidity());
    EXPECT_EQ("a@x", record->stableIdentity());
    EXPECT_EQ("ENC(body)", record->payload()["body"].get<string>());
    EXPECT_TRUE(record->payload()["snippet"].is_null());
    EXPECT_FALSE(record->isSoftDeleted());
}

TEST_F(MailProcessorTest, ComputesContentHashWhenMissing) {
    MailProcessor processor(account, store);
    string id = processor.insertFetched(fetched("INBOX", 7, ""));
    EXPECT_EQ("hash:0d5c43fd13e71d22879ce60bfe812ef1", local(id)->stableIdentity());
}

TEST_F(MailProcessorTest, SecondInsertReturnsExistingRecord) {
    MailProcessor processor(account, store);
    string first = processor.insertFetched(fetched("INBOX", 7, "a@x"));
    string second = processor.insertFetched(fetched("INBOX", 7, "a@x"));
    EXPECT_EQ(first, second);
    EXPECT_EQ(1u, liveLocals().size());
}

TEST_F(MailProcessorTest, NeverLinksTheMirror) {
    server.addFolder("INBOX", 100);
    FakeMessage m;
    m.messageId = "a@x";
    server.append("INBOX", m);
    ServerMirror(account, store, session).syncFolders({"INBOX"});

    MailProcessor(account, store).insertFetched(fetched("INBOX", 1, "a@x"));

    auto rows = mirrorRows("INBOX");
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ("", rows[0]->linkedLocalId());
}

TEST_F(MailProcessorTest, RejectsInvalidMessages) {
    MailProcessor processor(account, store);

    EXPECT_THROW(processor.insertFetched(fetched("", 7, "a@x")), SyncException);
    EXPECT_THROW(processor.insertFetched(fetched("INBOX", 0, "a@x")), SyncException);

    FetchedMessage bad = fetched("INBOX", 7, "a@x");
    bad.payload = {{"body", 12}};
    EXPECT_THROW(processor.insertFetched(bad), SyncException);

    bad.payload = nlohmann::json::array();
    EXPECT_THROW(processor.insertFetched(bad), SyncException);

    EXPECT_TRUE(liveLocals().empty());
}

TEST_F(MailProcessorTest, FetchedMessageFromJSON) {
    nlohmann::json json = {
        {"folder", "INBOX"},
        {"uid", 9},
        {"uidvalidity", 100},
        {"envelope", {{"message_id", "<a@x>"}, {"date", 1700000000}}},
        {"payload", {{"body", "ENC"}}},
    };
    FetchedMessage m = FetchedMessage::fromJSON(json);
    EXPECT_EQ("INBOX", m.folder);
    EXPECT_EQ(9u, m.uid);
    EXPECT_EQ(100u, m.uidvalidity);
    EXPECT_EQ("a@x", m.envelope.messageId);
    EXPECT_EQ("", m.contentHash);

    EXPECT_THROW(FetchedMessage::fromJSON(nlohmann::json::array()), SyncException);
}

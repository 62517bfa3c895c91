#include <gtest/gtest.h>
#include <MailCore/MailCore.h>

#include "mailmirror/envelope.hpp"
#include "FakeServer.hpp"

using namespace std;

class EnvelopeTest : public ::testing::Test {
protected:
    mailcore::AutoreleasePool pool;
};

TEST_F(EnvelopeTest, FromIMAPMessageNormalizesFields) {
    FakeMessage m;
    m.uid = 4;
    m.messageId = "abc@example.com";
    m.from = "Alice@Example.COM";
    m.subject = "Hello";
    m.inReplyTo = "parent@example.com";
    m.flags = mailcore::MessageFlagSeen;

    Envelope e = Envelope::fromIMAPMessage(buildIMAPMessage(m));
    EXPECT_EQ("abc@example.com", e.messageId);
    EXPECT_EQ("alice@example.com", e.from);
    EXPECT_EQ("Hello", e.subject);
    EXPECT_EQ(1700000000, e.date);
    EXPECT_EQ("parent@example.com", e.inReplyTo);
    EXPECT_EQ(mailcore::MessageFlagSeen, e.flags);
    EXPECT_EQ("abc@example.com", e.stableIdentity());
}

TEST_F(EnvelopeTest, GeneratedMessageIDCountsAsAbsent) {
    FakeMessage m;
    m.uid = 1;
    m.from = "alice@example.com";
    m.subject = "Hello";

    Envelope e = Envelope::fromIMAPMessage(buildIMAPMessage(m));
    EXPECT_FALSE(e.hasMessageId());
    EXPECT_EQ("0d5c43fd13e71d22879ce60bfe812ef1", e.contentHash());
    EXPECT_EQ("hash:0d5c43fd13e71d22879ce60bfe812ef1", e.stableIdentity());
}

TEST_F(EnvelopeTest, FromJSONAcceptsHostPackets) {
    nlohmann::json json = {
        {"message_id", "<abc@example.com>"},
        {"from", "BOB@example.com"},
        {"subject", "Re: plans"},
        {"date", 1700000000},
        {"in_reply_to", "<root@example.com>"},
        {"references", {"<root@example.com>", "<>"}},
        {"flags", "\\Seen \\Answered"},
    };
    Envelope e = Envelope::fromJSON(json);
    EXPECT_EQ("abc@example.com", e.messageId);
    EXPECT_EQ("bob@example.com", e.from);
    EXPECT_EQ("root@example.com", e.inReplyTo);
    EXPECT_EQ((vector<string>{"root@example.com"}), e.references);
    EXPECT_EQ(mailcore::MessageFlagSeen | mailcore::MessageFlagAnswered, e.flags);
}

TEST_F(EnvelopeTest, FromJSONTreatsNullAsAbsent) {
    nlohmann::json json = {
        {"message_id", nullptr},
        {"subject", nullptr},
        {"date", -5},
    };
    Envelope e = Envelope::fromJSON(json);
    EXPECT_FALSE(e.hasMessageId());
    EXPECT_EQ("", e.subject);
    EXPECT_EQ(0, e.date);
    EXPECT_EQ("hash:565d240f5343e625ae579a4d45a770f1", e.stableIdentity());
}

TEST_F(EnvelopeTest, ToJSONUsesNullForMissingMessageID) {
    Envelope e;
    e.subject = "x";
    nlohmann::json json = e.toJSON();
    EXPECT_TRUE(json["message_id"].is_null());
    EXPECT_TRUE(json["in_reply_to"].is_null());
    EXPECT_EQ("x", json["subject"].get<string>());
    EXPECT_FALSE(json.count("gmail_thread_id"));
}

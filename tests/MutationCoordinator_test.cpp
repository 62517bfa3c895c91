#include "MailMirrorTest.hpp"

#include "mailmirror/delta_planner.hpp"
#include "mailmirror/mutation_coordinator.hpp"
#include "mailmirror/reconciler.hpp"
#include "mailmirror/server_mirror.hpp"

using namespace std;

class MutationCoordinatorTest : public MailMirrorTest {
protected:
    string id;

    void SetUp() override {
        MailMirrorTest::SetUp();
        server.addFolder("INBOX", 100);
        server.addFolder("Archive", 200);

        FakeMessage m;
        m.messageId = "a@x";
        m.subject = "Hello";
        server.append("INBOX", m);
        server.append("Archive", FakeMessage());

        ServerMirror(account, store, session).syncFolders({"INBOX", "Archive"});
        id = materialize("INBOX", 1);
        Reconciler(account, store).reconcile();
    }

    MutationResult apply(string action, string folder, uint32_t uid, string target = "") {
        MutationRequest request;
        request.action = action;
        request.folder = folder;
        request.uid = uid;
        request.target = target;
        return MutationCoordinator(account, store, session).applyMutation(request);
    }

    BulkMutationResult applyBulk(string action, map<string, vector<uint32_t>> uidsByFolder, string target = "") {
        BulkMutationRequest request;
        request.action = action;
        request.uidsByFolder = uidsByFolder;
        request.target = target;
        return MutationCoordinator(account, store, session).applyBulkMutation(request);
    }

    uint32_t addToInbox(string messageId) {
        FakeMessage m;
        m.messageId = messageId;
        m.subject = messageId;
        return server.append("INBOX", m);
    }
};

TEST_F(MutationCoordinatorTest, MoveWithUIDMapping) {
    MutationResult result = apply("move", "INBOX", 1, "Archive");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(MutationStateConfirmedNewUID, result.state);
    EXPECT_EQ("Archive", result.newFolder);
    EXPECT_EQ(2u, result.newUID);
    EXPECT_EQ(200u, result.newUIDValidity);

    EXPECT_TRUE(server.folders["INBOX"].messages.empty());
    EXPECT_EQ(1, server.expungeCalls);

    auto record = local(id);
    EXPECT_EQ("Archive", record->folder());
    EXPECT_EQ(2u, record->uid());
    EXPECT_EQ(200u, record->uidvalidity());
}

TEST_F(MutationCoordinatorTest, MoveWithRawCopyUIDResponse) {
    server.copyHint = FakeCopyHintRawResponse;
    MutationResult result = apply("move", "INBOX", 1, "Archive");

    EXPECT_EQ(MutationStateConfirmedNewUID, result.state);
    EXPECT_EQ(2u, result.newUID);
    EXPECT_EQ(200u, result.newUIDValidity);
    EXPECT_EQ(2u, local(id)->uid());
    EXPECT_EQ(nullptr, session->connectionLogger());
}

TEST_F(MutationCoordinatorTest, MoveWithoutHintIsRepairedByTheNextSync) {
    server.copyHint = FakeCopyHintNone;
    MutationResult result = apply("move", "INBOX", 1, "Archive");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(MutationStateConfirmedUIDUnknown, result.state);
    EXPECT_EQ("Archive", result.newFolder);
    EXPECT_EQ(0u, result.newUID);
    EXPECT_TRUE(result.toJSON()["new_uid"].is_null());

    // untouched until the mirror sees the new position
    EXPECT_EQ("INBOX", local(id)->folder());
    EXPECT_EQ(1u, local(id)->uid());

    ServerMirror(account, store, session).syncFolders({"INBOX", "Archive"});
    ReconcileStats stats = Reconciler(account, store).reconcile();
    EXPECT_EQ(0, stats.deleted);

    auto record = local(id);
    EXPECT_FALSE(record->isSoftDeleted());
    EXPECT_EQ("Archive", record->folder());
    EXPECT_EQ(2u, record->uid());

    // only the unrelated Archive message is left to fetch
    auto delta = DeltaPlanner(account, store).computeFetchDelta(FetchFilter());
    EXPECT_EQ(0u, delta.count("INBOX"));
    EXPECT_EQ((vector<uint32_t>{1}), delta["Archive"]);
}

TEST_F(MutationCoordinatorTest, MoveStandsWhenSourceCannotBeFlagged) {
    server.failingStores["INBOX"] = mailcore::ErrorStore;
    MutationResult result = apply("move", "INBOX", 1, "Archive");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(MutationStateConfirmedNewUID, result.state);
    EXPECT_EQ("Archive", result.newFolder);
    EXPECT_EQ(2u, result.newUID);
    EXPECT_NE(string::npos, result.message.find("Warning"));
    EXPECT_EQ(0, server.expungeCalls);

    // the copy exists on the server, the source is left behind
    EXPECT_EQ(1u, server.folders["INBOX"].messages.size());
    EXPECT_EQ(2u, server.folders["Archive"].messages.size());
    EXPECT_EQ("Archive", local(id)->folder());
    EXPECT_EQ(2u, local(id)->uid());

    // the next sync keeps the record where the move put it
    ServerMirror(account, store, session).syncFolders({"INBOX", "Archive"});
    ReconcileStats stats = Reconciler(account, store).reconcile();
    EXPECT_EQ(0, stats.deleted);
    EXPECT_EQ("Archive", local(id)->folder());
    EXPECT_EQ(2u, local(id)->uid());
}

TEST_F(MutationCoordinatorTest, MoveStandsWhenExpungeFails) {
    server.copyHint = FakeCopyHintNone;
    server.failingExpunges["INBOX"] = mailcore::ErrorExpunge;
    MutationResult result = apply("move", "INBOX", 1, "Archive");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(MutationStateConfirmedUIDUnknown, result.state);
    EXPECT_EQ("Archive", result.newFolder);
    EXPECT_NE(string::npos, result.message.find("could not be expunged"));
    EXPECT_EQ(1, server.copyCalls);
    EXPECT_FALSE(local(id)->isSoftDeleted());
}

TEST_F(MutationCoordinatorTest, MoveToMissingFolderFails) {
    MutationResult result = apply("move", "INBOX", 1, "Nowhere");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(MutationStateFailed, result.state);
    EXPECT_EQ(1u, server.folders["INBOX"].messages.size());
    EXPECT_EQ("INBOX", local(id)->folder());
}

TEST_F(MutationCoordinatorTest, MoveToSameFolderIsRejected) {
    MutationResult result = apply("move", "INBOX", 1, "INBOX");
    EXPECT_EQ(MutationStateFailed, result.state);
    EXPECT_EQ(0, server.copyCalls);
}

TEST_F(MutationCoordinatorTest, MoveToTrashPrefersFlaggedFolder) {
    server.addFolder("Deleted Items", 300);
    server.addFolder("Bin", 400, mailcore::IMAPFolderFlagTrash);

    MutationResult result = apply("move_to_trash", "INBOX", 1);
    EXPECT_TRUE(result.success);
    EXPECT_EQ("Bin", result.newFolder);
    EXPECT_EQ(400u, result.newUIDValidity);
    EXPECT_EQ(1u, server.folders["Bin"].messages.size());
}

TEST_F(MutationCoordinatorTest, MoveToTrashByName) {
    server.addFolder("Deleted Items", 300);
    MutationResult result = apply("move_to_trash", "INBOX", 1);
    EXPECT_EQ("Deleted Items", result.newFolder);
}

TEST_F(MutationCoordinatorTest, MoveToTrashWithoutTrashFolderFails) {
    MutationResult result = apply("move_to_trash", "INBOX", 1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(MutationStateFailed, result.state);
    EXPECT_EQ(0u, result.message.find("no-trash-folder"));
}

TEST_F(MutationCoordinatorTest, DeleteIsIdempotent) {
    MutationResult first = apply("delete", "INBOX", 1);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(MutationStateConfirmedUIDUnknown, first.state);
    EXPECT_EQ("Deleted.", first.message);
    EXPECT_TRUE(server.folders["INBOX"].messages.empty());
    EXPECT_TRUE(local(id)->isSoftDeleted());

    MutationResult second = apply("delete", "INBOX", 1);
    EXPECT_TRUE(second.success);
    EXPECT_EQ(MutationStateConfirmedUIDUnknown, second.state);
    EXPECT_EQ("Already deleted.", second.message);
    EXPECT_EQ(1, server.expungeCalls);
}

TEST_F(MutationCoordinatorTest, FlagChangesKeepTheUID) {
    MutationResult result = apply("mark_read", "INBOX", 1);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(MutationStateConfirmedNewUID, result.state);
    EXPECT_EQ(1u, result.newUID);
    EXPECT_EQ(100u, result.newUIDValidity);
    EXPECT_TRUE(server.folders["INBOX"].messages[1].flags & mailcore::MessageFlagSeen);
    EXPECT_TRUE(local(id)->isSeen());

    apply("flag", "INBOX", 1);
    apply("mark_unread", "INBOX", 1);
    EXPECT_FALSE(local(id)->isSeen());
    EXPECT_TRUE(local(id)->isFlagged());

    apply("unflag", "INBOX", 1);
    EXPECT_FALSE(local(id)->isFlagged());
    EXPECT_EQ(0, server.folders["INBOX"].messages[1].flags);
}

TEST_F(MutationCoordinatorTest, InvalidRequestsFail) {
    EXPECT_EQ(MutationStateFailed, apply("archive", "INBOX", 1).state);
    EXPECT_EQ(MutationStateFailed, apply("move", "INBOX", 1).state);
    EXPECT_EQ(MutationStateFailed, apply("delete", "", 1).state);
    EXPECT_EQ(MutationStateFailed, apply("delete", "INBOX", 0).state);
    EXPECT_FALSE(local(id)->isSoftDeleted());
}

TEST_F(MutationCoordinatorTest, RequestAndResultJSON) {
    MutationRequest request = MutationRequest::fromJSON({{"action", "move"}, {"folder", "INBOX"}, {"uid", 3}, {"target", "Archive"}});
    EXPECT_EQ("move", request.action);
    EXPECT_EQ(3u, request.uid);
    EXPECT_EQ("Archive", request.target);

    MutationResult result;
    result.success = true;
    result.state = MutationStateConfirmedNewUID;
    result.newFolder = "Archive";
    result.newUID = 9;
    result.newUIDValidity = 200;
    nlohmann::json json = result.toJSON();
    EXPECT_EQ("CONFIRMED_NEW_UID", json["state"].get<string>());
    EXPECT_EQ(9u, json["new_uid"].get<uint32_t>());
    EXPECT_EQ(200u, json["new_uidvalidity"].get<uint32_t>());

    EXPECT_EQ("FAILED", MutationStateName(MutationStateFailed));
    EXPECT_EQ("SENT_TO_SERVER", MutationStateName(MutationStateSentToServer));
}

TEST_F(MutationCoordinatorTest, BulkMoveSendsOneCopyPerFolder) {
    server.copyHint = FakeCopyHintRawResponse;
    addToInbox("b@x");
    addToInbox("c@x");
    string second = materialize("INBOX", 2);

    BulkMutationResult result = applyBulk("move", {{"INBOX", {1, 2, 3}}}, "Archive");

    EXPECT_TRUE(result.allSuccess());
    EXPECT_FALSE(result.partialSuccess());
    EXPECT_EQ(3, result.total);
    EXPECT_EQ(1, server.copyCalls);
    EXPECT_EQ(1, server.expungeCalls);
    EXPECT_TRUE(server.folders["INBOX"].messages.empty());

    ASSERT_EQ(3u, result.results.size());
    EXPECT_EQ(1u, result.results[0].uid);
    EXPECT_EQ(2u, result.results[0].newUID);
    EXPECT_EQ(3u, result.results[1].newUID);
    EXPECT_EQ(4u, result.results[2].newUID);
    EXPECT_EQ(200u, result.results[2].newUIDValidity);

    EXPECT_EQ(2u, local(id)->uid());
    EXPECT_EQ("Archive", local(second)->folder());
    EXPECT_EQ(3u, local(second)->uid());
}

TEST_F(MutationCoordinatorTest, BulkFlagChangeReportsPartialFailure) {
    server.failingStores["Archive"] = mailcore::ErrorStore;

    BulkMutationResult result = applyBulk("mark_read", {{"INBOX", {1}}, {"Archive", {1}}});

    EXPECT_EQ(2, result.total);
    EXPECT_EQ(1, result.succeeded);
    EXPECT_EQ(1, result.failed);
    EXPECT_FALSE(result.allSuccess());
    EXPECT_TRUE(result.partialSuccess());

    for (auto & item : result.results) {
        if (item.folder == "INBOX") {
            EXPECT_TRUE(item.success);
            EXPECT_EQ(MutationStateConfirmedNewUID, item.state);
        } else {
            EXPECT_FALSE(item.success);
            EXPECT_EQ(MutationStateFailed, item.state);
            EXPECT_EQ("Archive", item.newFolder);
        }
    }
    EXPECT_TRUE(local(id)->isSeen());
    EXPECT_FALSE(server.folders["Archive"].messages[1].flags & mailcore::MessageFlagSeen);
}

TEST_F(MutationCoordinatorTest, BulkDeleteTreatsMissingUIDsAsDone) {
    addToInbox("b@x");

    BulkMutationResult result = applyBulk("delete", {{"INBOX", {1, 2, 9}}});

    EXPECT_TRUE(result.allSuccess());
    ASSERT_EQ(3u, result.results.size());
    EXPECT_EQ("Deleted.", result.results[0].message);
    EXPECT_EQ("Deleted.", result.results[1].message);
    EXPECT_EQ("Already deleted.", result.results[2].message);
    EXPECT_TRUE(server.folders["INBOX"].messages.empty());
    EXPECT_EQ(1, server.expungeCalls);
    EXPECT_TRUE(local(id)->isSoftDeleted());
}

TEST_F(MutationCoordinatorTest, BulkRejectsOnlyTheInvalidParts) {
    BulkMutationResult result = applyBulk("move", {{"INBOX", {0, 1}}, {"Archive", {1}}}, "Archive");

    EXPECT_EQ(3, result.total);
    EXPECT_EQ(1, result.succeeded);
    EXPECT_TRUE(result.partialSuccess());
    EXPECT_EQ(1, server.copyCalls);
    EXPECT_EQ("Archive", local(id)->folder());

    nlohmann::json json = result.toJSON();
    EXPECT_EQ(3, json["total"].get<int>());
    EXPECT_TRUE(json["partial_success"].get<bool>());
    EXPECT_FALSE(json["all_success"].get<bool>());
    EXPECT_EQ(3u, json["results"].size());
}

TEST_F(MutationCoordinatorTest, BulkWithUnresolvableTrashFailsEverything) {
    BulkMutationResult result = applyBulk("move_to_trash", {{"INBOX", {1}}, {"Archive", {1}}});
    EXPECT_EQ(2, result.failed);
    EXPECT_FALSE(result.partialSuccess());
    EXPECT_FALSE(result.allSuccess());
    EXPECT_EQ(0, server.copyCalls);
}

TEST_F(MutationCoordinatorTest, BulkRequestJSON) {
    BulkMutationRequest byFolder = BulkMutationRequest::fromJSON({{"action", "delete"}, {"folders", {{"INBOX", nlohmann::json::array({1, 2})}, {"Archive", nlohmann::json::array({7})}}}});
    EXPECT_EQ("delete", byFolder.action);
    EXPECT_EQ((vector<uint32_t>{1, 2}), byFolder.uidsByFolder["INBOX"]);
    EXPECT_EQ((vector<uint32_t>{7}), byFolder.uidsByFolder["Archive"]);

    nlohmann::json flat = {{"action", "move"}, {"folder", "INBOX"}, {"uids", nlohmann::json::array({4, 5})}, {"target", "Archive"}};
    EXPECT_TRUE(BulkMutationRequest::isBulkJSON(flat));
    BulkMutationRequest request = BulkMutationRequest::fromJSON(flat);
    EXPECT_EQ("Archive", request.target);
    EXPECT_EQ((vector<uint32_t>{4, 5}), request.uidsByFolder["INBOX"]);

    EXPECT_FALSE(BulkMutationRequest::isBulkJSON({{"action", "move"}, {"folder", "INBOX"}, {"uid", 4}}));
    EXPECT_THROW(BulkMutationRequest::fromJSON({{"action", "delete"}, {"folder", "INBOX"}, {"uids", nlohmann::json::array({"x"})}}), SyncException);
    EXPECT_THROW(BulkMutationRequest::fromJSON({{"action", "delete"}, {"folders", nlohmann::json::array({1, 2})}}), SyncException);
}

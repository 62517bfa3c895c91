#include "mailmirror/mutation_coordinator.hpp"
#include "mailmirror/mail_store_transaction.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/sync_exception.hpp"
#include "mailmirror/constants.hpp"

#include <set>

using namespace std;
using namespace mailcore;

string MutationStateName(MutationState state) {
    switch (state) {
        case MutationStateRequested:
            return "REQUESTED";
        case MutationStateSentToServer:
            return "SENT_TO_SERVER";
        case MutationStateConfirmedNewUID:
            return "CONFIRMED_NEW_UID";
        case MutationStateConfirmedUIDUnknown:
            return "CONFIRMED_UID_UNKNOWN";
        case MutationStateFailed:
            return "FAILED";
    }
    return "UNKNOWN";
}

MutationRequest MutationRequest::fromJSON(const nlohmann::json & json) {
    if (!json.is_object()) {
        throw SyncException("invalid-mutation", "Mutation is not an object: " + json.dump(), false);
    }
    MutationRequest request;
    if (json.count("action") && json["action"].is_string()) {
        request.action = json["action"].get<string>();
    }
    if (json.count("folder") && json["folder"].is_string()) {
        request.folder = json["folder"].get<string>();
    }
    if (json.count("uid") && json["uid"].is_number_integer() && json["uid"].get<int64_t>() >= 0) {
        request.uid = json["uid"].get<uint32_t>();
    }
    if (json.count("target") && json["target"].is_string()) {
        request.target = json["target"].get<string>();
    }
    return request;
}

static uint32_t uidFromJSON(const nlohmann::json & item) {
    if (!item.is_number_integer() || item.get<int64_t>() < 0 || item.get<int64_t>() > UINT32_MAX) {
        throw SyncException("invalid-mutation", "Not a UID: " + item.dump(), false);
    }
    return item.get<uint32_t>();
}

static vector<uint32_t> uidsFromJSON(const nlohmann::json & list) {
    if (!list.is_array()) {
        throw SyncException("invalid-mutation", "Expected a list of UIDs: " + list.dump(), false);
    }
    vector<uint32_t> uids{};
    for (const auto & item : list) {
        uids.push_back(uidFromJSON(item));
    }
    return uids;
}

bool BulkMutationRequest::isBulkJSON(const nlohmann::json & json) {
    return json.is_object() && (json.count("folders") || json.count("uids"));
}

BulkMutationRequest BulkMutationRequest::fromJSON(const nlohmann::json & json) {
    if (!json.is_object()) {
        throw SyncException("invalid-mutation", "Mutation is not an object: " + json.dump(), false);
    }
    BulkMutationRequest request;
    if (json.count("action") && json["action"].is_string()) {
        request.action = json["action"].get<string>();
    }
    if (json.count("target") && json["target"].is_string()) {
        request.target = json["target"].get<string>();
    }
    if (json.count("folders")) {
        if (!json["folders"].is_object()) {
            throw SyncException("invalid-mutation", "folders must map folder paths to UID lists.", false);
        }
        for (auto it = json["folders"].begin(); it != json["folders"].end(); ++it) {
            request.uidsByFolder[it.key()] = uidsFromJSON(it.value());
        }
    } else {
        string folder = json.count("folder") && json["folder"].is_string() ? json["folder"].get<string>() : "";
        if (json.count("uids")) {
            request.uidsByFolder[folder] = uidsFromJSON(json["uids"]);
        } else if (json.count("uid")) {
            request.uidsByFolder[folder] = {uidFromJSON(json["uid"])};
        }
    }
    return request;
}

nlohmann::json MutationResult::toJSON() const {
    return {
        {"folder", folder},
        {"uid", uid},
        {"success", success},
        {"state", MutationStateName(state)},
        {"new_folder", newFolder},
        {"new_uid", newUID == 0 ? nlohmann::json(nullptr) : nlohmann::json(newUID)},
        {"new_uidvalidity", newUIDValidity == 0 ? nlohmann::json(nullptr) : nlohmann::json(newUIDValidity)},
        {"message", message},
    };
}

void BulkMutationResult::add(MutationResult result) {
    total += 1;
    if (result.success) {
        succeeded += 1;
    } else {
        failed += 1;
    }
    results.push_back(result);
}

bool BulkMutationResult::allSuccess() const {
    return failed == 0 && succeeded > 0;
}

bool BulkMutationResult::partialSuccess() const {
    return succeeded > 0 && failed > 0;
}

nlohmann::json BulkMutationResult::toJSON() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto & result : results) {
        items.push_back(result.toJSON());
    }
    return {
        {"total", total},
        {"succeeded", succeeded},
        {"failed", failed},
        {"all_success", allSuccess()},
        {"partial_success", partialSuccess()},
        {"results", items},
    };
}

static void markFailed(MutationResult & result, SyncException & ex) {
    result.success = false;
    result.state = MutationStateFailed;
    result.newFolder = result.folder;
    result.newUID = 0;
    result.newUIDValidity = 0;
    result.message = ex.key + ": " + ex.debuginfo;
}

void ResponseCaptureLogger::log(void * sender, ConnectionLogType logType, Data * buffer) {
    if (buffer && logType == ConnectionLogTypeReceived) {
        accumulated = accumulated + string(buffer->bytes(), buffer->length());
    }
}

MutationCoordinator::MutationCoordinator(shared_ptr<Account> account, MailStore * store, IMAPSession * session) :
    session(session),
    store(store),
    account(account),
    logger(spdlog::get("logger"))
{
}

MutationResult MutationCoordinator::applyMutation(MutationRequest request) {
    BulkMutationRequest bulk;
    bulk.action = request.action;
    bulk.target = request.target;
    bulk.uidsByFolder[request.folder] = {request.uid};

    return applyBulkMutation(bulk).results.front();
}

BulkMutationResult MutationCoordinator::applyBulkMutation(BulkMutationRequest request) {
    BulkMutationResult bulk;

    // Requests that can never reach the server fail on their own.
    map<string, vector<MutationResult>> pending{};
    for (auto & pair : request.uidsByFolder) {
        set<uint32_t> seen{};
        for (uint32_t uid : pair.second) {
            if (seen.count(uid)) {
                continue;
            }
            seen.insert(uid);

            MutationResult result;
            result.folder = pair.first;
            result.uid = uid;
            result.newFolder = pair.first;

            logger->info("applyMutation - {} {}:{} {}", request.action, pair.first, uid, request.target);

            if (pair.first == "" || uid == 0) {
                SyncException ex("invalid-mutation", "A mutation requires a folder and a non-zero uid.", false);
                markFailed(result, ex);
                bulk.add(result);
                continue;
            }
            pending[pair.first].push_back(result);
        }
    }
    if (pending.empty()) {
        return bulk;
    }

    string action = request.action;
    string target = request.target;

    try {
        if (action == "move_to_trash") {
            target = trashFolderPath();
            action = "move";
        }
        if (action == "move" && target == "") {
            throw SyncException("invalid-mutation", "move requires a target folder.", false);
        }
        set<string> known = {"move", "delete", "mark_read", "mark_unread", "flag", "unflag"};
        if (!known.count(action)) {
            throw SyncException("invalid-mutation", "Unknown mutation action: " + request.action, false);
        }
    } catch (SyncException & ex) {
        logger->error("applyMutation - {}", ex.toJSON().dump());
        for (auto & pair : pending) {
            for (auto & result : pair.second) {
                markFailed(result, ex);
                bulk.add(result);
            }
        }
        return bulk;
    }

    for (auto & pair : pending) {
        string folder = pair.first;
        vector<MutationResult> & results = pair.second;

        try {
            if (action == "move") {
                if (target == folder) {
                    throw SyncException("invalid-mutation", "The messages are already in " + target + ".", false);
                }
                performMove(folder, target, results);
            } else if (action == "delete") {
                performDelete(folder, results);
            } else if (action == "mark_read") {
                performFlagChange(folder, results, MessageFlagSeen, true);
            } else if (action == "mark_unread") {
                performFlagChange(folder, results, MessageFlagSeen, false);
            } else if (action == "flag") {
                performFlagChange(folder, results, MessageFlagFlagged, true);
            } else if (action == "unflag") {
                performFlagChange(folder, results, MessageFlagFlagged, false);
            }
            for (auto & result : results) {
                result.success = (result.state != MutationStateFailed);
            }

        } catch (SyncException & ex) {
            logger->error("applyMutation - {} failed in {}: {}", action, folder, ex.toJSON().dump());
            for (auto & result : results) {
                markFailed(result, ex);
            }
        }

        for (auto & result : results) {
            bulk.add(result);
        }
    }

    if (bulk.total > 1) {
        logger->info("applyMutation - {}: {}/{} succeeded", request.action, bulk.succeeded, bulk.total);
    }
    return bulk;
}

void MutationCoordinator::performMove(string folder, string target, vector<MutationResult> & results) {
    // allocated mailcore objects freed when `pool` is removed from the stack
    AutoreleasePool pool;

    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(folder);
    String * destPath = AS_MCSTR(target);
    IndexSet * uids = IndexSet::indexSet();
    for (auto & result : results) {
        uids->addIndex(result.uid);
        result.state = MutationStateSentToServer;
    }
    HashMap * uidmap = nullptr;

    ResponseCaptureLogger capture;
    ConnectionLogger * previousLogger = session->connectionLogger();
    session->setConnectionLogger(&capture);
    session->copyMessages(path, uids, destPath, &uidmap, &err);
    session->setConnectionLogger(previousLogger);

    if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "applyMutation - copyMessages");
    }

    map<uint32_t, uint32_t> mapping{};
    uint32_t newUIDValidity = 0;

    // Only returned if the UIDPLUS extension is present and mailcore parsed it.
    if (uidmap != nullptr) {
        for (auto & result : results) {
            Value * value = (Value *)uidmap->objectForKey(Value::valueWithUnsignedLongValue(result.uid));
            if (value != nullptr) {
                mapping[result.uid] = value->unsignedIntValue();
            }
        }
    }

    // Otherwise look for a COPYUID response code in what the server sent back.
    uint32_t capturedValidity = 0;
    map<uint32_t, uint32_t> capturedMapping{};
    if (MailUtils::parseUIDRemapSets(capture.accumulated, capturedValidity, capturedMapping)) {
        newUIDValidity = capturedValidity;
        for (auto & pair : capturedMapping) {
            if (!mapping.count(pair.first)) {
                mapping[pair.first] = pair.second;
            }
        }
    }

    if (!mapping.empty() && newUIDValidity == 0) {
        IMAPFolderStatus * status = session->folderStatus(destPath, &err);
        if (err == ErrorCode::ErrorNone && status != nullptr) {
            newUIDValidity = status->uidValidity();
        } else {
            logger->warn("applyMutation - unable to read UIDVALIDITY of {} (error: {})", target, ErrorCodeToTypeMap[err]);
            mapping.clear();
            err = ErrorCode::ErrorNone;
        }
    }

    // The copy is confirmed from here on. If the source can't be cleaned up the
    // move still stands; the leftover copy is seen by the next mirror scan.
    string cleanupWarning = "";
    session->storeFlagsByUID(path, uids, IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
    if (err != ErrorCode::ErrorNone) {
        cleanupWarning = " Warning: the source copy in " + folder + " could not be flagged deleted (" + ErrorCodeToTypeMap[err] + ").";
    } else {
        session->expungeUIDs(path, uids, &err);
        if (err != ErrorCode::ErrorNone) {
            cleanupWarning = " Warning: the source copy in " + folder + " could not be expunged (" + ErrorCodeToTypeMap[err] + ").";
        }
    }
    if (cleanupWarning != "") {
        logger->warn("applyMutation - copied to {} but cleanup of {} failed: {}", target, folder, ErrorCodeToTypeMap[err]);
    }

    bool anyUnknown = false;
    for (auto & result : results) {
        result.newFolder = target;
        if (mapping.count(result.uid)) {
            result.state = MutationStateConfirmedNewUID;
            result.newUID = mapping[result.uid];
            result.newUIDValidity = newUIDValidity;
            result.message = "Moved to " + target + "." + cleanupWarning;
        } else {
            // The next mirror scan + reconcile finds the message in its new folder by identity.
            anyUnknown = true;
            result.state = MutationStateConfirmedUIDUnknown;
            result.message = "Moved to " + target + "; the server did not report the new UID." + cleanupWarning;
        }
    }
    if (anyUnknown) {
        logger->info("applyMutation - {}: no UID remapping hint, local records left for the next reconcile", SyncErrorKindName(SyncErrorKindProtocolCapabilityMissing));
    }
    if (mapping.empty()) {
        return;
    }

    try {
        MailStoreTransaction transaction{store, "applyMutation"};
        for (auto & result : results) {
            if (result.state != MutationStateConfirmedNewUID) {
                continue;
            }
            auto local = findLocalRecord(folder, result.uid);
            if (local) {
                local->setFolder(target);
                local->setUID(result.newUID);
                local->setUIDValidity(result.newUIDValidity);
                store->save(local.get());
            }
        }
        transaction.commit();
    } catch (SQLite::Exception & ex) {
        logger->error("applyMutation - move confirmed but the local records could not be updated: {}", ex.what());
        for (auto & result : results) {
            result.message = result.message + " Local record will be repaired by the next sync.";
        }
    }
}

void MutationCoordinator::performDelete(string folder, vector<MutationResult> & results) {
    AutoreleasePool pool;

    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(folder);
    IndexSet * uids = IndexSet::indexSet();
    for (auto & result : results) {
        uids->addIndex(result.uid);
        result.state = MutationStateSentToServer;
    }

    set<uint32_t> present{};
    Array * existing = session->fetchMessagesByUID(path, IMAPMessagesRequestKindUid, uids, nullptr, &err);
    if (err == ErrorCode::ErrorNonExistantFolder) {
        err = ErrorCode::ErrorNone;
    } else if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "applyMutation - fetchMessagesByUID");
    } else if (existing != nullptr) {
        for (uint32_t uid : MailUtils::uidsOfArray(existing)) {
            present.insert(uid);
        }
    }

    if (!present.empty()) {
        IndexSet * presentUIDs = IndexSet::indexSet();
        for (uint32_t uid : present) {
            presentUIDs->addIndex(uid);
        }
        session->storeFlagsByUID(path, presentUIDs, IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
        if (err != ErrorCode::ErrorNone) {
            throw SyncException(err, "applyMutation - storeFlagsByUID");
        }
        session->expungeUIDs(path, presentUIDs, &err);
        if (err != ErrorCode::ErrorNone) {
            throw SyncException(err, "applyMutation - expungeUIDs");
        }
    }

    for (auto & result : results) {
        result.state = MutationStateConfirmedUIDUnknown;
        if (present.count(result.uid)) {
            result.message = "Deleted.";
        } else {
            logger->info("applyMutation - {}:{} is already gone from the server", folder, result.uid);
            result.message = "Already deleted.";
        }
    }

    try {
        MailStoreTransaction transaction{store, "applyMutation"};
        time_t now = time(0);
        for (auto & result : results) {
            auto local = findLocalRecord(folder, result.uid);
            if (local) {
                local->softDelete(now);
                store->save(local.get());
            }
        }
        transaction.commit();
    } catch (SQLite::Exception & ex) {
        logger->error("applyMutation - delete confirmed but the local records could not be updated: {}", ex.what());
        for (auto & result : results) {
            result.message = result.message + " Local record will be repaired by the next sync.";
        }
    }
}

void MutationCoordinator::performFlagChange(string folder, vector<MutationResult> & results, MessageFlag flag, bool add) {
    AutoreleasePool pool;

    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(folder);
    IndexSet * uids = IndexSet::indexSet();
    for (auto & result : results) {
        uids->addIndex(result.uid);
        result.state = MutationStateSentToServer;
    }

    session->storeFlagsByUID(path, uids, add ? IMAPStoreFlagsRequestKindAdd : IMAPStoreFlagsRequestKindRemove, flag, &err);
    if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "applyMutation - storeFlagsByUID");
    }

    // flag changes never alter the UID
    for (auto & result : results) {
        result.state = MutationStateConfirmedNewUID;
        result.newUID = result.uid;
        result.message = "Flags updated.";
    }

    try {
        MailStoreTransaction transaction{store, "applyMutation"};
        for (auto & result : results) {
            auto local = findLocalRecord(folder, result.uid);
            if (local) {
                result.newUIDValidity = local->uidvalidity();
                int flags = add ? (local->messageFlags() | flag) : (local->messageFlags() & ~flag);
                if (local->applyMessageFlags(flags)) {
                    store->save(local.get());
                }
            }
        }
        transaction.commit();
    } catch (SQLite::Exception & ex) {
        logger->error("applyMutation - flag change confirmed but the local records could not be updated: {}", ex.what());
        for (auto & result : results) {
            result.message = result.message + " Local record will be repaired by the next sync.";
        }
    }
}

string MutationCoordinator::trashFolderPath() {
    AutoreleasePool pool;

    ErrorCode err = ErrorCode::ErrorNone;
    Array * folders = session->fetchAllFolders(&err);
    if (err != ErrorCode::ErrorNone) {
        throw SyncException(err, "applyMutation - fetchAllFolders");
    }

    // A folder flagged \Trash beats one that is merely named like a trash folder.
    string byName = "";
    for (unsigned int ii = 0; ii < folders->count(); ii++) {
        IMAPFolder * folder = (IMAPFolder *)folders->objectAtIndex(ii);
        if (folder->flags() & IMAPFolderFlagTrash) {
            return string(folder->path()->UTF8Characters());
        }
        if (byName == "" && MailUtils::roleForFolder(folder) == "trash") {
            byName = string(folder->path()->UTF8Characters());
        }
    }
    if (byName == "") {
        throw SyncException("no-trash-folder", "Could not find a trash folder on the server.", false);
    }
    return byName;
}

shared_ptr<LocalMailRecord> MutationCoordinator::findLocalRecord(string folder, uint32_t uid) {
    Query q = Query()
        .equal("accountId", account->id())
        .equal("folder", folder)
        .equal("uid", uid)
        .equal("deletedAt", 0)
        .orderBy("uidvalidity DESC");
    return store->find<LocalMailRecord>(q);
}

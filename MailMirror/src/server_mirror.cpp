#include "mailmirror/server_mirror.hpp"
#include "mailmirror/mail_store_transaction.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/envelope.hpp"
#include "mailmirror/constants.hpp"

using namespace mailcore;

nlohmann::json MirrorSyncStats::toJSON() const {
    nlohmann::json errorsJSON = nlohmann::json::array();
    for (const auto & error : errors) {
        errorsJSON.push_back(error.toJSON());
    }
    return {
        {"scanned", scanned},
        {"on_server", onServer},
        {"inserted", inserted},
        {"removed", removed},
        {"errors", errorsJSON},
    };
}

ServerMirror::ServerMirror(std::shared_ptr<Account> account, MailStore * store, IMAPSession * session) :
    session(session),
    store(store),
    account(account),
    logger(spdlog::get("logger")),
    cancelled(nullptr)
{
}

void ServerMirror::setCancelFlag(std::atomic<bool> * flag) {
    cancelled = flag;
}

MirrorSyncStats ServerMirror::syncFolders(std::vector<std::string> folders) {
    MirrorSyncStats stats{};

    if (folders.size() == 0) {
        folders = store->knownFolders(account->id());
        if (folders.size() == 0) {
            logger->info("syncFolders - no folders to scan, skipping");
            return stats;
        }
    }

    for (auto & folder : folders) {
        if (cancelled != nullptr && cancelled->load()) {
            logger->info("syncFolders - cancelled before scanning {}", folder);
            break;
        }

        try {
            syncFolder(folder, stats);

        } catch (SyncException & ex) {
            logger->warn("syncFolders - {}: {}", folder, ex.toJSON().dump());
            stats.errors.push_back(SyncErrorFromException(ex, folder));

        } catch (SQLite::Exception & ex) {
            if (IsUniqueConstraintViolation(ex)) {
                // Another worker is scanning the same folder (or the server reported a
                // UID twice). The transaction has been rolled back; try again next cycle.
                logger->warn("syncFolders - {}: concurrent sync detected, skipping folder", folder);
                stats.errors.push_back(SyncError{SyncErrorKindConcurrencyConflict, folder, "Concurrent sync detected, skipping folder"});
            } else {
                logger->error("syncFolders - {}: {}", folder, ex.what());
                stats.errors.push_back(SyncErrorFromException(ex, folder));
            }

        } catch (nlohmann::json::exception & ex) {
            logger->error("syncFolders - {}: {}", folder, ex.what());
            stats.errors.push_back(SyncError{SyncErrorKindOther, folder, ex.what()});
        }
    }

    logger->info("syncFolders - {} folders, {} on server, +{} inserted, {} removed, {} errors",
                  stats.scanned, stats.onServer, stats.inserted, stats.removed, stats.errors.size());
    return stats;
}

void ServerMirror::syncFolder(std::string folderPath, MirrorSyncStats & stats) {
    std::string scannedAtKey = "mirror-scanned-at:" + account->id() + ":" + folderPath;
    std::string lastScan = store->getKeyValue(scannedAtKey);
    logger->info("syncFolder - {} (last scanned {})", folderPath, lastScan.empty() ? "never" : lastScan);

    // Network first: nothing is written until the whole folder was observed.
    auto observed = observeFolder(folderPath);

    MailStoreTransaction transaction{store, "syncFolder"};

    Query q = Query().equal("accountId", account->id()).equal("folder", folderPath);
    auto previous = store->findAllMap<ServerMailRecord>(q, "id");

    int removed = store->removeServerRecordsInFolder(account->id(), folderPath);

    for (auto & record : observed) {
        if (previous.count(record->id())) {
            record->_data["firstSeenAt"] = previous[record->id()]->firstSeenAt();
        }
        store->save(record.get());
    }
    store->saveKeyValue(scannedAtKey, MailUtils::timestampForTime(time(0)));

    transaction.commit();

    stats.scanned += 1;
    stats.onServer += observed.size();
    stats.inserted += observed.size();
    stats.removed += removed;

    logger->info("syncFolder - {}: {} messages (removed {}, inserted {})", folderPath, observed.size(), removed, observed.size());
}

std::vector<std::shared_ptr<ServerMailRecord>> ServerMirror::observeFolder(std::string folderPath) {
    // allocated mailcore objects freed when `pool` is removed from the stack
    AutoreleasePool pool;

    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(folderPath);

    IMAPFolderStatus * status = session->folderStatus(path, &err);
    if (err != ErrorNone) {
        throw SyncException(err, "syncFolder - folderStatus " + folderPath);
    }
    uint32_t uidvalidity = status->uidValidity();

    IndexSet * remoteUIDs = session->search(path, IMAPSearchExpression::searchAll(), &err);
    if (err != ErrorNone) {
        throw SyncException(err, "syncFolder - search " + folderPath);
    }

    std::vector<uint32_t> uids = MailUtils::uidsOfIndexSet(remoteUIDs);
    std::vector<std::shared_ptr<ServerMailRecord>> observed{};
    observed.reserve(uids.size());
    time_t now = time(0);

    IMAPMessagesRequestKind kind = (IMAPMessagesRequestKind)(IMAPMessagesRequestKindHeaders | IMAPMessagesRequestKindFlags);
    auto chunks = MailUtils::chunksOfVector(uids, MIRROR_FETCH_BATCH_SIZE);

    for (auto & chunk : chunks) {
        if (cancelled != nullptr && cancelled->load()) {
            throw SyncException("cancelled", "syncFolder - cancelled while scanning " + folderPath, true);
        }

        AutoreleasePool chunkPool;
        IndexSet * set = IndexSet::indexSet();
        for (uint32_t uid : chunk) {
            set->addIndex(uid);
        }

        Array * remote = session->fetchMessagesByUID(path, kind, set, nullptr, &err);
        if (err != ErrorNone) {
            throw SyncException(err, "syncFolder - fetchMessagesByUID " + folderPath);
        }

        for (unsigned int ii = 0; ii < remote->count(); ii++) {
            IMAPMessage * msg = (IMAPMessage *)remote->objectAtIndex(ii);
            Envelope envelope = Envelope::fromIMAPMessage(msg);
            observed.push_back(std::make_shared<ServerMailRecord>(account->id(), folderPath, uidvalidity, msg->uid(), envelope, now));
        }
    }

    return observed;
}

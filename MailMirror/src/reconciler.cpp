#include "mailmirror/reconciler.hpp"
#include "mailmirror/account_lock.hpp"
#include "mailmirror/mail_store_transaction.hpp"
#include "mailmirror/constants.hpp"

using namespace std;

static bool isAtPosition(LocalMailRecord * local, ServerMailRecord * row) {
    return local->folder() == row->folder() && local->uid() == row->uid() && local->uidvalidity() == row->uidvalidity();
}

nlohmann::json ReconcileStats::toJSON() const {
    nlohmann::json errorsJSON = nlohmann::json::array();
    for (const auto & error : errors) {
        errorsJSON.push_back(error.toJSON());
    }
    return {
        {"updated", updated},
        {"deleted", deleted},
        {"linked", linked},
        {"errors", errorsJSON},
    };
}

Reconciler::Reconciler(shared_ptr<Account> account, MailStore * store) :
    store(store),
    account(account),
    logger(spdlog::get("logger"))
{
}

ReconcileStats Reconciler::reconcile() {
    ReconcileStats stats{};

    try {
        AccountLock lock{store, "reconcile", account->id(), account->lockTTL()};
        if (!lock.acquired()) {
            logger->warn("reconcile - {} is held by another worker, skipping", lock.name());
            stats.errors.push_back(SyncError{SyncErrorKindConcurrencyConflict, account->id(), "Another reconcile pass is running for this account"});
            return stats;
        }

        MailStoreTransaction transaction{store, "reconcile"};
        time_t now = time(0);

        Query lq = Query().equal("accountId", account->id()).equal("deletedAt", 0).orderBy("id ASC");
        auto locals = store->findAll<LocalMailRecord>(lq);

        Query sq = Query().equal("accountId", account->id()).equal("isDeleted", 0).orderBy("folder ASC, uid ASC");
        auto rows = store->findAll<ServerMailRecord>(sq);

        MirrorIdentityMap mirror{};
        for (auto & row : rows) {
            mirror[row->stableIdentity()].push_back(row);
        }

        // 1. Duplicate resolution
        auto survivors = resolveDuplicates(locals, mirror, stats, now);

        // 2 + 3. Move / flag propagation, then deletion of everything the mirror no longer has
        propagateToLocal(survivors, mirror, stats, now);

        transaction.commit();

    } catch (SQLite::Exception & ex) {
        logger->error("reconcile - rolled back: {}", ex.what());
        stats = ReconcileStats{};
        stats.errors.push_back(SyncErrorFromException(ex, account->id()));

    } catch (SyncException & ex) {
        logger->error("reconcile - rolled back: {}", ex.toJSON().dump());
        stats = ReconcileStats{};
        stats.errors.push_back(SyncErrorFromException(ex, account->id()));

    } catch (nlohmann::json::exception & ex) {
        logger->error("reconcile - rolled back: {}", ex.what());
        stats = ReconcileStats{};
        stats.errors.push_back(SyncError{SyncErrorKindOther, account->id(), ex.what()});
    }

    logger->info("reconcile - {} updated, {} deleted, {} linked, {} errors", stats.updated, stats.deleted, stats.linked, stats.errors.size());
    return stats;
}

vector<shared_ptr<LocalMailRecord>> Reconciler::resolveDuplicates(vector<shared_ptr<LocalMailRecord>> & locals, MirrorIdentityMap & mirror, ReconcileStats & stats, time_t now) {
    vector<shared_ptr<LocalMailRecord>> survivors{};

    // std::map keeps groups (and so the log output) in a stable order
    map<string, vector<shared_ptr<LocalMailRecord>>> groups{};
    for (auto & local : locals) {
        groups[local->stableIdentity()].push_back(local);
    }

    for (auto & pair : groups) {
        auto & group = pair.second;
        if (group.size() == 1) {
            survivors.push_back(group.front());
            continue;
        }

        shared_ptr<LocalMailRecord> keep = nullptr;
        auto & candidates = mirror[pair.first];
        for (auto & member : group) {
            for (auto & row : candidates) {
                if (isAtPosition(member.get(), row.get())) {
                    keep = member;
                    break;
                }
            }
            if (keep) {
                break;
            }
        }

        if (keep == nullptr) {
            logger->warn("reconcile - {} copies of {} and none matches the mirror, soft-deleting all", group.size(), pair.first);
            stats.errors.push_back(SyncError{SyncErrorKindDataIntegrityAnomaly, pair.first, "Duplicate identity with no record matching the mirror; all copies soft-deleted"});
        } else {
            survivors.push_back(keep);
        }

        for (auto & member : group) {
            if (member == keep) {
                continue;
            }
            member->softDelete(now);
            store->save(member.get());
            stats.deleted += 1;
        }
    }

    return survivors;
}

void Reconciler::propagateToLocal(vector<shared_ptr<LocalMailRecord>> & survivors, MirrorIdentityMap & mirror, ReconcileStats & stats, time_t now) {
    set<string> claimed{};
    vector<shared_ptr<LocalMailRecord>> unplaced{};
    vector<shared_ptr<LocalMailRecord>> orphans{};

    // Records already sitting at a mirror position claim that row first, so a
    // moved sibling with the same identity can never take it from them.
    for (auto & local : survivors) {
        auto it = mirror.find(local->stableIdentity());
        if (it == mirror.end() || it->second.size() == 0) {
            orphans.push_back(local);
            continue;
        }
        bool placed = false;
        for (auto & row : it->second) {
            if (!claimed.count(row->id()) && isAtPosition(local.get(), row.get())) {
                claimed.insert(row->id());
                applyMirrorRow(local.get(), row.get(), stats);
                placed = true;
                break;
            }
        }
        if (!placed) {
            unplaced.push_back(local);
        }
    }

    // The rest moved: take the first unclaimed row of the identity.
    for (auto & local : unplaced) {
        bool placed = false;
        for (auto & row : mirror[local->stableIdentity()]) {
            if (!claimed.count(row->id())) {
                claimed.insert(row->id());
                logger->info("reconcile - {} moved {}:{}:{} -> {}:{}:{}", local->id(), local->folder(), local->uidvalidity(), local->uid(), row->folder(), row->uidvalidity(), row->uid());
                applyMirrorRow(local.get(), row.get(), stats);
                placed = true;
                break;
            }
        }
        if (!placed) {
            logger->warn("reconcile - {} has no unclaimed mirror row left, leaving it for the next pass", local->id());
        }
    }

    // Mirror rows not claimed this pass must not keep pointing at a record.
    for (auto & pair : mirror) {
        for (auto & row : pair.second) {
            if (!claimed.count(row->id()) && row->linkedLocalId() != "") {
                row->setLinkedLocalId("");
                store->save(row.get());
            }
        }
    }

    // 3. Deletion
    for (auto & local : orphans) {
        local->softDelete(now);
        store->save(local.get());
        stats.deleted += 1;
    }
}

void Reconciler::applyMirrorRow(LocalMailRecord * local, ServerMailRecord * row, ReconcileStats & stats) {
    bool changed = false;

    if (!isAtPosition(local, row)) {
        local->setFolder(row->folder());
        local->setUID(row->uid());
        local->setUIDValidity(row->uidvalidity());
        changed = true;
    }
    if (local->applyMessageFlags(row->messageFlags())) {
        changed = true;
    }
    if (changed) {
        store->save(local);
        stats.updated += 1;
    }

    if (row->linkedLocalId() != local->id()) {
        row->setLinkedLocalId(local->id());
        store->save(row);
        stats.linked += 1;
    }
}

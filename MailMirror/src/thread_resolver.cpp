#include "mailmirror/thread_resolver.hpp"
#include "mailmirror/account_lock.hpp"
#include "mailmirror/mail_store_transaction.hpp"
#include "mailmirror/mail_utils.hpp"
#include "mailmirror/constants.hpp"

#include <algorithm>
#include <set>

using namespace std;
using namespace mailcore;

// GmailThreadSource

GmailThreadSource::GmailThreadSource(IMAPSession * session) :
    session(session)
{
}

bool GmailThreadSource::fetchThreads(string folderPath, nlohmann::json & nested) {
    AutoreleasePool pool;

    IndexSet * capabilities = session->storedCapabilities();
    if (capabilities == nullptr || !capabilities->containsIndex(IMAPCapabilityGmail)) {
        return false;
    }

    ErrorCode err = ErrorCode::ErrorNone;
    String * path = AS_MCSTR(folderPath);

    IndexSet * remoteUIDs = session->search(path, IMAPSearchExpression::searchAll(), &err);
    if (err != ErrorNone) {
        throw SyncException(err, "fetchThreads - search " + folderPath);
    }

    vector<uint32_t> uids = MailUtils::uidsOfIndexSet(remoteUIDs);
    auto chunks = MailUtils::chunksOfVector(uids, MIRROR_FETCH_BATCH_SIZE);

    vector<uint64_t> order{};
    map<uint64_t, vector<uint32_t>> threads{};
    vector<uint32_t> unthreaded{};

    IMAPMessagesRequestKind kind = (IMAPMessagesRequestKind)(IMAPMessagesRequestKindUid | IMAPMessagesRequestKindGmailThreadID);
    for (auto & chunk : chunks) {
        AutoreleasePool chunkPool;
        IndexSet * set = IndexSet::indexSet();
        for (uint32_t uid : chunk) {
            set->addIndex(uid);
        }
        Array * remote = session->fetchMessagesByUID(path, kind, set, nullptr, &err);
        if (err != ErrorNone) {
            throw SyncException(err, "fetchThreads - fetchMessagesByUID " + folderPath);
        }
        for (unsigned int ii = 0; ii < remote->count(); ii++) {
            IMAPMessage * msg = (IMAPMessage *)remote->objectAtIndex(ii);
            uint64_t thrid = msg->gmailThreadID();
            if (thrid == 0) {
                unthreaded.push_back(msg->uid());
                continue;
            }
            if (!threads.count(thrid)) {
                order.push_back(thrid);
            }
            threads[thrid].push_back(msg->uid());
        }
    }

    nested = nlohmann::json::array();
    for (uint64_t thrid : order) {
        auto & members = threads[thrid];
        sort(members.begin(), members.end());
        if (members.size() == 1) {
            nested.push_back(members.front());
        } else {
            nested.push_back(members);
        }
    }
    for (uint32_t uid : unthreaded) {
        nested.push_back(uid);
    }
    return true;
}

// ThreadAssignment

nlohmann::json ThreadAssignment::toJSON() const {
    return {
        {"folder", folder},
        {"uid", uid},
        {"thread_id", threadId},
        {"parent_uid", parentUID == 0 ? nlohmann::json(nullptr) : nlohmann::json(parentUID)},
        {"parent_id", parentId == "" ? nlohmann::json(nullptr) : nlohmann::json(parentId)},
    };
}

// ThreadResolver

ThreadResolver::ThreadResolver(shared_ptr<Account> account, MailStore * store, ServerThreadSource * source) :
    store(store),
    account(account),
    logger(spdlog::get("logger")),
    source(source)
{
}

const vector<SyncError> & ThreadResolver::errors() {
    return _errors;
}

bool ThreadResolver::headerChainsOnly() const {
    return _headerChainsOnly;
}

nlohmann::json ThreadResolver::assignmentsToJSON(const map<string, ThreadAssignment> & assignments) {
    nlohmann::json result = nlohmann::json::object();
    for (auto & pair : assignments) {
        result[pair.first] = pair.second.toJSON();
    }
    return result;
}

map<string, ThreadAssignment> ThreadResolver::resolveThreads() {
    _errors.clear();
    _headerChainsOnly = false;
    map<string, ThreadAssignment> results{};
    vector<ThreadNode> nodes{};
    int changed = 0;

    try {
        AccountLock lock{store, "threads", account->id(), account->lockTTL()};
        if (!lock.acquired()) {
            logger->warn("resolveThreads - {} is held by another worker, skipping", lock.name());
            _errors.push_back(SyncError{SyncErrorKindConcurrencyConflict, account->id(), "Another thread resolution is running for this account"});
            return results;
        }

        Query q = Query().equal("accountId", account->id()).equal("deletedAt", 0).orderBy("folder ASC, uid ASC");
        auto locals = store->findAll<LocalMailRecord>(q);

        nodes.reserve(locals.size());
        for (auto & local : locals) {
            ThreadNode node;
            node.localId = local->id();
            node.folder = local->folder();
            node.uid = local->uid();
            node.messageId = local->messageId();
            node.inReplyTo = local->inReplyTo();
            node.previousThreadId = local->threadId();
            nodes.push_back(node);
        }

        applyServerStructure(nodes);
        linkReplyChains(nodes);
        vector<string> threadIds = assignThreadIds(nodes);

        for (size_t ii = 0; ii < nodes.size(); ii++) {
            ThreadNode & node = nodes[ii];
            ThreadAssignment a;
            a.folder = node.folder;
            a.uid = node.uid;
            a.threadId = threadIds[ii];
            a.parentUID = node.parent >= 0 ? nodes[node.parent].uid : 0;
            a.parentId = node.parent >= 0 ? nodes[node.parent].localId : "";
            results[node.localId] = a;
        }

        try {
            MailStoreTransaction transaction{store, "resolveThreads"};
            for (auto & local : locals) {
                ThreadAssignment & a = results[local->id()];
                if (local->threadId() != a.threadId || local->parentUID() != a.parentUID || local->parentId() != a.parentId) {
                    local->setThread(a.threadId, a.parentUID, a.parentId);
                    store->save(local.get());
                    changed += 1;
                }
            }
            transaction.commit();
        } catch (SQLite::Exception & ex) {
            logger->error("resolveThreads - unable to persist thread assignments: {}", ex.what());
            _errors.push_back(SyncErrorFromException(ex, account->id()));
            changed = 0;
        }

    } catch (SQLite::Exception & ex) {
        logger->error("resolveThreads - unable to read local records: {}", ex.what());
        _errors.push_back(SyncErrorFromException(ex, account->id()));
        results.clear();
    } catch (SyncException & ex) {
        logger->error("resolveThreads - {}", ex.toJSON().dump());
        _errors.push_back(SyncErrorFromException(ex, account->id()));
        results.clear();
    }

    logger->info("resolveThreads - {} messages, {} updated, {} errors", nodes.size(), changed, _errors.size());
    return results;
}

void ThreadResolver::applyServerStructure(vector<ThreadNode> & nodes) {
    if (source == nullptr) {
        logger->info("resolveThreads - no server thread source, using Message-ID chains only");
        _headerChainsOnly = true;
        return;
    }

    map<string, map<uint32_t, int>> byFolder{};
    for (size_t ii = 0; ii < nodes.size(); ii++) {
        byFolder[nodes[ii].folder][nodes[ii].uid] = (int)ii;
    }

    int thread = 0;
    for (auto & pair : byFolder) {
        nlohmann::json nested;
        try {
            if (!source->fetchThreads(pair.first, nested)) {
                logger->info("resolveThreads - {}: server thread structure unavailable, using Message-ID chains only", SyncErrorKindName(SyncErrorKindProtocolCapabilityMissing));
                _headerChainsOnly = true;
                return;
            }
        } catch (SyncException & ex) {
            logger->warn("resolveThreads - {}: {}", pair.first, ex.toJSON().dump());
            _errors.push_back(SyncErrorFromException(ex, pair.first));
            continue;
        }
        if (!nested.is_array()) {
            continue;
        }
        for (const auto & element : nested) {
            if (element.is_number_integer() && element.get<int64_t>() >= 0) {
                auto it = pair.second.find(element.get<uint32_t>());
                if (it != pair.second.end() && nodes[it->second].serverThread == -1) {
                    nodes[it->second].serverThread = thread;
                }
            } else if (element.is_array()) {
                walkThreadList(element, -1, thread, pair.second, nodes);
            }
            thread += 1;
        }
    }
}

void ThreadResolver::walkThreadList(const nlohmann::json & list, int parent, int thread, map<uint32_t, int> & byUID, vector<ThreadNode> & nodes) {
    // UIDs we have no local record for are skipped; their descendants attach
    // to the nearest ancestor we do have.
    int prev = parent;
    for (const auto & item : list) {
        if (item.is_array()) {
            walkThreadList(item, prev, thread, byUID, nodes);
            continue;
        }
        if (!(item.is_number_integer() && item.get<int64_t>() > 0)) {
            continue;
        }
        auto it = byUID.find(item.get<uint32_t>());
        if (it == byUID.end()) {
            continue;
        }
        ThreadNode & node = nodes[it->second];
        if (node.serverThread != -1) {
            logger->warn("resolveThreads - server listed {}:{} twice, keeping first position", node.folder, node.uid);
            continue;
        }
        node.serverThread = thread;
        node.serverParent = prev;
        prev = it->second;
    }
}

void ThreadResolver::linkReplyChains(vector<ThreadNode> & nodes) {
    map<string, int> byMessageId{};
    for (size_t ii = 0; ii < nodes.size(); ii++) {
        if (nodes[ii].messageId != "" && !byMessageId.count(nodes[ii].messageId)) {
            byMessageId[nodes[ii].messageId] = (int)ii;
        }
    }

    for (size_t ii = 0; ii < nodes.size(); ii++) {
        ThreadNode & node = nodes[ii];
        if (node.inReplyTo == "") {
            node.parent = node.serverParent;
            continue;
        }
        auto it = byMessageId.find(node.inReplyTo);
        if (it != byMessageId.end() && it->second != (int)ii) {
            node.parent = it->second;
        } else {
            // The message we reply to was never fetched, was deleted, or lives
            // in another account. Start a new thread rather than guess.
            node.parent = -1;
            node.brokenChain = true;
        }
    }
}

vector<string> ThreadResolver::assignThreadIds(vector<ThreadNode> & nodes) {
    size_t n = nodes.size();
    vector<string> threadIds(n, "");
    vector<bool> visited(n, false);
    set<string> claimed{};
    map<int, string> serverThreadIds{};

    auto idForRoot = [&](int root) {
        ThreadNode & node = nodes[root];
        bool placedByServer = node.serverThread != -1 && !node.brokenChain;
        if (placedByServer && serverThreadIds.count(node.serverThread)) {
            return serverThreadIds[node.serverThread];
        }
        // Reuse the id persisted last time unless another root already took it.
        string id = node.previousThreadId;
        if (id == "" || claimed.count(id)) {
            id = MailUtils::idRandomlyGenerated();
        }
        claimed.insert(id);
        if (placedByServer) {
            serverThreadIds[node.serverThread] = id;
        }
        return id;
    };

    auto descend = [&](int root, vector<vector<int>> & children) {
        string id = idForRoot(root);
        vector<int> stack{root};
        visited[root] = true;
        while (stack.size() > 0) {
            int cur = stack.back();
            stack.pop_back();
            threadIds[cur] = id;
            for (int child : children[cur]) {
                if (visited[child]) {
                    continue;
                }
                visited[child] = true;
                stack.push_back(child);
            }
        }
    };

    auto deriveChildren = [&]() {
        vector<vector<int>> children(n);
        for (size_t ii = 0; ii < n; ii++) {
            if (nodes[ii].parent >= 0) {
                children[nodes[ii].parent].push_back((int)ii);
            }
        }
        return children;
    };

    vector<vector<int>> children = deriveChildren();
    for (size_t ii = 0; ii < n; ii++) {
        if (nodes[ii].parent == -1) {
            descend((int)ii, children);
        }
    }

    // Anything not reached from a root hangs off a cycle.
    for (size_t ii = 0; ii < n; ii++) {
        if (visited[ii]) {
            continue;
        }
        set<int> seen{};
        int cur = (int)ii;
        while (nodes[cur].parent != -1 && !seen.count(cur)) {
            seen.insert(cur);
            cur = nodes[cur].parent;
        }
        logger->warn("resolveThreads - reply cycle through {}:{}, unparenting it", nodes[cur].folder, nodes[cur].uid);
        _errors.push_back(SyncError{SyncErrorKindDataIntegrityAnomaly, nodes[cur].localId, "Reply cycle detected; message unparented"});
        nodes[cur].parent = -1;
        nodes[cur].serverThread = -1;

        children = deriveChildren();
        descend(cur, children);
    }

    return threadIds;
}

#include "mailmirror/mail_processor.hpp"
#include "mailmirror/mail_store_transaction.hpp"
#include "mailmirror/sync_exception.hpp"

using namespace std;

FetchedMessage FetchedMessage::fromJSON(const nlohmann::json & json) {
    if (!json.is_object()) {
        throw SyncException("invalid-fetched-message", "Fetched message is not an object: " + json.dump(), false);
    }
    FetchedMessage message;
    if (json.count("folder") && json["folder"].is_string()) {
        message.folder = json["folder"].get<string>();
    }
    if (json.count("uid") && json["uid"].is_number_integer() && json["uid"].get<int64_t>() >= 0) {
        message.uid = json["uid"].get<uint32_t>();
    }
    if (json.count("uidvalidity") && json["uidvalidity"].is_number_integer() && json["uidvalidity"].get<int64_t>() >= 0) {
        message.uidvalidity = json["uidvalidity"].get<uint32_t>();
    }
    if (json.count("envelope") && json["envelope"].is_object()) {
        message.envelope = Envelope::fromJSON(json["envelope"]);
    }
    if (json.count("content_hash") && json["content_hash"].is_string()) {
        message.contentHash = json["content_hash"].get<string>();
    }
    message.payload = json.count("payload") ? json["payload"] : nlohmann::json::object();
    return message;
}

MailProcessor::MailProcessor(shared_ptr<Account> account, MailStore * store) :
    store(store),
    account(account),
    logger(spdlog::get("logger"))
{
}

string MailProcessor::insertFetched(const FetchedMessage & message) {
    if (message.folder == "" || message.uid == 0) {
        throw SyncException("invalid-fetched-message", "insertFetched requires a folder and a non-zero uid.", false);
    }
    if (!message.payload.is_object()) {
        throw SyncException("invalid-fetched-message", "insertFetched payload must be an object.", false);
    }
    for (auto it = message.payload.begin(); it != message.payload.end(); ++it) {
        if (!it.value().is_string() && !it.value().is_null()) {
            throw SyncException("invalid-fetched-message", "insertFetched payload field '" + it.key() + "' is not a string.", false);
        }
    }

    string hash = message.contentHash != "" ? message.contentHash : message.envelope.contentHash();

    try {
        MailStoreTransaction transaction{store, "insertFetched"};

        Query q = Query()
            .equal("accountId", account->id())
            .equal("folder", message.folder)
            .equal("uidvalidity", message.uidvalidity)
            .equal("uid", message.uid)
            .equal("deletedAt", 0);
        auto existing = store->find<LocalMailRecord>(q);
        if (existing) {
            logger->info("insertFetched - {}:{}:{} already stored as {}", message.folder, message.uidvalidity, message.uid, existing->id());
            transaction.commit();
            return existing->id();
        }

        LocalMailRecord record{account->id(), message.folder, message.uidvalidity, message.uid, message.envelope, hash, message.payload, time(0)};
        store->save(&record);
        transaction.commit();

        logger->info("insertFetched - {}:{}:{} stored as {} ({})", message.folder, message.uidvalidity, message.uid, record.id(), record.stableIdentity());
        return record.id();

    } catch (SQLite::Exception & ex) {
        throw SyncException("insert-failed", string("insertFetched - ") + ex.what(), false);
    }
}

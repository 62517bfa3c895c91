#include "mailmirror/delta_planner.hpp"
#include "mailmirror/models/server_mail_record.hpp"

#include <algorithm>
#include <unordered_set>

using namespace std;

FetchFilter FetchFilter::forAccount(shared_ptr<Account> account) {
    FetchFilter filter;
    filter.includeFolders = account->includeFolders();
    filter.excludeFolders = account->excludeFolders();
    filter.since = account->since();
    filter.unseenOnly = account->unseenOnly();
    return filter;
}

FetchFilter FetchFilter::fromJSON(const nlohmann::json & json, shared_ptr<Account> account) {
    // keys missing from the packet fall back to the account's sync preferences
    FetchFilter filter = FetchFilter::forAccount(account);
    if (json.count("include_folders") && json["include_folders"].is_array()) {
        filter.includeFolders = json["include_folders"].get<vector<string>>();
    }
    if (json.count("exclude_folders") && json["exclude_folders"].is_array()) {
        filter.excludeFolders = json["exclude_folders"].get<vector<string>>();
    }
    if (json.count("since") && json["since"].is_number()) {
        filter.since = json["since"].get<time_t>();
    }
    if (json.count("unseen_only") && json["unseen_only"].is_boolean()) {
        filter.unseenOnly = json["unseen_only"].get<bool>();
    }
    return filter;
}

DeltaPlanner::DeltaPlanner(shared_ptr<Account> account, MailStore * store) :
    store(store),
    account(account),
    logger(spdlog::get("logger"))
{
}

map<string, vector<uint32_t>> DeltaPlanner::computeFetchDelta(FetchFilter filter) {
    map<string, vector<uint32_t>> delta{};

    // Identities already materialized anywhere in the account, in any folder.
    unordered_set<string> materialized{};
    {
        SQLite::Statement st(store->db(), "SELECT DISTINCT stableIdentity FROM LocalMailRecord WHERE accountId = ? AND deletedAt = 0");
        st.bind(1, account->id());
        while (st.executeStep()) {
            materialized.insert(st.getColumn("stableIdentity").getString());
        }
    }

    Query q = Query().equal("accountId", account->id()).equal("isDeleted", 0).isNull("linkedLocalId");
    if (filter.includeFolders.size() > 0) {
        q.equal("folder", filter.includeFolders);
    }
    if (filter.since > 0) {
        q.gte("envelopeDate", filter.since);
    }
    q.orderBy("folder ASC, uid ASC");

    auto candidates = store->findAll<ServerMailRecord>(q);
    int skippedMaterialized = 0;

    for (auto & record : candidates) {
        string folder = record->folder();
        if (find(filter.excludeFolders.begin(), filter.excludeFolders.end(), folder) != filter.excludeFolders.end()) {
            continue;
        }
        if (filter.unseenOnly && (record->messageFlags() & mailcore::MessageFlagSeen)) {
            continue;
        }
        if (materialized.count(record->stableIdentity())) {
            skippedMaterialized += 1;
            continue;
        }
        // two candidates sharing an identity are both kept; the reconciler resolves the duplicate
        delta[folder].push_back(record->uid());
    }

    size_t total = 0;
    for (auto & pair : delta) {
        sort(pair.second.begin(), pair.second.end());
        total += pair.second.size();
    }

    logger->info("computeFetchDelta - {} candidates, {} already materialized, {} to fetch in {} folders",
                 candidates.size(), skippedMaterialized, total, delta.size());
    return delta;
}

nlohmann::json DeltaPlanner::deltaToJSON(const map<string, vector<uint32_t>> & delta) {
    nlohmann::json result = nlohmann::json::object();
    for (auto & pair : delta) {
        result[pair.first] = pair.second;
    }
    return result;
}

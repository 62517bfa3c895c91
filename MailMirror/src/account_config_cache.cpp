#include "mailmirror/account_config_cache.hpp"
#include "mailmirror/constants.hpp"
#include "mailmirror/sync_exception.hpp"

#include <fstream>
#include <sstream>

AccountConfigCache::AccountConfigCache(std::string configDir) :
    _accounts({}), _seeds({}), _configDir(configDir)
{
}

std::shared_ptr<Account> AccountConfigCache::get(std::string accountId) {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_accounts.count(accountId)) {
        return _accounts[accountId];
    }

    std::string path = _configDir + FS_PATH_SEP + "accounts" + FS_PATH_SEP + accountId + ".json";
    std::ifstream file(path);
    if (!file.good()) {
        if (_seeds.count(accountId)) {
            spdlog::get("logger")->info("No configuration file for account {}, using the account it was started with", accountId);
            _accounts[accountId] = _seeds[accountId];
            return _seeds[accountId];
        }
        throw SyncException("account-not-found", "No configuration for account " + accountId + " at " + path, false);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(buffer.str());
    } catch (nlohmann::json::parse_error & ex) {
        throw SyncException("account-invalid", path + ": " + ex.what(), false);
    }

    auto account = std::make_shared<Account>(json);
    if (account->valid() != "") {
        throw SyncException("account-invalid", "Account is missing required fields: " + account->valid(), false);
    }
    spdlog::get("logger")->info("Loaded configuration for account {}", accountId);
    _accounts[accountId] = account;
    return account;
}

void AccountConfigCache::put(std::shared_ptr<Account> account) {
    std::lock_guard<std::mutex> lock(_mtx);
    _accounts[account->id()] = account;
    _seeds[account->id()] = account;
}

bool AccountConfigCache::contains(std::string accountId) {
    std::lock_guard<std::mutex> lock(_mtx);
    return _accounts.count(accountId) > 0;
}

void AccountConfigCache::invalidate(std::string accountId) {
    std::lock_guard<std::mutex> lock(_mtx);
    if (accountId == "") {
        _accounts.clear();
    } else {
        _accounts.erase(accountId);
    }
}

size_t AccountConfigCache::size() {
    std::lock_guard<std::mutex> lock(_mtx);
    return _accounts.size();
}

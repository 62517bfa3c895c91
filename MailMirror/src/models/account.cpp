#include "mailmirror/models/account.hpp"
#include "mailmirror/constants.hpp"
#include "mailmirror/sync_exception.hpp"

std::string Account::TABLE_NAME = "Account";

static std::vector<std::string> stringsInJSONArray(nlohmann::json & val) {
    std::vector<std::string> results{};
    if (!val.is_array()) {
        return results;
    }
    for (const auto & item : val) {
        if (item.is_string()) {
            results.push_back(item.get<std::string>());
        }
    }
    return results;
}

Account::Account(nlohmann::json json) : MailModel(json) {
    if (!_data.count("aid") && _data.count("id")) {
        _data["aid"] = _data["id"];
    }
    if (!_data.count("v")) {
        _data["v"] = 0;
    }
}

std::string Account::valid() {
    if (!_data.count("id") || !_data.count("settings")) {
        return "id or settings";
    }
    if (!_data.count("provider")) {
        return "provider";
    }

    nlohmann::json & s = _data["settings"];

    if (!s.count("imap_password")) {
        return "imap_password";
    }
    if (!(s.count("imap_port") && s.count("imap_host") && s.count("imap_username"))) {
        return "imap configuration";
    }
    if (s.count("imap_allow_insecure_ssl") && !s["imap_allow_insecure_ssl"].is_boolean()) {
        return "imap_allow_insecure_ssl";
    }
    if (_data.count("sync") && !_data["sync"].is_object()) {
        return "sync";
    }
    return ""; // true
}

std::string Account::provider() {
    return _data["provider"].get<std::string>();
}

std::string Account::emailAddress() {
    return _data.count("emailAddress") ? _data["emailAddress"].get<std::string>() : "";
}

unsigned int Account::IMAPPort() {
    nlohmann::json & val = _data["settings"]["imap_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

std::string Account::IMAPHost() {
    return _data["settings"]["imap_host"].get<std::string>();
}

std::string Account::IMAPUsername() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_username") ? s["imap_username"].get<std::string>() : "";
}

std::string Account::IMAPPassword() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_password") ? s["imap_password"].get<std::string>() : "";
}

std::string Account::IMAPSecurity() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_security") ? s["imap_security"].get<std::string>() : "SSL / TLS";
}

bool Account::IMAPAllowInsecureSSL() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_allow_insecure_ssl") ? s["imap_allow_insecure_ssl"].get<bool>() : false;
}

std::vector<std::string> Account::includeFolders() {
    if (!_data.count("sync") || !_data["sync"].count("include_folders")) {
        return {};
    }
    return stringsInJSONArray(_data["sync"]["include_folders"]);
}

std::vector<std::string> Account::excludeFolders() {
    if (!_data.count("sync") || !_data["sync"].count("exclude_folders")) {
        return {};
    }
    return stringsInJSONArray(_data["sync"]["exclude_folders"]);
}

time_t Account::since() {
    if (!_data.count("sync") || !_data["sync"].count("since")) {
        return 0;
    }
    return _data["sync"]["since"].get<time_t>();
}

bool Account::unseenOnly() {
    if (!_data.count("sync") || !_data["sync"].count("unseen_only")) {
        return false;
    }
    return _data["sync"]["unseen_only"].get<bool>();
}

int Account::networkTimeout() {
    if (!_data.count("sync") || !_data["sync"].count("network_timeout")) {
        return DEFAULT_NETWORK_TIMEOUT;
    }
    return _data["sync"]["network_timeout"].get<int>();
}

int Account::lockTTL() {
    if (!_data.count("sync") || !_data["sync"].count("lock_ttl")) {
        return ACCOUNT_LOCK_TTL;
    }
    return _data["sync"]["lock_ttl"].get<int>();
}

/* Account objects are not stored in the database. */

std::string Account::tableName() {
    return TABLE_NAME;
}

std::vector<std::string> Account::columnsForQuery() {
    throw SyncException("invalid-model", "Account objects are not stored in the database", false);
}

#include "mailmirror/mail_utils.hpp"
#include "mailmirror/constants.hpp"
#include "mailmirror/models/account.hpp"
#include "sha256.h"

#include <algorithm>
#include <mutex>
#include <random>
#include <time.h>

using namespace mailcore;

static std::mutex randomMtx;

std::string MailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string MailUtils::timestampForTime(time_t time) {
    tm ptm;
    gmtime_r(&time, &ptm);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%d %H:%M:%S", &ptm);
    return std::string(buffer);
}

std::string MailUtils::dateStringForTime(time_t time) {
    if (time <= 0) {
        return "";
    }
    tm ptm;
    gmtime_r(&time, &ptm);
    char buffer[40];
    strftime(buffer, 40, "%Y-%m-%dT%H:%M:%S+00:00", &ptm);
    return std::string(buffer);
}

std::string MailUtils::sha256Hex(std::string src) {
    std::vector<unsigned char> hash(32);
    picosha2::hash256(src.begin(), src.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string MailUtils::contentHash(std::string dateString, std::string from, std::string subject) {
    return sha256Hex(dateString + "|" + from + "|" + subject).substr(0, 32);
}

std::string MailUtils::stableIdentity(std::string messageId, std::string contentHash) {
    if (messageId != "") {
        return messageId;
    }
    return "hash:" + contentHash;
}

std::string MailUtils::normalizeMessageID(std::string messageId) {
    size_t start = messageId.find_first_not_of(" \t\r\n<");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = messageId.find_last_not_of(" \t\r\n>");
    return messageId.substr(start, end - start + 1);
}

std::string MailUtils::idRandomlyGenerated() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dis(0, 255);

    std::vector<unsigned char> bytes(20);
    {
        std::lock_guard<std::mutex> lock(randomMtx);
        for (auto & b : bytes) {
            b = (unsigned char)dis(gen);
        }
    }
    return picosha2::bytes_to_hex_string(bytes.begin(), bytes.end());
}

std::string MailUtils::idForServerRecord(std::string accountId, std::string folder, uint32_t uidvalidity, uint32_t uid) {
    return sha256Hex(accountId + ":" + folder + ":" + std::to_string(uidvalidity) + ":" + std::to_string(uid));
}

static std::vector<std::pair<int, std::string>> FLAG_NAMES = {
    {MessageFlagSeen, "\\Seen"},
    {MessageFlagAnswered, "\\Answered"},
    {MessageFlagFlagged, "\\Flagged"},
    {MessageFlagDeleted, "\\Deleted"},
    {MessageFlagDraft, "\\Draft"},
    {MessageFlagForwarded, "$Forwarded"},
};

std::string MailUtils::flagsStringForMessageFlags(int flags) {
    std::string result = "";
    for (const auto & pair : FLAG_NAMES) {
        if (flags & pair.first) {
            if (result != "") {
                result += " ";
            }
            result += pair.second;
        }
    }
    return result;
}

int MailUtils::messageFlagsForFlagsString(std::string flags) {
    transform(flags.begin(), flags.end(), flags.begin(), ::tolower);
    int result = 0;

    size_t pos = 0;
    while (pos < flags.size()) {
        size_t end = flags.find(' ', pos);
        if (end == std::string::npos) {
            end = flags.size();
        }
        std::string token = flags.substr(pos, end - pos);
        for (const auto & pair : FLAG_NAMES) {
            std::string name = pair.second;
            transform(name.begin(), name.end(), name.begin(), ::tolower);
            if (token == name) {
                result |= pair.first;
            }
        }
        pos = end + 1;
    }
    return result;
}

std::vector<uint32_t> MailUtils::uidsOfIndexSet(IndexSet * set) {
    std::vector<uint32_t> uids {};
    Range * ranges = set->allRanges();
    for (unsigned int ii = 0; ii < set->rangesCount(); ii++) {
        uint64_t first = ranges[ii].location;
        uint64_t last = (ranges[ii].length == UINT64_MAX) ? UINT32_MAX : first + ranges[ii].length;
        for (uint64_t uid = first; uid <= last && uid <= UINT32_MAX; uid++) {
            uids.push_back((uint32_t)uid);
        }
    }
    return uids;
}

std::vector<uint32_t> MailUtils::uidsOfArray(Array * array) {
    std::vector<uint32_t> uids {};
    uids.reserve(array->count());
    for (unsigned int ii = 0; ii < array->count(); ii++) {
        uids.push_back(((IMAPMessage*)array->objectAtIndex(ii))->uid());
    }
    return uids;
}

static bool parseUInt32(std::string str, uint32_t & out) {
    if (str.size() == 0 || str.size() > 10) {
        return false;
    }
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    unsigned long long val = std::stoull(str);
    if (val == 0 || val > UINT32_MAX) {
        return false;
    }
    out = (uint32_t)val;
    return true;
}

// Expands an IMAP uid-set ("4,7:9") into individual UIDs. Returns an empty
// vector when the set is malformed.
std::vector<uint32_t> MailUtils::parseUIDSet(std::string set) {
    std::vector<uint32_t> uids {};
    size_t pos = 0;

    while (pos <= set.size()) {
        size_t end = set.find(',', pos);
        if (end == std::string::npos) {
            end = set.size();
        }
        std::string item = set.substr(pos, end - pos);
        size_t colon = item.find(':');
        if (colon == std::string::npos) {
            uint32_t uid = 0;
            if (!parseUInt32(item, uid)) {
                return {};
            }
            uids.push_back(uid);
        } else {
            uint32_t a = 0;
            uint32_t b = 0;
            if (!parseUInt32(item.substr(0, colon), a) || !parseUInt32(item.substr(colon + 1), b)) {
                return {};
            }
            if (a > b) {
                std::swap(a, b);
            }
            if (b - a > 100000) {
                return {};
            }
            for (uint64_t uid = a; uid <= b; uid++) {
                uids.push_back((uint32_t)uid);
            }
        }
        pos = end + 1;
    }
    return uids;
}

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::string nextToken(std::string & str, size_t & pos) {
    while (pos < str.size() && (str[pos] == ' ' || str[pos] == '\t')) {
        pos++;
    }
    size_t start = pos;
    while (pos < str.size() && !isSpace(str[pos]) && str[pos] != ']') {
        pos++;
    }
    return str.substr(start, pos - start);
}

// Finds the first well-formed COPYUID response code in `raw`.
static bool scanCopyUID(std::string raw, uint32_t & uidvalidity, std::vector<uint32_t> & source, std::vector<uint32_t> & dest) {
    std::string lower = raw;
    transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    size_t found = lower.find("copyuid");
    while (found != std::string::npos) {
        size_t next = found + 7;
        bool boundaryBefore = (found == 0) || isSpace(lower[found - 1]) || lower[found - 1] == '[' || lower[found - 1] == '(';
        bool boundaryAfter = (next < lower.size()) && (lower[next] == ' ' || lower[next] == '\t');

        if (boundaryBefore && boundaryAfter) {
            size_t pos = next;
            std::string validityToken = nextToken(lower, pos);
            std::string sourceToken = nextToken(lower, pos);
            std::string destToken = nextToken(lower, pos);

            if (parseUInt32(validityToken, uidvalidity)) {
                source = MailUtils::parseUIDSet(sourceToken);
                dest = MailUtils::parseUIDSet(destToken);
                if (source.size() > 0 && source.size() == dest.size()) {
                    return true;
                }
            }
        }
        found = lower.find("copyuid", next);
    }

    // Some client libraries hand over only the untagged payload: "<uidvalidity> <old> <new>".
    size_t pos = 0;
    while (pos < lower.size() && isSpace(lower[pos])) {
        pos++;
    }
    std::string validityToken = nextToken(lower, pos);
    std::string sourceToken = nextToken(lower, pos);
    std::string destToken = nextToken(lower, pos);
    while (pos < lower.size() && isSpace(lower[pos])) {
        pos++;
    }
    if (pos != lower.size() || !parseUInt32(validityToken, uidvalidity)) {
        return false;
    }
    source = MailUtils::parseUIDSet(sourceToken);
    dest = MailUtils::parseUIDSet(destToken);
    return source.size() > 0 && source.size() == dest.size();
}

bool MailUtils::parseUIDRemapSets(std::string raw, uint32_t & uidvalidity, std::map<uint32_t, uint32_t> & mapping) {
    std::vector<uint32_t> source{};
    std::vector<uint32_t> dest{};
    uint32_t validity = 0;

    if (!scanCopyUID(raw, validity, source, dest)) {
        return false;
    }
    uidvalidity = validity;
    mapping.clear();
    for (size_t ii = 0; ii < source.size(); ii++) {
        mapping[source[ii]] = dest[ii];
    }
    return true;
}

bool MailUtils::parseUIDRemap(std::string raw, UIDRemap & out) {
    std::vector<uint32_t> source{};
    std::vector<uint32_t> dest{};
    uint32_t validity = 0;

    if (!scanCopyUID(raw, validity, source, dest)) {
        return false;
    }
    out = UIDRemap{validity, source[0], dest[0]};
    return true;
}

std::string MailUtils::roleForFolderPath(std::string path) {
    transform(path.begin(), path.end(), path.begin(), ::tolower);

    if (COMMON_FOLDER_NAMES.find(path) != COMMON_FOLDER_NAMES.end()) {
        return COMMON_FOLDER_NAMES[path];
    }
    return "";
}

std::string MailUtils::roleForFolder(IMAPFolder * folder) {
    IMAPFolderFlag flags = folder->flags();
    if (flags & IMAPFolderFlagTrash) {
        return "trash";
    }
    if (flags & IMAPFolderFlagAll) {
        return "all";
    }
    if (flags & IMAPFolderFlagSentMail) {
        return "sent";
    }
    if (flags & IMAPFolderFlagDrafts) {
        return "drafts";
    }
    if (flags & IMAPFolderFlagJunk) {
        return "spam";
    }
    if (flags & IMAPFolderFlagSpam) {
        return "spam";
    }
    if (flags & IMAPFolderFlagInbox) {
        return "inbox";
    }
    return roleForFolderPath(std::string(folder->path()->UTF8Characters()));
}

void MailUtils::enableVerboseLogging() {
    MCLogEnabled = 1;
}

void MailUtils::configureSessionForAccount(IMAPSession & session, std::shared_ptr<Account> account) {
    session.setHostname(AS_MCSTR(account->IMAPHost()));
    session.setPort(account->IMAPPort());
    session.setUsername(AS_MCSTR(account->IMAPUsername()));
    session.setPassword(AS_MCSTR(account->IMAPPassword()));

    std::string security = account->IMAPSecurity();
    if (security == "SSL / TLS" || security == "SSL") {
        session.setConnectionType(ConnectionType::ConnectionTypeTLS);
    } else if (security == "STARTTLS") {
        session.setConnectionType(ConnectionType::ConnectionTypeStartTLS);
    } else {
        session.setConnectionType(ConnectionType::ConnectionTypeClear);
    }
    session.setCheckCertificateEnabled(!account->IMAPAllowInsecureSSL());
    session.setTimeout(account->networkTimeout());
}

std::string MailUtils::qmarks(size_t count) {
    if (count == 0) {
        return "";
    }
    std::string qmarks{"?"};
    for (size_t i = 1; i < count; i ++) {
        qmarks = qmarks + ",?";
    }
    return qmarks;
}

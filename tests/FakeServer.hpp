#ifndef FAKESERVER_HPP
#define FAKESERVER_HPP

#include <gmock/gmock.h>
#include <MailCore/MailCore.h>
#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "MockIMAPSession.hpp"
#include "mailmirror/mail_utils.hpp"

struct FakeMessage {
    uint32_t uid = 0;
    std::string messageId;
    std::string from = "sender@example.com";
    std::string subject;
    time_t date = 1700000000;
    int flags = 0;
    std::string inReplyTo;
    uint64_t gmailThreadId = 0;
};

enum FakeCopyHint {
    FakeCopyHintUIDMapping,   // mailcore returns the uid mapping
    FakeCopyHintRawResponse,  // only the raw COPYUID response carries it
    FakeCopyHintNone,         // server without UIDPLUS
};

inline mailcore::String * fakeStr(const std::string & str) {
    return mailcore::String::stringWithUTF8Characters(str.c_str());
}

inline mailcore::IMAPMessage * buildIMAPMessage(const FakeMessage & m) {
    mailcore::IMAPMessage * msg = new mailcore::IMAPMessage();
    msg->autorelease();
    msg->setUid(m.uid);
    msg->setFlags((mailcore::MessageFlag)m.flags);
    msg->setGmailThreadID(m.gmailThreadId);

    mailcore::MessageHeader * header = msg->header();
    if (m.messageId != "") {
        header->setMessageID(fakeStr(m.messageId));
    }
    header->setFrom(mailcore::Address::addressWithMailbox(fakeStr(m.from)));
    header->setSubject(fakeStr(m.subject));
    header->setDate(m.date);
    if (m.inReplyTo != "") {
        header->setInReplyTo(mailcore::Array::arrayWithObject(fakeStr(m.inReplyTo)));
    }
    return msg;
}

/**
 An in-memory IMAP server behind a MockIMAPSession. Tests arrange folders
 and messages, install it, and then drive the code under test.
 */
class FakeServer {
public:
    struct Folder {
        uint32_t uidvalidity = 1;
        uint32_t uidNext = 1;
        int flags = 0;
        std::map<uint32_t, FakeMessage> messages;
    };

    std::map<std::string, Folder> folders;
    std::vector<int> capabilities;
    FakeCopyHint copyHint = FakeCopyHintUIDMapping;
    std::map<std::string, mailcore::ErrorCode> failingFolders;
    std::map<std::string, mailcore::ErrorCode> failingStores;    // storeFlagsByUID fails in these folders
    std::map<std::string, mailcore::ErrorCode> failingExpunges;  // expungeUIDs fails in these folders
    std::vector<std::string> duplicatingFolders;  // report every UID twice
    std::vector<unsigned int> fetchBatchSizes;
    int copyCalls = 0;
    int expungeCalls = 0;

    void addFolder(std::string path, uint32_t uidvalidity, int flags = 0) {
        Folder folder;
        folder.uidvalidity = uidvalidity;
        folder.flags = flags;
        folders[path] = folder;
    }

    uint32_t append(std::string path, FakeMessage message) {
        Folder & folder = folders[path];
        if (message.uid == 0) {
            message.uid = folder.uidNext;
        }
        folder.uidNext = std::max(folder.uidNext, message.uid + 1);
        folder.messages[message.uid] = message;
        return message.uid;
    }

    // Another client moved a message: it disappears from `path` and shows up
    // in `dest` under a fresh UID.
    uint32_t moveOnServer(std::string path, uint32_t uid, std::string dest) {
        FakeMessage message = folders[path].messages[uid];
        folders[path].messages.erase(uid);
        message.uid = 0;
        return append(dest, message);
    }

    void resetUIDValidity(std::string path, uint32_t uidvalidity) {
        folders[path].uidvalidity = uidvalidity;
        folders[path].uidNext = 1;
        folders[path].messages.clear();
    }

    void install(MockIMAPSession & session) {
        using ::testing::_;
        using ::testing::Invoke;

        ON_CALL(session, storedCapabilities()).WillByDefault(Invoke([this]() {
            mailcore::IndexSet * set = mailcore::IndexSet::indexSet();
            for (int cap : capabilities) {
                set->addIndex(cap);
            }
            return set;
        }));

        ON_CALL(session, folderStatus(_, _)).WillByDefault(Invoke([this](mailcore::String * path, mailcore::ErrorCode * err) -> mailcore::IMAPFolderStatus * {
            std::string p = path->UTF8Characters();
            if (failingFolders.count(p)) {
                *err = failingFolders[p];
                return nullptr;
            }
            if (!folders.count(p)) {
                *err = mailcore::ErrorNonExistantFolder;
                return nullptr;
            }
            mailcore::IMAPFolderStatus * status = new mailcore::IMAPFolderStatus();
            status->autorelease();
            status->setUidValidity(folders[p].uidvalidity);
            status->setUidNext(folders[p].uidNext);
            status->setMessageCount((uint32_t)folders[p].messages.size());
            *err = mailcore::ErrorNone;
            return status;
        }));

        ON_CALL(session, fetchAllFolders(_)).WillByDefault(Invoke([this](mailcore::ErrorCode * err) {
            mailcore::Array * result = mailcore::Array::array();
            for (auto & pair : folders) {
                mailcore::IMAPFolder * folder = new mailcore::IMAPFolder();
                folder->autorelease();
                folder->setPath(fakeStr(pair.first));
                folder->setFlags((mailcore::IMAPFolderFlag)pair.second.flags);
                result->addObject(folder);
            }
            *err = mailcore::ErrorNone;
            return result;
        }));

        ON_CALL(session, search(_, _, _)).WillByDefault(Invoke([this](mailcore::String * path, mailcore::IMAPSearchExpression * expr, mailcore::ErrorCode * err) -> mailcore::IndexSet * {
            std::string p = path->UTF8Characters();
            if (!folders.count(p)) {
                *err = mailcore::ErrorNonExistantFolder;
                return nullptr;
            }
            mailcore::IndexSet * set = mailcore::IndexSet::indexSet();
            for (auto & pair : folders[p].messages) {
                set->addIndex(pair.first);
            }
            *err = mailcore::ErrorNone;
            return set;
        }));

        ON_CALL(session, fetchMessagesByUID(_, _, _, _, _)).WillByDefault(Invoke([this](mailcore::String * path, mailcore::IMAPMessagesRequestKind kind, mailcore::IndexSet * uids, mailcore::IMAPProgressCallback * cb, mailcore::ErrorCode * err) -> mailcore::Array * {
            std::string p = path->UTF8Characters();
            if (!folders.count(p)) {
                *err = mailcore::ErrorNonExistantFolder;
                return nullptr;
            }
            mailcore::Array * result = mailcore::Array::array();
            for (uint32_t uid : MailUtils::uidsOfIndexSet(uids)) {
                auto it = folders[p].messages.find(uid);
                if (it == folders[p].messages.end()) {
                    continue;
                }
                result->addObject(buildIMAPMessage(it->second));
                if (std::find(duplicatingFolders.begin(), duplicatingFolders.end(), p) != duplicatingFolders.end()) {
                    result->addObject(buildIMAPMessage(it->second));
                }
            }
            fetchBatchSizes.push_back(result->count());
            *err = mailcore::ErrorNone;
            return result;
        }));

        ON_CALL(session, copyMessages(_, _, _, _, _)).WillByDefault(Invoke([this, &session](mailcore::String * path, mailcore::IndexSet * uids, mailcore::String * destPath, mailcore::HashMap ** pUidMapping, mailcore::ErrorCode * err) {
            std::string p = path->UTF8Characters();
            std::string d = destPath->UTF8Characters();
            copyCalls += 1;
            if (!folders.count(p) || !folders.count(d)) {
                *err = mailcore::ErrorNonExistantFolder;
                return;
            }
            mailcore::HashMap * mapping = mailcore::HashMap::hashMap();
            std::string oldSet = "";
            std::string newSet = "";
            for (uint32_t uid : MailUtils::uidsOfIndexSet(uids)) {
                if (!folders[p].messages.count(uid)) {
                    continue;
                }
                FakeMessage copy = folders[p].messages[uid];
                copy.uid = 0;
                uint32_t newUID = append(d, copy);
                mapping->setObjectForKey(mailcore::Value::valueWithUnsignedLongValue(uid), mailcore::Value::valueWithUnsignedLongValue(newUID));
                oldSet += (oldSet == "" ? "" : ",") + std::to_string(uid);
                newSet += (newSet == "" ? "" : ",") + std::to_string(newUID);
            }
            if (copyHint == FakeCopyHintUIDMapping) {
                *pUidMapping = mapping;
            } else if (copyHint == FakeCopyHintRawResponse && session.connectionLogger() != nullptr) {
                std::string response = "A12 OK [COPYUID " + std::to_string(folders[d].uidvalidity) + " " + oldSet + " " + newSet + "] Copy completed\r\n";
                mailcore::Data * data = mailcore::Data::dataWithBytes(response.c_str(), (unsigned int)response.size());
                session.connectionLogger()->log(&session, mailcore::ConnectionLogTypeReceived, data);
            }
            *err = mailcore::ErrorNone;
        }));

        ON_CALL(session, storeFlagsByUID(_, _, _, _, _)).WillByDefault(Invoke([this](mailcore::String * path, mailcore::IndexSet * uids, mailcore::IMAPStoreFlagsRequestKind kind, mailcore::MessageFlag flags, mailcore::ErrorCode * err) {
            std::string p = path->UTF8Characters();
            if (failingStores.count(p)) {
                *err = failingStores[p];
                return;
            }
            for (uint32_t uid : MailUtils::uidsOfIndexSet(uids)) {
                auto it = folders[p].messages.find(uid);
                if (it == folders[p].messages.end()) {
                    continue;
                }
                if (kind == mailcore::IMAPStoreFlagsRequestKindAdd) {
                    it->second.flags |= flags;
                } else if (kind == mailcore::IMAPStoreFlagsRequestKindRemove) {
                    it->second.flags &= ~flags;
                } else {
                    it->second.flags = flags;
                }
            }
            *err = mailcore::ErrorNone;
        }));

        ON_CALL(session, expungeUIDs(_, _, _)).WillByDefault(Invoke([this](mailcore::String * path, mailcore::IndexSet * uids, mailcore::ErrorCode * err) {
            std::string p = path->UTF8Characters();
            expungeCalls += 1;
            if (failingExpunges.count(p)) {
                *err = failingExpunges[p];
                return;
            }
            for (uint32_t uid : MailUtils::uidsOfIndexSet(uids)) {
                auto it = folders[p].messages.find(uid);
                if (it != folders[p].messages.end() && (it->second.flags & mailcore::MessageFlagDeleted)) {
                    folders[p].messages.erase(it);
                }
            }
            *err = mailcore::ErrorNone;
        }));
    }
};

#endif // FAKESERVER_HPP

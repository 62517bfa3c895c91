#include "mailmirror/envelope.hpp"
#include "mailmirror/mail_utils.hpp"

#include <algorithm>

using namespace mailcore;

static std::string stringOrBlank(String * str) {
    if (str == nullptr) {
        return "";
    }
    return std::string(str->UTF8Characters());
}

static std::string lowercase(std::string str) {
    transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

Envelope::Envelope() :
    messageId(""), from(""), subject(""), date(0), inReplyTo(""), references({}), flags(0), gmailThreadId(0)
{
}

Envelope Envelope::fromIMAPMessage(IMAPMessage * msg) {
    Envelope e;
    MessageHeader * header = msg->header();

    if (header != nullptr) {
        if (!header->isMessageIDAutoGenerated()) {
            e.messageId = MailUtils::normalizeMessageID(stringOrBlank(header->messageID()));
        }
        if (header->from() != nullptr) {
            e.from = lowercase(stringOrBlank(header->from()->mailbox()));
        }
        e.subject = stringOrBlank(header->subject());
        e.date = header->date() > 0 ? header->date() : 0;

        Array * inReplyTo = header->inReplyTo();
        if (inReplyTo != nullptr && inReplyTo->count() > 0) {
            e.inReplyTo = MailUtils::normalizeMessageID(stringOrBlank((String *)inReplyTo->objectAtIndex(0)));
        }
        Array * references = header->references();
        if (references != nullptr) {
            for (unsigned int ii = 0; ii < references->count(); ii++) {
                std::string ref = MailUtils::normalizeMessageID(stringOrBlank((String *)references->objectAtIndex(ii)));
                if (ref != "") {
                    e.references.push_back(ref);
                }
            }
        }
    }

    e.flags = msg->flags();
    e.gmailThreadId = msg->gmailThreadID();
    return e;
}

/*
 Accepts the envelope object of a host packet:
 {"message_id": "<a@b>", "from": "...", "subject": "...", "date": 1700000000,
  "in_reply_to": "<x@y>", "references": [...], "flags": "\\Seen"}
 Every key is optional; null is treated like an absent key.
 */
Envelope Envelope::fromJSON(const nlohmann::json & json) {
    Envelope e;
    if (json.count("message_id") && json["message_id"].is_string()) {
        e.messageId = MailUtils::normalizeMessageID(json["message_id"].get<std::string>());
    }
    if (json.count("from") && json["from"].is_string()) {
        e.from = lowercase(json["from"].get<std::string>());
    }
    if (json.count("subject") && json["subject"].is_string()) {
        e.subject = json["subject"].get<std::string>();
    }
    if (json.count("date") && json["date"].is_number()) {
        e.date = json["date"].get<time_t>();
        if (e.date < 0) {
            e.date = 0;
        }
    }
    if (json.count("in_reply_to") && json["in_reply_to"].is_string()) {
        e.inReplyTo = MailUtils::normalizeMessageID(json["in_reply_to"].get<std::string>());
    }
    if (json.count("references") && json["references"].is_array()) {
        for (const auto & ref : json["references"]) {
            if (ref.is_string() && MailUtils::normalizeMessageID(ref.get<std::string>()) != "") {
                e.references.push_back(MailUtils::normalizeMessageID(ref.get<std::string>()));
            }
        }
    }
    if (json.count("flags") && json["flags"].is_string()) {
        e.flags = MailUtils::messageFlagsForFlagsString(json["flags"].get<std::string>());
    }
    if (json.count("gmail_thread_id") && json["gmail_thread_id"].is_number_integer()) {
        e.gmailThreadId = json["gmail_thread_id"].get<uint64_t>();
    }
    return e;
}

bool Envelope::hasMessageId() const {
    return messageId != "";
}

std::string Envelope::dateString() const {
    return MailUtils::dateStringForTime(date);
}

std::string Envelope::flagsString() const {
    return MailUtils::flagsStringForMessageFlags(flags);
}

std::string Envelope::contentHash() const {
    return MailUtils::contentHash(dateString(), from, subject);
}

std::string Envelope::stableIdentity() const {
    return MailUtils::stableIdentity(messageId, contentHash());
}

nlohmann::json Envelope::toJSON() const {
    nlohmann::json json = {
        {"message_id", hasMessageId() ? nlohmann::json(messageId) : nlohmann::json(nullptr)},
        {"from", from},
        {"subject", subject},
        {"date", date},
        {"in_reply_to", inReplyTo == "" ? nlohmann::json(nullptr) : nlohmann::json(inReplyTo)},
        {"references", references},
        {"flags", flagsString()},
    };
    if (gmailThreadId != 0) {
        json["gmail_thread_id"] = gmailThreadId;
    }
    return json;
}

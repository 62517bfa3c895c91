/** Envelope [MailMirror]
 *
 * Author(s): Ben Gotow
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef Envelope_hpp
#define Envelope_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

/**
 The canonical shape of a message's metadata. Provider specific sources
 (mailcore's IMAPMessage, packets from the host process) are normalized into
 this type once; everything downstream consumes only Envelope.

 Message-IDs are stored without angle brackets. An Envelope whose message
 had no Message-ID header (or one mailcore generated itself) has an empty
 messageId.
 */
struct Envelope {
    std::string messageId;
    std::string from;
    std::string subject;
    time_t date;
    std::string inReplyTo;
    std::vector<std::string> references;
    int flags;
    uint64_t gmailThreadId;

    Envelope();

    static Envelope fromIMAPMessage(mailcore::IMAPMessage * msg);
    static Envelope fromJSON(const nlohmann::json & json);

    bool hasMessageId() const;
    std::string dateString() const;
    std::string flagsString() const;
    std::string contentHash() const;
    std::string stableIdentity() const;

    nlohmann::json toJSON() const;
};

#endif /* Envelope_hpp */

/** AccountLock [MailMirror]
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

#ifndef AccountLock_hpp
#define AccountLock_hpp

#include <string>

#include "mailmirror/mail_store.hpp"

/**
 An advisory, cross-process lock on one (purpose, account) pair, stored as a
 row in the `_Lock` table. Acquired in the constructor and released in the
 destructor. A lock whose holder died is taken over once `ttl` seconds have
 passed since it was acquired.

 Must be constructed outside of an open transaction so that other
 connections see the lock row immediately.
 */
class AccountLock
{
public:
    AccountLock(MailStore * store, std::string purpose, std::string accountId, int ttl);
    ~AccountLock() noexcept;

    bool acquired();
    std::string name();

private:
    AccountLock(const AccountLock&);
    AccountLock& operator=(const AccountLock&);

    MailStore * mStore;
    std::string mName;
    std::string mOwner;
    bool mAcquired;
};

#endif /* AccountLock_hpp */

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONNECTION_ENTRY_H_0923475023984750923
#define CONNECTION_ENTRY_H_0923475023984750923

#include <chrono>
#include "remote_session.h"


namespace fnav
{
/*  one pooled control connection plus its bookkeeping
    - timestamps are accessed under the pool's lock only
    - the session is used by the borrowing caller without lock
    - destruction closes children, then the main session                   */
class ConnectionEntry
{
public:
    ConnectionEntry(std::unique_ptr<RemoteSession>&& session, const std::string& baseUrl, std::chrono::steady_clock::time_point now);
    ~ConnectionEntry() { close(); }

    RemoteSession& session() { return *session_; }
    const RemoteSession& session() const { return *session_; }

    const std::string& getBaseUrl() const { return baseUrl_; }

    std::chrono::steady_clock::time_point getCreatedAt        () const { return createdAt_; }
    std::chrono::steady_clock::time_point getLastUsedAt       () const { return lastUsedAt_; }
    std::chrono::steady_clock::time_point getLastHealthCheckAt() const { return lastHealthCheckAt_; }

    //acquisition order: tie-break for equal "lastUsedAt"
    uint64_t getUseSeq() const { return useSeq_; }

    void markUsed(std::chrono::steady_clock::time_point now, uint64_t useSeq)
    {
        lastUsedAt_ = now;
        useSeq_ = useSeq;
    }

    void markHealthChecked(std::chrono::steady_clock::time_point now) { lastHealthCheckAt_ = now; }

    //close and drop children whose transfer is done
    void reapFinishedChildren(); //noexcept

    bool isClosed() const { return closed_; }
    void close(); //noexcept; best effort, errors go to the extra log

private:
    ConnectionEntry           (const ConnectionEntry&) = delete;
    ConnectionEntry& operator=(const ConnectionEntry&) = delete;

    const std::unique_ptr<RemoteSession> session_;
    const std::string baseUrl_; //no password!

    const std::chrono::steady_clock::time_point createdAt_;
    std::chrono::steady_clock::time_point lastUsedAt_;
    std::chrono::steady_clock::time_point lastHealthCheckAt_;
    uint64_t useSeq_ = 0;

    bool closed_ = false;
};
}

#endif //CONNECTION_ENTRY_H_0923475023984750923

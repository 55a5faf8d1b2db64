// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONNECTION_POOL_H_4390587230498572093
#define CONNECTION_POOL_H_4390587230498572093

#include <zen/error_log.h>
#include <zen/file_error.h>
#include <zen/thread.h>
#include "bookmarks.h"
#include "connection_entry.h"
#include "pool_config.h"
#include "pool_key.h"


namespace fnav
{
DEFINE_NEW_FILE_ERROR(ErrorConnectionUnavailable)

//returns a connected and logged-in session
using SessionFactory = std::function<std::unique_ptr<RemoteSession>(const ConnectionIdentity& id)>; //throw SysError


//borrowed connection: reaps finished children when going out of scope
class ScopedConnection
{
public:
    ScopedConnection() {}
    ScopedConnection(ScopedConnection&& tmp) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&& tmp) noexcept
    {
        release();
        entry_ = std::move(tmp.entry_);
        path_  = std::move(tmp.path_);
        return *this;
    }

    ~ScopedConnection() { release(); }

    explicit operator bool() const { return static_cast<bool>(entry_); }

    const std::string& getPath() const; //throw std::logic_error if empty
    RemoteSession&     session() const; //

    const std::string& getBaseUrl() const;

private:
    friend class ConnectionPool;
    ScopedConnection(const std::shared_ptr<ConnectionEntry>& entry, const std::string& path) : entry_(entry), path_(path) {}

    void release(); //noexcept

    std::shared_ptr<ConnectionEntry> entry_;
    std::string path_;
};


/*  keyed reuse of live FTP control connections
    - key: caller context + host + port + credentials => never shared between two callers
    - idle entries are evicted after "idleTimeout", the least recently used ones when exceeding "capacity"
    - NOOP health check at most once per "healthCheckInterval"
    - all bookkeeping under one lock; connect and NOOP run outside of it                    */
class ConnectionPool
{
public:
    ConnectionPool(const PoolConfig& cfg,
                   const BookmarkStore& bookmarks,
                   const SessionFactory& sessionFactory,
                   const std::function<std::chrono::steady_clock::time_point()>& getNow = [] { return std::chrono::steady_clock::now(); });

    ScopedConnection acquire(const std::string& url,       CallerContext caller = getThreadCallerContext()); //throw SysError, ErrorConnectionUnavailable
    ScopedConnection acquire(const ConnectionIdentity& id, CallerContext caller = getThreadCallerContext()); //throw ErrorConnectionUnavailable

    void closeAll();
    void closeByBaseUrl(const std::string& baseUrl);

    //sorted by base URL: (base URL, last visited URL)
    std::vector<std::pair<std::string, std::string>> listOpenConnections() const;

    void recordVisited(const std::string& url); //throw SysError

    //evict idle entries, then enforce capacity; also run by the background cleaner
    void sweep();

    size_t size() const;
    const PoolConfig& getConfig() const { return cfg_; }

    //informational events (connect, evict, reconnect)
    void setActivityLogEnabled(bool enabled);
    zen::ErrorLog fetchActivityLog();

private:
    ConnectionPool           (const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    struct PoolState
    {
        std::map<PoolKey, std::shared_ptr<ConnectionEntry>> entries;
        std::map<std::string /*base URL*/, std::string /*last visited URL*/> lastVisited;
        uint64_t useSeq = 0;

        bool activityLogEnabled = false;
        zen::ErrorLog activityLog;
    };

    void evictStale(PoolState& state, std::chrono::steady_clock::time_point now);
    void evictExcess(PoolState& state, std::chrono::steady_clock::time_point now);

    static void logActivity(PoolState& state, const std::wstring& msg);

    //context of worker thread:
    void runSessionCleanUp(); //throw ThreadStopRequest

    const PoolConfig cfg_;
    const BookmarkStore& bookmarks_;
    const SessionFactory sessionFactory_;
    const std::function<std::chrono::steady_clock::time_point()> getNow_;

    mutable zen::Protected<PoolState> state_;

    zen::InterruptibleThread sessionCleaner_; //declare last: stop before any other member is destroyed!
};
}

#endif //CONNECTION_POOL_H_4390587230498572093

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "connection_pool.h"
#include <optional>
#include <set>

using namespace zen;
using namespace fnav;


namespace
{
[[noreturn]] inline
void throwContractViolation(int line)
{
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(line) + "] Contract violation!");
}


std::wstring fmtUrl(const std::string& url) { return fmtPath(utfTo<std::wstring>(url)); }


std::wstring fmtConnectedFor(std::chrono::steady_clock::duration age)
{
    const int64_t ageSec = std::chrono::duration_cast<std::chrono::seconds>(age).count();
    return _P("1 sec", "%x sec", ageSec);
}
}


const std::string& ScopedConnection::getPath() const
{
    if (!entry_)
        throwContractViolation(__LINE__);
    return path_;
}


RemoteSession& ScopedConnection::session() const
{
    if (!entry_)
        throwContractViolation(__LINE__);
    return entry_->session();
}


const std::string& ScopedConnection::getBaseUrl() const
{
    if (!entry_)
        throwContractViolation(__LINE__);
    return entry_->getBaseUrl();
}


void ScopedConnection::release() //noexcept
{
    if (entry_)
    {
        //only the owning caller uses this session => no lock needed
        entry_->reapFinishedChildren(); //noexcept

        entry_.reset(); //evicted while borrowed? => closed now
    }
}

//------------------------------------------------------------------------------------------------------------------------

ConnectionPool::ConnectionPool(const PoolConfig& cfg,
                               const BookmarkStore& bookmarks,
                               const SessionFactory& sessionFactory,
                               const std::function<std::chrono::steady_clock::time_point()>& getNow) :
    cfg_(clampPoolConfig(cfg)),
    bookmarks_(bookmarks),
    sessionFactory_(sessionFactory),
    getNow_(getNow)
{
    if (!sessionFactory_ || !getNow_)
        throwContractViolation(__LINE__);

    if (cfg_.cleanupInterval > std::chrono::seconds(0))
        sessionCleaner_ = InterruptibleThread([this]
    {
        setCurrentThreadName(Zstr("Session Cleaner[FTP]"));
        runSessionCleanUp(); //throw ThreadStopRequest
    });
}


ScopedConnection ConnectionPool::acquire(const std::string& url, CallerContext caller) //throw SysError, ErrorConnectionUnavailable
{
    return acquire(bookmarks_.resolve(url), caller); //throw SysError, ErrorConnectionUnavailable
}


ScopedConnection ConnectionPool::acquire(const ConnectionIdentity& id, CallerContext caller) //throw ErrorConnectionUnavailable
{
    const PoolKey key = makePoolKey(id, caller);
    const std::string baseUrl = getBaseUrl(id);

    std::shared_ptr<ConnectionEntry> entry;
    bool needsHealthCheck = false;

    state_.access([&](PoolState& state)
    {
        const auto now = getNow_();
        evictStale(state, now);
        evictExcess(state, now);

        auto it = state.entries.find(key);
        if (it == state.entries.end())
            return;

        if (it->second->session().isClosed())
        {
            logActivity(state, replaceCpy(_("Connection to %x was closed. Reconnecting..."), L"%x", fmtUrl(baseUrl)));
            state.entries.erase(it); //run ~ConnectionEntry *inside* the lock! => avoid hitting server limits!
            return;
        }

        entry = it->second;

        if (now - entry->getLastHealthCheckAt() > cfg_.healthCheckInterval)
            needsHealthCheck = true;
        else
            entry->markUsed(now, ++state.useSeq);
    });

    if (needsHealthCheck) //send NOOP outside the lock: only the owning caller context can use this entry
    {
        std::optional<SysError> healthError;
        try
        {
            entry->session().sendNoop(); //throw SysError
        }
        catch (const SysError& e) { healthError = e; }

        state_.access([&](PoolState& state)
        {
            auto it = state.entries.find(key);
            const bool stillPooled = it != state.entries.end() && it->second == entry; //evicted in the meantime?

            if (healthError)
            {
                logActivity(state, replaceCpy(_("Connection to %x is not responding. Reconnecting..."), L"%x", fmtUrl(baseUrl)) +
                            L"\n\n" + healthError->toString());
                if (stillPooled)
                    state.entries.erase(it);
                entry.reset();
            }
            else if (!stillPooled)
                entry.reset();
            else
            {
                const auto now = getNow_();
                entry->markHealthChecked(now);
                entry->markUsed(now, ++state.useSeq);
            }
        });
    }

    if (!entry) //connect outside the lock: don't block other callers
    {
        std::unique_ptr<RemoteSession> session;
        try
        {
            session = sessionFactory_(id); //throw SysError
            //larger listings than the default cache size => avoid eviction thrashing
            session->setMetadataCacheSize(cfg_.metadataCacheSize);
        }
        catch (const SysError& e)
        {
            throw ErrorConnectionUnavailable(replaceCpy(_("Cannot connect to %x."), L"%x", fmtUrl(baseUrl)), e.toString());
        }

        auto newEntry = std::make_shared<ConnectionEntry>(std::move(session), baseUrl, getNow_());

        state_.access([&](PoolState& state)
        {
            newEntry->markUsed(newEntry->getLastUsedAt(), ++state.useSeq);

            state.entries[key] = newEntry; //at most one entry per key
            logActivity(state, replaceCpy(_("Connected to %x."), L"%x", fmtUrl(baseUrl)));

            evictExcess(state, newEntry->getCreatedAt());
        });
        entry = std::move(newEntry);
    }

    return ScopedConnection(entry, id.path);
}


void ConnectionPool::closeAll()
{
    state_.access([&](PoolState& state)
    {
        if (!state.entries.empty())
            logActivity(state, _P("Closing 1 connection.", "Closing %x connections.", state.entries.size()));
        state.entries.clear();
        state.lastVisited.clear();
    });
}


void ConnectionPool::closeByBaseUrl(const std::string& baseUrl)
{
    state_.access([&](PoolState& state)
    {
        //there may be several entries: one per caller context
        const size_t countErased = std::erase_if(state.entries, [&](const auto& item) { return item.second->getBaseUrl() == baseUrl; });
        if (countErased > 0)
            logActivity(state, replaceCpy(_("Closed connection to %x."), L"%x", fmtUrl(baseUrl)));

        state.lastVisited.erase(baseUrl);
    });
}


std::vector<std::pair<std::string, std::string>> ConnectionPool::listOpenConnections() const
{
    std::vector<std::pair<std::string, std::string>> output;

    state_.access([&](PoolState& state)
    {
        std::set<std::string> baseUrls;
        for (const auto& [key, entry] : state.entries)
            baseUrls.insert(entry->getBaseUrl());

        for (const std::string& baseUrl : baseUrls)
            if (auto it = state.lastVisited.find(baseUrl);
                it != state.lastVisited.end())
                output.emplace_back(baseUrl, it->second);
            else
                output.emplace_back(baseUrl, baseUrl + '/');
    });
    return output;
}


void ConnectionPool::recordVisited(const std::string& url) //throw SysError
{
    const std::string baseUrl = getBaseUrl(bookmarks_.resolve(url)); //throw SysError

    state_.access([&](PoolState& state) { state.lastVisited[baseUrl] = url; });
}


void ConnectionPool::sweep()
{
    state_.access([&](PoolState& state)
    {
        const auto now = getNow_();
        evictStale(state, now);
        evictExcess(state, now);
    });
}


size_t ConnectionPool::size() const
{
    return state_.access([](const PoolState& state) { return state.entries.size(); });
}


void ConnectionPool::setActivityLogEnabled(bool enabled)
{
    state_.access([&](PoolState& state)
    {
        state.activityLogEnabled = enabled;
        if (!enabled)
            state.activityLog.clear();
    });
}


ErrorLog ConnectionPool::fetchActivityLog()
{
    return state_.access([](PoolState& state) { return std::exchange(state.activityLog, ErrorLog()); });
}


void ConnectionPool::evictStale(PoolState& state, std::chrono::steady_clock::time_point now)
{
    std::erase_if(state.entries, [&](const auto& item)
    {
        const std::shared_ptr<ConnectionEntry>& entry = item.second;

        if (now - entry->getLastUsedAt() <= cfg_.idleTimeout)
            return false;

        logActivity(state, replaceCpy(replaceCpy(_("Closing idle connection to %x (connected for %y)."), L"%x", fmtUrl(entry->getBaseUrl())),
                                      L"%y", fmtConnectedFor(now - entry->getCreatedAt())));
        return true; //run ~ConnectionEntry *inside* the lock! => avoid hitting server limits!
    });
}


void ConnectionPool::evictExcess(PoolState& state, std::chrono::steady_clock::time_point now)
{
    while (state.entries.size() > cfg_.capacity)
    {
        //least recently used; equal times => acquired first
        auto itLru = std::min_element(state.entries.begin(), state.entries.end(), [](const auto& lhs, const auto& rhs)
        {
            if (lhs.second->getLastUsedAt() != rhs.second->getLastUsedAt())
                return lhs.second->getLastUsedAt() < rhs.second->getLastUsedAt();
            return lhs.second->getUseSeq() < rhs.second->getUseSeq();
        });

        logActivity(state, replaceCpy(replaceCpy(_("Too many connections. Closing connection to %x (connected for %y)."), L"%x", fmtUrl(itLru->second->getBaseUrl())),
                                      L"%y", fmtConnectedFor(now - itLru->second->getCreatedAt())));
        state.entries.erase(itLru);
    }
}


void ConnectionPool::logActivity(PoolState& state, const std::wstring& msg)
{
    if (state.activityLogEnabled)
        logMsg(state.activityLog, msg, MSG_TYPE_INFO);
}


//run a dedicated clean-up thread => it's unclear when the server lets a connection time out, so we do it preemptively
//context of worker thread:
void ConnectionPool::runSessionCleanUp() //throw ThreadStopRequest
{
    for (;;)
    {
        interruptibleSleep(cfg_.cleanupInterval); //throw ThreadStopRequest
        sweep();
    }
}

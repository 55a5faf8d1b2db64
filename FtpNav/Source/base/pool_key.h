// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef POOL_KEY_H_5829304752390847523
#define POOL_KEY_H_5829304752390847523

#include <atomic>
#include <compare>
#include "ftp_url.h"


namespace fnav
{
//one control connection is never shared between two caller contexts
struct CallerContext
{
    uint64_t id = 0;

    std::strong_ordering operator<=>(const CallerContext&) const = default;
    bool operator==(const CallerContext&) const = default;
};

//distinct for each thread, stable for the thread's lifetime
CallerContext getThreadCallerContext();

//explicit token for a logical task that is not bound to one thread; never equal to a thread's context
CallerContext createCallerContext();


struct PoolKey
{
    CallerContext caller;
    std::string host;
    int port = DEFAULT_PORT_FTP;
    std::string username;
    std::string password;

    std::strong_ordering operator<=>(const PoolKey&) const = default;
    bool operator==(const PoolKey&) const = default;
};

inline
PoolKey makePoolKey(const ConnectionIdentity& id, CallerContext caller)
{
    return
    {
        .caller   = caller,
        .host     = id.host,
        .port     = id.port,
        .username = id.username,
        .password = id.password,
    };
}








//######################## implementation ########################
namespace impl
{
inline constinit std::atomic<uint64_t> callerContextCount{0}; //zero-initialized => not subject to static initialization order fiasco
}


inline
CallerContext getThreadCallerContext()
{
    thread_local const uint64_t threadContextId = ++impl::callerContextCount;
    return {threadContextId};
}


inline
CallerContext createCallerContext()
{
    return {++impl::callerContextCount};
}
}

#endif //POOL_KEY_H_5829304752390847523

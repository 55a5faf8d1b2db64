// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "connection_entry.h"
#include <zen/file_error.h>

using namespace zen;
using namespace fnav;


ConnectionEntry::ConnectionEntry(std::unique_ptr<RemoteSession>&& session, const std::string& baseUrl, std::chrono::steady_clock::time_point now) :
    session_(std::move(session)),
    baseUrl_(baseUrl),
    createdAt_(now),
    lastUsedAt_(now),
    lastHealthCheckAt_(now)
{
    if (!session_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void ConnectionEntry::reapFinishedChildren() //noexcept
{
    std::vector<std::unique_ptr<RemoteChild>>& children = session_->getChildren();

    std::erase_if(children, [&](const std::unique_ptr<RemoteChild>& child)
    {
        if (!child->transferFinished())
            return false;
        try
        {
            child->close(); //throw SysError
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot close data connection to %x."), L"%x", fmtPath(utfTo<std::wstring>(baseUrl_))) + L"\n\n" + e.toString());
        }
        return true; //drop even on failure: never retried
    });
}


void ConnectionEntry::close() //noexcept
{
    if (closed_)
        return;
    closed_ = true;

    std::vector<std::unique_ptr<RemoteChild>>& children = session_->getChildren();

    for (const std::unique_ptr<RemoteChild>& child : children)
        try
        {
            child->close(); //throw SysError
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot close data connection to %x."), L"%x", fmtPath(utfTo<std::wstring>(baseUrl_))) + L"\n\n" + e.toString());
        }
    children.clear();

    try
    {
        session_->close(); //throw SysError
    }
    catch (const SysError& e)
    {
        logExtraError(replaceCpy(_("Cannot close connection to %x."), L"%x", fmtPath(utfTo<std::wstring>(baseUrl_))) + L"\n\n" + e.toString());
    }
}

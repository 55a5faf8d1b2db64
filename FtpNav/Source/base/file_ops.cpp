// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_ops.h"
#include <cstring>
#include <unistd.h>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <zen/scope_guard.h>

using namespace zen;
using namespace fnav;


namespace
{
std::wstring fmtUrl(const std::string& url) { return fmtPath(utfTo<std::wstring>(url)); }


ScopedConnection acquireForUrl(ConnectionPool& pool, const std::string& url, const std::wstring& errorMsg) //throw FileError
{
    try
    {
        if (!isFtpUrl(url))
            throw SysError(_("URL must include any of the following schemes: ftp://, ftps://"));

        return pool.acquire(url); //throw SysError, ErrorConnectionUnavailable
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


Zstring getServerPath(const ScopedConnection& conn)
{
    return normalizeServerPath(utfTo<Zstring>(decodeUrlComponent(conn.getPath())));
}


void removeFolderRecursion(RemoteSession& session, const Zstring& folderPath) //throw SysError
{
    for (const RemoteItem& item : session.listFolder(folderPath)) //throw SysError
    {
        const Zstring itemPath = appendServerPath(folderPath, item.name);

        if (item.type == RemoteItemType::folder)
            removeFolderRecursion(session, itemPath); //throw SysError
        else
            session.removeFile(itemPath); //throw SysError; symlinks: removes the link only
    }
    session.removeFolder(folderPath); //throw SysError
}


std::string readRemoteFile(ConnectionPool& pool, const std::string& url, const std::wstring& errorMsg) //throw FileError
{
    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError

    std::string byteStream;
    try
    {
        conn.session().downloadFile(getServerPath(conn), [&](const void* buffer, size_t bytesToWrite)
        {
            byteStream.append(static_cast<const char*>(buffer), bytesToWrite);
        }); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    return byteStream;
}


void writeRemoteFile(ConnectionPool& pool, const std::string& url, const std::string& byteStream, const std::wstring& errorMsg) //throw FileError
{
    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError

    size_t bytesDone = 0;
    try
    {
        conn.session().uploadFile(getServerPath(conn), [&](void* buffer, size_t bytesToRead)
        {
            const size_t bytesRead = std::min(bytesToRead, byteStream.size() - bytesDone);
            std::memcpy(buffer, byteStream.data() + bytesDone, bytesRead);
            bytesDone += bytesRead;
            return bytesRead;
        }); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}
}


RemoteItem fnav::getRemoteItem(ConnectionPool& pool, const std::string& url) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtUrl(url));

    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError
    try
    {
        return conn.session().getItemInfo(getServerPath(conn)); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void fnav::createRemoteFolder(ConnectionPool& pool, const std::string& url) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtUrl(url));

    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError
    try
    {
        conn.session().createFolder(getServerPath(conn)); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void fnav::removeRemoteItem(ConnectionPool& pool, const std::string& url) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot delete %x."), L"%x", fmtUrl(url));

    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError
    try
    {
        RemoteSession& session = conn.session();
        const Zstring itemPath = getServerPath(conn);

        if (itemPath == Zstr("/"))
            throw SysError(_("Path is device root."));

        if (session.getItemInfo(itemPath).type == RemoteItemType::folder) //throw SysError
            removeFolderRecursion(session, itemPath); //throw SysError
        else
            session.removeFile(itemPath); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void fnav::touchRemoteFile(ConnectionPool& pool, const std::string& url) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtUrl(url));

    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError
    try
    {
        RemoteSession& session = conn.session();
        const Zstring filePath = getServerPath(conn);

        if (filePath == Zstr("/"))
            throw SysError(_("Path is device root."));

        //list the parent: "not existing" is distinguished from failure
        const Zstring fileName = afterLast(filePath, Zstr('/'), IfNotFoundReturn::all);
        for (const RemoteItem& item : session.listFolder(getServerParentPath(filePath))) //throw SysError
            if (item.name == fileName)
                throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(fileName)));

        session.uploadFile(filePath, [](void* buffer, size_t bytesToRead) { return static_cast<size_t>(0); }); //throw SysError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void fnav::downloadRemoteFile(ConnectionPool& pool, const std::string& url, const Zstring& localFilePath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot copy file %x to %y."), L"%x", L'\n' + fmtUrl(url)), L"%y", L'\n' + fmtPath(localFilePath));

    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError

    const Zstring tmpFilePath = localFilePath + Zstr('.') + numberTo<Zstring>(::getpid()) + Zstr(".tmp");

    FileOutputPlain tmpFile(tmpFilePath); //throw FileError
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    try
    {
        conn.session().downloadFile(getServerPath(conn), [&](const void* buffer, size_t bytesToWrite)
        {
            for (size_t bytesDone = 0; bytesDone < bytesToWrite; )
                bytesDone += tmpFile.tryWrite(static_cast<const char*>(buffer) + bytesDone, bytesToWrite - bytesDone); //throw FileError
        }); //throw SysError, FileError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    tmpFile.close(); //throw FileError

    moveAndRenameItem(tmpFilePath, localFilePath); //throw FileError
}


void fnav::uploadRemoteFile(ConnectionPool& pool, const Zstring& localFilePath, const std::string& url) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot copy file %x to %y."), L"%x", L'\n' + fmtPath(localFilePath)), L"%y", L'\n' + fmtUrl(url));

    FileInputPlain fileIn(localFilePath); //throw FileError

    const ScopedConnection conn = acquireForUrl(pool, url, errorMsg); //throw FileError
    try
    {
        conn.session().uploadFile(getServerPath(conn), [&](void* buffer, size_t bytesToRead)
        {
            //fill the buffer unless end of file: tryRead() may return short
            size_t bytesDone = 0;
            while (bytesDone < bytesToRead)
            {
                const size_t bytesRead = fileIn.tryRead(static_cast<char*>(buffer) + bytesDone, bytesToRead - bytesDone); //throw FileError
                if (bytesRead == 0) //end of file
                    break;
                bytesDone += bytesRead;
            }
            return bytesDone;
        }); //throw SysError, FileError
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
}


void fnav::copyRemoteFile(ConnectionPool& pool, const std::string& urlFrom, const std::string& urlTo) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot copy file %x to %y."), L"%x", L'\n' + fmtUrl(urlFrom)), L"%y", L'\n' + fmtUrl(urlTo));

    //one connection at a time: source and target may share a pooled connection
    const std::string byteStream = readRemoteFile(pool, urlFrom, errorMsg); //throw FileError
    writeRemoteFile(pool, urlTo, byteStream, errorMsg);                     //
}


void fnav::moveRemoteItem(ConnectionPool& pool, const std::string& urlFrom, const std::string& urlTo) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot move %x to %y."), L"%x", L'\n' + fmtUrl(urlFrom)), L"%y", L'\n' + fmtUrl(urlTo));
    {
        const ScopedConnection connFrom = acquireForUrl(pool, urlFrom, errorMsg); //throw FileError
        const ScopedConnection connTo   = acquireForUrl(pool, urlTo,   errorMsg); //
        try
        {
            if (&connFrom.session() == &connTo.session()) //same pool key => same server and credentials
            {
                connFrom.session().renameItem(getServerPath(connFrom), getServerPath(connTo)); //throw SysError
                return;
            }

            if (connFrom.session().getItemInfo(getServerPath(connFrom)).type == RemoteItemType::folder) //throw SysError
                throw SysError(_("Operation not supported between different devices."));
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    copyRemoteFile(pool, urlFrom, urlTo); //throw FileError
    removeRemoteItem(pool, urlFrom);      //
}

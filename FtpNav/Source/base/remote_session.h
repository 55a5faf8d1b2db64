// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_SESSION_H_7842390574129034857
#define REMOTE_SESSION_H_7842390574129034857

#include <functional>
#include <memory>
#include <vector>
#include <zen/sys_error.h>


namespace fnav
{
enum class RemoteItemType
{
    file,
    folder,
    symlink,
};

struct RemoteItem
{
    RemoteItemType type = RemoteItemType::file;
    Zstring name;
    uint64_t size = 0;
    time_t modTime = 0; //number of seconds since Jan 1st 1970 UTC
};


//data connection opened for a single file transfer
class RemoteChild
{
public:
    virtual ~RemoteChild() {}

    virtual bool transferFinished() const = 0;
    virtual void close() = 0; //throw SysError
};


/*  one control connection to a server: all calls from a single thread at a time!

    server paths: absolute, '/' separated, e.g. "/pub/readme.txt"               */
class RemoteSession
{
public:
    virtual ~RemoteSession() {}

    //no I/O: connection lost or closed locally?
    virtual bool isClosed() const = 0;

    virtual void sendNoop() = 0; //throw SysError

    //children first, then the control connection; calling twice is a no-op
    virtual void close() = 0; //throw SysError

    virtual void setMetadataCacheSize(size_t itemCount) = 0;

    //finished children remain listed until the owner reaps them
    virtual std::vector<std::unique_ptr<RemoteChild>>& getChildren() = 0;

    virtual Zstring getHomePath() = 0; //throw SysError

    virtual std::vector<RemoteItem> listFolder(const Zstring& folderPath) = 0; //throw SysError
    virtual RemoteItem getItemInfo(const Zstring& itemPath) = 0;               //throw SysError

    virtual void renameItem  (const Zstring& pathFrom, const Zstring& pathTo) = 0; //throw SysError
    virtual void removeFile  (const Zstring& filePath) = 0;                        //throw SysError
    virtual void removeFolder(const Zstring& folderPath) = 0;                      //throw SysError
    virtual void createFolder(const Zstring& folderPath) = 0;                      //throw SysError

    //transfers run on a child session
    virtual void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) = 0; //throw SysError, X
    virtual void uploadFile  (const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) = 0;       //throw SysError, X
    //readBlock: return "bytesToRead" bytes unless end of stream
};

//------------------------------------------------------------------------------------

//"/a/b/" -> "/a/b", "" -> "/"
inline
Zstring normalizeServerPath(const Zstring& path)
{
    Zstring output = zen::startsWith(path, Zstr('/')) ? path : Zstr('/') + path;
    while (output.size() > 1 && zen::endsWith(output, Zstr('/')))
        output.pop_back();
    return output;
}


inline
Zstring appendServerPath(const Zstring& folderPath, const Zstring& itemName)
{
    return zen::endsWith(folderPath, Zstr('/')) ? folderPath + itemName : folderPath + Zstr('/') + itemName;
}


inline
Zstring getServerParentPath(const Zstring& itemPath) //"/a/b" -> "/a"; "/" for root items
{
    return normalizeServerPath(zen::beforeLast(normalizeServerPath(itemPath), Zstr('/'), zen::IfNotFoundReturn::none));
}
}

#endif //REMOTE_SESSION_H_7842390574129034857

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_OPS_H_2093847502938475092
#define FILE_OPS_H_2093847502938475092

#include "connection_pool.h"


namespace fnav
{
/*  item operations on ftp:// and ftps:// URLs, each on a connection borrowed from the pool
    - the URL path is the item path (%-encoded), aliases are resolved by the pool
    - errors name the URL; ErrorConnectionUnavailable if no connection could be opened      */

RemoteItem getRemoteItem(ConnectionPool& pool, const std::string& url); //throw FileError

void createRemoteFolder(ConnectionPool& pool, const std::string& url); //throw FileError

//folders are removed recursively
void removeRemoteItem(ConnectionPool& pool, const std::string& url); //throw FileError

//create an empty file: ERROR if the name is already used
void touchRemoteFile(ConnectionPool& pool, const std::string& url); //throw FileError

//existing target files are overwritten
void downloadRemoteFile(ConnectionPool& pool, const std::string& url, const Zstring& localFilePath); //throw FileError
void uploadRemoteFile  (ConnectionPool& pool, const Zstring& localFilePath, const std::string& url); //throw FileError

//files only: same or different server
void copyRemoteFile(ConnectionPool& pool, const std::string& urlFrom, const std::string& urlTo); //throw FileError

/*  same server and credentials: rename on the server (files and folders)
    otherwise: copy, then remove the source (files only)                    */
void moveRemoteItem(ConnectionPool& pool, const std::string& urlFrom, const std::string& urlTo); //throw FileError
}

#endif //FILE_OPS_H_2093847502938475092

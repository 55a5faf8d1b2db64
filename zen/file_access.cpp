// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
    #include <sys/stat.h>
    #include <unistd.h> //unlink
    #include <cstdio>   //rename

using namespace zen;


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (basePath.empty())
        return relPath;
    if (relPath.empty())
        return basePath;

    const bool baseHasSep = endsWith  (basePath, FILE_NAME_SEPARATOR);
    const bool relHasSep  = startsWith(relPath,  FILE_NAME_SEPARATOR);

    if (baseHasSep && relHasSep)
        return basePath + relPath.substr(1);
    if (baseHasSep || relHasSep)
        return basePath + relPath;
    return basePath + FILE_NAME_SEPARATOR + relPath;
}


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = endsWith(itemPath, FILE_NAME_SEPARATOR) && itemPath.size() > 1 ? beforeLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::none) : itemPath;

    if (!contains(path, FILE_NAME_SEPARATOR) || path == Zstr("/")) //relative name or device root
        return std::nullopt;

    const Zstring parentPath = beforeLast(path, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);
    if (parentPath.empty())
        return Zstring(Zstr("/"));
    return parentPath;
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), "unlink");
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) //throw FileError
{
    //rename() replaces an existing target atomically
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                    L"%x", L'\n' + fmtPath(pathFrom)),
                                         L"%y", L'\n' + fmtPath(pathTo)), "rename");
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    //path most likely already exists => check first
    if (const std::optional<ItemType> type = getItemTypeIfExists(dirPath)) //throw FileError
    {
        if (*type == ItemType::file /*obscure, but possible*/)
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                            replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(dirPath)));
        return;
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(dirPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    if (::mkdir(dirPath.c_str(), 0755) != 0 && errno != EEXIST) //EEXIST: created in the meantime
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), "mkdir");
}

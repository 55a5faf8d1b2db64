// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include <optional>
#include "file_error.h"


namespace zen
{

const Zchar FILE_NAME_SEPARATOR = '/';

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

enum class ItemType
{
    file,
    folder,
    symlink,
};
//distinguish error/not existing: ENOENT and ENOTDIR mean "not existing"
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing

//rename within the same file system, replacing an existing target
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo); //throw FileError

void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_access.h"


namespace zen
{
using FileHandle = int;
const FileHandle invalidFileHandle = -1;

class FileBase
{
public:
    FileHandle getHandle() { return hFile_; }
    const Zstring& getFilePath() const { return filePath_; }

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void close(); //throw FileError -> good place to catch errors when closing stream!

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


class FileOutputPlain : public FileBase
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    using FileBase::close;
};

//-----------------------------------------------------------------------------------------------

[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw FileError

//write temporary file, then rename => readers never see a half-written file
void setFileContent(const Zstring& filePath, std::string_view byteStream); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345

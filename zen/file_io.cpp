// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
    #include <sys/stat.h>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


namespace
{
const size_t blockSize = 64 * 1024;
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); } //output: caller must close() explicitly to see errors
}


void FileBase::close() //throw FileError
{
    if (hFile_ == invalidFileHandle)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    ZEN_ON_SCOPE_EXIT(hFile_ = invalidFileHandle);

    if (::close(hFile_) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "close");
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileHandle openHandleForRead(const Zstring& filePath) //throw FileError
{
    //caveat: check for file types that block during open(): character device, block device, named pipe
    const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fdFile == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), "open");

    return fdFile; //pass ownership
}


FileHandle openHandleForWrite(const Zstring& filePath) //throw FileError
{
    const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH; //0644

    //O_EXCL: temporary file names are unique per process => an existing file is a leftover and an error
    const int fdFile = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, lockFileMode);
    if (fdFile == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "open");

    return fdFile; //pass ownership
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileBase(openHandleForRead(filePath), filePath) {} //throw FileError


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //Compare copy_reg() in copy.c: ftp://ftp.gnu.org/gnu/coreutils/coreutils-8.23.tar.xz

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath) :
    FileBase(openHandleForWrite(filePath), filePath) {} //throw FileError


size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

std::string zen::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string byteStream;
    for (;;)
    {
        const size_t oldSize = byteStream.size();
        byteStream.resize(oldSize + blockSize);

        const size_t bytesRead = fileIn.tryRead(byteStream.data() + oldSize, blockSize); //throw FileError; may return short, only 0 means EOF!
        byteStream.resize(oldSize + bytesRead);

        if (bytesRead == 0) //end of file
            return byteStream;
    }
}


void zen::setFileContent(const Zstring& filePath, std::string_view byteStream) //throw FileError
{
    const Zstring tmpFilePath = filePath + Zstr('.') + numberTo<Zstring>(::getpid()) + Zstr(".tmp");

    FileOutputPlain tmpFile(tmpFilePath); //throw FileError
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    for (size_t bytesDone = 0; bytesDone < byteStream.size(); )
        bytesDone += tmpFile.tryWrite(byteStream.data() + bytesDone, byteStream.size() - bytesDone); //throw FileError

    tmpFile.close(); //throw FileError

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath); //throw FileError
}

// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include "extra_log.h"
    #include <sys/stat.h>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle;
    }
    catch (const SysError& e) { throw FileError(replaceCpy<std::wstring>(L"Cannot write file %x.", L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForRead(const Zstring& filePath) //throw FileError
{
    const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
        THROW_LAST_FILE_ERROR(replaceCpy<std::wstring>(L"Cannot open file %x.", L"%x", fmtPath(filePath)), "open");
    return fdFile; //pass ownership
}


FileBase::FileHandle openHandleForWrite(const Zstring& filePath, FileOutputMode mode) //throw FileError, ErrorTargetExisting
{
    const int flags = mode == FileOutputMode::createNew ?
                      O_WRONLY | O_CREAT | O_EXCL   | O_CLOEXEC :
                      O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
    const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

    const int fdFile = ::open(filePath.c_str(), flags, lockFileMode);
    if (fdFile == -1)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        const std::wstring errorMsg = replaceCpy<std::wstring>(L"Cannot write file %x.", L"%x", fmtPath(filePath));
        const std::wstring errorDescr = formatSystemError("open", ec);

        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, errorDescr);

        throw FileError(errorMsg, errorDescr);
    }
    return fdFile; //pass ownership
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileBase(openHandleForRead(filePath), filePath) {} //throw FileError


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesRead = 0;
    do
    {
        bytesRead = ::read(getHandle(), buffer, bytesToRead);
    }
    while (bytesRead < 0 && getLastError() == EINTR); //Compare copy_reg() in copy.c: ftp://ftp.gnu.org/gnu/coreutils/coreutils-8.23.tar.xz

    if (bytesRead < 0)
        THROW_LAST_FILE_ERROR(replaceCpy<std::wstring>(L"Cannot read file %x.", L"%x", fmtPath(getFilePath())), "read");
    if (static_cast<size_t>(bytesRead) > bytesToRead) //better safe than sorry
        throw FileError(replaceCpy<std::wstring>(L"Cannot read file %x.", L"%x", fmtPath(getFilePath())), formatSystemError("ReadFile", L"", L"Buffer overflow."));

    return bytesRead; //"zero indicates end of file"
}

//----------------------------------------------------------------------------------------------------

FileOutputPlain::FileOutputPlain(const Zstring& filePath, FileOutputMode mode) :
    FileBase(openHandleForWrite(filePath, mode), filePath) {} //throw FileError, ErrorTargetExisting


size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ssize_t bytesWritten = 0;
    do
    {
        bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
    }
    while (bytesWritten < 0 && getLastError() == EINTR);

    if (bytesWritten <= 0)
    {
        if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
            errno = ENOSPC;

        THROW_LAST_FILE_ERROR(replaceCpy<std::wstring>(L"Cannot write file %x.", L"%x", fmtPath(getFilePath())), "write");
    }
    if (bytesWritten > static_cast<ssize_t>(bytesToWrite)) //better safe than sorry
        throw FileError(replaceCpy<std::wstring>(L"Cannot write file %x.", L"%x", fmtPath(getFilePath())), formatSystemError("write", L"", L"Buffer overflow."));

    return bytesWritten;
}


void FileOutputPlain::write(std::string_view byteStream) //throw FileError
{
    for (size_t pos = 0; pos < byteStream.size(); )
        pos += tryWrite(byteStream.data() + pos, std::min(byteStream.size() - pos, blockSize)); //throw FileError
}

//----------------------------------------------------------------------------------------------------

std::string zen::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string output;
    for (;;)
    {
        const size_t oldSize = output.size();
        output.resize(oldSize + FileBase::blockSize);

        const size_t bytesRead = fileIn.tryRead(output.data() + oldSize, FileBase::blockSize); //throw FileError
        output.resize(oldSize + bytesRead);

        if (bytesRead == 0) //end of file
            return output;
    }
}


void zen::setFileContent(const Zstring& filePath, std::string_view byteStream) //throw FileError
{
    const Zstring tmpFilePath = filePath + Zstr(".tmp");
    {
        FileOutputPlain tmpFile(tmpFilePath, FileOutputMode::createNew); //throw FileError, (ErrorTargetExisting)
        ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
        catch (const FileError& e) { logExtraError(e.toString()); });

        tmpFile.write(byteStream); //throw FileError
        tmpFile.close();           //
    }
    //operation finished: move temp file transactionally
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError
}


void zen::appendFileContent(const Zstring& filePath, std::string_view byteStream) //throw FileError
{
    FileOutputPlain fileOut(filePath, FileOutputMode::append); //throw FileError
    fileOut.write(byteStream); //throw FileError
    fileOut.close();           //
}

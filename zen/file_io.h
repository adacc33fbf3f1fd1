// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_access.h"


namespace zen
{
    const char LINE_BREAK[] = "\n";

/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    static constexpr size_t blockSize = 64 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

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


enum class FileOutputMode
{
    createNew, //fail if existing
    append,    //create if missing
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const Zstring& filePath, FileOutputMode mode); //throw FileError, ErrorTargetExisting

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    void write(std::string_view byteStream); //throw FileError
};

//-----------------------------------------------------------------------------------------------

std::string getFileContent(const Zstring& filePath); //throw FileError

//overwrites if existing + transactional! :)
void setFileContent(const Zstring& filePath, std::string_view byteStream); //throw FileError

void appendFileContent(const Zstring& filePath, std::string_view byteStream); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345

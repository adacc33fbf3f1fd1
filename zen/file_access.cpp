// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
    #include <sys/stat.h>
    #include <unistd.h>
    #include <cstdio> //rename

using namespace zen;


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        if (getLastError() == ENOENT)
            return std::nullopt;
        THROW_LAST_FILE_ERROR(replaceCpy<std::wstring>(L"Cannot read file attributes of %x.", L"%x", fmtPath(itemPath)), "lstat");
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = endsWith(itemPath, FILE_NAME_SEPARATOR) && itemPath.size() > 1 ? beforeLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::none) : itemPath;

    if (!contains(path, FILE_NAME_SEPARATOR) || path == Zstr("/"))
        return std::nullopt;

    const Zstring parentPath = beforeLast(path, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);
    if (parentPath.empty()) //e.g. "/tmp"
        return Zstring(1, FILE_NAME_SEPARATOR);
    return parentPath;
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (basePath.empty())
        return relPath;
    if (relPath.empty())
        return basePath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + (startsWith(relPath, FILE_NAME_SEPARATOR) ? relPath.substr(1) : relPath);
    return basePath + (startsWith(relPath, FILE_NAME_SEPARATOR) ? relPath : FILE_NAME_SEPARATOR + relPath);
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy<std::wstring>(L"Cannot delete file %x.", L"%x", fmtPath(filePath)), "unlink");
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return replaceCpy(replaceCpy<std::wstring>(L"Cannot move file %x to %y.",
                                                                         L"%x", L'\n' + fmtPath(pathFrom)),
                                               L"%y", L'\n' + fmtPath(pathTo)); };

    if (!replaceExisting && itemExists(pathTo)) //throw FileError
        throw ErrorTargetExisting(getErrorMsg(), replaceCpy<std::wstring>(L"The name %x is already used by another item.", L"%x", fmtPath(pathTo)));

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0) //replaces existing files atomically
        THROW_LAST_FILE_ERROR(getErrorMsg(), "rename");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

    if (::mkdir(dirPath.c_str(), mode) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before directly/indirectly making other system calls!
        const std::wstring errorMsg = replaceCpy<std::wstring>(L"Cannot create directory %x.", L"%x", fmtPath(dirPath));
        const std::wstring errorDescr = formatSystemError("mkdir", ec);

        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, errorDescr);
        throw FileError(errorMsg, errorDescr);
    }
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    //path most likely already exists => check first
    if (const std::optional<ItemType> type = getItemTypeIfExists(dirPath)) //throw FileError
    {
        if (*type == ItemType::file) //obscure, but possible
            throw FileError(replaceCpy<std::wstring>(L"Cannot create directory %x.", L"%x", fmtPath(dirPath)),
                            replaceCpy<std::wstring>(L"The name %x is already used by another item.", L"%x", fmtPath(dirPath)));
        return;
    }

    if (const std::optional<Zstring> parentPath = getParentFolderPath(dirPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    try
    {
        createDirectory(dirPath); //throw FileError, ErrorTargetExisting
    }
    catch (ErrorTargetExisting&) {} //possible, if createDirectoryIfMissingRecursion() is run in parallel
}

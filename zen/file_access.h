// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include <optional>
#include "file_error.h"


namespace zen
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//distinguish error/not existing: "not existing" only if lstat() reports ENOENT
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no parent for "/" and relative single names
Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing

void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorTargetExisting

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857

// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_type.h"
#include <zen/zstring.h>

using namespace zen;
using namespace nftp;


namespace
{
const char* const textFileExtensions[] =
{
    "txt", "md", "html", "htm", "css", "js", "json", "xml", "csv", "log", "ini",
    "conf", "cfg", "py", "java", "c", "cpp", "h", "sh", "bat", "yaml", "yml", "toml",
};
}


bool nftp::isBinaryFile(std::string_view fileName) //nothrow
{
    //consider file name only: "dir.txt/file" has no extension
    const std::string_view itemName = afterLast(fileName, FILE_NAME_SEPARATOR, IfNotFoundReturn::all);

    //leading dots do not start an extension: ".bashrc", ".txt"
    const std::string_view stem = makeStringView(std::find_if(itemName.begin(), itemName.end(), [](char c) { return c != '.'; }), itemName.end());

    if (!contains(stem, '.'))
        return true;

    const std::string_view extension = afterLast(stem, '.', IfNotFoundReturn::none);

    return std::none_of(std::begin(textFileExtensions), std::end(textFileExtensions),
    [&](const char* ext) { return equalAsciiNoCase(extension, ext); });
}


TransferMode nftp::selectTransferMode(std::string_view fileName)
{
    return isBinaryFile(fileName) ? TransferMode::binary : TransferMode::ascii;
}

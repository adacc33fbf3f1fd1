// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "log_file.h"
#include <zen/file_access.h>
#include <zen/file_io.h>

using namespace zen;
using namespace nftp;


void LogFileWriter::append(const std::string& stream) //throw FileError
{
    if (!parentFolderCreated_)
    {
        if (const std::optional<Zstring> parentPath = getParentFolderPath(filePath_))
            createDirectoryIfMissingRecursion(*parentPath); //throw FileError
        parentFolderCreated_ = true;
    }

    appendFileContent(filePath_, stream); //throw FileError
}


void LogFileWriter::write(const LogEntry& entry) //throw FileError
{
    append(formatMessage(entry)); //throw FileError
}


void LogFileWriter::write(const ErrorLog& log) //throw FileError
{
    std::string stream;
    for (const LogEntry& entry : log)
        stream += formatMessage(entry);

    if (!stream.empty())
        append(stream); //throw FileError
}

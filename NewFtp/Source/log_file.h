// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LOG_FILE_H_1473928465013276
#define LOG_FILE_H_1473928465013276

#include <zen/error_log.h>
#include <zen/file_error.h>


namespace nftp
{
//append "[2024-01-31 13:45:00]  Error:  text" lines; file and parent folder are created on first write
class LogFileWriter
{
public:
    explicit LogFileWriter(const Zstring& filePath) : filePath_(filePath) {}

    void write(const zen::LogEntry& entry); //throw FileError
    void write(const zen::ErrorLog& log);   //

    const Zstring& getFilePath() const { return filePath_; }

private:
    LogFileWriter           (const LogFileWriter&) = delete;
    LogFileWriter& operator=(const LogFileWriter&) = delete;

    void append(const std::string& stream); //throw FileError

    const Zstring filePath_;
    bool parentFolderCreated_ = false;
};
}

#endif //LOG_FILE_H_1473928465013276

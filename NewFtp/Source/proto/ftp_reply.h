// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_REPLY_H_7502381946230581
#define FTP_REPLY_H_7502381946230581

#include <optional>
#include <vector>
#include <zen/zstring.h>


namespace nftp
{
//https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
const int FTP_REPLY_FILE_STATUS_OK      = 150;
const int FTP_REPLY_COMMAND_OK          = 200;
const int FTP_REPLY_FEATURES            = 211;
const int FTP_REPLY_SERVICE_READY       = 220;
const int FTP_REPLY_TRANSFER_COMPLETE   = 226;
const int FTP_REPLY_PASSIVE_MODE        = 227;
const int FTP_REPLY_LOGGED_IN           = 230;
const int FTP_REPLY_PATH_CREATED        = 257;
const int FTP_REPLY_NEED_PASSWORD       = 331;
const int FTP_REPLY_NOT_LOGGED_IN       = 530;


struct FtpReply
{
    std::optional<int> code; //none: reply line could not be parsed
    std::string message;     //trimmed; raw line if unparsable

    bool operator==(const FtpReply&) const = default;
};

//"230 Login successful." => {230, "Login successful."}
FtpReply parseFtpReply(std::string_view line); //nothrow: logs an error for unparsable lines


enum class ReplyCategory
{
    none,
    positivePreliminary  = 1, //1xx
    positiveCompletion   = 2, //2xx
    positiveIntermediate = 3, //3xx
    transientNegative    = 4, //4xx
    permanentNegative    = 5, //5xx
};
ReplyCategory getReplyCategory(int code);

std::wstring formatFtpStatus(int code);


//split a raw server buffer into non-empty lines (CR, LF and NUL separated)
std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

//final reply of a (multi-line) server buffer: last line of form "ddd text"
std::optional<FtpReply> parseLastFtpReply(const std::string& buf);
}

#endif //FTP_REPLY_H_7502381946230581

// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_reply.h"
#include <zen/extra_log.h>

using namespace zen;
using namespace nftp;


namespace
{
bool hasReplyCode(std::string_view line)
{
    return line.size() >= 3 &&
           isDigit(line[0]) &&
           isDigit(line[1]) &&
           isDigit(line[2]);
}
}


FtpReply nftp::parseFtpReply(std::string_view line) //nothrow
{
    if (!hasReplyCode(line))
    {
        logExtraError(L"Cannot parse FTP reply: " + utfTo<std::wstring>(line));
        return {std::nullopt, std::string(line)};
    }

    const int code = (line[0] - '0') * 100 +
                     (line[1] - '0') * 10 +
                     (line[2] - '0');

    return {code, std::string(trimCpy(line.substr(3)))};
}


ReplyCategory nftp::getReplyCategory(int code)
{
    switch (code / 100)
    {
        //*INDENT-OFF*
        case 1: return ReplyCategory::positivePreliminary;
        case 2: return ReplyCategory::positiveCompletion;
        case 3: return ReplyCategory::positiveIntermediate;
        case 4: return ReplyCategory::transientNegative;
        case 5: return ReplyCategory::permanentNegative;
        default: return ReplyCategory::none;
        //*INDENT-ON*
    }
}


std::wstring nftp::formatFtpStatus(int code)
{
    const std::wstring_view statusText = [&]() -> std::wstring_view
    {
        switch (code)
        {
            //*INDENT-OFF*
            case 400: return L"The command was not accepted but the error condition is temporary.";
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 434: return L"Requested host unavailable.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 522: return L"Server does not support the requested network protocol.";
            case 530: return L"User not logged in.";
            case 532: return L"Need account for storing files.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 551: return L"Requested action aborted. Page type unknown.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (statusText.empty())
        return replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(code));
    else
        return replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(code)) + std::wstring(statusText);
}


std::vector<std::string_view> nftp::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    split2(buf, [](char c) { return isLineBreak(c) || c == '\0'; },
    [&lines](const std::string_view block)
    {
        if (!block.empty()) //consider <CR><LF>
            lines.push_back(block);
    });

    return lines;
}


std::optional<FtpReply> nftp::parseLastFtpReply(const std::string& buf)
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);

    //"230-" marks a continuation line, "230 " the final one
    for (auto it = lines.rbegin(); it != lines.rend(); ++it)
        if (it->size() >= 4 && hasReplyCode(*it) && (*it)[3] == ' ')
            return parseFtpReply(*it);

    return std::nullopt;
}

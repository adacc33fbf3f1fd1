// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <iostream>
#include <memory>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <libcurl/curl_wrap.h>
#include "proto/file_type.h"
#include "config.h"
#include "ftp_session.h"
#include "log_file.h"
#include "return_codes.h"

using namespace zen;
using namespace nftp;


namespace
{
DEFINE_NEW_FILE_ERROR(ErrorCommandLine)

const Zchar DEFAULT_CONFIG_FILE[] = Zstr("client_config.json");


void showSyntaxHelp()
{
    std::cout <<
              "Syntax:\n\n"
              "newftp [--config FILE] ls [PATH]        List remote directory\n"
              "newftp [--config FILE] pwd              Show remote working directory\n"
              "newftp [--config FILE] quote COMMAND... Send raw FTP command\n"
              "newftp [--config FILE] test             Check connection to server\n"
              "newftp parse-mlsd FILE                  Parse saved MLSD listing\n"
              "newftp parse-list FILE                  Parse saved LIST listing\n"
              "newftp transfer-mode FILE_NAME...       Show automatic transfer mode\n\n"
              "--config FILE: JSON client configuration (default: " << DEFAULT_CONFIG_FILE << ")\n";
}


std::string formatListingEntry(const FtpListingEntry& entry)
{
    if (entry.type == FtpItemType::unknown)
        return "?          " + entry.name;

    std::string line;
    line += entry.type == FtpItemType::dir ? 'd' : '-';
    line += entry.permissions ? *entry.permissions : "---------";
    line += ' ';

    std::string sizeStr = entry.size ? numberTo<std::string>(*entry.size) : "";
    if (sizeStr.size() < 12)
        sizeStr.insert(0, 12 - sizeStr.size(), ' ');
    line += sizeStr;

    if (entry.modified)
        line += "  " + *entry.modified;

    line += "  " + entry.name;
    return line;
}


void printListing(const std::vector<FtpListingEntry>& entries)
{
    for (const FtpListingEntry& entry : entries)
        std::cout << formatListingEntry(entry) << '\n';
}


std::vector<FtpListingEntry> parseListingFile(const Zstring& filePath, ListingFormat format) //throw FileError
{
    const std::string rawListing = getFileContent(filePath); //throw FileError
    return parseListing(splitFtpResponse(rawListing), format);
}


FtpSessionCfg getSessionCfg(const ClientConfig& cfg)
{
    FtpSessionCfg sessionCfg;
    sessionCfg.server     = cfg.defaultHost;
    sessionCfg.port       = cfg.defaultPort;
    sessionCfg.username   = cfg.username;
    sessionCfg.password   = cfg.password;
    sessionCfg.timeoutSec = cfg.timeoutSec;
    sessionCfg.connectionMode = cfg.passiveMode ? ConnectionMode::passive : ConnectionMode::active;
    sessionCfg.transferMode   = cfg.transferMode == TransferModeCfg::ascii ? TransferMode::ascii : TransferMode::binary;
    return sessionCfg;
}


//run FTP session command, report errors in context of the server
template <class Function>
void accessFtpServer(const ClientConfig& cfg, Function useSession) //throw FileError
{
    try
    {
        FtpSession session(getSessionCfg(cfg));
        useSession(session); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy<std::wstring>(L"Cannot access FTP server %x.", L"%x",
                                                 fmtPath(utfTo<std::wstring>(cfg.defaultHost + ':' + numberTo<std::string>(cfg.defaultPort)))), e.toString());
    }
}


NftpExitCode runCommandLine(const std::vector<Zstring>& commandArgs, std::unique_ptr<LogFileWriter>& logFile) //throw FileError, ErrorCommandLine
{
    const char* optionConfig = "--config";

    auto isHelpRequest = [](const Zstring& arg)
    {
        auto it = std::find_if(arg.begin(), arg.end(), [](Zchar c) { return c != Zstr('-'); });
        if (it == arg.begin()) return false; //require at least one prefix character

        const Zstring argTmp(it, arg.end());
        return equalAsciiNoCase(argTmp, "help") ||
               equalAsciiNoCase(argTmp, "h")    ||
               argTmp == Zstr("?");
    };

    Zstring configFilePath = DEFAULT_CONFIG_FILE;

    auto it = commandArgs.begin();
    for (; it != commandArgs.end() && startsWith(*it, Zstr('-')); ++it)
        if (isHelpRequest(*it))
        {
            showSyntaxHelp();
            return NftpExitCode::success;
        }
        else if (equalAsciiNoCase(*it, optionConfig))
        {
            if (++it == commandArgs.end())
                throw ErrorCommandLine(replaceCpy<std::wstring>(L"A file path is expected after %x.", L"%x", utfTo<std::wstring>(optionConfig)));
            configFilePath = *it;
        }
        else
            throw ErrorCommandLine(replaceCpy<std::wstring>(L"Unknown command line option %x.", L"%x", fmtPath(*it)));

    if (it == commandArgs.end())
        throw ErrorCommandLine(L"No command specified.");

    const Zstring command = *it++;
    const std::vector<Zstring> params(it, commandArgs.end());

    auto expectParamCount = [&](size_t minCount, size_t maxCount)
    {
        if (params.size() < minCount || params.size() > maxCount)
            throw ErrorCommandLine(replaceCpy<std::wstring>(L"Wrong number of arguments for command %x.", L"%x", fmtPath(command)));
    };
    //-------------------------------------------------------------------------------
    //offline commands: no configuration needed
    if (command == Zstr("parse-mlsd") || command == Zstr("parse-list"))
    {
        expectParamCount(1, 1);
        printListing(parseListingFile(params[0], command == Zstr("parse-mlsd") ? ListingFormat::mlsd : ListingFormat::list)); //throw FileError
        return NftpExitCode::success;
    }

    if (command == Zstr("transfer-mode"))
    {
        if (params.empty())
            throw ErrorCommandLine(L"File name is missing.");

        for (const Zstring& fileName : params)
            std::cout << utfTo<std::string>(getModeName(selectTransferMode(fileName))) << "  " << fileName << '\n';
        return NftpExitCode::success;
    }
    //-------------------------------------------------------------------------------
    if (command != Zstr("ls")  &&
        command != Zstr("pwd") &&
        command != Zstr("quote") &&
        command != Zstr("test"))
        throw ErrorCommandLine(replaceCpy<std::wstring>(L"Unknown command %x.", L"%x", fmtPath(command)));

    const ClientConfig cfg = loadConfig(configFilePath); //throw FileError

    setExtraLogLevel(cfg.logLevel);
    if (!cfg.logFilePath.empty())
        logFile = std::make_unique<LogFileWriter>(cfg.logFilePath);

    NftpExitCode rc = NftpExitCode::success;

    if (command == Zstr("ls"))
    {
        expectParamCount(0, 1);
        const std::string dirPath = params.empty() ? "/" : utfTo<std::string>(params[0]);

        accessFtpServer(cfg, [&](FtpSession& session) { printListing(session.listDirectory(dirPath)); }); //throw FileError
    }
    else if (command == Zstr("pwd"))
    {
        expectParamCount(0, 0);
        accessFtpServer(cfg, [&](FtpSession& session) { std::cout << session.getWorkingDirectory() << '\n'; }); //throw FileError
    }
    else if (command == Zstr("quote"))
    {
        if (params.empty())
            throw ErrorCommandLine(L"FTP command is missing.");

        std::string ftpCmd;
        for (const Zstring& param : params)
            ftpCmd += (ftpCmd.empty() ? "" : " ") + utfTo<std::string>(param);

        accessFtpServer(cfg, [&](FtpSession& session) //throw FileError
        {
            const FtpReply reply = session.runCommand(ftpCmd); //throw SysError
            if (!reply.code)
            {
                std::cout << reply.message << '\n';
                raiseExitCode(rc, NftpExitCode::error);
                return;
            }

            std::cout << *reply.code << ' ' << reply.message << '\n';

            const ReplyCategory category = getReplyCategory(*reply.code);
            if (category == ReplyCategory::transientNegative ||
                category == ReplyCategory::permanentNegative)
            {
                logExtraError(formatFtpStatus(*reply.code));
                raiseExitCode(rc, NftpExitCode::error);
            }
        });
    }
    else if (command == Zstr("test"))
    {
        expectParamCount(0, 0);
        accessFtpServer(cfg, [&](FtpSession& session) //throw FileError
        {
            session.testConnection(); //throw SysError
            std::cout << "Connection OK: " << cfg.defaultHost << ':' << cfg.defaultPort << '\n';
        });
    }
    return rc;
}
}


int main(int argc, char* argv[])
{
    libcurlInit();
    ZEN_ON_SCOPE_EXIT(libcurlTearDown());

    std::unique_ptr<LogFileWriter> logFile; //set after reading config

    setExtraLogSink([&](const LogEntry& entry) //nothrow!
    {
        const std::string msgFmt = formatMessage(entry);
        std::cerr << msgFmt;

        if (logFile)
            try
            {
                logFile->write(entry); //throw FileError
            }
            catch (const FileError& e)
            {
                logFile.reset(); //report once only
                std::cerr << utfTo<std::string>(e.toString()) << '\n';
            }
    });
    ZEN_ON_SCOPE_EXIT(setExtraLogSink(nullptr));

    const std::vector<Zstring> commandArgs(argv + std::min(argc, 1), argv + argc); //skip exe path

    try
    {
        return static_cast<int>(runCommandLine(commandArgs, logFile)); //throw FileError, ErrorCommandLine
    }
    catch (const ErrorCommandLine& e)
    {
        std::cerr << utfTo<std::string>(e.toString()) << "\n\n";
        showSyntaxHelp();
        return static_cast<int>(NftpExitCode::usage);
    }
    catch (const FileError& e)
    {
        logExtraError(e.toString());
        return static_cast<int>(NftpExitCode::error);
    }
}

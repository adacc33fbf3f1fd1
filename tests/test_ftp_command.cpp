// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <stdexcept>
#include "../NewFtp/Source/proto/ftp_command.h"
#include "../NewFtp/Source/proto/file_type.h"
#include "../NewFtp/Source/ftp_session.h"
#include "test_common.h"

using namespace zen;
using namespace nftp;
using namespace test;


// =================== A. Command Wrapper ===================
void testCommandWrapper(TestStats& stats)
{
    std::cout << "\n[A. Command Wrapper]\n";

    fetchExtraLog(); //discard previous entries

    const int rv = invokeFtpCommand("list", [](const std::string& path, int depth)
    {
        return static_cast<int>(path.size()) + depth;
    }, std::string("/pub"), 3);

    check(stats, rv == 7, "return value passed through");

    ErrorLog log = fetchExtraLog();
    check(stats, logContains(log, MSG_TYPE_DEBUG, "LIST /pub 3"), "command and arguments logged");
    check(stats, !logContains(log, MSG_TYPE_ERROR, "LIST"), "no error logged on success");

    invokeFtpCommand("type", [](TransferMode) {}, TransferMode::ascii);
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_DEBUG, "TYPE ASCII"), "mode argument logged by name");

    int callCount = 0;
    invokeFtpCommand("noop", [&] { ++callCount; });
    check(stats, callCount == 1, "invoked exactly once");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_DEBUG, "NOOP"), "command without arguments logged");

    std::wstring caughtMsg;
    try
    {
        invokeFtpCommand("cwd", [](const char*) { throw SysError(L"Directory not found."); }, "/missing");
    }
    catch (const SysError& e) { caughtMsg = e.toString(); }

    check(stats, caughtMsg == L"Directory not found.", "original SysError rethrown unchanged");
    log = fetchExtraLog();
    check(stats, logContains(log, MSG_TYPE_DEBUG, "CWD /missing"), "failing command logged before invocation");
    check(stats, logContains(log, MSG_TYPE_ERROR, "CWD failed: Directory not found."), "failure logged as error");

    checkThrows<std::runtime_error>(stats, []
    {
        invokeFtpCommand("stor", [] { throw std::runtime_error("disk full"); });
    }, "other exception types rethrown");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_ERROR, "STOR failed: disk full"), "std::exception message logged");
}


// =================== B. Transfer and Connection Modes ===================
void testModes(TestStats& stats)
{
    std::cout << "\n[B. Transfer and Connection Modes]\n";

    check(stats, getTypeCode(TransferMode::ascii) == 'A' && getTypeCode(TransferMode::binary) == 'I', "type codes");
    check(stats, getTypeCommand(TransferMode::binary) == "TYPE I", "TYPE I command");
    check(stats, getTypeCommand(TransferMode::ascii) == "TYPE A", "TYPE A command");

    check(stats, getCommandFamily(ConnectionMode::active) == "PORT", "active => PORT");
    check(stats, getCommandFamily(ConnectionMode::passive) == "PASV", "passive => PASV");

    check(stats, parseTransferMode("ascii") == TransferMode::ascii, "parse \"ascii\"");
    check(stats, parseTransferMode(" Binary ") == TransferMode::binary, "parse \"Binary\" with blanks");
    check(stats, parseTransferMode("i") == TransferMode::binary, "parse wire code \"i\"");
    check(stats, !parseTransferMode("ebcdic"), "unsupported transfer mode");

    check(stats, parseConnectionMode("PASSIVE") == ConnectionMode::passive, "parse \"PASSIVE\"");
    check(stats, parseConnectionMode("port") == ConnectionMode::active, "parse \"port\"");
    check(stats, !parseConnectionMode(""), "empty connection mode");
}


// =================== C. File Type Detection ===================
void testFileType(TestStats& stats)
{
    std::cout << "\n[C. File Type Detection]\n";

    check(stats, !isBinaryFile("readme.txt"), "readme.txt => text");
    check(stats, !isBinaryFile("INDEX.HTML"), "extension case-insensitive");
    check(stats, !isBinaryFile("/var/www/site.config.json"), "last extension counts");
    check(stats, isBinaryFile("image.png"), "image.png => binary");
    check(stats, isBinaryFile("Makefile"), "no extension => binary");
    check(stats, isBinaryFile("docs.txt/archive"), "folder extension ignored");
    check(stats, isBinaryFile("file."), "empty extension => binary");
    check(stats, isBinaryFile(".txt") && isBinaryFile(".c") && isBinaryFile(".h"), "dot file named like an extension => binary");
    check(stats, isBinaryFile("/home/user/.bashrc"), "hidden file without extension => binary");
    check(stats, isBinaryFile("..txt"), "multiple leading dots => binary");
    check(stats, !isBinaryFile(".profile.sh"), "hidden file with text extension => text");

    check(stats, selectTransferMode("notes.md") == TransferMode::ascii, "auto mode: text => ASCII");
    check(stats, selectTransferMode("setup.exe") == TransferMode::binary, "auto mode: binary => BINARY");
}


// =================== D. Log Buffer ===================
void testLogBuffer(TestStats& stats)
{
    std::cout << "\n[D. Log Buffer]\n";

    fetchExtraLog(); //discard previous entries

    for (size_t i = 0; i < 2 * EXTRA_LOG_BUFFER_MAX + 10; ++i)
        logExtraDebug(L"entry " + numberTo<std::wstring>(i));

    const ErrorLog log = fetchExtraLog();
    check(stats, !log.empty() && log.size() <= EXTRA_LOG_BUFFER_MAX, "unfetched log is bounded");
    check(stats, !log.empty() && log.back().message == "entry " + numberTo<std::string>(2 * EXTRA_LOG_BUFFER_MAX + 9), "newest entry kept");
    check(stats, !logContains(log, MSG_TYPE_DEBUG, "entry 0"), "oldest entries discarded first");
    check(stats, fetchExtraLog().empty(), "fetch drains the log");
}


// =================== E. Server Responses ===================
void testServerResponses(TestStats& stats)
{
    std::cout << "\n[E. Server Responses]\n";

    FtpFeatures features = parseFeatResponse("211-Features:\r\n"
                                              " MDTM\r\n"
                                              " MLST type*;size*;modify*;\r\n"
                                              " UTF8\r\n"
                                              " CLNT\r\n"
                                              "211 End\r\n");
    check(stats, features.mlsd && features.utf8 && features.clnt, "FEAT: MLST, UTF8, CLNT");

    features = parseFeatResponse("211-Extensions supported:\r\n"
                                 "211-MLSD\r\n"
                                 "211 End of extentions.\r\n");
    check(stats, features.mlsd && !features.utf8, "FEAT: multi-line RFC 2228 format");

    check(stats, parseFeatResponse("500 FEAT not understood\r\n") == FtpFeatures(), "FEAT not supported");

    check(stats, parsePwdResponse("257 \"/home/user\" is current directory.\r\n") == "/home/user", "PWD");
    check(stats, parsePwdResponse("257 \"/a \"\"quoted\"\" dir\" created\r\n") == "/a \"quoted\" dir", "PWD: quote doubling");
    checkThrows<SysError>(stats, [] { parsePwdResponse("550 Permission denied\r\n"); }, "PWD: negative reply throws");
    checkThrows<SysError>(stats, [] { parsePwdResponse("257 no quotes\r\n"); }, "PWD: missing path throws");
}


int main()
{
    setExtraLogLevel(MSG_TYPE_DEBUG);

    TestStats stats;
    testCommandWrapper(stats);
    testModes(stats);
    testFileType(stats);
    testLogBuffer(stats);
    testServerResponses(stats);

    stats.print();
    return stats.exitCode();
}

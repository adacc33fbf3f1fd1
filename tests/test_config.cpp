// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <functional>
#include <unistd.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include "../NewFtp/Source/config.h"
#include "../NewFtp/Source/log_file.h"
#include "test_common.h"

using namespace zen;
using namespace nftp;
using namespace test;


namespace
{
Zstring createTempFolder()
{
    char tmpl[] = "/tmp/newftp_test_XXXXXX";
    if (!::mkdtemp(tmpl))
        throw FileError(L"Cannot create temporary folder.", formatSystemError("mkdtemp", getLastError()));
    return tmpl;
}


std::wstring getErrorText(const std::function<void()>& fun)
{
    try
    {
        fun();
    }
    catch (const FileError& e) { return e.toString(); }
    return {};
}
}


// =================== A. Default Configuration ===================
void testDefaultConfig(TestStats& stats, const Zstring& tempFolder)
{
    std::cout << "\n[A. Default Configuration]\n";

    const Zstring cfgPath = appendPath(tempFolder, Zstr("sub/client_config.json"));
    fetchExtraLog(); //discard previous entries

    const ClientConfig cfg = loadConfig(cfgPath); //throw FileError
    check(stats, cfg == ClientConfig(), "missing file => defaults");
    check(stats, cfg.defaultHost == "localhost" && cfg.defaultPort == 21 && cfg.passiveMode, "default values");
    check(stats, cfg.transferMode == TransferModeCfg::automatic && cfg.logLevel == MSG_TYPE_INFO, "default modes");
    check(stats, itemExists(cfgPath), "default file created, including parent folder");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_WARNING, "not found"), "warning for missing file");

    check(stats, loadConfig(cfgPath) == ClientConfig(), "created file loads as defaults");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_INFO, "Configuration loaded"), "info message on load");
}


// =================== B. Custom Values ===================
void testCustomConfig(TestStats& stats, const Zstring& tempFolder)
{
    std::cout << "\n[B. Custom Values]\n";

    const Zstring cfgPath = appendPath(tempFolder, Zstr("custom.json"));
    setFileContent(cfgPath,
                   "{\n"
                   "    // production server\n"
                   "    \"default_host\": \"ftp.example.com\",\n"
                   "    \"default_port\": 2121,\n"
                   "    \"username\": \"alice\",\n"
                   "    \"passive_mode\": false,\n"
                   "    // \"timeout\": 5,\n"
                   "    \"transfer_mode\": \"ASCII\",\n"
                   "    \"log_level\": \"debug\",\n"
                   "    \"log_file\": \"/var/log/newftp.log\",\n"
                   "    \"unknown_key\": [1, 2]\n"
                   "}\n"); //throw FileError

    const ClientConfig cfg = loadConfig(cfgPath); //throw FileError
    check(stats, cfg.defaultHost == "ftp.example.com" && cfg.defaultPort == 2121, "host and port");
    check(stats, cfg.username == "alice" && cfg.password.empty(), "credentials");
    check(stats, !cfg.passiveMode, "active mode");
    check(stats, cfg.timeoutSec == 30, "commented-out key ignored");
    check(stats, cfg.transferMode == TransferModeCfg::ascii, "transfer mode case-insensitive");
    check(stats, cfg.logLevel == MSG_TYPE_DEBUG, "log level case-insensitive");
    check(stats, cfg.logFilePath == Zstr("/var/log/newftp.log"), "log file path");
}


// =================== C. Invalid Values ===================
void testInvalidValues(TestStats& stats, const Zstring& tempFolder)
{
    std::cout << "\n[C. Invalid Values]\n";

    const Zstring cfgPath = appendPath(tempFolder, Zstr("invalid.json"));
    setFileContent(cfgPath,
                   "{\n"
                   "    \"default_host\": 42,\n"
                   "    \"default_port\": 70000,\n"
                   "    \"timeout\": null,\n"
                   "    \"passive_mode\": \"yes\",\n"
                   "    \"transfer_mode\": \"ebcdic\"\n"
                   "}\n"); //throw FileError
    fetchExtraLog(); //discard previous entries

    const ClientConfig cfg = loadConfig(cfgPath); //throw FileError
    check(stats, cfg == ClientConfig(), "invalid values => defaults");

    const ErrorLog log = fetchExtraLog();
    check(stats, logContains(log, MSG_TYPE_WARNING, "\"default_host\" is not a string"), "type mismatch warning");
    check(stats, logContains(log, MSG_TYPE_WARNING, "\"passive_mode\" is not a boolean"), "boolean mismatch warning");
    check(stats, logContains(log, MSG_TYPE_WARNING, "port out of range"), "port range warning");
    check(stats, logContains(log, MSG_TYPE_WARNING, "invalid value for \"transfer_mode\""), "enum value warning");
    check(stats, !logContains(log, MSG_TYPE_WARNING, "\"timeout\""), "null silently uses default");
    check(stats, getStats(log).warning == 4 && getStats(log).error == 0, "one warning per invalid value");
}


// =================== D. Malformed Files ===================
void testMalformedFiles(TestStats& stats, const Zstring& tempFolder)
{
    std::cout << "\n[D. Malformed Files]\n";

    const Zstring cfgPath = appendPath(tempFolder, Zstr("broken.json"));

    setFileContent(cfgPath, "{\n    \"default_host\": \"x\"\n    \"default_port\": 21\n}\n"); //throw FileError
    std::wstring errorMsg = getErrorText([&] { loadConfig(cfgPath); });
    check(stats, contains(errorMsg, L"Error parsing file"), "syntax error => FileError");
    check(stats, contains(errorMsg, L"row 3"), "error position reported");

    setFileContent(cfgPath, "[1, 2, 3]"); //throw FileError
    errorMsg = getErrorText([&] { loadConfig(cfgPath); });
    check(stats, contains(errorMsg, L"does not contain a valid configuration"), "non-object => FileError");
}


// =================== E. Save and Reload ===================
void testSaveConfig(TestStats& stats, const Zstring& tempFolder)
{
    std::cout << "\n[E. Save and Reload]\n";

    ClientConfig cfg;
    cfg.defaultHost  = "files.example.org";
    cfg.defaultPort  = 990;
    cfg.username     = "bob";
    cfg.password     = "p\"w\\d";
    cfg.timeoutSec   = 5;
    cfg.passiveMode  = false;
    cfg.transferMode = TransferModeCfg::binary;
    cfg.logLevel     = MSG_TYPE_WARNING;
    cfg.logFilePath  = appendPath(tempFolder, Zstr("client.log"));

    const Zstring cfgPath = appendPath(tempFolder, Zstr("saved.json"));
    saveConfig(cfg, cfgPath); //throw FileError
    check(stats, loadConfig(cfgPath) == cfg, "saved configuration reloads unchanged");

    check(stats, parseLogLevel(formatLogLevel(MSG_TYPE_ERROR)) == MSG_TYPE_ERROR, "log level names");
    check(stats, !parseLogLevel("verbose"), "unknown log level");
    check(stats, parseTransferModeCfg("AUTO") == TransferModeCfg::automatic, "\"auto\" transfer mode");
}


// =================== F. Log File ===================
void testLogFile(TestStats& stats, const Zstring& tempFolder)
{
    std::cout << "\n[F. Log File]\n";

    const Zstring logPath = appendPath(tempFolder, Zstr("logs/client.log"));
    LogFileWriter writer(logPath);

    writer.write(LogEntry{std::time(nullptr), MSG_TYPE_INFO, "Connected to ftp.example.com"}); //throw FileError

    ErrorLog log;
    logMsg(log, L"LIST /pub", MSG_TYPE_DEBUG);
    logMsg(log, L"LIST failed: timeout", MSG_TYPE_ERROR);
    writer.write(log); //throw FileError
    writer.write(ErrorLog()); //no-op

    const std::string content = getFileContent(logPath); //throw FileError
    const size_t posConnected = content.find("Connected to ftp.example.com");
    const size_t posList      = content.find("LIST /pub");
    const size_t posFailed    = content.find("LIST failed: timeout");

    check(stats, posConnected != std::string::npos && posList != std::string::npos && posFailed != std::string::npos, "all messages written");
    check(stats, posConnected < posList && posList < posFailed, "messages appended in order");
    check(stats, std::count(content.begin(), content.end(), '\n') == 3, "one line per message");
}


int main()
{
    setExtraLogLevel(MSG_TYPE_DEBUG);

    TestStats stats;
    try
    {
        const Zstring tempFolder = createTempFolder(); //throw FileError

        testDefaultConfig (stats, tempFolder);
        testCustomConfig  (stats, tempFolder);
        testInvalidValues (stats, tempFolder);
        testMalformedFiles(stats, tempFolder);
        testSaveConfig    (stats, tempFolder);
        testLogFile       (stats, tempFolder);
    }
    catch (const FileError& e)
    {
        check(stats, false, "unexpected error: " + utfTo<std::string>(e.toString()));
    }

    stats.print();
    return stats.exitCode();
}

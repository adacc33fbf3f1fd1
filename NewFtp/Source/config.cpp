// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "config.h"
#include <zen/extra_log.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/json.h>

using namespace zen;
using namespace nftp;


namespace
{
//keep row numbers intact for error reporting
std::string removeCommentLines(const std::string& stream)
{
    std::string output;
    bool firstLine = true;
    split(stream, '\n', [&](const std::string_view line)
    {
        if (!std::exchange(firstLine, false))
            output += '\n';

        if (!startsWith(trimCpy(line), "//"))
            output += line;
    });
    return output;
}


class ConfigReader
{
public:
    ConfigReader(const JsonValue& jval, const Zstring& filePath) : jval_(jval), filePath_(filePath) {}

    void read(const std::string& name, std::string& value) const
    {
        if (const JsonValue* child = getChild(name))
        {
            if (child->type == JsonValue::Type::string)
                value = child->primVal;
            else
                reportTypeError(name, L"string");
        }
    }

    void read(const std::string& name, int& value) const
    {
        if (const JsonValue* child = getChild(name))
        {
            const std::string_view num = child->primVal;
            const std::string_view digits = startsWith(num, '-') ? num.substr(1) : num;

            if (child->type == JsonValue::Type::number &&
                !digits.empty() && digits.size() <= 9 &&
                std::all_of(digits.begin(), digits.end(), [](char c) { return isDigit(c); }))
                value = stringTo<int>(num);
            else
                reportTypeError(name, L"integer");
        }
    }

    void read(const std::string& name, bool& value) const
    {
        if (const JsonValue* child = getChild(name))
        {
            if (child->type == JsonValue::Type::boolean)
                value = child->primVal == "true";
            else
                reportTypeError(name, L"boolean");
        }
    }

    template <class T, class Function>
    void read(const std::string& name, T& value, Function parseValue) const
    {
        if (const JsonValue* child = getChild(name))
        {
            if (child->type != JsonValue::Type::string)
                reportTypeError(name, L"string");
            else if (const std::optional<T> parsed = parseValue(child->primVal))
                value = *parsed;
            else
                logExtraWarning(replaceCpy(replaceCpy<std::wstring>(L"Configuration file %x: invalid value for \"%y\": ",
                                                                       L"%x", fmtPath(filePath_)),
                                           L"%y", utfTo<std::wstring>(name)) + utfTo<std::wstring>(child->primVal));
        }
    }

private:
    const JsonValue* getChild(const std::string& name) const
    {
        const JsonValue* child = getChildFromJsonObject(jval_, name);
        if (child && child->type == JsonValue::Type::null)
            return nullptr; //"null" => use default
        return child;
    }

    void reportTypeError(const std::string& name, const std::wstring& expectedType) const
    {
        logExtraWarning(replaceCpy(replaceCpy(replaceCpy<std::wstring>(L"Configuration file %x: \"%y\" is not a %z, using default value.",
                                                                       L"%x", fmtPath(filePath_)),
                                              L"%y", utfTo<std::wstring>(name)),
                                   L"%z", expectedType));
    }

    const JsonValue& jval_;
    const Zstring& filePath_;
};
}


std::string nftp::formatLogLevel(MessageType level)
{
    switch (level)
    {
        //*INDENT-OFF*
        case MSG_TYPE_DEBUG:   return "DEBUG";
        case MSG_TYPE_INFO:    return "INFO";
        case MSG_TYPE_WARNING: return "WARNING";
        case MSG_TYPE_ERROR:   return "ERROR";
        //*INDENT-ON*
    }
    assert(false);
    return "INFO";
}


std::optional<MessageType> nftp::parseLogLevel(std::string_view str)
{
    for (const MessageType level : {MSG_TYPE_DEBUG, MSG_TYPE_INFO, MSG_TYPE_WARNING, MSG_TYPE_ERROR})
        if (equalAsciiNoCase(trimCpy(str), formatLogLevel(level)))
            return level;
    return std::nullopt;
}


std::string nftp::formatTransferModeCfg(TransferModeCfg mode)
{
    switch (mode)
    {
        //*INDENT-OFF*
        case TransferModeCfg::automatic: return "auto";
        case TransferModeCfg::ascii:     return "ascii";
        case TransferModeCfg::binary:    return "binary";
        //*INDENT-ON*
    }
    assert(false);
    return "auto";
}


std::optional<TransferModeCfg> nftp::parseTransferModeCfg(std::string_view str)
{
    for (const TransferModeCfg mode : {TransferModeCfg::automatic, TransferModeCfg::ascii, TransferModeCfg::binary})
        if (equalAsciiNoCase(trimCpy(str), formatTransferModeCfg(mode)))
            return mode;
    return std::nullopt;
}


ClientConfig nftp::loadConfig(const Zstring& filePath) //throw FileError
{
    if (!itemExists(filePath)) //throw FileError
    {
        logExtraWarning(replaceCpy<std::wstring>(L"Configuration file %x not found, creating default configuration.", L"%x", fmtPath(filePath)));

        const ClientConfig defaultCfg;
        saveConfig(defaultCfg, filePath); //throw FileError
        return defaultCfg;
    }

    const std::string stream = removeCommentLines(getFileContent(filePath)); //throw FileError

    JsonValue jval;
    try
    {
        jval = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw FileError(replaceCpy(replaceCpy(replaceCpy<std::wstring>(L"Error parsing file %x, row %y, column %z.",
                                                                       L"%x", fmtPath(filePath)),
                                              L"%y", numberTo<std::wstring>(e.row + 1)),
                                   L"%z", numberTo<std::wstring>(e.col + 1)));
    }

    if (jval.type != JsonValue::Type::object)
        throw FileError(replaceCpy<std::wstring>(L"File %x does not contain a valid configuration.", L"%x", fmtPath(filePath)));

    ClientConfig cfg;
    const ConfigReader in(jval, filePath);

    in.read("default_host", cfg.defaultHost);
    in.read("default_port", cfg.defaultPort);
    in.read("username",     cfg.username);
    in.read("password",     cfg.password);
    in.read("timeout",      cfg.timeoutSec);
    in.read("passive_mode", cfg.passiveMode);
    in.read("transfer_mode", cfg.transferMode, parseTransferModeCfg);
    in.read("log_level",     cfg.logLevel,     parseLogLevel);

    std::string logFilePath;
    in.read("log_file", logFilePath);
    cfg.logFilePath = utfTo<Zstring>(logFilePath);

    if (cfg.defaultPort < 1 || cfg.defaultPort > 65535)
    {
        logExtraWarning(replaceCpy<std::wstring>(L"Configuration file %x: port out of range, using default value.", L"%x", fmtPath(filePath)));
        cfg.defaultPort = ClientConfig().defaultPort;
    }
    if (cfg.timeoutSec <= 0)
    {
        logExtraWarning(replaceCpy<std::wstring>(L"Configuration file %x: invalid timeout, using default value.", L"%x", fmtPath(filePath)));
        cfg.timeoutSec = ClientConfig().timeoutSec;
    }

    logExtraInfo(replaceCpy<std::wstring>(L"Configuration loaded: %x", L"%x", fmtPath(filePath)));
    return cfg;
}


void nftp::saveConfig(const ClientConfig& cfg, const Zstring& filePath) //throw FileError
{
    JsonValue jval(JsonValue::Type::object);
    jval.objectVal.emplace("default_host",  JsonValue(cfg.defaultHost));
    jval.objectVal.emplace("default_port",  JsonValue(cfg.defaultPort));
    jval.objectVal.emplace("username",      JsonValue(cfg.username));
    jval.objectVal.emplace("password",      JsonValue(cfg.password));
    jval.objectVal.emplace("timeout",       JsonValue(cfg.timeoutSec));
    jval.objectVal.emplace("passive_mode",  JsonValue(cfg.passiveMode));
    jval.objectVal.emplace("transfer_mode", JsonValue(formatTransferModeCfg(cfg.transferMode)));
    jval.objectVal.emplace("log_level",     JsonValue(formatLogLevel(cfg.logLevel)));
    if (!cfg.logFilePath.empty())
        jval.objectVal.emplace("log_file", JsonValue(utfTo<std::string>(cfg.logFilePath)));

    if (const std::optional<Zstring> parentPath = getParentFolderPath(filePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(filePath, serializeJson(jval)); //throw FileError
}

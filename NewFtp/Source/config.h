// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONFIG_H_5091836472305182
#define CONFIG_H_5091836472305182

#include <zen/error_log.h>
#include <zen/file_error.h>


namespace nftp
{
enum class TransferModeCfg
{
    automatic, //by file extension
    ascii,
    binary,
};


struct ClientConfig
{
    std::string defaultHost = "localhost";
    int defaultPort = 21;
    std::string username; //empty: anonymous
    std::string password;
    int timeoutSec = 30;
    bool passiveMode = true;
    TransferModeCfg transferMode = TransferModeCfg::automatic;
    zen::MessageType logLevel = zen::MSG_TYPE_INFO;
    Zstring logFilePath; //optional

    bool operator==(const ClientConfig&) const = default;
};


/*  JSON, e.g. client_config.json:
        {
            "default_host": "ftp.example.com",
            "default_port": 21,
            // comment lines are allowed
            "passive_mode": true,
            "transfer_mode": "auto",
            "log_level": "INFO"
        }
    missing file => created with default values
    unknown keys are ignored, values of wrong type are replaced by defaults (with warning)   */
ClientConfig loadConfig(const Zstring& filePath); //throw FileError
void saveConfig(const ClientConfig& cfg, const Zstring& filePath); //throw FileError

std::string formatLogLevel(zen::MessageType level); //"DEBUG", "INFO", "WARNING", "ERROR"
std::optional<zen::MessageType> parseLogLevel(std::string_view str); //case-insensitive

std::string formatTransferModeCfg(TransferModeCfg mode); //"auto", "ascii", "binary"
std::optional<TransferModeCfg> parseTransferModeCfg(std::string_view str);
}

#endif //CONFIG_H_5091836472305182

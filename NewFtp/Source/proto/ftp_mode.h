// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_MODE_H_48103957215436027
#define FTP_MODE_H_48103957215436027

#include <cassert>
#include <optional>
#include <zen/string_tools.h>


namespace nftp
{
enum class TransferMode
{
    ascii,  //TYPE A
    binary, //TYPE I
};

enum class ConnectionMode
{
    active,  //PORT: server connects to client
    passive, //PASV: client connects to server
};


char getTypeCode(TransferMode mode); //'A' or 'I'
std::string getTypeCommand(TransferMode mode); //e.g. "TYPE I"
std::string getCommandFamily(ConnectionMode mode); //"PORT" or "PASV"

std::wstring getModeName(TransferMode   mode); //"ASCII"/"BINARY"
std::wstring getModeName(ConnectionMode mode); //"ACTIVE"/"PASSIVE"

//accepts mode names and wire codes, case-insensitive
std::optional<TransferMode>   parseTransferMode  (std::string_view str);
std::optional<ConnectionMode> parseConnectionMode(std::string_view str);






//######################## implementation ##########################
inline
char getTypeCode(TransferMode mode)
{
    switch (mode)
    {
        //*INDENT-OFF*
        case TransferMode::ascii:  return 'A';
        case TransferMode::binary: return 'I';
        //*INDENT-ON*
    }
    assert(false);
    return 'I';
}


inline
std::string getTypeCommand(TransferMode mode)
{
    return std::string("TYPE ") + getTypeCode(mode);
}


inline
std::string getCommandFamily(ConnectionMode mode)
{
    switch (mode)
    {
        //*INDENT-OFF*
        case ConnectionMode::active:  return "PORT";
        case ConnectionMode::passive: return "PASV";
        //*INDENT-ON*
    }
    assert(false);
    return "PASV";
}


inline
std::wstring getModeName(TransferMode mode)
{
    return mode == TransferMode::ascii ? L"ASCII" : L"BINARY";
}


inline
std::wstring getModeName(ConnectionMode mode)
{
    return mode == ConnectionMode::active ? L"ACTIVE" : L"PASSIVE";
}


inline
std::optional<TransferMode> parseTransferMode(std::string_view str)
{
    using namespace zen;
    const std::string_view mode = trimCpy(str);

    if (equalAsciiNoCase(mode, "ascii") || equalAsciiNoCase(mode, "A"))
        return TransferMode::ascii;
    if (equalAsciiNoCase(mode, "binary") || equalAsciiNoCase(mode, "I"))
        return TransferMode::binary;
    return std::nullopt;
}


inline
std::optional<ConnectionMode> parseConnectionMode(std::string_view str)
{
    using namespace zen;
    const std::string_view mode = trimCpy(str);

    if (equalAsciiNoCase(mode, "active") || equalAsciiNoCase(mode, "PORT"))
        return ConnectionMode::active;
    if (equalAsciiNoCase(mode, "passive") || equalAsciiNoCase(mode, "PASV"))
        return ConnectionMode::passive;
    return std::nullopt;
}
}

#endif //FTP_MODE_H_48103957215436027

// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_ADDRESS_H_2390561874230957
#define FTP_ADDRESS_H_2390561874230957

#include <cstdint>
#include <zen/sys_error.h>


namespace nftp
{
DEFINE_NEW_SYS_ERROR(SysErrorMalformedAddress)


struct FtpAddress
{
    std::string host; //dotted quad
    uint16_t port = 0;

    bool operator==(const FtpAddress&) const = default;
};

/* "227 Entering Passive Mode (192,168,1,10,4,1)." => {"192.168.1.10", 1025}

    h1,h2,h3,h4,p1,p2 may appear anywhere in the line, with or without parentheses */
FtpAddress parsePassiveAddress(std::string_view line); //throw SysErrorMalformedAddress

//"192.168.1.10", 1025 => "192,168,1,10,4,1"
std::string buildActiveCommandArgument(std::string_view host, uint16_t port); //throw SysErrorMalformedAddress
}

#endif //FTP_ADDRESS_H_2390561874230957

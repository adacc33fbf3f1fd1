// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "../NewFtp/Source/proto/ftp_address.h"
#include "test_common.h"

using namespace zen;
using namespace nftp;
using namespace test;


// =================== A. PASV Replies ===================
void testPassiveAddress(TestStats& stats)
{
    std::cout << "\n[A. PASV Replies]\n";

    FtpAddress addr = parsePassiveAddress("227 Entering Passive Mode (192,168,1,10,4,1).");
    check(stats, addr.host == "192.168.1.10" && addr.port == 1025, "standard 227 reply");

    addr = parsePassiveAddress("227 =10,0,0,1,0,21");
    check(stats, addr.host == "10.0.0.1" && addr.port == 21, "numbers without parentheses");

    addr = parsePassiveAddress("227 Passive 2024 ready (10,0,0,5,200,10)");
    check(stats, addr.host == "10.0.0.5" && addr.port == 200 * 256 + 10, "unrelated numbers before the tuple are skipped");

    addr = parsePassiveAddress("(0,0,0,0,255,255)");
    check(stats, addr.host == "0.0.0.0" && addr.port == 65535, "maximum port");

    checkThrows<SysErrorMalformedAddress>(stats, [] { parsePassiveAddress("227 Entering Passive Mode (192,168,1,10,4)."); },
                                          "five numeric groups => malformed address");

    checkThrows<SysErrorMalformedAddress>(stats, [] { parsePassiveAddress("227 Entering Passive Mode."); },
                                          "no numbers => malformed address");

    checkThrows<SysErrorMalformedAddress>(stats, [] { parsePassiveAddress("227 (300,1,1,1,4,1)"); },
                                          "number above 255 => malformed address");
}


// =================== B. PORT Arguments ===================
void testActiveArgument(TestStats& stats)
{
    std::cout << "\n[B. PORT Arguments]\n";

    check(stats, buildActiveCommandArgument("192.168.1.10", 1025) == "192,168,1,10,4,1", "host and port split into six numbers");
    check(stats, buildActiveCommandArgument("127.0.0.1", 0) == "127,0,0,1,0,0", "port 0");
    check(stats, buildActiveCommandArgument("127.0.0.1", 65535) == "127,0,0,1,255,255", "port 65535");

    bool roundTripOk = true;
    for (const uint16_t port : {0, 1, 255, 256, 1025, 21000, 65534, 65535})
        for (const char* host : {"0.0.0.0", "10.20.30.40", "255.255.255.255"})
            if (parsePassiveAddress("227 (" + buildActiveCommandArgument(host, port) + ")") != FtpAddress{host, port})
                roundTripOk = false;
    check(stats, roundTripOk, "PORT argument parsed back yields same host and port");

    checkThrows<SysErrorMalformedAddress>(stats, [] { buildActiveCommandArgument("ftp.example.com", 21); }, "host name => malformed address");
    checkThrows<SysErrorMalformedAddress>(stats, [] { buildActiveCommandArgument("10.0.0", 21); }, "three components => malformed address");
    checkThrows<SysErrorMalformedAddress>(stats, [] { buildActiveCommandArgument("10.0.0.256", 21); }, "component above 255 => malformed address");
    checkThrows<SysErrorMalformedAddress>(stats, [] { buildActiveCommandArgument("10..0.1", 21); }, "empty component => malformed address");
}


int main()
{
    TestStats stats;
    testPassiveAddress(stats);
    testActiveArgument(stats);

    stats.print();
    return stats.exitCode();
}

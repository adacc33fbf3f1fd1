// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "../NewFtp/Source/proto/ftp_listing.h"
#include "../NewFtp/Source/proto/ftp_reply.h"
#include "test_common.h"

using namespace zen;
using namespace nftp;
using namespace test;


// =================== A. MLSD Listing ===================
void testMlsdListing(TestStats& stats)
{
    std::cout << "\n[A. MLSD Listing]\n";

    std::vector<FtpListingEntry> entries = parseMlsdListing({"size=1024;type=file; report.txt"});
    check(stats, entries.size() == 1, "one line => one entry");
    if (entries.size() == 1)
    {
        const FtpListingEntry& e = entries[0];
        check(stats, e.name == "report.txt" && e.type == FtpItemType::file, "name and type");
        check(stats, e.facts == std::map<std::string, std::string>{{"size", "1024"}, {"type", "file"}}, "raw facts");
        check(stats, e.size == 1024u, "size derived from fact");
    }

    entries = parseMlsdListing(
    {
        "type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869; .",
        "Type=Dir;Modify=20170117144634;UNIX.mode=0755;UNIX.owner=ftp;UNIX.group=users; my folder",
        "type=file;size=4;modify=20170113063314.123;UNIX.mode=0640;UNIX.uid=874;UNIX.gid=869; read me.txt",
        "type=OS.unix=slink:/target; link",
    });
    check(stats, entries.size() == 4, "all valid lines parsed, order kept");
    if (entries.size() == 4)
    {
        check(stats, entries[0].name == "." && entries[0].type == FtpItemType::dir, "cdir => dir");
        check(stats, entries[1].name == "my folder" && entries[1].type == FtpItemType::dir, "name with blank, case-insensitive keys");
        check(stats, entries[1].facts.count("modify") == 1 && entries[1].facts.count("Modify") == 0, "keys are lower-cased");
        check(stats, entries[1].owner == "ftp" && entries[1].group == "users", "unix.owner/unix.group");
        check(stats, entries[0].owner == "874" && entries[0].group == "869", "fallback to unix.uid/unix.gid");
        check(stats, entries[1].permissions == "rwxr-xr-x", "unix.mode => permissions");
        check(stats, entries[2].modified == "20170113063314.123", "modify fact kept verbatim");
        check(stats, entries[2].modTime == 1484289194, "modify fact => UTC time");
        check(stats, entries[2].size == 4u && entries[2].permissions == "rw-r-----", "file size and mode");
        check(stats, entries[3].type == FtpItemType::unknown && !entries[3].size, "unknown type");
    }
}


// =================== B. MLSD Errors ===================
void testMlsdErrors(TestStats& stats)
{
    std::cout << "\n[B. MLSD Errors]\n";

    fetchExtraLog(); //discard previous entries

    const std::vector<FtpListingEntry> entries = parseMlsdListing(
    {
        "type=file;size=1; a.txt",
        "type=file;size=2;nofact; b.txt", //fact without '='
        "type=file;size=3;",              //no name
        "",
        "   \r",
        "type=file;size=4; d.txt",
    });
    check(stats, entries.size() == 2 && entries[0].name == "a.txt" && entries[1].name == "d.txt", "malformed and blank lines skipped");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_WARNING, "nofact"), "warning logged for skipped line");

    check(stats, parseMlsdListing({}).empty(), "empty listing");

    checkThrows<SysError>(stats, [] { parseMlsdLine("type=file;size=3;"); }, "single line without name throws");

    const FtpListingEntry huge = parseMlsdLine("type=file;size=99999999999999999999999; huge.bin");
    check(stats, huge.name == "huge.bin" && !huge.size, "size beyond 64 bit => no size");
    check(stats, huge.facts.at("size") == "99999999999999999999999", "raw size fact kept");

    check(stats, parseMlsdLine("type=file;size=18446744073709551615; max.bin").size == 18446744073709551615ull, "largest 64-bit size");
}


// =================== C. LIST Listing ===================
void testUnixListing(TestStats& stats)
{
    std::cout << "\n[C. LIST Listing]\n";

    std::vector<FtpListingEntry> entries = parseUnixListing({"drwxr-xr-x 2 user group 4096 Jan 1 12:00 mydir"});
    check(stats, entries.size() == 1, "one line => one entry");
    if (entries.size() == 1)
    {
        const FtpListingEntry& e = entries[0];
        check(stats, e.type == FtpItemType::dir && e.name == "mydir", "directory name and type");
        check(stats, e.permissions == "rwxr-xr-x" && e.linkCount == 2, "permissions and link count");
        check(stats, e.owner == "user" && e.group == "group", "owner and group");
        check(stats, e.size == 4096u && e.modified == "Jan 1 12:00", "size and date");
        check(stats, e.facts.empty(), "no facts for LIST");
    }

    entries = parseUnixListing(
    {
        "-rw-r--r--   1 www-data www-data   2217 Feb 28  2016 Unit Test.vcxproj.user\r\n",
        "lrwxrwxrwx 1 root root 18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects",
        "-rwsr-xr-T 3 0 0 0 Dec 31 23:59 special",
    });
    check(stats, entries.size() == 3, "three entries");
    if (entries.size() == 3)
    {
        check(stats, entries[0].type == FtpItemType::file && entries[0].name == "Unit Test.vcxproj.user", "file name with blank, line break stripped");
        check(stats, entries[0].owner == "www-data" && entries[0].modified == "Feb 28  2016", "owner with dash, year instead of time");
        check(stats, entries[1].type == FtpItemType::file && entries[1].name == "Projects -> /mnt/hgfs/Projects", "symlink kept verbatim");
        check(stats, entries[2].permissions == "rwsr-xr-T" && entries[2].size == 0u, "special permission bits");
    }
}


// =================== D. LIST Fallback ===================
void testUnixListingFallback(TestStats& stats)
{
    std::cout << "\n[D. LIST Fallback]\n";

    fetchExtraLog(); //discard previous entries

    std::vector<FtpListingEntry> entries = parseUnixListing({"not a valid listing line"});
    check(stats, entries.size() == 1 && entries[0].name == "not a valid listing line" && entries[0].type == FtpItemType::unknown,
          "unrecognized line => unknown entry");
    check(stats, entries.size() == 1 && !entries[0].size && !entries[0].permissions, "unknown entry has no metadata");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_DEBUG, "not a valid listing line"), "debug diagnostic recorded");

    entries = parseUnixListing({"total 4953", "", "  ", "01-10-17  11:58AM       <DIR>          version  "});
    check(stats, entries.size() == 2, "blank lines contribute no entries");
    if (entries.size() == 2)
    {
        check(stats, entries[0].name == "total 4953" && entries[0].type == FtpItemType::unknown, "\"total\" line degrades");
        check(stats, entries[1].name == "01-10-17  11:58AM       <DIR>          version" && entries[1].type == FtpItemType::unknown,
              "DOS format degrades, name trimmed");
    }

    entries = parseUnixListing({"drwxr-xr-x 2 user group 4096 Jan 1 12:00"});
    check(stats, entries.size() == 1 && entries[0].type == FtpItemType::unknown, "missing name => unknown");

    entries = parseUnixListing({"-rw-r--r-- 99999999999 u g 1 Jan 1 2020 a"});
    check(stats, entries.size() == 1 && entries[0].type == FtpItemType::unknown && !entries[0].linkCount, "link count beyond int => unknown");

    entries = parseUnixListing({"-rw-r--r-- 1 u g 99999999999999999999999 Jan 1 2020 a"});
    check(stats, entries.size() == 1 && entries[0].type == FtpItemType::unknown && !entries[0].size, "size beyond 64 bit => unknown");

    entries = parseUnixListing({"-rw-r--r-- 1 u g 5000000000 Jan 1 2020 big.iso"});
    check(stats, entries.size() == 1 && entries[0].size == 5000000000u, "size beyond 32 bit");

    entries = parseUnixListing({"drwxr-xr-x 2 user group 4k Jan 1 12:00 dir"});
    check(stats, entries.size() == 1 && entries[0].type == FtpItemType::unknown, "non-numeric size => unknown");
}


// =================== E. Format Selection and Permissions ===================
void testListingHelpers(TestStats& stats)
{
    std::cout << "\n[E. Format Selection and Permissions]\n";

    const std::string rawListing = "type=file;size=10; a\r\ntype=dir; b\r\n";
    check(stats, parseListing(splitFtpResponse(rawListing), ListingFormat::mlsd).size() == 2, "MLSD strategy");

    const std::string rawList = "-rw-r--r-- 1 u g 10 Jan 1 2020 a\r\n";
    const std::vector<FtpListingEntry> entries = parseListing(splitFtpResponse(rawList), ListingFormat::list);
    check(stats, entries.size() == 1 && entries[0].name == "a" && entries[0].type == FtpItemType::file, "LIST strategy");

    check(stats, formatPermissions(0755) == "rwxr-xr-x", "0755 => rwxr-xr-x");
    check(stats, formatPermissions(0) == "---------", "0 => ---------");
    check(stats, formatPermissions(04755) == "rwsr-xr-x", "setuid shown as s");
    check(stats, formatPermissions(01644) == "rw-r--r-T", "sticky without exec shown as T");

    check(stats, parsePermissions("rwxr-x---") == 0750, "rwxr-x--- => 0750");
    check(stats, parsePermissions("rwxrwsrwt") == 03777, "setgid and sticky");
    check(stats, parsePermissions(formatPermissions(02640)) == 02640, "format and parse agree");
    check(stats, !parsePermissions("rwxr-x--"), "too short => none");
    check(stats, !parsePermissions("rwxq-x---"), "invalid char => none");
}


int main()
{
    setExtraLogLevel(MSG_TYPE_DEBUG);

    TestStats stats;
    testMlsdListing(stats);
    testMlsdErrors(stats);
    testUnixListing(stats);
    testUnixListingFallback(stats);
    testListingHelpers(stats);

    stats.print();
    return stats.exitCode();
}

// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LISTING_H_8821407356198342
#define FTP_LISTING_H_8821407356198342

#include <map>
#include <optional>
#include <vector>
#include <ctime>
#include <zen/sys_error.h>


namespace nftp
{
enum class FtpItemType
{
    file,
    dir,
    unknown,
};


struct FtpListingEntry
{
    std::string name;
    FtpItemType type = FtpItemType::unknown;

    std::optional<uint64_t>    size;
    std::optional<std::string> permissions; //"rwxr-xr-x"
    std::optional<int>         linkCount;
    std::optional<std::string> owner;
    std::optional<std::string> group;
    std::optional<std::string> modified; //as sent by server: "Jan 1 12:00" (LIST), "20170113063314" (MLSD)
    std::optional<time_t>      modTime;  //UTC, MLSD only

    std::map<std::string, std::string> facts; //MLSD only: lower-case key => value

    bool operator==(const FtpListingEntry&) const = default;
};


enum class ListingFormat
{
    mlsd, //RFC 3659 machine-readable facts
    list, //"ls -l"-style text
};

//blank lines are skipped; output order = input order (including "." and "..")
std::vector<FtpListingEntry> parseMlsdListing(const std::vector<std::string_view>& lines); //nothrow: malformed lines are skipped with a warning
std::vector<FtpListingEntry> parseUnixListing(const std::vector<std::string_view>& lines); //nothrow: malformed lines are degraded to FtpItemType::unknown

std::vector<FtpListingEntry> parseListing(const std::vector<std::string_view>& lines, ListingFormat format);

//single line:
FtpListingEntry parseMlsdLine    (std::string_view line); //throw SysError
FtpListingEntry parseUnixListLine(std::string_view line); //throw SysError


//0755 <=> "rwxr-xr-x"; special bits: s/S (setuid, setgid), t/T (sticky)
std::string formatPermissions(int mode);
std::optional<int> parsePermissions(std::string_view text); //nullopt if not 9 valid chars
}

#endif //FTP_LISTING_H_8821407356198342

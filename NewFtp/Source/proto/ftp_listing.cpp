// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_listing.h"
#include <charconv>
#include <functional>
#include <zen/extra_log.h>
#include <zen/time.h>

using namespace zen;
using namespace nftp;


namespace
{
class FtpLineParser
{
public:
    explicit FtpLineParser(const std::string_view& line) : it_(line.begin()), itEnd_(line.end()) {}
    /**/     FtpLineParser(std::string_view&&) = delete;

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw SysError(L"Unexpected end of line.");

        const auto rngEnd = it_ + count;

        if (!std::all_of(it_, rngEnd, acceptChar))
            throw SysError(L"Expected char type not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw SysError(L"Expected char range not found.");

        return makeStringView(std::exchange(it_, rngEnd), rngEnd);
    }

private:
    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


bool isBlankLine(std::string_view line)
{
    return std::all_of(line.begin(), line.end(), [](char c) { return isWhiteSpace(c); });
}


std::string_view trimLineBreaks(std::string_view line)
{
    while (!line.empty() && isLineBreak(line.back()))
        line.remove_suffix(1);
    return line;
}


//nullopt for non-digits or if value does not fit into Num
template <class Num>
std::optional<Num> parseUnsigned(std::string_view str)
{
    if (str.empty() || !std::all_of(str.begin(), str.end(), [](char c) { return isDigit(c); }))
        return std::nullopt; //e.g. "-1"

    Num num = 0;
    const std::from_chars_result rv = std::from_chars(str.data(), str.data() + str.size(), num);
    if (rv.ec != std::errc() || rv.ptr != str.data() + str.size())
        return std::nullopt; //std::errc::result_out_of_range
    return num;
}


//"0755" => 0755
std::optional<int> parseOctalMode(std::string_view str)
{
    if (str.empty() || str.size() > 5 || !std::all_of(str.begin(), str.end(), [](char c) { return '0' <= c && c <= '7'; }))
        return std::nullopt;

    int mode = 0;
    for (const char c : str)
        mode = mode * 8 + (c - '0');
    return mode;
}


//"20170113063314" or "20170113063314.123" (UTC)
std::optional<time_t> parseModifyFact(std::string_view str)
{
    str = beforeFirst(str, '.', IfNotFoundReturn::all); //truncate millisecond precision

    if (str.size() != 14 || !std::all_of(str.begin(), str.end(), [](char c) { return isDigit(c); }))
        return std::nullopt;

    TimeComp tc;
    tc.year   = stringTo<int>(str.substr(0, 4));
    tc.month  = stringTo<int>(str.substr(4, 2));
    tc.day    = stringTo<int>(str.substr(6, 2));
    tc.hour   = stringTo<int>(str.substr(8, 2));
    tc.minute = stringTo<int>(str.substr(10, 2));
    tc.second = stringTo<int>(str.substr(12, 2));

    if (const auto [modTime, timeValid] = utcToTimeT(tc);
        timeValid)
        return modTime;
    return std::nullopt;
}


std::optional<std::string> getFact(const std::map<std::string, std::string>& facts, const std::string& key)
{
    auto it = facts.find(key);
    if (it == facts.end())
        return std::nullopt;
    return it->second;
}
}


FtpListingEntry nftp::parseMlsdLine(std::string_view line) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
        type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder   */
    try
    {
        const std::string_view trimmed = trimCpy(line);

        const auto itBlank = std::find_if(trimmed.begin(), trimmed.end(), [](char c) { return isWhiteSpace(c); });
        if (itBlank == trimmed.end())
            throw SysError(L"Item name not available.");

        const std::string_view factsText = trimmed.substr(0, itBlank - trimmed.begin());

        FtpListingEntry entry;
        entry.name = trimmed.substr(itBlank - trimmed.begin() + 1); //name may contain blanks

        split(factsText, ';', [&](const std::string_view fact)
        {
            if (!fact.empty())
            {
                if (!contains(fact, '='))
                    throw SysError(L"Invalid fact: " + utfTo<std::wstring>(fact));

                std::string key(beforeFirst(fact, '=', IfNotFoundReturn::none));
                for (char& c : key)
                    c = asciiToLower(c);

                entry.facts[key] = afterFirst(fact, '=', IfNotFoundReturn::none);
            }
        });
        //-----------------------------------------------------------------
        if (const std::optional<std::string> typeFact = getFact(entry.facts, "type"))
        {
            if (equalAsciiNoCase(*typeFact, "file"))
                entry.type = FtpItemType::file;
            else if (equalAsciiNoCase(*typeFact, "dir")  ||
                     equalAsciiNoCase(*typeFact, "cdir") ||
                     equalAsciiNoCase(*typeFact, "pdir"))
                entry.type = FtpItemType::dir;
            //symlinks, e.g. "OS.unix=slink:/target", are not specified further
        }

        if (const std::optional<std::string> sizeFact = getFact(entry.facts, "size"))
            entry.size = parseUnsigned<uint64_t>(*sizeFact);

        if (const std::optional<std::string> modifyFact = getFact(entry.facts, "modify"))
        {
            entry.modified = *modifyFact;
            entry.modTime = parseModifyFact(*modifyFact);
        }

        if (const std::optional<std::string> modeFact = getFact(entry.facts, "unix.mode"))
            if (const std::optional<int> mode = parseOctalMode(*modeFact))
                entry.permissions = formatPermissions(*mode);

        entry.owner = getFact(entry.facts, "unix.owner");
        if (!entry.owner)
            entry.owner = getFact(entry.facts, "unix.uid");

        entry.group = getFact(entry.facts, "unix.group");
        if (!entry.group)
            entry.group = getFact(entry.facts, "unix.gid");

        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected MLSD line. (" + utfTo<std::wstring>(line) + L") " + e.toString());
    }
}


FtpListingEntry nftp::parseUnixListLine(std::string_view line) //throw SysError
{
    /* Unix standard listing: "ls -l --all"

        drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
        -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
        -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
        lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

        file type: -:file  l:symlink  d:directory  b:block device  p:named pipe  c:char device  s:socket

        permissions: (r|-)(w|-)(x|s|S|-)    user
                     (r|-)(w|-)(x|s|S|-)    group  s := S + x      S = Setgid
                     (r|-)(w|-)(x|t|T|-)    others t := T + x      T = sticky bit       */
    try
    {
        FtpLineParser parser(line);

        const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        });
        //------------------------------------------------------------------------------------
        const std::string_view permissions = parser.readRange(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(&isWhiteSpace<char>); //throw SysError
        //------------------------------------------------------------------------------------
        //hard-link count (no separators)
        const std::string_view linkCount = parser.readRange(&isDigit<char>); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                               //throw SysError
        //------------------------------------------------------------------------------------
        const std::string_view owner = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                            //throw SysError

        const std::string_view group = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                            //throw SysError
        //------------------------------------------------------------------------------------
        //file size (no separators)
        const std::string_view fileSize = parser.readRange(&isDigit<char>); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                              //throw SysError
        //------------------------------------------------------------------------------------
        //"Jan 10 11:58" or "Feb 28  2016"
        const std::string_view monthStr = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                               //throw SysError

        parser.readRange(&isDigit<char>);      //throw SysError
        parser.readRange(&isWhiteSpace<char>); //throw SysError

        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || c == '_' || isDigit(c) || isAsciiAlpha(c); }); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                                                                             //throw SysError

        const std::string_view modified(monthStr.data(), timeOrYear.data() + timeOrYear.size() - monthStr.data());
        //------------------------------------------------------------------------------------
        const std::string_view itemName = parser.readRange([](char) { return true; }); //throw SysError

        const std::optional<int> linkCountVal = parseUnsigned<int>(linkCount);
        if (!linkCountVal)
            throw SysError(L"Link count out of range.");

        const std::optional<uint64_t> fileSizeVal = parseUnsigned<uint64_t>(fileSize);
        if (!fileSizeVal)
            throw SysError(L"File size out of range.");

        FtpListingEntry entry;
        entry.name        = itemName; //symlinks: "name -> target"
        entry.type        = typeTag == "d" ? FtpItemType::dir : FtpItemType::file;
        entry.permissions = std::string(permissions);
        entry.linkCount   = *linkCountVal;
        entry.owner       = std::string(owner);
        entry.group       = std::string(group);
        entry.size        = *fileSizeVal;
        entry.modified    = std::string(modified);
        return entry;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected LIST line. (" + utfTo<std::wstring>(line) + L") " + e.toString());
    }
}


std::vector<FtpListingEntry> nftp::parseMlsdListing(const std::vector<std::string_view>& lines) //nothrow
{
    std::vector<FtpListingEntry> output;

    for (const std::string_view line : lines)
        if (!isBlankLine(line))
            try
            {
                output.push_back(parseMlsdLine(line)); //throw SysError
            }
            catch (const SysError& e)
            {
                logExtraWarning(L"Failed to parse MLSD line: " + e.toString());
            }

    return output;
}


std::vector<FtpListingEntry> nftp::parseUnixListing(const std::vector<std::string_view>& lines) //nothrow
{
    std::vector<FtpListingEntry> output;

    for (const std::string_view rawLine : lines)
        if (!isBlankLine(rawLine))
        {
            const std::string_view line = trimLineBreaks(rawLine);
            try
            {
                output.push_back(parseUnixListLine(line)); //throw SysError
            }
            catch (const SysError& e)
            {
                //e.g. "total 4953" or non-Unix server formats
                logExtraDebug(L"Cannot parse as Unix format: " + e.toString());

                FtpListingEntry entry;
                entry.name = trimCpy(line);
                entry.type = FtpItemType::unknown;
                output.push_back(entry);
            }
        }

    return output;
}


std::vector<FtpListingEntry> nftp::parseListing(const std::vector<std::string_view>& lines, ListingFormat format)
{
    switch (format)
    {
        case ListingFormat::mlsd:
            return parseMlsdListing(lines);
        case ListingFormat::list:
            return parseUnixListing(lines);
    }
    assert(false);
    return {};
}


std::string nftp::formatPermissions(int mode)
{
    auto formatTriple = [](int bits, bool special, char specialExec, char specialNoExec)
    {
        std::string triple;
        triple += bits & 4 ? 'r' : '-';
        triple += bits & 2 ? 'w' : '-';
        if (special)
            triple += bits & 1 ? specialExec : specialNoExec;
        else
            triple += bits & 1 ? 'x' : '-';
        return triple;
    };

    return formatTriple(mode >> 6, mode & 04000, 's', 'S') +
           formatTriple(mode >> 3, mode & 02000, 's', 'S') +
           formatTriple(mode,      mode & 01000, 't', 'T');
}


std::optional<int> nftp::parsePermissions(std::string_view text)
{
    if (text.size() != 9)
        return std::nullopt;

    int mode = 0;
    for (size_t i = 0; i < 9; ++i)
    {
        const int bitPos = 8 - static_cast<int>(i); //r, w, x of user, group, others
        const char c = text[i];

        switch (i % 3)
        {
            case 0:
                if (c == 'r')
                    mode |= 1 << bitPos;
                else if (c != '-')
                    return std::nullopt;
                break;

            case 1:
                if (c == 'w')
                    mode |= 1 << bitPos;
                else if (c != '-')
                    return std::nullopt;
                break;

            case 2:
            {
                const int specialBit = i == 2 ? 04000 : i == 5 ? 02000 : 01000;
                const char specialExec   = i == 8 ? 't' : 's';
                const char specialNoExec = i == 8 ? 'T' : 'S';

                if (c == 'x')
                    mode |= 1 << bitPos;
                else if (c == specialExec)
                    mode |= (1 << bitPos) | specialBit;
                else if (c == specialNoExec)
                    mode |= specialBit;
                else if (c != '-')
                    return std::nullopt;
                break;
            }
        }
    }
    return mode;
}

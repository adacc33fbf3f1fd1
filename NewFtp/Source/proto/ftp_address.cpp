// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_address.h"
#include <array>

using namespace zen;
using namespace nftp;


namespace
{
const int ADDRESS_NUMBER_MAX = 255;


//nullopt if not a valid octet
std::optional<int> parseOctet(std::string_view digits)
{
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return isDigit(c); }))
        return std::nullopt;

    int num = 0;
    for (const char c : digits)
    {
        num = num * 10 + (c - '0');
        if (num > ADDRESS_NUMBER_MAX)
            return std::nullopt;
    }
    return num;
}


//try to read "d+,d+,d+,d+,d+,d+" starting at the beginning of a digit run
std::optional<std::array<std::string_view, 6>> readAddressNumbers(std::string_view str)
{
    std::array<std::string_view, 6> numbers;
    auto it = str.begin();

    for (size_t i = 0; i < numbers.size(); ++i)
    {
        if (i > 0)
        {
            if (it == str.end() || *it != ',')
                return std::nullopt;
            ++it;
        }
        const auto itNumEnd = std::find_if_not(it, str.end(), [](char c) { return isDigit(c); });
        if (itNumEnd == it)
            return std::nullopt;

        numbers[i] = makeStringView(it, itNumEnd);
        it = itNumEnd;
    }
    return numbers;
}
}


FtpAddress nftp::parsePassiveAddress(std::string_view line) //throw SysErrorMalformedAddress
{
    //leftmost match: a match can only start at the beginning of a digit run
    for (auto it = line.begin(); it != line.end(); ++it)
        if (isDigit(*it) && (it == line.begin() || !isDigit(it[-1])))
            if (const std::optional<std::array<std::string_view, 6>> numbers = readAddressNumbers(makeStringView(it, line.end())))
            {
                std::array<int, 6> octets = {};
                for (size_t i = 0; i < octets.size(); ++i)
                    if (const std::optional<int> octet = parseOctet((*numbers)[i]))
                        octets[i] = *octet;
                    else
                        throw SysErrorMalformedAddress(L"Address number out of range: " + utfTo<std::wstring>((*numbers)[i]) +
                                                       L" (" + utfTo<std::wstring>(line) + L')');

                FtpAddress addr;
                addr.host = numberTo<std::string>(octets[0]) + '.' +
                            numberTo<std::string>(octets[1]) + '.' +
                            numberTo<std::string>(octets[2]) + '.' +
                            numberTo<std::string>(octets[3]);
                addr.port = static_cast<uint16_t>(octets[4] * 256 + octets[5]);
                return addr;
            }

    throw SysErrorMalformedAddress(L"Unexpected PASV response. (" + utfTo<std::wstring>(line) + L')');
}


std::string nftp::buildActiveCommandArgument(std::string_view host, uint16_t port) //throw SysErrorMalformedAddress
{
    std::vector<std::string_view> components;
    split(host, '.', [&](std::string_view block) { components.push_back(block); });

    if (components.size() != 4)
        throw SysErrorMalformedAddress(L"Host is not an IPv4 address: " + utfTo<std::wstring>(host));

    std::string arg;
    for (const std::string_view comp : components)
    {
        const std::optional<int> octet = parseOctet(comp);
        if (!octet)
            throw SysErrorMalformedAddress(L"Host is not an IPv4 address: " + utfTo<std::wstring>(host));

        arg += numberTo<std::string>(*octet) + ',';
    }
    return arg + numberTo<std::string>(port / 256) + ',' + numberTo<std::string>(port % 256);
}

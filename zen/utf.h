// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include <optional>
#include "string_tools.h" //impl::strView


namespace zen
{
//convert char- and wchar_t-based "string-like" objects applying UTF conversions (but only if necessary!)
//char: UTF-8, wchar_t: UTF-32 (Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

constexpr std::string_view BYTE_ORDER_MARK_UTF8 = "\xEF\xBB\xBF";









//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;
using Char8     = uint8_t;

const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;

const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;

static_assert(sizeof(wchar_t) == 4);


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a Char8
{
    if (cp <= 0b111'1111)
        writeOutput(static_cast<Char8>(cp));
    else if (cp <= 0b0111'1111'1111)
    {
        writeOutput(static_cast<Char8>((cp >> 6)        | 0b1100'0000)); //110x xxxx
        writeOutput(static_cast<Char8>((cp & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else if (cp <= 0b1111'1111'1111'1111)
    {
        if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX) //[0xd800, 0xdfff]
            codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
        else
        {
            writeOutput(static_cast<Char8>( (cp >> 12)             | 0b1110'0000)); //1110 xxxx
            writeOutput(static_cast<Char8>(((cp >> 6) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
            writeOutput(static_cast<Char8>( (cp       & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        }
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<Char8>( (cp >> 18)              | 0b1111'0000)); //1111 0xxx
        writeOutput(static_cast<Char8>(((cp >> 12) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<Char8>(((cp >> 6)  & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<Char8>( (cp        & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
}


class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) : it_(str.begin()), last_(str.end()) {}

    std::optional<CodePoint> getNext() //invalid sequences are reported as REPLACEMENT_CHAR
    {
        if (it_ == last_)
            return std::nullopt;

        const Char8 ch = static_cast<Char8>(*it_++);
        CodePoint cp = ch;

        if (ch < 0x80) //1 byte
            ;
        else if (ch >> 5 == 0b110) //2 bytes
        {
            cp &= 0b1'1111;
            if (decodeTrail(cp))
                if (cp <= 0b111'1111) //overlong encoding
                    cp = REPLACEMENT_CHAR;
        }
        else if (ch >> 4 == 0b1110) //3 bytes
        {
            cp &= 0b1111;
            if (decodeTrail(cp) && decodeTrail(cp))
                if (cp <= 0b0111'1111'1111 ||
                    (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
                    cp = REPLACEMENT_CHAR;
        }
        else if (ch >> 3 == 0b11110) //4 bytes
        {
            cp &= 0b111;
            if (decodeTrail(cp) && decodeTrail(cp) && decodeTrail(cp))
                if (cp <= 0b1111'1111'1111'1111 || cp > CODE_POINT_MAX)
                    cp = REPLACEMENT_CHAR;
        }
        else //invalid begin of UTF8 encoding
            cp = REPLACEMENT_CHAR;

        return cp;
    }

private:
    bool decodeTrail(CodePoint& cp)
    {
        if (it_ != last_)
        {
            const Char8 ch = static_cast<Char8>(*it_);
            if (ch >> 6 == 0b10)
            {
                cp = (cp << 6) + (ch & 0b11'1111);
                ++it_;
                return true;
            }
        }
        cp = REPLACEMENT_CHAR;
        return false;
    }

    std::string_view::const_iterator it_;
    const std::string_view::const_iterator last_;
};


inline
std::wstring utf8ToWide(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());

    Utf8Decoder decoder(str);
    while (const std::optional<CodePoint> cp = decoder.getNext())
        output += static_cast<wchar_t>(*cp);
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
        codePointToUtf8(static_cast<CodePoint>(c), [&](Char8 b) { output += static_cast<char>(b); });
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = impl::CharTypeOf<SourceString>;
    using TargetChar = typename TargetString::value_type;
    const auto sv = impl::strView(str);

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(sv.begin(), sv.end());
    else if constexpr (std::is_same_v<SourceChar, char>)
        return TargetString(impl::utf8ToWide(sv));
    else
        return TargetString(impl::wideToUtf8(sv));
}
}

#endif //UTF_H_01832479146991573473545

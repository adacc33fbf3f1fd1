// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <algorithm>
#include <charconv>
#include <compare>
#include <string>
#include <string_view>
#include <vector>


//useful non-member functions for std::basic_string, std::basic_string_view, C strings and single chars
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
template <class Char> bool isAsciiChar (Char c);
template <class Char> bool isAsciiAlpha(Char c);
template <class S   > bool isAsciiString(const S& str);
template <class Char> Char asciiToLower(Char c);
template <class Char> Char asciiToUpper(Char c);

//both S and T can be strings or char/wchar_t arrays or single char/wchar_t
template <class S, class T> bool contains(const S& str, const T& term);

template <class S, class T> bool startsWith           (const S& str, const T& prefix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool endsWith             (const S& str, const T& postfix);

template <class S, class T> bool equalAsciiNoCase(const S& lhs, const T& rhs);
template <class S, class T> std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs); //basic case-insensitive comparison (considering A-Z only!)

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Function1, class Function2> void split2(const S& str, Function1 isDelimiter, Function2 onStringPart);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S>                     void trim(S& str, TrimSide side = TrimSide::both);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//conversion between integral numbers and strings
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

std::pair<char, char> hexify(unsigned char c, bool upperCase = true);

template <class Iterator> auto makeStringView(Iterator first, Iterator last);









//---------------------- implementation ----------------------
namespace impl
{
inline std::string_view  strView(const char&    c) { return {&c, 1}; }
inline std::wstring_view strView(const wchar_t& c) { return {&c, 1}; }

template <class Char> inline std::basic_string_view<Char> strView(const Char* str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(const std::basic_string<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(std::basic_string_view<Char> str) { return str; }

template <class S>
using CharTypeOf = typename decltype(strView(std::declval<const S&>()))::value_type;
}


template <class Iterator> inline
auto makeStringView(Iterator first, Iterator last)
{
    using CharType = std::remove_cv_t<std::remove_reference_t<decltype(*first)>>;
    return std::basic_string_view<CharType>(&*first, last - first); //&*first: caller must not pass end() of an empty range
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
    //following std::isspace() for default locale but without the interface insanity:
    //  - std::isspace() takes an int, but expects an unsigned char
    //  - some parts of UTF-8 chars are erroneously seen as whitespace
}


template <class Char> inline
bool isLineBreak(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>('\r') || c == static_cast<Char>('\n');
}


template <class Char> inline
bool isDigit(Char c) //similar to implementation of std::isdigit()!
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
bool isAsciiChar(Char c)
{
    return static_cast<std::make_unsigned_t<Char>>(c) < 128;
}


template <class Char> inline
bool isAsciiAlpha(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'));
}


template <class S> inline
bool isAsciiString(const S& str)
{
    const auto sv = impl::strView(str);
    return std::all_of(sv.begin(), sv.end(), [](auto c) { return isAsciiChar(c); });
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class Char> inline
Char asciiToUpper(Char c)
{
    if (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'))
        return static_cast<Char>(c - static_cast<Char>('a') + static_cast<Char>('A'));
    return c;
}


namespace impl
{
template <class Char1, class Char2> inline
std::weak_ordering strcmpAsciiNoCase(const Char1* lhs, const Char2* rhs, size_t len)
{
    while (len-- > 0)
    {
        const Char1 charL = asciiToLower(*lhs++); //ordering: lower-case chars have higher code points than uppper-case
        const Char2 charR = asciiToLower(*rhs++); //
        if (charL != charR)
            return static_cast<std::make_unsigned_t<Char1>>(charL) <=> static_cast<std::make_unsigned_t<Char2>>(charR); //unsigned char-comparison is the convention!
    }
    return std::weak_ordering::equivalent;
}
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto sv = impl::strView(str);
    const auto pf = impl::strView(prefix);
    return sv.size() >= pf.size() && std::equal(pf.begin(), pf.end(), sv.begin());
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto sv = impl::strView(str);
    const auto pf = impl::strView(prefix);
    return sv.size() >= pf.size() && impl::strcmpAsciiNoCase(sv.data(), pf.data(), pf.size()) == std::weak_ordering::equivalent;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto sv = impl::strView(str);
    const auto pf = impl::strView(postfix);
    return sv.size() >= pf.size() && std::equal(pf.begin(), pf.end(), sv.end() - pf.size());
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lv = impl::strView(lhs);
    const auto rv = impl::strView(rhs);
    return lv.size() == rv.size() && impl::strcmpAsciiNoCase(lv.data(), rv.data(), lv.size()) == std::weak_ordering::equivalent;
}


template <class S, class T> inline
std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lv = impl::strView(lhs);
    const auto rv = impl::strView(rhs);

    if (const std::weak_ordering cmp = impl::strcmpAsciiNoCase(lv.data(), rv.data(), std::min(lv.size(), rv.size()));
        cmp != std::weak_ordering::equivalent)
        return cmp;
    return lv.size() <=> rv.size();
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, impl::CharTypeOf<T>>);
    return impl::strView(str).find(impl::strView(term)) != std::basic_string_view<impl::CharTypeOf<S>>::npos;
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, impl::CharTypeOf<T>>);
    const auto sv = impl::strView(str);
    const auto tv = impl::strView(term);
    assert(!tv.empty());

    const size_t pos = sv.rfind(tv);
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(sv.substr(pos + tv.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, impl::CharTypeOf<T>>);
    const auto sv = impl::strView(str);
    const auto tv = impl::strView(term);
    assert(!tv.empty());

    const size_t pos = sv.rfind(tv);
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(sv.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, impl::CharTypeOf<T>>);
    const auto sv = impl::strView(str);
    const auto tv = impl::strView(term);
    assert(!tv.empty());

    const size_t pos = sv.find(tv);
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(sv.substr(pos + tv.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, impl::CharTypeOf<T>>);
    const auto sv = impl::strView(str);
    const auto tv = impl::strView(term);
    assert(!tv.empty());

    const size_t pos = sv.find(tv);
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(sv.substr(0, pos));
}


template <class S, class Function1, class Function2> inline
void split2(const S& str, Function1 isDelimiter, Function2 onStringPart)
{
    const auto sv = impl::strView(str);
    auto blockFirst = sv.begin();

    for (;;)
    {
        const auto blockLast = std::find_if(blockFirst, sv.end(), isDelimiter);
        onStringPart(sv.substr(blockFirst - sv.begin(), blockLast - blockFirst));

        if (blockLast == sv.end())
            return;

        blockFirst = blockLast + 1;
    }
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, Char>);
    split2(str, [delimiter](Char c) { return c == delimiter; }, onStringPart);
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    const auto sv = impl::strView(str);
    auto first = sv.begin();
    auto last  = sv.end();

    if (side == TrimSide::right || side == TrimSide::both)
        while (first != last && isWhiteSpace(last[-1]))
            --last;

    if (side == TrimSide::left || side == TrimSide::both)
        while (first != last && isWhiteSpace(*first))
            ++first;

    if (first == sv.begin() && last == sv.end())
        return str;
    return S(sv.substr(first - sv.begin(), last - first));
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    str = trimCpy(str, side);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    static_assert(std::is_same_v<impl::CharTypeOf<S>, impl::CharTypeOf<T>>);
    static_assert(std::is_same_v<impl::CharTypeOf<T>, impl::CharTypeOf<U>>);
    const auto oldView = impl::strView(oldTerm);
    const auto newView = impl::strView(newTerm);
    if (oldView.empty())
        return;

    size_t pos = str.find(oldView);
    if (pos == S::npos)
        return; //optimize "oldTerm not found"

    S output(str, 0, pos);
    size_t posLast = 0;
    do
    {
        output += newView;
        posLast = pos + oldView.size();
        pos = str.find(oldView, posLast);

        output.append(str, posLast, pos == S::npos ? S::npos : pos - posLast);
    }
    while (pos != S::npos);

    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);
    char buffer[2 + sizeof(Num) * 241 / 100]; //required chars (+ sign char): 1 + ceil(ln_10(256^sizeof(n)))

    const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(ec == std::errc());
    (void)ec;

    S output;
    for (const char c : makeStringView(std::begin(buffer), ptr))
        output += static_cast<impl::CharTypeOf<S>>(c);
    return output;
}


//very fast conversion to integers: leading whitespace is skipped, parsing stops at the first non-digit
template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    using CharType = impl::CharTypeOf<S>;
    const auto sv = impl::strView(str);

    auto it = std::find_if_not(sv.begin(), sv.end(), [](CharType c) { return isWhiteSpace(c); });

    bool hasMinusSign = false;
    if (it != sv.end())
    {
        if (*it == static_cast<CharType>('-'))
        {
            hasMinusSign = true;
            ++it;
        }
        else if (*it == static_cast<CharType>('+'))
            ++it;
    }

    Num number = 0;
    for (; it != sv.end() && isDigit(*it); ++it)
    {
        number *= 10;
        number += static_cast<Num>(*it - static_cast<CharType>('0'));
    }
    //rest of string should contain whitespace only, it's NOT a bug if there is something else!

    if constexpr (std::is_signed_v<Num>)
        return hasMinusSign ? -number : number;
    else
    {
        assert(!hasMinusSign);
        return number;
    }
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15); //guaranteed by design below!
        if (num <= 9)
            return static_cast<char>('0' + num); //no signed/unsigned char problem here!
        if (upperCase)
            return static_cast<char>('A' + (num - 10));
        else
            return static_cast<char>('a' + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}
}

#endif //STRING_TOOLS_H_213458973046

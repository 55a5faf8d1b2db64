// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <cstdio>
#include <charconv>
#include <algorithm>
#include <type_traits>
#include <vector>
#include <string>
#include <string_view>


//enhance *any* char- or wchar_t-based string class with useful non-member functions:
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
template <class Char> bool isHexDigit  (Char c);
template <class Char> Char asciiToLower(Char c);
template <class Char> Char asciiToUpper(Char c);

//"string-like": std::basic_string, std::basic_string_view, const Char*, single Char
template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class T> std::vector<S> split(const S& str, const T& delimiter, SplitOnEmpty soe);

template <class S>                   void trim   (S& str, bool fromLeft = true, bool fromRight = true);
template <class S>                   S    trimCpy(S  str, bool fromLeft = true, bool fromRight = true);
template <class S, class T, class U> void replace   (S& str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U> S    replaceCpy(S  str, const T& oldTerm, const U& newTerm);

template <class S> S asciiToLowerCpy(S str);

//high-performance conversion between numbers and strings
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //returns 0 on parsing error

std::pair<char, char> hexify  (unsigned char c, bool upperCase = true);
char                  unhexify(char high, char low);

template <class Iterator>
auto makeStringView(Iterator first, Iterator last) { return std::basic_string_view<std::decay_t<decltype(*first)>>(&*first, last - first); }






//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    //std::isspace() considers 0xa0 in UTF-8 a white space => don't use
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
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
bool isHexDigit(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return (static_cast<Char>('0') <= c && c <= static_cast<Char>('9')) ||
           (static_cast<Char>('A') <= c && c <= static_cast<Char>('F')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('f'));
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
inline std::basic_string_view<char>    strView(const char*    str) { return str; }
inline std::basic_string_view<wchar_t> strView(const wchar_t* str) { return str; }
inline std::basic_string_view<char>    strView(const char&    ch ) { return {&ch, 1}; }
inline std::basic_string_view<wchar_t> strView(const wchar_t& ch ) { return {&ch, 1}; }

template <class Char> inline
std::basic_string_view<Char> strView(const std::basic_string<Char>& str) { return str; }

template <class Char> inline
std::basic_string_view<Char> strView(std::basic_string_view<Char> str) { return str; }

template <class S>
using StrViewType = decltype(strView(std::declval<const S&>()));
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::strView(str).find(impl::strView(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    return impl::strView(str).starts_with(impl::strView(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    return impl::strView(str).ends_with(impl::strView(postfix));
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsView = impl::strView(lhs);
    const auto rhsView = impl::strView(rhs);

    return lhsView.size() == rhsView.size() &&
           std::equal(lhsView.begin(), lhsView.end(), rhsView.begin(),
    [](auto charL, auto charR) { return asciiToLower(charL) == asciiToLower(charR); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strView    = impl::strView(str);
    const auto prefixView = impl::strView(prefix);

    return strView.size() >= prefixView.size() &&
           equalAsciiNoCase(strView.substr(0, prefixView.size()), prefixView);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::strView(str);
    const auto termView = impl::strView(term);
    assert(!termView.empty());

    const size_t pos = strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::strView(str);
    const auto termView = impl::strView(term);
    assert(!termView.empty());

    const size_t pos = strView.rfind(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::strView(str);
    const auto termView = impl::strView(term);
    assert(!termView.empty());

    const size_t pos = strView.find(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(pos + termView.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto strView  = impl::strView(str);
    const auto termView = impl::strView(term);
    assert(!termView.empty());

    const size_t pos = strView.find(termView);
    if (pos == strView.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strView.substr(0, pos));
}


template <class S, class T> inline
std::vector<S> split(const S& str, const T& delimiter, SplitOnEmpty soe)
{
    const auto strView  = impl::strView(str);
    const auto delimView = impl::strView(delimiter);

    std::vector<S> output;
    if (delimView.empty())
    {
        if (!strView.empty() || soe == SplitOnEmpty::allow)
            output.push_back(str);
        return output;
    }

    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = strView.find(delimView, blockStart);
        const auto block = strView.substr(blockStart, blockEnd == strView.npos ? strView.npos : blockEnd - blockStart);

        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);

        if (blockEnd == strView.npos)
            return output;
        blockStart = blockEnd + delimView.size();
    }
}


template <class S> inline
void trim(S& str, bool fromLeft, bool fromRight)
{
    assert(fromLeft || fromRight);
    const auto view = impl::strView(str);

    auto itFirst = view.begin();
    auto itLast  = view.end();

    if (fromRight)
        while (itLast != itFirst && isWhiteSpace(*(itLast - 1)))
            --itLast;

    if (fromLeft)
        while (itFirst != itLast && isWhiteSpace(*itFirst))
            ++itFirst;

    str = S(view.substr(itFirst - view.begin(), itLast - itFirst));
}


template <class S> inline
S trimCpy(S str, bool fromLeft, bool fromRight)
{
    trim(str, fromLeft, fromRight);
    return str;
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::strView(oldTerm);
    const auto newView = impl::strView(newTerm);
    assert(!oldView.empty());
    if (oldView.empty())
        return;

    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S> inline
S asciiToLowerCpy(S str)
{
    for (auto& c : str)
        c = asciiToLower(c);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    std::string buf;
    if constexpr (std::is_integral_v<Num> && !std::is_same_v<Num, bool>)
    {
        char buffer[64];
        const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
        assert(rv.ec == std::errc());
        buf.assign(buffer, rv.ptr);
    }
    else
    {
        static_assert(std::is_floating_point_v<Num>);
        char buffer[128];
        const int charsWritten = std::snprintf(buffer, sizeof(buffer), "%g", static_cast<double>(number));
        if (charsWritten > 0)
            buf.assign(buffer, std::min<size_t>(charsWritten, sizeof(buffer) - 1));
    }
    return S(buf.begin(), buf.end()); //ASCII only => widening conversion is fine
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    const auto view = impl::strView(str);

    std::string buf; //ASCII only => narrowing conversion is fine
    for (auto c : view)
        buf += static_cast<char>(c);

    auto itFirst = std::find_if_not(buf.begin(), buf.end(), [](char c) { return isWhiteSpace(c); });
    if (itFirst != buf.end() && *itFirst == '+') //from_chars() rejects leading '+'
        ++itFirst;
    const char* const first = buf.data() + (itFirst - buf.begin());
    const char* const last  = buf.data() + buf.size();

    Num number = 0;
    if (const std::from_chars_result rv = std::from_chars(first, last, number);
        rv.ec != std::errc())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);

        if (upperCase)
            return static_cast<char>('A' + (num - 10));
        else
            return static_cast<char>('a' + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') //no locale-dependent std::isdigit()
            return hex - '0';
        else if ('A' <= hex && hex <= 'F')
            return (hex - 'A') + 10;
        else if ('a' <= hex && hex <= 'f')
            return (hex - 'a') + 10;
        assert(false);
        return 0;
    };
    return static_cast<unsigned char>(16 * unhexifyDigit(high) + unhexifyDigit(low)); //[!] convert to unsigned char first, then to char (which may be signed)
}
}

#endif //STRING_TOOLS_H_213458973046

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <cstdint>
#include <optional>
#include "string_tools.h"


namespace zen
{
//convert char- and wchar_t-based "string-like" objects applying UTF conversions (but only if necessary!)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

constexpr std::string_view BYTE_ORDER_MARK_UTF8 = "\xEF\xBB\xBF";

//number of code points of a UTF-encoded string (char- or wchar_t-based)
template <class UtfString>
size_t unicodeLength(const UtfString& str);









//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;
using Char8     = uint8_t;

const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE     = 0xdc00;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;

const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;

static_assert(sizeof(wchar_t) == 4, "Linux: UTF32-wchar_t");


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a char
{
    //https://en.wikipedia.org/wiki/UTF-8 surrogate halves and code points > U+10FFFF are invalid
    auto out = [&](CodePoint c) { writeOutput(static_cast<char>(static_cast<Char8>(c))); };

    if (cp <= 0b111'1111)
        out(cp);
    else if (cp <= 0b0111'1111'1111)
    {
        out((cp >> 6)        | 0b1100'0000); //110x xxxx
        out((cp & 0b11'1111) | 0b1000'0000); //10xx xxxx
    }
    else if (cp <= 0b1111'1111'1111'1111)
    {
        if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX)
            codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
        else
        {
            out( (cp >> 12)             | 0b1110'0000); //1110 xxxx
            out(((cp >> 6) & 0b11'1111) | 0b1000'0000); //10xx xxxx
            out( (cp       & 0b11'1111) | 0b1000'0000); //10xx xxxx
        }
    }
    else if (cp <= CODE_POINT_MAX)
    {
        out( (cp >> 18)              | 0b1111'0000); //1111 0xxx
        out(((cp >> 12) & 0b11'1111) | 0b1000'0000); //10xx xxxx
        out(((cp >> 6)  & 0b11'1111) | 0b1000'0000); //10xx xxxx
        out( (cp        & 0b11'1111) | 0b1000'0000); //10xx xxxx
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
}


class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) : it_(reinterpret_cast<const Char8*>(str.data())), last_(it_ + str.size()) {}

    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return std::nullopt;

        const Char8 ch = *it_++;
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
            const Char8 ch = *it_;
            if (ch >> 6 == 0b10) //trail byte expected!
            {
                cp = (cp << 6) + (ch & 0b11'1111);
                ++it_;
                return true;
            }
        }
        cp = REPLACEMENT_CHAR;
        return false;
    }

    const Char8* it_;
    const Char8* const last_;
};


class Utf32Decoder
{
public:
    explicit Utf32Decoder(std::wstring_view str) : it_(str.begin()), last_(str.end()) {}

    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return std::nullopt;
        return static_cast<CodePoint>(*it_++);
    }

private:
    std::wstring_view::const_iterator it_;
    const std::wstring_view::const_iterator last_;
};


inline Utf8Decoder  makeUtfDecoder(std::string_view  str) { return Utf8Decoder (str); }
inline Utf32Decoder makeUtfDecoder(std::wstring_view str) { return Utf32Decoder(str); }


template <class Char, class Function> inline
void codePointToUtf(CodePoint cp, Function writeOutput)
{
    if constexpr (sizeof(Char) == 1)
        codePointToUtf8(cp, writeOutput);
    else
        writeOutput(static_cast<wchar_t>(cp));
}
}


template <class UtfString> inline
size_t unicodeLength(const UtfString& str)
{
    auto decoder = impl::makeUtfDecoder(impl::strView(str));
    size_t uniLen = 0;
    while (decoder.getNext())
        ++uniLen;
    return uniLen;
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto strView = impl::strView(str);
    using CharSrc = typename decltype(strView)::value_type;
    using CharTrg = typename TargetString::value_type;

    if constexpr (sizeof(CharSrc) == sizeof(CharTrg))
        return TargetString(strView.begin(), strView.end());
    else
    {
        TargetString output;
        output.reserve(strView.size());

        auto decoder = impl::makeUtfDecoder(strView);
        while (const std::optional<impl::CodePoint> cp = decoder.getNext())
            impl::codePointToUtf<CharTrg>(*cp, [&](auto c) { output += static_cast<CharTrg>(c); });
        return output;
    }
}
}

#endif //UTF_H_01832479146991573473545

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "zstring.h"
    #include <glib.h>
    #include "sys_error.h"

using namespace zen;


namespace
{
bool isAsciiString(const Zstring& str)
{
    return std::all_of(str.begin(), str.end(), [](Zchar c) { return static_cast<unsigned char>(c) < 128; });
}


Zstring getUpperCaseAscii(const Zstring& str)
{
    Zstring output = str;
    for (Zchar& c : output)  //identical to g_unichar_toupper() for ASCII
        c = asciiToUpper(c); //
    return output;
}


Zstring getUpperCaseNonAscii(const Zstring& str)
{
    //do NOT fail on broken UTF encoding: normalize using REPLACEMENT_CHAR
    const Zstring strValidUtf = utfTo<Zstring>(utfTo<std::wstring>(str));
    try
    {
        gchar* strNorm = ::g_utf8_normalize(strValidUtf.c_str(), strValidUtf.length(), G_NORMALIZE_NFC);
        if (!strNorm)
            throw SysError(formatSystemError("g_utf8_normalize", L"", L"Conversion failed."));
        ZEN_ON_SCOPE_EXIT(::g_free(strNorm));

        Zstring output;
        output.reserve(strValidUtf.size());

        static_assert(sizeof(impl::CodePoint) == sizeof(gunichar));
        impl::Utf8Decoder decoder(strNorm);
        while (const std::optional<impl::CodePoint> cp = decoder.getNext())
            impl::codePointToUtf8(::g_unichar_toupper(*cp), [&](char c) { output += c; }); //don't use std::towupper: *incomplete* and locale-dependent!
        return output;
    }
    catch (const SysError& e)
    {
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Error converting string to upper case:" + '\n' +
                                 utfTo<std::string>(str)  + "\n\n" + utfTo<std::string>(e.toString()));
    }
}
}


Zstring getUpperCase(const Zstring& str)
{
    return isAsciiString(str) ? //fast path
           getUpperCaseAscii(str) :
           getUpperCaseNonAscii(str); //slow path
}

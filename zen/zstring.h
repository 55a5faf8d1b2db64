// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <string>
#include <string_view>


    using Zchar = char;
    #define Zstr(x) x


//native string type for file paths and OS APIs (UTF-8 on Linux)
using Zstring = std::basic_string<Zchar>;

using ZstringView = std::basic_string_view<Zchar>;

//log messages: UTF-8
using Zstringc = std::string;


/* Unicode-aware upper case (NFC-normalized), e.g. for case-insensitive bookmark search
    Caveat: don't expect input/output string sizes to match:
    - different UTF-8 encoding length of upper-case chars
    - output is Unicode-normalized                                         */
Zstring getUpperCase(const Zstring& str);

#endif //ZSTRING_H_73425873425789

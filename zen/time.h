// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <ctime>
#include <utility>
#include "string_tools.h"
#include "zstring.h"


namespace zen
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime(time_t utc); //convert time_t (UTC) to UTC time components, returns TimeComp() on error
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc); //convert UTC time components to time_t (UTC)

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error
TimeComp getLocalTime(); //utc = std::time()

//----------------------------------------------------------------------------------------------------------------------------------
/* format (current) date and time; example:
            formatTime(formatIsoDateTimeTag); -> "2011-10-29 17:55:34"
            formatTime(formatTimeTag);        -> "17:55:34"                       */
Zstring formatTime(const Zchar* format, const TimeComp& tc = getLocalTime()); //format as specified by "std::strftime", returns empty string on error

const Zchar* const formatTimeTag        = Zstr("%X");                //locale-dependent time representation: e.g. 2:55:02 PM
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //e.g. 2001-08-23 14:55:02

//----------------------------------------------------------------------------------------------------------------------------------
//supports %Y %m %d %H %M %S; returns TimeComp() on error
//example: parseTime("%Y%m%d%H%M%S", "20170113063314");
TimeComp parseTime(std::string_view format, std::string_view str); //similar to ::strptime()








//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    std::tm ctc = {};
    ctc.tm_year  = tc.year - 1900; //years since 1900
    ctc.tm_mon   = tc.month - 1;   //0-11
    ctc.tm_mday  = tc.day;         //1-31
    ctc.tm_hour  = tc.hour;        //0-23
    ctc.tm_min   = tc.minute;      //0-59
    ctc.tm_sec   = tc.second;      //0-60 (including leap second)
    ctc.tm_isdst = -1;             //negative if no information is available
    return ctc;
}


inline
TimeComp toZenTimeComponents(const std::tm& ctc)
{
    TimeComp tc;
    tc.year   = ctc.tm_year + 1900;
    tc.month  = ctc.tm_mon + 1;
    tc.day    = ctc.tm_mday;
    tc.hour   = ctc.tm_hour;
    tc.minute = ctc.tm_min;
    tc.second = ctc.tm_sec;
    return tc;
}
}


inline
TimeComp getUtcTime(time_t utc)
{
    std::tm ctc = {};
    if (::gmtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return impl::toZenTimeComponents(ctc);
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);
    ctc.tm_isdst = 0; //unused by timegm(), but take no chances

    const time_t utc = ::timegm(&ctc); //Linux, 64-bit: apparently no limits
    if (utc == -1)
        return {};

    return {utc, true};
}


inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return impl::toZenTimeComponents(ctc);
}


inline
TimeComp getLocalTime()
{
    const time_t utc = std::time(nullptr); //returns -1 on error
    if (utc == -1)
        return TimeComp();

    return getLocalTime(utc);
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc = impl::toClibTimeComponents(tc);
    std::mktime(&ctc); //std::strftime() needs all elements of "struct tm" filled, e.g. tm_wday, tm_yday

    Zstring buf(256, Zstr('\0'));
    //GCC: returns 0 on invalid input
    const size_t charsWritten = std::strftime(buf.data(), buf.size(), format, &ctc);
    buf.resize(charsWritten);
    return buf;
}


inline
TimeComp parseTime(std::string_view format, std::string_view str)
{
    auto itStr = str.begin();

    auto extractNumber = [&](int& result, size_t digitCount)
    {
        if (static_cast<size_t>(str.end() - itStr) < digitCount)
            return false;

        if (!std::all_of(itStr, itStr + digitCount, [](char c) { return isDigit(c); }))
            return false;

        result = stringTo<int>(std::string_view(&*itStr, digitCount));
        itStr += digitCount;
        return true;
    };

    TimeComp output;

    for (auto itFmt = format.begin(); itFmt != format.end(); ++itFmt)
        if (*itFmt == '%')
        {
            if (++itFmt == format.end())
                return TimeComp();

            int* target = nullptr;
            size_t digitCount = 2;
            switch (*itFmt)
            {
                //*INDENT-OFF*
                case 'Y': target = &output.year; digitCount = 4; break;
                case 'm': target = &output.month;  break;
                case 'd': target = &output.day;    break;
                case 'H': target = &output.hour;   break;
                case 'M': target = &output.minute; break;
                case 'S': target = &output.second; break;
                default: return TimeComp();
                //*INDENT-ON*
            }
            if (!extractNumber(*target, digitCount))
                return TimeComp();
        }
        else if (isWhiteSpace(*itFmt)) //single whitespace in format => skip zero or more whitespace characters in input
        {
            while (itStr != str.end() && isWhiteSpace(*itStr))
                ++itStr;
        }
        else
        {
            if (itStr == str.end() || *itStr != *itFmt)
                return TimeComp();
            ++itStr;
        }

    if (itStr != str.end())
        return TimeComp();

    if (output.month  < 1 || output.month  > 12 ||
        output.day    < 1 || output.day    > 31 ||
        output.hour   < 0 || output.hour   > 23 ||
        output.minute < 0 || output.minute > 59 ||
        output.second < 0 || output.second > 60)
        return TimeComp();

    return output;
}
}

#endif //TIME_H_8457092814324342453627

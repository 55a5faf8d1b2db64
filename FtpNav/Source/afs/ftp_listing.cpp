// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_listing.h"
#include <functional>
#include <zen/time.h>

using namespace zen;
using namespace fnav;


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

    char peekNextChar() const { return it_ == itEnd_ ? '\0' : *it_; }

private:
    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


Zstring serverToUtfEncoding(const std::string_view& str) //UTF-8 is requested via "OPTS UTF8 ON" where supported
{
    return utfTo<Zstring>(str);
}


bool isDotEntry(const Zstring& itemName) { return itemName == Zstr(".") || itemName == Zstr(".."); }


//"ls -l"
RemoteItem parseUnixLine(const std::string_view& rawLine, time_t utcTimeNow, int utcCurrentYear, int ownerGroupCount) //throw SysError
{
    /*  total 4953                                                  <- optional first line, skipped by caller
        drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
        -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
        -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
        lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

        no group:                     dr-xr-xr-x   2 root        512 Apr  8  1994 etc
        no owner, no group:           drwxrwxrwx 1              0 Jan  1 00:00 dirname/     */
    try
    {
        FtpLineParser parser(rawLine);

        const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        });
        //------------------------------------------------------------------------------------
        //permissions
        parser.readRange(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(&isWhiteSpace<char>); //throw SysError
        //------------------------------------------------------------------------------------
        //hard-link count
        parser.readRange(&isDigit<char>);      //throw SysError
        parser.readRange(&isWhiteSpace<char>); //throw SysError
        //------------------------------------------------------------------------------------
        //both owner + group, owner only, or none at all
        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
            parser.readRange(&isWhiteSpace<char>);             //throw SysError
        }
        //------------------------------------------------------------------------------------
        const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(&isDigit<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                          //throw SysError
        //------------------------------------------------------------------------------------
        const std::string_view monthStr = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                               //throw SysError

        const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(monthStr, name); });
        if (itMonth == std::end(months))
            throw SysError(L"Failed to parse month name.");
        //------------------------------------------------------------------------------------
        const int day = stringTo<int>(parser.readRange(&isDigit<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                           //throw SysError
        if (day < 1 || day > 31)
            throw SysError(L"Failed to parse day of month.");
        //------------------------------------------------------------------------------------
        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                                               //throw SysError

        TimeComp timeComp;
        timeComp.month = 1 + static_cast<int>(itMonth - std::begin(months));
        timeComp.day = day;

        if (contains(timeOrYear, ':'))
        {
            const int hour   = stringTo<int>(beforeFirst(timeOrYear, ':', IfNotFoundReturn::none));
            const int minute = stringTo<int>(afterFirst (timeOrYear, ':', IfNotFoundReturn::none));
            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError(L"Failed to parse modification time.");

            timeComp.hour   = hour;
            timeComp.minute = minute;
            timeComp.year = utcCurrentYear; //tentatively

            const auto [serverLocalTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError(L"Modification time is invalid.");

            if (serverLocalTime > utcTimeNow + 24 * 3600) //time zones range from UTC-12:00 to UTC+14:00: 1 day tolerance
                --timeComp.year; //"more likely" this time is from last year
        }
        else if (timeOrYear.size() == 4)
        {
            timeComp.year = stringTo<int>(timeOrYear);

            if (timeComp.year < 1600 || timeComp.year >= 3000)
                throw SysError(L"Failed to parse modification time.");
        }
        else
            throw SysError(L"Failed to parse modification time.");

        //LIST has no time zone: treat as UTC
        const auto [modTime, timeValid] = utcToTimeT(timeComp);
        if (!timeValid)
            throw SysError(L"Modification time is invalid.");
        //------------------------------------------------------------------------------------
        const std::string_view trail = parser.readRange([](char) { return true; }); //throw SysError
        std::string_view itemName;
        if (typeTag == "l")
            itemName = beforeFirst(trail, std::string_view(" -> "), IfNotFoundReturn::none);
        else
            itemName = trail;
        if (itemName.empty())
            throw SysError(L"Item name not available.");

        if (itemName == "." || itemName == "..")
            return {RemoteItemType::folder, utfTo<Zstring>(itemName), 0, 0};
        //------------------------------------------------------------------------------------
        RemoteItem item;
        if (typeTag == "d")
            item.type = RemoteItemType::folder;
        else if (typeTag == "l")
            item.type = RemoteItemType::symlink;
        else
            item.size = fileSize;

        item.name = serverToUtfEncoding(itemName);
        if (item.type == RemoteItemType::folder && endsWith(item.name, Zstr('/')))
            item.name.pop_back();

        item.modTime = modTime;
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") [ownerGroupCount: " + numberTo<std::wstring>(ownerGroupCount) + L"] " + e.toString());
    }
}


std::vector<RemoteItem> parseUnix(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto it = lines.begin();

    if (it != lines.end() && startsWith(*it, std::string_view("total ")))
        ++it;

    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(utcTimeNow));

    const int utcCurrentYear = tc.year;

    //the listing format is consistent per item type, but may differ between them
    std::optional<int> dirOwnerGroupCount;
    std::optional<int> fileOwnerGroupCount;
    std::optional<int> linkOwnerGroupCount;

    std::vector<RemoteItem> output;

    std::for_each(it, lines.end(), [&](const std::string_view line)
    {
        auto& ownerGroupCount = [&]() -> std::optional<int>&
        {
            switch (line[0]) //lines are never empty: see splitFtpResponse()
            {
                //*INDENT-OFF*
                case 'd': return  dirOwnerGroupCount;
                case 'l': return linkOwnerGroupCount;
                default : return fileOwnerGroupCount;
                //*INDENT-ON*
            }
        }();

        if (!ownerGroupCount)
            ownerGroupCount = [&]
        {
            std::optional<SysError> firstError;

            for (int i = 3; i-- > 0;)
                try
                {
                    parseUnixLine(line, utcTimeNow, utcCurrentYear, i /*ownerGroupCount*/); //throw SysError
                    return i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }
            throw* firstError; //owner + group: most likely the relevant one
        }();

        RemoteItem item = parseUnixLine(line, utcTimeNow, utcCurrentYear, *ownerGroupCount); //throw SysError
        if (!isDotEntry(item.name))
            output.push_back(std::move(item));
    });

    return output;
}


//"dir"
std::vector<RemoteItem> parseWindows(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    /*  IIS, US locale:
            10-27-15  03:46AM       <DIR>          pub
            04-08-14  03:09PM               11,399 readme.txt

        IIS option "four-digit years":
            06-22-2017  04:25PM       <DIR>          test
            06-20-2017  12:50PM              1875499 zstring.obj

        Windows CE, 24h clock:
            01-01-98  13:00       <DIR>          Storage Card          */
    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(utcTimeNow));
    const int utcCurrentYear = tc.year;

    std::vector<RemoteItem> output;
    for (const std::string_view& line : splitFtpResponse(buf))
        try
        {
            FtpLineParser parser(line);

            const int month = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //throw SysError
            const int day = stringTo<int>(parser.readRange(2, &isDigit<char>));   //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //throw SysError
            const std::string_view yearString = parser.readRange(&isDigit<char>); //throw SysError
            parser.readRange(&isWhiteSpace<char>);                                //throw SysError

            if (month < 1 || month > 12 || day < 1 || day > 31)
                throw SysError(L"Failed to parse modification time.");

            int year = 0;
            if (yearString.size() == 2)
            {
                year = (utcCurrentYear / 100) * 100 + stringTo<int>(yearString);
                if (year > utcCurrentYear + 1 /*local time leeway*/)
                    year -= 100;
            }
            else if (yearString.size() == 4)
                year = stringTo<int>(yearString);
            else
                throw SysError(L"Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            int hour = stringTo<int>(parser.readRange(2, &isDigit<char>));         //throw SysError
            parser.readRange(1, [](char c) { return c == ':'; });                  //throw SysError
            const int minute = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
            if (!isWhiteSpace(parser.peekNextChar()))
            {
                const std::string_view period = parser.readRange(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
                if (period == "PM")
                {
                    if (0 <= hour && hour < 12)
                        hour += 12;
                }
                else if (hour == 12)
                    hour = 0;
            }
            parser.readRange(&isWhiteSpace<char>); //throw SysError

            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError(L"Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            TimeComp timeComp;
            timeComp.year   = year;
            timeComp.month  = month;
            timeComp.day    = day;
            timeComp.hour   = hour;
            timeComp.minute = minute;

            const auto [modTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError(L"Modification time is invalid.");
            //------------------------------------------------------------------------------------
            const std::string_view dirTagOrSize = parser.readRange(std::not_fn(isWhiteSpace<char>)); //throw SysError
            parser.readRange(&isWhiteSpace<char>); //throw SysError

            const bool isDir = dirTagOrSize == "<DIR>";
            uint64_t fileSize = 0;
            if (!isDir)
            {
                std::string sizeStr(dirTagOrSize);
                replace(sizeStr, ',', "");
                replace(sizeStr, '.', "");
                if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), &isDigit<char>))
                    throw SysError(L"Failed to parse file size.");
                fileSize = stringTo<uint64_t>(sizeStr);
            }
            //------------------------------------------------------------------------------------
            const std::string_view itemName = parser.readRange([](char) { return true; }); //throw SysError

            if (itemName != "." &&
                itemName != "..")
            {
                RemoteItem item;
                if (isDir)
                    item.type = RemoteItemType::folder;
                item.name    = serverToUtfEncoding(itemName);
                item.size    = fileSize;
                item.modTime = modTime;

                output.push_back(std::move(item));
            }
        }
        catch (const SysError& e)
        {
            throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(line) + L") " + e.toString());
        }

    return output;
}
}


std::vector<std::string_view> fnav::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    auto itBlock = buf.begin();
    for (auto it = buf.begin();; ++it)
        if (it == buf.end() || isLineBreak(*it) || *it == '\0')
        {
            if (it != itBlock) //consider Windows' <CR><LF>
                lines.push_back(makeStringView(itBlock, it));

            if (it == buf.end())
                return lines;
            itBlock = it + 1;
        }
}


std::wstring fnav::formatFtpStatus(int sc)
{
    const std::wstring_view statusText = [&]() -> std::wstring_view //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 434: return L"Requested host unavailable.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 504: return L"Command not implemented for that parameter.";
            case 521: return L"Data connection cannot be opened with this PROT setting.";
            case 530: return L"User not logged in.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 536: return L"Requested PROT level not supported by mechanism.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (statusText.empty())
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc)));
    else
        return trimCpy(replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + std::wstring(statusText));
}


FtpFeatures fnav::parseFeatResponse(const std::string& featResponse)
{
    FtpFeatures output;
    std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string_view& line)
    {
        return startsWith(line, std::string_view("211-")) || startsWith(line, std::string_view("211 "));
    });
    if (it != lines.end())
        for (++it; it != lines.end(); ++it)
        {
            if (equalAsciiNoCase     (*it, "211 End") || //Serv-U: "211 End (for details use "HELP commmand" where command is the command of interest)"
                startsWithAsciiNoCase(*it, "211 End "))  //Home Ftp Server: "211 End of extentions."
                break;

            std::string line(*it);
            //ProFTPD with "MultilineRFC2228 = on"
            if (startsWith(line, "211-"))
                line = ' ' + afterFirst(line, '-', IfNotFoundReturn::none);

            //https://tools.ietf.org/html/rfc3659#section-7.8
            //"there is no distinct FEAT output for MLSD. The presence of the MLST feature indicates that both MLST and MLSD are supported"
            if (equalAsciiNoCase     (line, " MLST")  ||
                startsWithAsciiNoCase(line, " MLST ") || //SP "MLST" [SP factlist] CRLF
                equalAsciiNoCase     (line, " MLSD"))    //non-compliant, but seen in the wild
                output.mlsd = true;

            else if (equalAsciiNoCase(line, " UTF8") ||
                     equalAsciiNoCase(line, " UTF8 ON") ||
                     equalAsciiNoCase(line, " UTF-8"))
                output.utf8 = true;

            else if (equalAsciiNoCase(line, " CLNT"))
                output.clnt = true;
        }
    return output;
}


Zstring fnav::parsePwdResponse(const std::string& pwdResponse) //throw SysError
{
    for (const std::string_view& line : splitFtpResponse(pwdResponse))
        if (startsWith(line, std::string_view("257 ")))
        {
            /* 257<space>[rubbish]"<directory-name>"<space><commentary>

               "The directory name can contain any character; embedded double-quotes should be escaped by
                double-quotes (the "quote-doubling" convention)." https://tools.ietf.org/html/rfc959          */
            auto itBegin = std::find(line.begin(), line.end(), '"');
            if (itBegin != line.end())
                for (auto it = ++itBegin; it != line.end(); ++it)
                    if (*it == '"')
                    {
                        if (it + 1 != line.end() && it[1] == '"')
                            ++it; //skip double quote
                        else
                        {
                            const std::string homePathRaw = replaceCpy(std::string(itBegin, it), "\"\"", '"');

                            Zstring homePath = serverToUtfEncoding(homePathRaw);
                            if (!startsWith(homePath, Zstr('/')))
                                homePath = Zstr('/') + homePath;
                            if (homePath.size() > 1 && endsWith(homePath, Zstr('/')))
                                homePath.pop_back();
                            return homePath;
                        }
                    }
            break;
        }
    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(pwdResponse) + L')');
}


std::vector<RemoteItem> fnav::parseMlsdListing(const std::string& buf) //throw SysError
{
    std::vector<RemoteItem> output;
    for (const std::string_view& line : splitFtpResponse(buf))
    {
        RemoteItem item = parseMlstLine(line); //throw SysError
        if (!isDotEntry(item.name))
            output.push_back(std::move(item));
    }
    return output;
}


RemoteItem fnav::parseMlstLine(const std::string_view& rawLine) //throw SysError
{
    /*  https://tools.ietf.org/html/rfc3659
        type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
        type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; ..
        type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
        type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder   */
    try
    {
        RemoteItem item;

        auto itBegin = rawLine.begin();
        if (startsWith(rawLine, ' ')) //leading blank is already trimmed if MLSD was processed by curl
            ++itBegin;
        auto itBlank = std::find(itBegin, rawLine.end(), ' ');
        if (itBlank == rawLine.end())
            throw SysError(L"Item name not available.");

        const std::string_view facts = makeStringView(itBegin, itBlank);
        item.name = serverToUtfEncoding(makeStringView(itBlank + 1, rawLine.end()));

        std::string_view typeFact;
        std::string_view fileSize;

        for (const std::string_view& fact : split(facts, ';', SplitOnEmpty::skip))
            if (startsWithAsciiNoCase(fact, "type=")) //must be case-insensitive!!!
            {
                const std::string_view tmp = afterFirst(fact, '=', IfNotFoundReturn::none);
                typeFact = beforeFirst(tmp, ':', IfNotFoundReturn::all);
            }
            else if (startsWithAsciiNoCase(fact, "size="))
                fileSize = afterFirst(fact, '=', IfNotFoundReturn::none);
            else if (startsWithAsciiNoCase(fact, "modify="))
            {
                std::string_view modifyFact = afterFirst(fact, '=', IfNotFoundReturn::none);
                modifyFact = beforeLast(modifyFact, '.', IfNotFoundReturn::all); //truncate millisecond precision if available

                const TimeComp tc = parseTime("%Y%m%d%H%M%S", modifyFact);
                if (tc == TimeComp())
                    throw SysError(L"Modification time is invalid.");

                if (const auto [modTime, timeValid] = utcToTimeT(tc);
                    timeValid)
                    item.modTime = modTime;
                else
                    throw SysError(L"Modification time is invalid.");
            }

        if (equalAsciiNoCase(typeFact, "cdir"))
            return {RemoteItemType::folder, Zstr("."), 0, 0};
        if (equalAsciiNoCase(typeFact, "pdir"))
            return {RemoteItemType::folder, Zstr(".."), 0, 0};

        if (equalAsciiNoCase(typeFact, "dir"))
            item.type = RemoteItemType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") || //the OS.unix=slink:/target syntax is a hack and often skips
                 equalAsciiNoCase(typeFact, "OS.unix=symlink")) //the target path after the colon: http://www.proftpd.org/docs/modules/mod_facts.html
            item.type = RemoteItemType::symlink;

        if (item.name.empty())
            throw SysError(L"Item name not available.");

        if (item.type == RemoteItemType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), &isDigit<char>))
                throw SysError(L"File size not available."); //can be "-1" on broken servers
            item.size = stringTo<uint64_t>(fileSize);
        }
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") " + e.toString());
    }
}


std::vector<RemoteItem> fnav::parseListListing(const std::string& buf, time_t utcTimeNow) //throw SysError
{
    if (!buf.empty() && isDigit(buf[0])) //Unix lines start with the type tag, Windows lines with the date
        return parseWindows(buf, utcTimeNow); //throw SysError
    return parseUnix(buf, utcTimeNow);        //
}

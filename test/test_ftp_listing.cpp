// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

/*

test_ftp_listing.cpp
--------------------

Parsing of FTP server responses: MLSD, LIST (Unix and Windows), FEAT and PWD.

*/


#define BOOST_TEST_MODULE ftp_listing

#include <boost/test/unit_test.hpp>
#include <zen/time.h>
#include <afs/ftp_listing.h>

using namespace zen;
using namespace fnav;


namespace
{
time_t utcTime(int year, int month, int day, int hour, int minute, int second = 0)
{
    const auto [utc, valid] = utcToTimeT(TimeComp{year, month, day, hour, minute, second});
    BOOST_REQUIRE(valid);
    return utc;
}


const RemoteItem* findItem(const std::vector<RemoteItem>& items, const Zstring& name)
{
    auto it = std::find_if(items.begin(), items.end(), [&](const RemoteItem& item) { return item.name == name; });
    return it != items.end() ? &*it : nullptr;
}
}


BOOST_AUTO_TEST_CASE(split_response_lines)
{
    const std::string buf = "line 1\r\nline 2\n\nline 3";
    const std::vector<std::string_view> lines = splitFtpResponse(buf);

    BOOST_REQUIRE_EQUAL(lines.size(), 3u);
    BOOST_CHECK(lines[0] == "line 1");
    BOOST_CHECK(lines[1] == "line 2");
    BOOST_CHECK(lines[2] == "line 3");

    const std::string empty;
    BOOST_CHECK(splitFtpResponse(empty).empty());
}


BOOST_AUTO_TEST_CASE(status_text)
{
    BOOST_CHECK(formatFtpStatus(550) == L"FTP status 550: File unavailable, e.g. file not found, no access.");
    BOOST_CHECK(formatFtpStatus(530) == L"FTP status 530: User not logged in.");
    BOOST_CHECK(formatFtpStatus(299) == L"FTP status 299.");
}


BOOST_AUTO_TEST_CASE(feat_response)
{
    const FtpFeatures features = parseFeatResponse("211-Features:\r\n"
                                                   " MDTM\r\n"
                                                   " MLST type*;size*;modify*;\r\n"
                                                   " UTF8\r\n"
                                                   " CLNT\r\n"
                                                   "211 End\r\n");
    BOOST_CHECK(features.mlsd);
    BOOST_CHECK(features.utf8);
    BOOST_CHECK(features.clnt);

    const FtpFeatures minimal = parseFeatResponse("211-Features:\r\n"
                                                  " MDTM\r\n"
                                                  " SIZE\r\n"
                                                  "211 End\r\n");
    BOOST_CHECK(!minimal.mlsd);
    BOOST_CHECK(!minimal.utf8);
    BOOST_CHECK(!minimal.clnt);

    //FEAT not supported at all
    const FtpFeatures none = parseFeatResponse("500 FEAT not understood\r\n");
    BOOST_CHECK(!none.mlsd);
}


BOOST_AUTO_TEST_CASE(pwd_response)
{
    BOOST_CHECK(parsePwdResponse("257 \"/home/alice\" is the current directory\r\n") == Zstr("/home/alice"));
    BOOST_CHECK(parsePwdResponse("257 \"/\" is the current directory\r\n") == Zstr("/"));
    BOOST_CHECK(parsePwdResponse("257 \"/pub/\"\r\n") == Zstr("/pub"));
    BOOST_CHECK(parsePwdResponse("257 \"home\"\r\n") == Zstr("/home"));
    BOOST_CHECK(parsePwdResponse("257 \"/say \"\"hi\"\"\" created\r\n") == Zstr("/say \"hi\""));

    BOOST_CHECK_THROW(parsePwdResponse("550 Permission denied\r\n"), SysError);
    BOOST_CHECK_THROW(parsePwdResponse("257 no quotes\r\n"), SysError);
}


BOOST_AUTO_TEST_CASE(mlsd_listing)
{
    const std::string buf =
        "type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .\r\n"
        "type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; ..\r\n"
        "type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt\r\n"
        "type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755; folder\r\n"
        "type=OS.unix=slink:/tmp;modify=20170117144634; link\r\n"
        "Type=File;Size=10;Modify=20200101000000.123; My File.txt\r\n";

    const std::vector<RemoteItem> items = parseMlsdListing(buf);
    BOOST_REQUIRE_EQUAL(items.size(), 4u);

    const RemoteItem* file = findItem(items, Zstr("readme.txt"));
    BOOST_REQUIRE(file);
    BOOST_CHECK(file->type == RemoteItemType::file);
    BOOST_CHECK_EQUAL(file->size, 4u);
    BOOST_CHECK_EQUAL(file->modTime, utcTime(2017, 1, 13, 6, 33, 14));

    const RemoteItem* folder = findItem(items, Zstr("folder"));
    BOOST_REQUIRE(folder);
    BOOST_CHECK(folder->type == RemoteItemType::folder);
    BOOST_CHECK_EQUAL(folder->size, 0u);

    const RemoteItem* link = findItem(items, Zstr("link"));
    BOOST_REQUIRE(link);
    BOOST_CHECK(link->type == RemoteItemType::symlink);

    const RemoteItem* spaced = findItem(items, Zstr("My File.txt"));
    BOOST_REQUIRE(spaced);
    BOOST_CHECK_EQUAL(spaced->size, 10u);
    BOOST_CHECK_EQUAL(spaced->modTime, utcTime(2020, 1, 1, 0, 0));
}


BOOST_AUTO_TEST_CASE(mlst_errors)
{
    BOOST_CHECK_THROW(parseMlstLine("type=file;size=-1;modify=20170113063314; broken"), SysError);
    BOOST_CHECK_THROW(parseMlstLine("type=file;size=4;modify=20170113063314;"), SysError);
    BOOST_CHECK_THROW(parseMlstLine("type=file;size=4;modify=2017; bad time"), SysError);

    //leading blank as sent by the server
    BOOST_CHECK(parseMlstLine(" type=dir;modify=20170117144634; x").type == RemoteItemType::folder);
}


BOOST_AUTO_TEST_CASE(unix_listing)
{
    const time_t now = utcTime(2024, 6, 15, 12, 0);

    const std::string buf =
        "total 4953\r\n"
        "drwxr-xr-x 2 root root    4096 Jan 10 11:58 .\r\n"
        "drwxr-xr-x 1 root root    4096 Jan 10 11:58 version\r\n"
        "-rw-r--r-- 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user\r\n"
        "-rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest\r\n"
        "lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects\r\n";

    const std::vector<RemoteItem> items = parseListListing(buf, now);
    BOOST_REQUIRE_EQUAL(items.size(), 4u);

    const RemoteItem* folder = findItem(items, Zstr("version"));
    BOOST_REQUIRE(folder);
    BOOST_CHECK(folder->type == RemoteItemType::folder);
    BOOST_CHECK_EQUAL(folder->modTime, utcTime(2024, 1, 10, 11, 58));

    //date ahead of "now" => last year
    const RemoteItem* file = findItem(items, Zstr("Unit Test.vcxproj.user"));
    BOOST_REQUIRE(file);
    BOOST_CHECK(file->type == RemoteItemType::file);
    BOOST_CHECK_EQUAL(file->size, 1084u);
    BOOST_CHECK_EQUAL(file->modTime, utcTime(2023, 9, 2, 1, 17));

    const RemoteItem* manifest = findItem(items, Zstr("win32.manifest"));
    BOOST_REQUIRE(manifest);
    BOOST_CHECK_EQUAL(manifest->modTime, utcTime(2016, 2, 28, 0, 0));

    const RemoteItem* link = findItem(items, Zstr("Projects"));
    BOOST_REQUIRE(link);
    BOOST_CHECK(link->type == RemoteItemType::symlink);
}


BOOST_AUTO_TEST_CASE(unix_listing_without_group)
{
    const std::string buf =
        "dr-xr-xr-x   2 root        512 Apr  8  1994 etc\r\n"
        "-r--r--r--   1 root       1024 Apr  8  1994 motd\r\n";

    const std::vector<RemoteItem> items = parseListListing(buf, utcTime(2024, 6, 15, 12, 0));
    BOOST_REQUIRE_EQUAL(items.size(), 2u);

    BOOST_CHECK(items[0].name == Zstr("etc"));
    BOOST_CHECK(items[0].type == RemoteItemType::folder);
    BOOST_CHECK(items[1].name == Zstr("motd"));
    BOOST_CHECK_EQUAL(items[1].size, 1024u);
    BOOST_CHECK_EQUAL(items[1].modTime, utcTime(1994, 4, 8, 0, 0));
}


BOOST_AUTO_TEST_CASE(windows_listing)
{
    const std::string buf =
        "10-27-15  03:46AM       <DIR>          pub\r\n"
        "04-08-14  03:09PM               11,399 readme.txt\r\n"
        "06-22-2017  12:50PM              1875499 zstring.obj\r\n"
        "01-01-98  13:00       <DIR>          Storage Card\r\n";

    const std::vector<RemoteItem> items = parseListListing(buf, utcTime(2024, 6, 15, 12, 0));
    BOOST_REQUIRE_EQUAL(items.size(), 4u);

    BOOST_CHECK(items[0].name == Zstr("pub"));
    BOOST_CHECK(items[0].type == RemoteItemType::folder);
    BOOST_CHECK_EQUAL(items[0].modTime, utcTime(2015, 10, 27, 3, 46));

    BOOST_CHECK(items[1].type == RemoteItemType::file);
    BOOST_CHECK_EQUAL(items[1].size, 11399u);
    BOOST_CHECK_EQUAL(items[1].modTime, utcTime(2014, 4, 8, 15, 9));

    BOOST_CHECK_EQUAL(items[2].size, 1875499u);
    BOOST_CHECK_EQUAL(items[2].modTime, utcTime(2017, 6, 22, 12, 50));

    BOOST_CHECK(items[3].name == Zstr("Storage Card"));
    BOOST_CHECK_EQUAL(items[3].modTime, utcTime(1998, 1, 1, 13, 0));
}


BOOST_AUTO_TEST_CASE(list_errors)
{
    const time_t now = utcTime(2024, 6, 15, 12, 0);

    BOOST_CHECK_THROW(parseListListing("garbage line\r\n", now), SysError);
    BOOST_CHECK_THROW(parseListListing("-rw-r--r-- 1 root root 1084 Foo  2 01:17 x\r\n", now), SysError);
    BOOST_CHECK_THROW(parseListListing("13-27-15  03:46AM       <DIR>          pub\r\n", now), SysError);

    BOOST_CHECK(parseListListing("", now).empty());
}

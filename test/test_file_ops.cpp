// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

/*

test_file_ops.cpp
-----------------

Stat, create, delete, transfer and move of items on pooled FTP connections.

*/


#define BOOST_TEST_MODULE file_ops

#include <boost/test/unit_test.hpp>
#include <zen/file_io.h>
#include <base/file_ops.h>
#include "fake_session.h"

using namespace zen;
using namespace fnav;
using namespace fnav_test;


namespace
{
struct PoolFixture
{
    PoolFixture()
    {
        server.folders.insert(Zstr("/pub"));
        server.files[Zstr("/pub/readme.txt")] = "hello";
        server.files[Zstr("/pub/my file.txt")] = "spaces";
    }

    FakeServer server;
    ManualClock clock;
    BookmarkStore bookmarks;
    ConnectionPool pool{makeTestPoolConfig(), bookmarks, makeFakeSessionFactory(server), clock.getNowFunction()};
};
}


BOOST_FIXTURE_TEST_CASE(item_attributes, PoolFixture)
{
    const RemoteItem file = getRemoteItem(pool, "ftp://example.com/pub/readme.txt");
    BOOST_CHECK(file.type == RemoteItemType::file);
    BOOST_CHECK_EQUAL(file.name, "readme.txt");
    BOOST_CHECK_EQUAL(file.size, 5u);

    BOOST_CHECK(getRemoteItem(pool, "ftp://example.com/pub/").type == RemoteItemType::folder);
    BOOST_CHECK_EQUAL(getRemoteItem(pool, "ftp://example.com/pub/my%20file.txt").size, 6u);

    BOOST_CHECK_THROW(getRemoteItem(pool, "ftp://example.com/pub/missing.txt"), FileError);
    BOOST_CHECK_THROW(getRemoteItem(pool, "http://example.com/pub/readme.txt"), FileError);

    BOOST_CHECK_EQUAL(server.connectCount, 1);
}


BOOST_FIXTURE_TEST_CASE(no_connection, PoolFixture)
{
    server.refuseConnect = true;
    BOOST_CHECK_THROW(getRemoteItem(pool, "ftp://example.com/pub/readme.txt"), ErrorConnectionUnavailable);
}


BOOST_FIXTURE_TEST_CASE(create_and_remove_folders, PoolFixture)
{
    createRemoteFolder(pool, "ftp://example.com/a");
    createRemoteFolder(pool, "ftp://example.com/a/b");
    server.files[Zstr("/a/b/file.txt")] = "data";
    server.files[Zstr("/a/top.txt")] = "data";

    BOOST_CHECK_THROW(createRemoteFolder(pool, "ftp://example.com/a"), FileError);
    BOOST_CHECK_THROW(createRemoteFolder(pool, "ftp://example.com/missing/c"), FileError);

    removeRemoteItem(pool, "ftp://example.com/a");
    BOOST_CHECK(!server.folders.contains(Zstr("/a")));
    BOOST_CHECK(!server.folders.contains(Zstr("/a/b")));
    BOOST_CHECK(!server.files.contains(Zstr("/a/b/file.txt")));
    BOOST_CHECK(!server.files.contains(Zstr("/a/top.txt")));

    removeRemoteItem(pool, "ftp://example.com/pub/readme.txt");
    BOOST_CHECK(!server.files.contains(Zstr("/pub/readme.txt")));

    BOOST_CHECK_THROW(removeRemoteItem(pool, "ftp://example.com/pub/readme.txt"), FileError);
    BOOST_CHECK_THROW(removeRemoteItem(pool, "ftp://example.com/"), FileError);
    BOOST_CHECK(server.folders.contains(Zstr("/pub")));
}


BOOST_FIXTURE_TEST_CASE(touch_creates_empty_file, PoolFixture)
{
    touchRemoteFile(pool, "ftp://example.com/pub/new.txt");
    BOOST_REQUIRE(server.files.contains(Zstr("/pub/new.txt")));
    BOOST_CHECK(server.files[Zstr("/pub/new.txt")].empty());

    //the upload ran on a child connection: reaped on release
    BOOST_CHECK_EQUAL(server.childCloseCount, 1);

    BOOST_CHECK_THROW(touchRemoteFile(pool, "ftp://example.com/pub/new.txt"), FileError);
    BOOST_CHECK_THROW(touchRemoteFile(pool, "ftp://example.com/pub"), FileError);
    BOOST_CHECK_EQUAL(server.files[Zstr("/pub/readme.txt")], "hello");
}


BOOST_FIXTURE_TEST_CASE(download_and_upload, PoolFixture)
{
    server.files[Zstr("/pub/data.bin")] = "0123456789abc"; //several transfer blocks

    const TempFilePath localPath("download.bin");
    downloadRemoteFile(pool, "ftp://example.com/pub/data.bin", localPath.get());
    BOOST_CHECK_EQUAL(getFileContent(localPath.get()), "0123456789abc");

    //existing local file is replaced
    server.files[Zstr("/pub/data.bin")] = "new";
    downloadRemoteFile(pool, "ftp://example.com/pub/data.bin", localPath.get());
    BOOST_CHECK_EQUAL(getFileContent(localPath.get()), "new");

    const TempFilePath uploadPath("upload.txt");
    setFileContent(uploadPath.get(), "upload me please");
    uploadRemoteFile(pool, uploadPath.get(), "ftp://example.com/pub/up.txt");
    BOOST_CHECK_EQUAL(server.files[Zstr("/pub/up.txt")], "upload me please");

    BOOST_CHECK_EQUAL(server.childCloseCount, 3);
    BOOST_CHECK_EQUAL(server.connectCount, 1);
}


BOOST_FIXTURE_TEST_CASE(failed_download_leaves_no_file, PoolFixture)
{
    const TempFilePath localPath("missing.bin");

    BOOST_CHECK_THROW(downloadRemoteFile(pool, "ftp://example.com/pub/missing.bin", localPath.get()), FileError);
    BOOST_CHECK(!itemExists(localPath.get()));
    BOOST_CHECK(!itemExists(localPath.get() + Zstr('.') + numberTo<Zstring>(::getpid()) + Zstr(".tmp")));

    BOOST_CHECK_THROW(uploadRemoteFile(pool, localPath.get(), "ftp://example.com/pub/up.txt"), FileError);
    BOOST_CHECK(!server.files.contains(Zstr("/pub/up.txt")));
}


BOOST_FIXTURE_TEST_CASE(copy_file, PoolFixture)
{
    copyRemoteFile(pool, "ftp://example.com/pub/readme.txt", "ftp://example.com/pub/readme%20copy.txt");

    BOOST_CHECK_EQUAL(server.files[Zstr("/pub/readme copy.txt")], "hello");
    BOOST_CHECK_EQUAL(server.files[Zstr("/pub/readme.txt")], "hello");
    BOOST_CHECK_EQUAL(server.connectCount, 1);

    BOOST_CHECK_THROW(copyRemoteFile(pool, "ftp://example.com/pub/missing.txt", "ftp://example.com/pub/x.txt"), FileError);
}


BOOST_FIXTURE_TEST_CASE(move_on_same_server_renames, PoolFixture)
{
    bookmarks.setTable({{"ftp://work", Bookmark{"ftp://example.com", "/", ""}}});

    moveRemoteItem(pool, "ftp://example.com/pub/readme.txt", "ftp://example.com/pub/renamed.txt");
    BOOST_CHECK_EQUAL(server.files[Zstr("/pub/renamed.txt")], "hello");
    BOOST_CHECK(!server.files.contains(Zstr("/pub/readme.txt")));

    //alias and target share the connection
    moveRemoteItem(pool, "ftp://work/pub", "ftp://example.com/public");
    BOOST_CHECK(server.folders.contains(Zstr("/public")));
    BOOST_CHECK(!server.folders.contains(Zstr("/pub")));

    BOOST_CHECK_EQUAL(server.connectCount, 1);
    BOOST_CHECK_EQUAL(server.childCloseCount, 0); //no transfers
}


BOOST_FIXTURE_TEST_CASE(move_between_servers_copies_then_removes, PoolFixture)
{
    //one file tree serves all hosts
    moveRemoteItem(pool, "ftp://a.example.com/pub/readme.txt", "ftp://b.example.com/pub/moved.txt");

    BOOST_CHECK_EQUAL(server.files[Zstr("/pub/moved.txt")], "hello");
    BOOST_CHECK(!server.files.contains(Zstr("/pub/readme.txt")));
    BOOST_CHECK_EQUAL(server.connectCount, 2);
    BOOST_CHECK_EQUAL(server.childCloseCount, 2);

    BOOST_CHECK_THROW(moveRemoteItem(pool, "ftp://a.example.com/pub", "ftp://b.example.com/pub2"), FileError);
    BOOST_CHECK(server.folders.contains(Zstr("/pub")));
}

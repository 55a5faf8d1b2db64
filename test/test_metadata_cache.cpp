// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

/*

test_metadata_cache.cpp
-----------------------

Bounded item metadata cache: least recently used entries go first, folder invalidation drops children.

*/


#define BOOST_TEST_MODULE metadata_cache

#include <boost/test/unit_test.hpp>
#include <afs/metadata_cache.h>

using namespace fnav;


namespace
{
RemoteItem makeFile(const Zstring& name, uint64_t size) { return {RemoteItemType::file, name, size, 0}; }
RemoteItem makeFolder(const Zstring& name) { return {RemoteItemType::folder, name, 0, 0}; }
}


BOOST_AUTO_TEST_CASE(insert_and_find)
{
    MetadataCache cache(10);
    cache.insert(Zstr("/pub/a.txt"), makeFile(Zstr("a.txt"), 5));

    const std::optional<RemoteItem> item = cache.find(Zstr("/pub/a.txt"));
    BOOST_REQUIRE(item);
    BOOST_CHECK_EQUAL(item->size, 5u);

    BOOST_CHECK(!cache.find(Zstr("/pub/b.txt")));

    //overwrite
    cache.insert(Zstr("/pub/a.txt"), makeFile(Zstr("a.txt"), 7));
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK_EQUAL(cache.find(Zstr("/pub/a.txt"))->size, 7u);
}


BOOST_AUTO_TEST_CASE(least_recently_used_is_dropped)
{
    MetadataCache cache(3);
    cache.insert(Zstr("/a"), makeFile(Zstr("a"), 1));
    cache.insert(Zstr("/b"), makeFile(Zstr("b"), 2));
    cache.insert(Zstr("/c"), makeFile(Zstr("c"), 3));

    BOOST_CHECK(cache.find(Zstr("/a"))); //"b" is now the oldest

    cache.insert(Zstr("/d"), makeFile(Zstr("d"), 4));
    BOOST_CHECK_EQUAL(cache.size(), 3u);
    BOOST_CHECK(!cache.find(Zstr("/b")));
    BOOST_CHECK(cache.find(Zstr("/a")));
    BOOST_CHECK(cache.find(Zstr("/c")));
    BOOST_CHECK(cache.find(Zstr("/d")));
}


BOOST_AUTO_TEST_CASE(shrink_on_capacity_change)
{
    MetadataCache cache(1000);
    for (int i = 0; i < 100; ++i)
        cache.insert(Zstr("/f") + zen::numberTo<Zstring>(i), makeFile(Zstr("f"), i));

    cache.setCapacity(10);
    BOOST_CHECK_EQUAL(cache.getCapacity(), 10u);
    BOOST_CHECK_EQUAL(cache.size(), 10u);
    BOOST_CHECK(!cache.find(Zstr("/f89")));
    BOOST_CHECK(cache.find(Zstr("/f90")));
    BOOST_CHECK(cache.find(Zstr("/f99")));
}


BOOST_AUTO_TEST_CASE(erase_folder_drops_children)
{
    MetadataCache cache(100);
    cache.insert(Zstr("/pub"),            makeFolder(Zstr("pub")));
    cache.insert(Zstr("/pub/a.txt"),      makeFile(Zstr("a.txt"), 1));
    cache.insert(Zstr("/pub/sub/b.txt"),  makeFile(Zstr("b.txt"), 2));
    cache.insert(Zstr("/public"),         makeFolder(Zstr("public")));
    cache.insert(Zstr("/public/c.txt"),   makeFile(Zstr("c.txt"), 3));

    cache.erase(Zstr("/pub"));

    BOOST_CHECK_EQUAL(cache.size(), 2u);
    BOOST_CHECK(!cache.find(Zstr("/pub/sub/b.txt")));
    BOOST_CHECK(cache.find(Zstr("/public")));
    BOOST_CHECK(cache.find(Zstr("/public/c.txt")));

    cache.clear();
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}


BOOST_AUTO_TEST_CASE(zero_capacity_keeps_nothing)
{
    MetadataCache cache(0);
    cache.insert(Zstr("/a"), makeFile(Zstr("a"), 1));

    BOOST_CHECK_EQUAL(cache.size(), 0u);
    BOOST_CHECK(!cache.find(Zstr("/a")));
}

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

/*

test_pool_config.cpp
--------------------

Pool settings from "FTP Settings.json": defaults, overrides and clamping.

*/


#define BOOST_TEST_MODULE pool_config

#include <boost/test/unit_test.hpp>
#include <zen/file_io.h>
#include "fake_session.h"

using namespace zen;
using namespace fnav;
using namespace fnav_test;
using std::chrono::seconds;


BOOST_AUTO_TEST_CASE(defaults)
{
    const TempFilePath filePath("FTP Settings missing.json");
    const PoolConfig cfg = loadPoolConfig(filePath.get());

    BOOST_CHECK_EQUAL(cfg.capacity, 3u);
    BOOST_CHECK(cfg.idleTimeout         == seconds(120));
    BOOST_CHECK(cfg.healthCheckInterval == seconds(5));
    BOOST_CHECK(cfg.cleanupInterval     == seconds(4));
    BOOST_CHECK_EQUAL(cfg.metadataCacheSize, 20000u);
    BOOST_CHECK_EQUAL(cfg.timeoutSec, 10);
    BOOST_CHECK(!cfg.disableDetailedStats);
}


BOOST_AUTO_TEST_CASE(partial_override)
{
    const TempFilePath filePath("FTP Settings partial.json");
    setFileContent(filePath.get(), R"({ "max_pool_size": 5, "connection_timeout_sec": 60, "disable_detailed_stats": true, "unknown_key": "ignored" })");

    const PoolConfig cfg = loadPoolConfig(filePath.get());
    BOOST_CHECK_EQUAL(cfg.capacity, 5u);
    BOOST_CHECK(cfg.idleTimeout == seconds(60));
    BOOST_CHECK(cfg.disableDetailedStats);

    BOOST_CHECK(cfg.healthCheckInterval == seconds(5));
    BOOST_CHECK_EQUAL(cfg.metadataCacheSize, 20000u);
}


BOOST_AUTO_TEST_CASE(out_of_range_values_are_clamped)
{
    const TempFilePath filePath("FTP Settings clamped.json");
    setFileContent(filePath.get(), R"({ "max_pool_size": 0, "network_timeout_sec": -3, "noop_check_interval_sec": -1, "stat_cache_size": -10 })");

    const PoolConfig cfg = loadPoolConfig(filePath.get());
    BOOST_CHECK_EQUAL(cfg.capacity, 1u);
    BOOST_CHECK_EQUAL(cfg.timeoutSec, 1);
    BOOST_CHECK(cfg.healthCheckInterval == seconds(0));
    BOOST_CHECK_EQUAL(cfg.metadataCacheSize, 0u);
}


BOOST_AUTO_TEST_CASE(invalid_settings)
{
    const TempFilePath filePath("FTP Settings invalid.json");

    setFileContent(filePath.get(), R"({ "max_pool_size": "five" })");
    BOOST_CHECK_THROW(loadPoolConfig(filePath.get()), FileError);

    setFileContent(filePath.get(), R"({ "max_pool_size": )");
    BOOST_CHECK_THROW(loadPoolConfig(filePath.get()), FileError);
}


BOOST_AUTO_TEST_CASE(save_and_reload)
{
    const TempFilePath filePath("FTP Settings saved.json");

    PoolConfig cfg;
    cfg.capacity = 7;
    cfg.idleTimeout = seconds(300);
    cfg.cleanupInterval = seconds(0);
    cfg.disableDetailedStats = true;
    savePoolConfig(cfg, filePath.get());

    const PoolConfig loaded = loadPoolConfig(filePath.get());
    BOOST_CHECK_EQUAL(loaded.capacity, 7u);
    BOOST_CHECK(loaded.idleTimeout == seconds(300));
    BOOST_CHECK(loaded.cleanupInterval == seconds(0));
    BOOST_CHECK(loaded.disableDetailedStats);
    BOOST_CHECK_EQUAL(loaded.timeoutSec, 10);
}

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "pool_config.h"
#include <zen/file_access.h>
#include <zen/json_io.h>

using namespace zen;
using namespace fnav;


namespace
{
template <class Num>
void readNumber(const JsonValue& jval, const std::string& name, Num& value, const Zstring& filePath) //throw FileError
{
    if (const JsonValue* child = getChildFromJsonObject(jval, name))
    {
        if (child->type != JsonValue::Type::number)
            throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)),
                            replaceCpy(_("Invalid value for %x."), L"%x", utfTo<std::wstring>(name)));

        value = stringTo<Num>(child->primVal);
    }
}


void readSeconds(const JsonValue& jval, const std::string& name, std::chrono::seconds& value, const Zstring& filePath) //throw FileError
{
    int64_t sec = value.count();
    readNumber(jval, name, sec, filePath); //throw FileError
    value = std::chrono::seconds(sec);
}
}


PoolConfig fnav::clampPoolConfig(PoolConfig cfg)
{
    cfg.capacity   = std::max<size_t>(cfg.capacity, 1);
    cfg.timeoutSec = std::max(cfg.timeoutSec, 1);

    cfg.idleTimeout         = std::max(cfg.idleTimeout,         std::chrono::seconds(0));
    cfg.healthCheckInterval = std::max(cfg.healthCheckInterval, std::chrono::seconds(0));
    cfg.cleanupInterval     = std::max(cfg.cleanupInterval,     std::chrono::seconds(0));
    return cfg;
}


PoolConfig fnav::loadPoolConfig(const Zstring& filePath) //throw FileError
{
    PoolConfig cfg;

    if (!itemExists(filePath)) //throw FileError
        return cfg;

    const JsonValue jval = loadJsonObject(filePath); //throw FileError

    int64_t capacity = static_cast<int64_t>(cfg.capacity);
    readNumber(jval, "max_pool_size", capacity, filePath); //throw FileError
    cfg.capacity = static_cast<size_t>(std::max<int64_t>(capacity, 0));

    int64_t cacheSize = static_cast<int64_t>(cfg.metadataCacheSize);
    readNumber(jval, "stat_cache_size", cacheSize, filePath); //throw FileError
    cfg.metadataCacheSize = static_cast<size_t>(std::max<int64_t>(cacheSize, 0));

    readSeconds(jval, "connection_timeout_sec",   cfg.idleTimeout,         filePath); //
    readSeconds(jval, "noop_check_interval_sec",  cfg.healthCheckInterval, filePath); //throw FileError
    readSeconds(jval, "cleanup_interval_sec",     cfg.cleanupInterval,     filePath); //
    readNumber (jval, "network_timeout_sec",      cfg.timeoutSec,          filePath); //

    if (const std::optional<std::string> val = getPrimitiveFromJsonObject(jval, "disable_detailed_stats"))
        cfg.disableDetailedStats = *val == "true";

    return clampPoolConfig(cfg);
}


void fnav::savePoolConfig(const PoolConfig& cfg, const Zstring& filePath) //throw FileError
{
    JsonValue jval(JsonValue::Type::object);
    jval.objectVal.emplace("max_pool_size",           JsonValue(static_cast<int64_t>(cfg.capacity)));
    jval.objectVal.emplace("stat_cache_size",         JsonValue(static_cast<int64_t>(cfg.metadataCacheSize)));
    jval.objectVal.emplace("connection_timeout_sec",  JsonValue(static_cast<int64_t>(cfg.idleTimeout.count())));
    jval.objectVal.emplace("noop_check_interval_sec", JsonValue(static_cast<int64_t>(cfg.healthCheckInterval.count())));
    jval.objectVal.emplace("cleanup_interval_sec",    JsonValue(static_cast<int64_t>(cfg.cleanupInterval.count())));
    jval.objectVal.emplace("network_timeout_sec",     JsonValue(cfg.timeoutSec));
    jval.objectVal.emplace("disable_detailed_stats",  JsonValue(cfg.disableDetailedStats));

    saveJsonDocument(jval, filePath); //throw FileError
}

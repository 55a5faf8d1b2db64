// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef POOL_CONFIG_H_2390847502938475092
#define POOL_CONFIG_H_2390847502938475092

#include <chrono>
#include <zen/zstring.h>


namespace fnav
{
struct PoolConfig
{
    size_t capacity = 3; //FTP servers commonly limit concurrent connections per IP
    std::chrono::seconds idleTimeout        {120};
    std::chrono::seconds healthCheckInterval{5};
    size_t metadataCacheSize = 20000; //items
    int timeoutSec = 10;
    std::chrono::seconds cleanupInterval{4}; //0: no background cleaner
    bool disableDetailedStats = false; //list names only
};

//"FTP Settings.json": missing file or keys => defaults
PoolConfig loadPoolConfig(const Zstring& filePath); //throw FileError
void savePoolConfig(const PoolConfig& cfg, const Zstring& filePath); //throw FileError

PoolConfig clampPoolConfig(PoolConfig cfg);
}

#endif //POOL_CONFIG_H_2390847502938475092

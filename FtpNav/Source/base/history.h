// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HISTORY_H_1209384750293847502
#define HISTORY_H_1209384750293847502

#include <ctime>
#include <map>
#include <vector>
#include <zen/zstring.h>


namespace fnav
{
using VisitHistory = std::map<std::string /*url*/, time_t /*last visit*/>;

//"FTP History.json": {"url": unix time}
VisitHistory loadHistory(const Zstring& filePath); //throw FileError; missing file => empty
void saveHistory(const VisitHistory& history, const Zstring& filePath); //throw FileError

void recordVisit(VisitHistory& history, const std::string& url, time_t visitTime = std::time(nullptr));

//urls containing "query" (case-insensitive), most recent first
std::vector<std::string> findRecent(const VisitHistory& history, const std::string_view query);
}

#endif //HISTORY_H_1209384750293847502

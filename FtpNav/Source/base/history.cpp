// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "history.h"
#include <zen/file_access.h>
#include <zen/json_io.h>

using namespace zen;
using namespace fnav;


VisitHistory fnav::loadHistory(const Zstring& filePath) //throw FileError
{
    if (!itemExists(filePath)) //throw FileError
        return {};

    const JsonValue jval = loadJsonObject(filePath); //throw FileError

    VisitHistory history;
    for (const auto& [url, jtime] : jval.objectVal)
    {
        if (jtime.type != JsonValue::Type::number)
            throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)),
                            replaceCpy(_("Invalid value for %x."), L"%x", utfTo<std::wstring>(url)));

        history.emplace(url, stringTo<time_t>(jtime.primVal)); //fractional seconds are truncated
    }
    return history;
}


void fnav::saveHistory(const VisitHistory& history, const Zstring& filePath) //throw FileError
{
    JsonValue jval(JsonValue::Type::object);

    for (const auto& [url, visitTime] : history)
        jval.objectVal.emplace(url, JsonValue(static_cast<int64_t>(visitTime)));

    saveJsonDocument(jval, filePath); //throw FileError
}


void fnav::recordVisit(VisitHistory& history, const std::string& url, time_t visitTime)
{
    history[url] = visitTime;
}


std::vector<std::string> fnav::findRecent(const VisitHistory& history, const std::string_view query)
{
    const Zstring queryUpper = getUpperCase(Zstring(query));

    std::vector<std::pair<time_t, std::string>> matches;
    for (const auto& [url, visitTime] : history)
        if (contains(getUpperCase(url), queryUpper))
            matches.emplace_back(visitTime, url);

    //most recent first; equal times: by url
    std::sort(matches.begin(), matches.end(), [](const auto& lhs, const auto& rhs)
    {
        if (lhs.first != rhs.first)
            return lhs.first > rhs.first;
        return lhs.second < rhs.second;
    });

    std::vector<std::string> urls;
    for (auto& [visitTime, url] : matches)
        urls.push_back(std::move(url));
    return urls;
}

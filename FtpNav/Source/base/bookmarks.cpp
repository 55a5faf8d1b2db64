// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "bookmarks.h"
#include <zen/file_access.h>
#include <zen/json_io.h>

using namespace zen;
using namespace fnav;


BookmarkTable fnav::loadBookmarks(const Zstring& filePath) //throw FileError
{
    if (!itemExists(filePath)) //throw FileError
        return {};

    const JsonValue jval = loadJsonObject(filePath); //throw FileError

    BookmarkTable bookmarks;
    for (const auto& [alias, jbookmark] : jval.objectVal)
    {
        if (jbookmark.type != JsonValue::Type::array ||
            jbookmark.arrayVal.empty() ||
            !std::all_of(jbookmark.arrayVal.begin(), jbookmark.arrayVal.end(), [](const JsonValue& jitem) { return jitem.type == JsonValue::Type::string; }))
            throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)),
                            replaceCpy(_("Invalid value for %x."), L"%x", utfTo<std::wstring>(alias)));

        const std::vector<JsonValue>& items = jbookmark.arrayVal;

        Bookmark& bm = bookmarks[alias];
        bm.targetBaseUrl = items[0].primVal;
        if (items.size() > 1)
            bm.defaultPath = items[1].primVal;
        if (items.size() > 2)
            bm.webUrl = items[2].primVal;
    }
    return bookmarks;
}


void fnav::saveBookmarks(const BookmarkTable& bookmarks, const Zstring& filePath) //throw FileError
{
    JsonValue jval(JsonValue::Type::object);

    for (const auto& [alias, bm] : bookmarks)
    {
        std::vector<JsonValue> items{JsonValue(bm.targetBaseUrl), JsonValue(bm.defaultPath)};
        if (!bm.webUrl.empty())
            items.emplace_back(bm.webUrl);

        jval.objectVal.emplace(alias, JsonValue(std::move(items)));
    }
    saveJsonDocument(jval, filePath); //throw FileError
}


std::string fnav::suggestBookmarkAlias(const std::string& url) //throw SysError
{
    std::string alias = getUrlWithoutPath(url); //throw SysError
    const std::string path = getUrlPath(url);   //

    if (!trimCpy(replaceCpy(path, '/', ' ')).empty())
        alias += replaceCpy(path, '/', '-');
    return alias;
}


std::string fnav::addBookmark(BookmarkTable& bookmarks, const std::string& url, std::string alias) //throw SysError
{
    if (!isFtpUrl(url))
        throw SysError(_("URL must include any of the following schemes: ftp://, ftps://"));

    std::string targetBaseUrl = getUrlWithoutPath(url); //throw SysError
    const std::string path    = getUrlPath(url);        //

    if (auto it = bookmarks.find(targetBaseUrl);
        it != bookmarks.end())
        targetBaseUrl = it->second.targetBaseUrl; //stored aliases are always resolved

    if (trimCpy(alias).empty())
        alias = suggestBookmarkAlias(url); //throw SysError
    else if (!isFtpUrl(alias))
        alias = beforeFirst(targetBaseUrl, "://", IfNotFoundReturn::none) + "://" + alias;

    if (!getUrlPath(alias).empty()) //throw SysError
        throw SysError(replaceCpy(_("Alias %x must not include path information."), L"%x", fmtPath(utfTo<std::wstring>(alias))));

    Bookmark& bm = bookmarks[alias];
    bm.targetBaseUrl = targetBaseUrl;
    bm.defaultPath   = path;
    return alias;
}


bool fnav::removeBookmark(BookmarkTable& bookmarks, const std::string& alias)
{
    return bookmarks.erase(alias) > 0;
}


std::string fnav::getBookmarkUrl(const std::string& alias, const Bookmark& bookmark)
{
    return appendUrlPath(alias, bookmark.defaultPath);
}


std::string fnav::getBookmarkWebUrl(const BookmarkTable& bookmarks, const std::string& url) //throw SysError
{
    const std::string alias = getUrlWithoutPath(url); //throw SysError

    auto it = bookmarks.find(alias);
    if (it == bookmarks.end())
        throw SysError(replaceCpy(_("Bookmark %x does not exist."), L"%x", fmtPath(utfTo<std::wstring>(alias))));

    std::string webUrl = it->second.webUrl;
    if (webUrl.empty())
        throw SysError(replaceCpy(_("Bookmark %x has no web URL."), L"%x", fmtPath(utfTo<std::wstring>(alias))));

    while (endsWith(webUrl, '/'))
        webUrl.pop_back();

    return appendUrlPath(webUrl, getUrlPath(url)); //throw SysError
}


void fnav::setBookmarkWebUrl(BookmarkTable& bookmarks, const std::string& alias, const std::string& webUrl) //throw SysError
{
    auto it = bookmarks.find(alias);
    if (it == bookmarks.end())
        throw SysError(replaceCpy(_("Bookmark %x does not exist."), L"%x", fmtPath(utfTo<std::wstring>(alias))));

    if (!webUrl.empty() &&
        !startsWith(webUrl, "http://") &&
        !startsWith(webUrl, "https://"))
        throw SysError(_("URL must include any of the following schemes: http://, https://"));

    it->second.webUrl = webUrl;
}


std::vector<std::string> fnav::findBookmarks(const BookmarkTable& bookmarks, const std::string_view query)
{
    const Zstring queryUpper = getUpperCase(Zstring(query));

    std::vector<std::string> aliases;
    for (const auto& [alias, bm] : bookmarks) //std::map => already sorted
        if (contains(getUpperCase(alias), queryUpper))
            aliases.push_back(alias);
    return aliases;
}

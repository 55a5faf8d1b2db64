// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BOOKMARKS_H_8203947520398475029
#define BOOKMARKS_H_8203947520398475029

#include <vector>
#include <zen/thread.h>
#include "ftp_url.h"


namespace fnav
{
//"FTP Bookmarks.json": {"alias": ["target base URL", "default path", "web URL"(optional)]}
BookmarkTable loadBookmarks(const Zstring& filePath); //throw FileError; missing file => empty
void saveBookmarks(const BookmarkTable& bookmarks, const Zstring& filePath); //throw FileError

//"ftp://host/a/b" => "ftp://host-a-b"
std::string suggestBookmarkAlias(const std::string& url); //throw SysError

/*  - url: ftp:// or ftps://; if its base is an alias itself, the new bookmark points to that alias' target
    - alias: empty => suggestBookmarkAlias(); missing scheme => scheme of the target; must not contain a path
    - replaces an existing bookmark of the same alias                                                      */
std::string addBookmark(BookmarkTable& bookmarks, const std::string& url, std::string alias); //throw SysError; returns alias

bool removeBookmark(BookmarkTable& bookmarks, const std::string& alias); //false if not existing

//alias + default path, e.g. "ftp://myserver/pub"
std::string getBookmarkUrl(const std::string& alias, const Bookmark& bookmark);

//web mirror of the bookmark behind "url", the URL path appended: "ftp://work/pub" => "https://example.com/pub"
std::string getBookmarkWebUrl(const BookmarkTable& bookmarks, const std::string& url); //throw SysError

//http:// or https://; empty: remove
void setBookmarkWebUrl(BookmarkTable& bookmarks, const std::string& alias, const std::string& webUrl); //throw SysError

//aliases containing "query" (case-insensitive), sorted
std::vector<std::string> findBookmarks(const BookmarkTable& bookmarks, const std::string_view query);


//thread-safe alias table as read by the connection pool
class BookmarkStore
{
public:
    BookmarkStore() {}
    explicit BookmarkStore(const BookmarkTable& bookmarks) : bookmarks_(bookmarks) {}

    BookmarkTable getTable() const { return bookmarks_.access([](const BookmarkTable& bookmarks) { return bookmarks; }); }
    void setTable(const BookmarkTable& bookmarks) { bookmarks_.access([&](BookmarkTable& bm) { bm = bookmarks; }); }

    ConnectionIdentity resolve(const std::string& url) const //throw SysError
    {
        return bookmarks_.access([&](const BookmarkTable& bookmarks) { return resolveConnectionIdentity(url, bookmarks); }); //throw SysError
    }

private:
    BookmarkStore           (const BookmarkStore&) = delete;
    BookmarkStore& operator=(const BookmarkStore&) = delete;

    mutable zen::Protected<BookmarkTable> bookmarks_;
};
}

#endif //BOOKMARKS_H_8203947520398475029

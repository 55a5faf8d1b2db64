// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <cstdlib>
#include <iostream>
#include <zen/file_access.h>
#include <zen/time.h>
#include <libcurl/curl_wrap.h>
#include "base/connection_pool.h"
#include "base/file_ops.h"
#include "base/history.h"
#include "afs/ftp.h"

using namespace zen;
using namespace fnav;


namespace
{
const Zchar SETTINGS_FILE_NAME [] = Zstr("FTP Settings.json");
const Zchar BOOKMARKS_FILE_NAME[] = Zstr("FTP Bookmarks.json");
const Zchar HISTORY_FILE_NAME  [] = Zstr("FTP History.json");


struct CommandLineOptions
{
    Zstring configDir;
    bool verbose = false;
};


CommandLineOptions parseCommandLine(int argc, char* argv[]) //throw SysError
{
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "--verbose" || arg == "-v")
            options.verbose = true;
        else if (arg == "--config")
        {
            if (++i == argc)
                throw SysError(replaceCpy(_("Missing value for command line parameter %x."), L"%x", L"--config"));
            options.configDir = utfTo<Zstring>(argv[i]);
        }
        else
            throw SysError(replaceCpy(_("Unknown command line parameter %x."), L"%x", utfTo<std::wstring>(arg)));
    }

    if (options.configDir.empty())
    {
        const char* homePath = ::getenv("HOME"); //no ownership transfer + no extended error reporting
        if (!homePath)
            throw SysError(_("Cannot determine the home directory. Please use --config <dir>."));
        options.configDir = appendPath(utfTo<Zstring>(homePath), Zstr(".config/FtpNav"));
    }
    return options;
}


void printLine(const std::wstring& msg) { std::cout << utfTo<std::string>(msg) << '\n'; }
void printError(const std::wstring& msg) { std::cerr << utfTo<std::string>(msg) << '\n'; }


std::string formatItem(const RemoteItem& item, bool detailedStats)
{
    const std::string name = utfTo<std::string>(item.name) + (item.type == RemoteItemType::folder ? "/" : "");
    if (!detailedStats)
        return name;

    std::string sizeFmt = item.type == RemoteItemType::file ? numberTo<std::string>(item.size) : std::string("-");
    if (sizeFmt.size() < 12)
        sizeFmt.insert(0, 12 - sizeFmt.size(), ' ');

    const std::string timeFmt = item.modTime == 0 ? std::string(19, ' ') :
                                utfTo<std::string>(formatTime(formatIsoDateTimeTag, getUtcTime(item.modTime)));

    return timeFmt + ' ' + sizeFmt + "  " + name;
}


//line-oriented front end for one connection pool
class FtpShell
{
public:
    FtpShell(const Zstring& configDir, bool verbose) : //throw FileError
        configDir_(configDir),
        poolCfg_(loadPoolConfig(appendPath(configDir, SETTINGS_FILE_NAME))),   //throw FileError
        bookmarks_(loadBookmarks(appendPath(configDir, BOOKMARKS_FILE_NAME))), //
        history_(loadHistory(appendPath(configDir, HISTORY_FILE_NAME))),       //
        pool_(poolCfg_, bookmarks_, [timeoutSec = clampPoolConfig(poolCfg_).timeoutSec](const ConnectionIdentity& id)
    {
        return createFtpSession(id, timeoutSec); //throw SysError
    })
    {
        pool_.setActivityLogEnabled(verbose);
    }

    //returns false on "quit"
    bool runCommand(const std::string& commandLine) //throw FileError, SysError
    {
        const std::vector<std::string> args = split(commandLine, ' ', SplitOnEmpty::skip);
        if (args.empty())
            return true;

        const std::string& cmd = args[0];
        const std::string arg1 = args.size() > 1 ? args[1] : std::string();
        const std::string arg2 = args.size() > 2 ? args[2] : std::string();

        if (cmd == "quit" || cmd == "exit")
            return false;
        else if (cmd == "open" && !arg1.empty())
            openUrl(arg1); //throw FileError, SysError
        else if (cmd == "stat" && !arg1.empty())
        {
            printLine(utfTo<std::wstring>(formatItem(getRemoteItem(pool_, arg1), true /*detailedStats*/))); //throw FileError
            pool_.recordVisited(arg1); //throw SysError
        }
        else if (cmd == "get" && !arg2.empty())
        {
            downloadRemoteFile(pool_, arg1, utfTo<Zstring>(arg2)); //throw FileError
            pool_.recordVisited(arg1); //throw SysError
        }
        else if (cmd == "put" && !arg2.empty())
        {
            uploadRemoteFile(pool_, utfTo<Zstring>(arg1), arg2); //throw FileError
            pool_.recordVisited(arg2); //throw SysError
        }
        else if ((cmd == "mv" || cmd == "cp") && !arg2.empty())
        {
            if (cmd == "mv")
                moveRemoteItem(pool_, arg1, arg2); //throw FileError
            else
                copyRemoteFile(pool_, arg1, arg2); //throw FileError
            pool_.recordVisited(arg2); //throw SysError
        }
        else if ((cmd == "rm" || cmd == "mkdir" || cmd == "touch") && !arg1.empty())
        {
            if (cmd == "rm")
                removeRemoteItem(pool_, arg1); //throw FileError
            else if (cmd == "mkdir")
                createRemoteFolder(pool_, arg1); //throw FileError
            else
                touchRemoteFile(pool_, arg1); //throw FileError
            pool_.recordVisited(arg1); //throw SysError
        }
        else if (cmd == "connections")
            for (const auto& [baseUrl, lastVisitedUrl] : pool_.listOpenConnections())
                printLine(utfTo<std::wstring>(baseUrl + "  " + lastVisitedUrl));
        else if (cmd == "close" && !arg1.empty())
            pool_.closeByBaseUrl(arg1);
        else if (cmd == "closeall")
        {
            pool_.closeAll();
            printLine(_("All FTP connections have been closed."));
        }
        else if (cmd == "bookmarks")
        {
            const BookmarkTable table = bookmarks_.getTable();
            for (const std::string& alias : findBookmarks(table, arg1))
                printLine(utfTo<std::wstring>(alias + "  " + getBookmarkUrl(alias, table.find(alias)->second)));
        }
        else if (cmd == "bookmark" && !arg1.empty())
        {
            BookmarkTable table = bookmarks_.getTable();
            const std::string alias = addBookmark(table, arg1, arg2); //throw SysError

            saveBookmarks(table, appendPath(configDir_, BOOKMARKS_FILE_NAME)); //throw FileError
            bookmarks_.setTable(table);
            printLine(replaceCpy(_("Bookmark %x added."), L"%x", utfTo<std::wstring>(alias)));
        }
        else if (cmd == "unbookmark" && !arg1.empty())
        {
            BookmarkTable table = bookmarks_.getTable();
            if (!removeBookmark(table, arg1))
                throw SysError(replaceCpy(_("Bookmark %x does not exist."), L"%x", utfTo<std::wstring>(arg1)));

            saveBookmarks(table, appendPath(configDir_, BOOKMARKS_FILE_NAME)); //throw FileError
            bookmarks_.setTable(table);
        }
        else if (cmd == "weburl" && !arg2.empty())
        {
            BookmarkTable table = bookmarks_.getTable();
            setBookmarkWebUrl(table, arg1, arg2 == "-" ? std::string() : arg2); //throw SysError

            saveBookmarks(table, appendPath(configDir_, BOOKMARKS_FILE_NAME)); //throw FileError
            bookmarks_.setTable(table);
        }
        else if (cmd == "weburl" && !arg1.empty())
            printLine(utfTo<std::wstring>(getBookmarkWebUrl(bookmarks_.getTable(), arg1))); //throw SysError
        else if (cmd == "history" && arg1 == "clear")
        {
            saveHistory({}, appendPath(configDir_, HISTORY_FILE_NAME)); //throw FileError
            history_.clear();
        }
        else if (cmd == "history")
            for (const std::string& url : findRecent(history_, arg1))
                printLine(utfTo<std::wstring>(url));
        else if (cmd == "stats")
        {
            PoolConfig cfg = poolCfg_;
            cfg.disableDetailedStats = !cfg.disableDetailedStats;
            savePoolConfig(cfg, appendPath(configDir_, SETTINGS_FILE_NAME)); //throw FileError
            poolCfg_ = cfg;

            printLine(poolCfg_.disableDetailedStats ?
                      _("FTP detailed stats disabled. Only file names will be shown.") :
                      _("FTP detailed stats enabled. File size and modification time will be shown."));
        }
        else
            printLine(_("Commands:") + L"\n"
                      L"  open <url>\n"
                      L"  stat <url>\n"
                      L"  get <url> <local file>\n"
                      L"  put <local file> <url>\n"
                      L"  cp <url> <url>\n"
                      L"  mv <url> <url>\n"
                      L"  rm <url>\n"
                      L"  mkdir <url>\n"
                      L"  touch <url>\n"
                      L"  connections\n"
                      L"  close <base url>\n"
                      L"  closeall\n"
                      L"  bookmarks [query]\n"
                      L"  bookmark <url> [alias]\n"
                      L"  unbookmark <alias>\n"
                      L"  weburl <url> | weburl <alias> <web url or ->\n"
                      L"  history [query] | history clear\n"
                      L"  stats\n"
                      L"  quit");
        return true;
    }

    ErrorLog fetchActivityLog() { return pool_.fetchActivityLog(); }

private:
    void openUrl(const std::string& url) //throw FileError, SysError
    {
        if (!isFtpUrl(url))
            throw SysError(_("URL must include any of the following schemes: ftp://, ftps://"));

        std::vector<RemoteItem> items;
        {
            const ScopedConnection conn = pool_.acquire(url); //throw SysError, ErrorConnectionUnavailable
            const Zstring folderPath = utfTo<Zstring>(decodeUrlComponent(conn.getPath()));
            try
            {
                items = conn.session().listFolder(folderPath); //throw SysError
            }
            catch (const SysError& e)
            {
                throw FileError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(utfTo<std::wstring>(conn.getBaseUrl()) + utfTo<std::wstring>(folderPath))), e.toString());
            }
        }

        std::sort(items.begin(), items.end(), [](const RemoteItem& lhs, const RemoteItem& rhs)
        {
            if ((lhs.type == RemoteItemType::folder) != (rhs.type == RemoteItemType::folder))
                return lhs.type == RemoteItemType::folder; //folders first
            return lhs.name < rhs.name;
        });

        for (const RemoteItem& item : items)
            std::cout << formatItem(item, !poolCfg_.disableDetailedStats) << '\n';

        pool_.recordVisited(url); //throw SysError

        recordVisit(history_, url);
        saveHistory(history_, appendPath(configDir_, HISTORY_FILE_NAME)); //throw FileError
    }

    const Zstring configDir_;
    PoolConfig poolCfg_;
    BookmarkStore bookmarks_;
    VisitHistory history_;
    ConnectionPool pool_; //declare after bookmarks_: references it
};
}


int main(int argc, char* argv[])
{
    initExtraLog([](const ErrorLog& log)
    {
        for (const LogEntry& entry : log)
            std::cerr << formatMessage(entry);
    });

    try
    {
        const CommandLineOptions options = parseCommandLine(argc, argv); //throw SysError

        libcurlInit();
        ZEN_ON_SCOPE_EXIT(libcurlTearDown());

        FtpShell shell(options.configDir, options.verbose); //throw FileError

        for (std::string line; std::cout << "ftpnav> " << std::flush, std::getline(std::cin, line);)
        {
            try
            {
                if (!shell.runCommand(trimCpy(line))) //throw FileError, SysError
                    break;
            }
            catch (const FileError& e) { printError(e.toString()); }
            catch (const SysError&  e) { printError(e.toString()); }

            for (const LogEntry& entry : shell.fetchActivityLog())
                std::cout << formatMessage(entry);

            for (const LogEntry& entry : fetchExtraLog())
                std::cerr << formatMessage(entry);
        }
        return EXIT_SUCCESS;
    }
    catch (const FileError& e)
    {
        printError(e.toString());
        return EXIT_FAILURE;
    }
    catch (const SysError& e)
    {
        printError(e.toString());
        return EXIT_FAILURE;
    }
}

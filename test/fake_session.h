// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FAKE_SESSION_H_3409857230948572309
#define FAKE_SESSION_H_3409857230948572309

#include <set>
#include <unistd.h>
#include <base/connection_pool.h>


namespace fnav_test
{
using namespace fnav;

//counters and file tree shared by all sessions of one test
struct FakeServer
{
    int connectCount    = 0;
    int noopCount       = 0;
    int closeCount      = 0;
    int childCloseCount = 0;

    bool refuseConnect = false;
    bool failNoop      = false;

    std::vector<ConnectionIdentity> connectedIds;

    //"child <host>" or "session <host>", in order of closing
    std::vector<std::string> closeEvents;

    std::map<Zstring, std::string> files; //path => content
    std::set<Zstring> folders{Zstr("/")};
};


class FakeChild : public RemoteChild
{
public:
    FakeChild(FakeServer& server, const std::string& host, bool finished, bool failClose) : server_(server), host_(host), finished_(finished), failClose_(failClose) {}

    bool transferFinished() const override { return finished_; }

    void close() override //throw SysError
    {
        ++server_.childCloseCount;
        server_.closeEvents.push_back("child " + host_);
        if (failClose_)
            throw zen::SysError(L"Data connection reset by peer.");
    }

private:
    FakeServer& server_;
    const std::string host_;
    const bool finished_;
    const bool failClose_;
};


class FakeSession : public RemoteSession
{
public:
    FakeSession(FakeServer& server, const ConnectionIdentity& id) : server_(server), id_(id) {}

    const ConnectionIdentity& getIdentity() const { return id_; }
    size_t getMetadataCacheSize() const { return metadataCacheSize_; }

    //server closed the control connection
    void disconnect() { disconnected_ = true; }

    void addChild(bool finished, bool failClose = false) { children_.push_back(std::make_unique<FakeChild>(server_, id_.host, finished, failClose)); }

    bool isClosed() const override { return closed_ || disconnected_; }

    void sendNoop() override //throw SysError
    {
        ++server_.noopCount;
        if (server_.failNoop || disconnected_)
            throw zen::SysError(L"421 Service not available, closing control connection.");
    }

    void close() override
    {
        if (closed_)
            return;
        closed_ = true;
        ++server_.closeCount;
        server_.closeEvents.push_back("session " + id_.host);
    }

    void setMetadataCacheSize(size_t itemCount) override { metadataCacheSize_ = itemCount; }

    std::vector<std::unique_ptr<RemoteChild>>& getChildren() override { return children_; }

    Zstring getHomePath() override { return Zstr("/"); }

    std::vector<RemoteItem> listFolder(const Zstring& folderPath) override //throw SysError
    {
        if (!server_.folders.contains(folderPath))
            throwNotFound();

        std::vector<RemoteItem> items;
        for (const Zstring& path : server_.folders)
            if (path != Zstr("/") && getServerParentPath(path) == folderPath)
                items.push_back({RemoteItemType::folder, zen::afterLast(path, Zstr('/'), zen::IfNotFoundReturn::all), 0, 0});

        for (const auto& [path, content] : server_.files)
            if (getServerParentPath(path) == folderPath)
                items.push_back({RemoteItemType::file, zen::afterLast(path, Zstr('/'), zen::IfNotFoundReturn::all), content.size(), 0});
        return items;
    }

    RemoteItem getItemInfo(const Zstring& itemPath) override //throw SysError
    {
        const Zstring itemName = zen::afterLast(itemPath, Zstr('/'), zen::IfNotFoundReturn::all);

        if (server_.folders.contains(itemPath))
            return {RemoteItemType::folder, itemName, 0, 0};

        if (auto it = server_.files.find(itemPath); it != server_.files.end())
            return {RemoteItemType::file, itemName, it->second.size(), 0};

        throwNotFound();
    }

    void renameItem(const Zstring& pathFrom, const Zstring& pathTo) override //throw SysError
    {
        if (auto it = server_.files.find(pathFrom); it != server_.files.end())
        {
            server_.files[pathTo] = it->second;
            server_.files.erase(pathFrom);
        }
        else if (server_.folders.erase(pathFrom) > 0)
            server_.folders.insert(pathTo);
        else
            throwNotFound();
    }

    void removeFile(const Zstring& filePath) override //throw SysError
    {
        if (server_.files.erase(filePath) == 0)
            throwNotFound();
    }

    void removeFolder(const Zstring& folderPath) override //throw SysError
    {
        if (!server_.folders.contains(folderPath))
            throwNotFound();
        if (!listFolder(folderPath).empty())
            throw zen::SysError(L"550 Directory not empty.");
        server_.folders.erase(folderPath);
    }

    void createFolder(const Zstring& folderPath) override //throw SysError
    {
        if (server_.folders.contains(folderPath) || server_.files.contains(folderPath))
            throw zen::SysError(L"550 File exists.");
        if (!server_.folders.contains(getServerParentPath(folderPath)))
            throwNotFound();
        server_.folders.insert(folderPath);
    }

    //transfers run on a finished child, reaped when the connection is released
    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) override //throw SysError, X
    {
        auto it = server_.files.find(filePath);
        if (it == server_.files.end())
            throwNotFound();

        addChild(true /*finished*/);

        const std::string content = it->second;
        for (size_t pos = 0; pos < content.size(); pos += FAKE_BLOCK_SIZE)
            writeBlock(content.data() + pos, std::min(FAKE_BLOCK_SIZE, content.size() - pos)); //throw X
    }

    void uploadFile(const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock) override //throw SysError, X
    {
        if (!server_.folders.contains(getServerParentPath(filePath)))
            throwNotFound();

        addChild(true /*finished*/);

        std::string content;
        for (char buffer[FAKE_BLOCK_SIZE];;)
        {
            const size_t bytesRead = readBlock(buffer, FAKE_BLOCK_SIZE); //throw X
            content.append(buffer, bytesRead);
            if (bytesRead < FAKE_BLOCK_SIZE)
                break;
        }
        server_.files[filePath] = content;
    }

private:
    static constexpr size_t FAKE_BLOCK_SIZE = 4;

    [[noreturn]] static void throwNotFound() { throw zen::SysError(L"550 No such file or directory."); }

    FakeServer& server_;
    const ConnectionIdentity id_;
    size_t metadataCacheSize_ = 0;
    bool closed_ = false;
    bool disconnected_ = false;
    std::vector<std::unique_ptr<RemoteChild>> children_;
};


inline
SessionFactory makeFakeSessionFactory(FakeServer& server)
{
    return [&server](const ConnectionIdentity& id) -> std::unique_ptr<RemoteSession>
    {
        if (server.refuseConnect)
            throw zen::SysError(L"Connection refused.");

        ++server.connectCount;
        server.connectedIds.push_back(id);
        return std::make_unique<FakeSession>(server, id);
    };
}


inline
FakeSession& getFakeSession(const ScopedConnection& conn)
{
    return dynamic_cast<FakeSession&>(conn.session());
}


class ManualClock
{
public:
    std::chrono::steady_clock::time_point now() const { return now_; }
    void advance(std::chrono::seconds duration) { now_ += duration; }

    std::function<std::chrono::steady_clock::time_point()> getNowFunction() { return [this] { return now_; }; }

private:
    std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::time_point() + std::chrono::hours(1);
};


//no background cleaner: eviction is driven by acquire() and sweep() only
inline
PoolConfig makeTestPoolConfig()
{
    PoolConfig cfg;
    cfg.cleanupInterval = std::chrono::seconds(0);
    return cfg;
}


//removed when going out of scope
class TempFilePath
{
public:
    explicit TempFilePath(const std::string& name) :
        filePath_("/tmp/ftpnav_test_" + zen::numberTo<std::string>(::getpid()) + '_' + name) { ::unlink(filePath_.c_str()); }

    ~TempFilePath() { ::unlink(filePath_.c_str()); }

    const Zstring& get() const { return filePath_; }

private:
    TempFilePath           (const TempFilePath&) = delete;
    TempFilePath& operator=(const TempFilePath&) = delete;

    const Zstring filePath_;
};
}

#endif //FAKE_SESSION_H_3409857230948572309

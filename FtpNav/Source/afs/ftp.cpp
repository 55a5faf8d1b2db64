// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp.h"
#include <zen/file_error.h>
#include <zen/scope_guard.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_listing.h"
#include "metadata_cache.h"
    #include <fcntl.h>

using namespace zen;
using namespace fnav;


namespace
{
//Extensions to FTP: https://tools.ietf.org/html/rfc3659
//FTP commands:      https://en.wikipedia.org/wiki/List_of_FTP_commands

const size_t DEFAULT_METADATA_CACHE_SIZE = 1000; //until resized by the owner


//one libcurl easy handle: libcurl keeps its control connection alive between calls to perform()
class FtpConnection
{
public:
    FtpConnection(const ConnectionIdentity& id, int timeoutSec) : id_(id), timeoutSec_(timeoutSec) {}

    ~FtpConnection() { close(); }

    //returns server response (header data)
    std::string perform(const Zstring& serverPath, bool isDir, curl_ftpmethod pathMethod, const std::vector<CurlOption>& extraOptions) //throw SysError
    {
        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_);

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setCurlOption(easyHandle_, {CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setCurlOption(easyHandle_, {CURLOPT_HEADERDATA, &headerData});         //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_HEADERFUNCTION, onHeaderReceived}); //

        setCurlOption(easyHandle_, {CURLOPT_URL, getCurlUrlPath(serverPath, isDir).c_str()}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_FTP_FILEMETHOD, pathMethod}); //throw SysError

        if (!id_.username.empty()) //else: libcurl defaults to "anonymous"
        {
            setCurlOption(easyHandle_, {CURLOPT_USERNAME, id_.username.c_str()}); //throw SysError
            setCurlOption(easyHandle_, {CURLOPT_PASSWORD, id_.password.c_str()}); //
        }

        setCurlOption(easyHandle_, {CURLOPT_PORT, id_.port}); //throw SysError

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setCurlOption(easyHandle_, {CURLOPT_NOSIGNAL, 1}); //throw SysError

        //allow PASV IP: some FTP servers really use IP different from control connection
        setCurlOption(easyHandle_, {CURLOPT_FTP_SKIP_PASV_IP, 0}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_CONNECTTIMEOUT, timeoutSec_}); //throw SysError

        //CURLOPT_TIMEOUT would limit the total transfer time => detect stalled transfers instead:
        setCurlOption(easyHandle_, {CURLOPT_LOW_SPEED_TIME, timeoutSec_}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError

        setCurlOption(easyHandle_, {CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSec_}); //throw SysError

        //long-running transfers on a child connection: keep the TCP control connection alive
        setCurlOption(easyHandle_, {CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_SOCKOPTDATA, &onSocketCreate});           //

        //TODO: add an option to require certificate checking for ftps
        setCurlOption(easyHandle_, {CURLOPT_CAINFO, 0}); //throw SysError
        //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."
        setCurlOption(easyHandle_, {CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
        setCurlOption(easyHandle_, {CURLOPT_SSL_VERIFYHOST, 0}); //

        if (id_.useTls()) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data: AUTH TLS, PBSZ 0, PROT P
            setCurlOption(easyHandle_, {CURLOPT_USE_SSL,    CURLUSESSL_ALL});  //throw SysError
            setCurlOption(easyHandle_, {CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //
        }

        for (const CurlOption& option : extraOptions)
            setCurlOption(easyHandle_, option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //note: curl_easy_perform() considers FTP response codes >= 400 as failure, prefix quote commands with '*' to ignore

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            long ftpStatusCode = 0; //optional
            if (::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode) == CURLE_OK && ftpStatusCode >= 400)
                errorMsg += (errorMsg.empty() ? L"" : L"\n") + formatFtpStatus(static_cast<int>(ftpStatusCode));

            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
        }

        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd) //throw SysError
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform(Zstr("/"), true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError
    }

    /*  Some RFC-2640-non-compliant servers require UTF8 to be explicitly enabled, others do not advertize
        "UTF8" in "FEAT", but still allow enabling it via "OPTS UTF8 ON"
        => needs to be repeated each time libcurl internally creates a new connection       */
    void initUtf8(const FtpFeatures& features) //throw SysError
    {
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == utf8RequestedSocket_)
                return;

        //some servers require "CLNT" before accepting "OPTS UTF8 ON"
        if (features.clnt)
            runSingleFtpCommand("CLNT FtpNav"); //throw SysError

        //'*': ignore if server does not know this legacy command
        runSingleFtpCommand("*OPTS UTF8 ON"); //throw SysError

        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            utf8RequestedSocket_ = *currentSocket; //remember what we did
        else
            throw SysError(L"Curl failed to cache FTP session."); //why is libcurl not caching the session???
    }

    std::optional<curl_socket_t> getActiveSocket() const //throw SysError
    {
        if (easyHandle_)
        {
            curl_socket_t currentSocket = 0;
            const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &currentSocket);
            if (rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
            if (currentSocket != CURL_SOCKET_BAD)
                return currentSocket;
        }
        return {};
    }

    //libcurl sends QUIT if the connection is still alive
    void close()
    {
        if (easyHandle_)
        {
            ::curl_easy_cleanup(easyHandle_);
            easyHandle_ = nullptr;
        }
    }

private:
    FtpConnection           (const FtpConnection&) = delete;
    FtpConnection& operator=(const FtpConnection&) = delete;

    std::string getCurlUrlPath(const Zstring& serverPath, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!) => bug: https://github.com/curl/curl/pull/4423

        for (const std::string& comp : split(utfTo<std::string>(serverPath), '/', SplitOnEmpty::skip))
        {
            char* compFmt = ::curl_easy_escape(easyHandle_, comp.c_str(), static_cast<int>(comp.size()));
            if (!compFmt)
                throw SysError(formatSystemError("curl_easy_escape(" + comp + ')', L"", L"Conversion failure"));
            ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

            if (!curlRelPath.empty())
                curlRelPath += '/';
            curlRelPath += compFmt;
        }

        if (trimCpy(id_.host).empty())
            throw SysError(_("Server name must not be empty."));

        const std::string host = contains(id_.host, ':') ? '[' + id_.host + ']' : id_.host; //IPv6 literal

        /*  CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs: https://github.com/curl/curl/pull/4382
            => use // because /%2f had bugs                                                                              */
        std::string path = "ftp://" + host + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    const ConnectionIdentity id_;
    const int timeoutSec_;

    CURL* easyHandle_ = nullptr;
    curl_socket_t utf8RequestedSocket_ = 0;
};

//===========================================================================================================================

//file transfer on its own control connection
class FtpChild : public RemoteChild
{
public:
    FtpChild(const ConnectionIdentity& id, int timeoutSec) : conn_(id, timeoutSec) {}

    bool transferFinished() const override { return finished_; }

    void close() override //throw SysError
    {
        conn_.close();
        finished_ = true;
    }

    void download(const Zstring& filePath, const FtpFeatures& features, //throw SysError, X
                  const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/)
    {
        ZEN_ON_SCOPE_EXIT(finished_ = true);

        std::exception_ptr exception;

        auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
        {
            try
            {
                writeBlock(buffer, bytesToWrite); //throw X
                return bytesToWrite;
            }
            catch (...)
            {
                exception = std::current_exception();
                return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
            }
        };
        curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        try
        {
            conn_.initUtf8(features); //throw SysError
            conn_.perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_WRITEDATA, &onBytesReceived},
                {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download (=> download until actual EOF if file size changes)
            }); //throw SysError
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

    //existing file is overwritten
    void upload(const Zstring& filePath, const FtpFeatures& features, //throw SysError, X
                const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/)
    {
        ZEN_ON_SCOPE_EXIT(finished_ = true);

        std::exception_ptr exception;

        auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
        {
            try
            {
                //libcurl calls back until 0 bytes are returned (Posix read() semantics)
                return readBlock(buffer, bytesToRead); //throw X; return "bytesToRead" bytes unless end of stream
            }
            catch (...)
            {
                exception = std::current_exception();
                return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        try
        {
            conn_.initUtf8(features); //throw SysError
            conn_.perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_UPLOAD, 1L},
                {CURLOPT_READDATA, &getBytesToSend},
                {CURLOPT_READFUNCTION, getBytesToSendWrapper},
            }); //throw SysError
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

private:
    FtpConnection conn_;
    bool finished_ = false;
};

//===========================================================================================================================

class FtpSession : public RemoteSession
{
public:
    FtpSession(const ConnectionIdentity& id, int timeoutSec) : id_(id), timeoutSec_(timeoutSec), control_(id, timeoutSec) {}

    void connect() //throw SysError
    {
        //connect + login (+ AUTH TLS, PBSZ, PROT for ftps)
        control_.runSingleFtpCommand("NOOP"); //throw SysError
    }

    bool isClosed() const override
    {
        if (closed_)
            return true;
        try
        {
            return !control_.getActiveSocket(); //throw SysError
        }
        catch (const SysError& e)
        {
            logExtraError(e.toString());
            return true;
        }
    }

    void sendNoop() override { control_.runSingleFtpCommand("NOOP"); } //throw SysError

    void close() override //throw SysError
    {
        if (closed_)
            return;
        closed_ = true;

        std::optional<SysError> firstError;
        for (const std::unique_ptr<RemoteChild>& child : children_)
            try
            {
                child->close(); //throw SysError
            }
            catch (const SysError& e)
            {
                if (!firstError)
                    firstError = e;
            }
        children_.clear();

        control_.close();
        metadataCache_.clear();

        if (firstError)
            throw* firstError;
    }

    void setMetadataCacheSize(size_t itemCount) override { metadataCache_.setCapacity(itemCount); }

    std::vector<std::unique_ptr<RemoteChild>>& getChildren() override { return children_; }

    Zstring getHomePath() override //throw SysError
    {
        if (!homePathCached_)
        {
            control_.initUtf8(getFeatures()); //throw SysError
            homePathCached_ = parsePwdResponse(control_.runSingleFtpCommand("PWD")); //throw SysError
        }
        return *homePathCached_;
    }

    std::vector<RemoteItem> listFolder(const Zstring& folderPathIn) override //throw SysError
    {
        const Zstring folderPath = normalizeServerPath(folderPathIn);
        std::string rawListing; //get raw FTP directory listing

        curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_WRITEDATA, &rawListing},
            {CURLOPT_WRITEFUNCTION, onBytesReceived},
        };
        curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

        const FtpFeatures& features = getFeatures(); //throw SysError
        if (features.mlsd)
        {
            options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

            //some servers process wildcards inside the MLSD "dirpath": http://www.proftpd.org/docs/howto/Globbing.html
            const bool pathHasWildcards =
                contains(afterFirst(folderPath, Zstr('['), IfNotFoundReturn::none), Zstr(']')) ||
                contains(folderPath, Zstr('*')) ||
                contains(folderPath, Zstr('?'));

            if (!pathHasWildcards)
                pathMethod = CURLFTPMETHOD_NOCWD; //faster than CURLFTPMETHOD_SINGLECWD
        }
        //else: use "LIST" + CURLFTPMETHOD_SINGLECWD; no LIST parameters: https://cr.yp.to/ftp/list.html

        control_.initUtf8(features);                                       //throw SysError
        control_.perform(folderPath, true /*isDir*/, pathMethod, options); //

        std::vector<RemoteItem> items = features.mlsd ?
                                        parseMlsdListing(rawListing) :                         //throw SysError
                                        parseListListing(rawListing, std::time(nullptr)); //

        for (const RemoteItem& item : items)
            metadataCache_.insert(appendServerPath(folderPath, item.name), item);

        return items;
    }

    RemoteItem getItemInfo(const Zstring& itemPathIn) override //throw SysError
    {
        const Zstring itemPath = normalizeServerPath(itemPathIn);
        if (itemPath == Zstr("/"))
            return {RemoteItemType::folder, Zstr("/"), 0, 0};

        if (std::optional<RemoteItem> item = metadataCache_.find(itemPath))
            return *item;

        const Zstring parentPath = getServerParentPath(itemPath);
        const Zstring itemName   = afterLast(itemPath, Zstr('/'), IfNotFoundReturn::all);

        for (const RemoteItem& item : listFolder(parentPath)) //throw SysError
            if (item.name == itemName)
                return item;

        throw SysError(replaceCpy(_("Cannot find %x."), L"%x", fmtPath(itemPath)));
    }

    void renameItem(const Zstring& pathFrom, const Zstring& pathTo) override //throw SysError
    {
        control_.initUtf8(getFeatures()); //throw SysError

        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ("RNFR " + utfTo<std::string>(normalizeServerPath(pathFrom))).c_str());
        quote = ::curl_slist_append(quote, ("RNTO " + utfTo<std::string>(normalizeServerPath(pathTo  ))).c_str());

        ZEN_ON_SCOPE_EXIT(metadataCache_.erase(normalizeServerPath(pathFrom)); metadataCache_.erase(normalizeServerPath(pathTo)));

        control_.perform(Zstr("/"), true /*isDir*/, CURLFTPMETHOD_NOCWD, //avoid needless CWDs
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError
    }

    void removeFile  (const Zstring& filePath  ) override { runPathCommand("DELE ", filePath);   } //throw SysError
    void removeFolder(const Zstring& folderPath) override { runPathCommand("RMD ",  folderPath); } //
    void createFolder(const Zstring& folderPath) override { runPathCommand("MKD ",  folderPath); } //

    void downloadFile(const Zstring& filePath, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) override //throw SysError, X
    {
        const FtpFeatures& features = getFeatures(); //throw SysError
        FtpChild& child = addChild();
        child.download(normalizeServerPath(filePath), features, writeBlock); //throw SysError, X
    }

    void uploadFile(const Zstring& filePath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) override //throw SysError, X
    {
        const FtpFeatures& features = getFeatures(); //throw SysError
        FtpChild& child = addChild();

        ZEN_ON_SCOPE_EXIT(metadataCache_.erase(normalizeServerPath(filePath)));
        child.upload(normalizeServerPath(filePath), features, readBlock); //throw SysError, X
    }

private:
    const FtpFeatures& getFeatures() //throw SysError
    {
        if (!featureCache_)
            //'*': ignore error if server does not support/allow FEAT
            featureCache_ = parseFeatResponse(control_.runSingleFtpCommand("*FEAT")); //throw SysError
        return *featureCache_;
    }

    void runPathCommand(const std::string& ftpCmd, const Zstring& itemPath) //throw SysError
    {
        control_.initUtf8(getFeatures()); //throw SysError

        ZEN_ON_SCOPE_EXIT(metadataCache_.erase(normalizeServerPath(itemPath)));
        control_.runSingleFtpCommand(ftpCmd + utfTo<std::string>(normalizeServerPath(itemPath))); //throw SysError
    }

    FtpChild& addChild()
    {
        auto child = std::make_unique<FtpChild>(id_, timeoutSec_);
        FtpChild& childRef = *child;
        children_.push_back(std::move(child));
        return childRef;
    }

    const ConnectionIdentity id_;
    const int timeoutSec_;

    FtpConnection control_;
    std::vector<std::unique_ptr<RemoteChild>> children_; //destroyed before the control connection

    MetadataCache metadataCache_{DEFAULT_METADATA_CACHE_SIZE};

    std::optional<FtpFeatures> featureCache_;
    std::optional<Zstring> homePathCached_;
    bool closed_ = false;
};
}


std::unique_ptr<RemoteSession> fnav::createFtpSession(const ConnectionIdentity& id, int timeoutSec) //throw SysError
{
    auto session = std::make_unique<FtpSession>(id, timeoutSec);
    session->connect(); //throw SysError
    return session;
}

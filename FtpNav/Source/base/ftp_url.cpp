// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_url.h"
#include <zen/file_error.h>

using namespace zen;
using namespace fnav;


namespace
{
const std::string_view schemeDelimiter = "://";


struct UrlParts
{
    std::string scheme;
    std::string netloc;
    std::string path;
};

UrlParts splitUrl(const std::string& url) //throw SysError
{
    const size_t posDelim = url.find(schemeDelimiter);
    if (posDelim == std::string::npos || posDelim == 0)
        throw SysError(replaceCpy(_("URL %x does not start with a scheme, e.g. ftp://"), L"%x", fmtPath(utfTo<std::wstring>(url))));

    UrlParts parts;
    parts.scheme = asciiToLowerCpy(url.substr(0, posDelim));

    const std::string_view rest = std::string_view(url).substr(posDelim + schemeDelimiter.size());

    const size_t posPath = rest.find_first_of("/?#");
    parts.netloc = rest.substr(0, posPath);

    if (posPath != std::string_view::npos)
    {
        const std::string_view pathEtc = rest.substr(posPath);
        parts.path = pathEtc.substr(0, pathEtc.find_first_of("?#")); //query and fragment are not part of an FTP path
    }
    return parts;
}
}


bool fnav::isFtpUrl(const std::string_view url)
{
    return startsWith(url, "ftp://") ||
           startsWith(url, "ftps://");
}


std::string fnav::decodeUrlComponent(const std::string_view str)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
        if (str[i] == '%' && i + 2 < str.size() &&
            isHexDigit(str[i + 1]) &&
            isHexDigit(str[i + 2]))
        {
            output += unhexify(str[i + 1], str[i + 2]);
            i += 2;
        }
        else
            output += str[i];
    return output;
}


ConnectionIdentity fnav::parseFtpUrl(const std::string& url) //throw SysError
{
    const UrlParts parts = splitUrl(url); //throw SysError

    ConnectionIdentity id;
    id.scheme = parts.scheme;
    id.path = parts.path.empty() ? "/" : parts.path;

    std::string hostPort = parts.netloc;
    if (contains(parts.netloc, '@'))
    {
        const std::string userInfo = beforeLast(parts.netloc, '@', IfNotFoundReturn::none);
        hostPort                   = afterLast (parts.netloc, '@', IfNotFoundReturn::none);

        id.username = decodeUrlComponent(beforeFirst(userInfo, ':', IfNotFoundReturn::all));
        id.password = decodeUrlComponent(afterFirst (userInfo, ':', IfNotFoundReturn::none));
    }

    std::string portStr;
    if (startsWith(hostPort, '[')) //IPv6 literal: [::1]:21
    {
        const size_t posClose = hostPort.find(']');
        if (posClose == std::string::npos)
            throw SysError(replaceCpy(_("Invalid IPv6 address in URL %x."), L"%x", fmtPath(utfTo<std::wstring>(url))));

        id.host = hostPort.substr(1, posClose - 1);
        portStr = afterFirst(hostPort.substr(posClose + 1), ':', IfNotFoundReturn::none);
    }
    else
    {
        id.host = beforeFirst(hostPort, ':', IfNotFoundReturn::all);
        portStr = afterFirst (hostPort, ':', IfNotFoundReturn::none);
    }
    id.host = asciiToLowerCpy(id.host);

    if (!portStr.empty())
    {
        if (!std::all_of(portStr.begin(), portStr.end(), [](char c) { return isDigit(c); }) || portStr.size() > 5)
            throw SysError(replaceCpy(_("Invalid port number %x."), L"%x", utfTo<std::wstring>(portStr)));

        const int port = stringTo<int>(portStr);
        if (port > 65535)
            throw SysError(replaceCpy(_("Invalid port number %x."), L"%x", utfTo<std::wstring>(portStr)));
        if (port > 0)
            id.port = port;
    }
    return id;
}


std::string fnav::getUrlWithoutPath(const std::string& url) //throw SysError
{
    const UrlParts parts = splitUrl(url); //throw SysError
    return url.substr(0, url.find(schemeDelimiter)) + std::string(schemeDelimiter) + parts.netloc;
}


std::string fnav::getUrlPath(const std::string& url) //throw SysError
{
    return splitUrl(url).path; //throw SysError
}


ConnectionIdentity fnav::resolveConnectionIdentity(const std::string& url, const BookmarkTable& bookmarks) //throw SysError
{
    auto it = bookmarks.find(getUrlWithoutPath(url)); //throw SysError
    if (it == bookmarks.end())
        return parseFtpUrl(url); //throw SysError

    //no recursion: alias targets are stored resolved
    ConnectionIdentity id = parseFtpUrl(it->second.targetBaseUrl); //throw SysError

    const std::string path = getUrlPath(url); //throw SysError
    id.path = path.empty() ? "/" : path;
    return id;
}


std::string fnav::getBaseUrl(const ConnectionIdentity& id)
{
    std::string baseUrl = id.scheme + std::string(schemeDelimiter);

    if (!id.username.empty())
        baseUrl += id.username + '@'; //decoded: a label, never parsed again

    if (contains(id.host, ':'))
        baseUrl += '[' + id.host + ']';
    else
        baseUrl += id.host;

    baseUrl += ':' + numberTo<std::string>(id.port);
    return baseUrl;
}


std::string fnav::appendUrlPath(const std::string& urlWithoutPath, const std::string& path)
{
    if (path.empty())
        return urlWithoutPath;

    if (startsWith(path, '/'))
        return urlWithoutPath + path;

    return urlWithoutPath + '/' + path;
}

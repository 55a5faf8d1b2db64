// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_LISTING_H_9023847509238475092
#define FTP_LISTING_H_9023847509238475092

#include "../base/remote_session.h"


namespace fnav
{
//server response => non-empty lines; views into "buf"
std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

std::wstring formatFtpStatus(int sc);


struct FtpFeatures //FEAT command: https://tools.ietf.org/html/rfc2389#page-4
{
    bool mlsd = false;
    bool clnt = false;
    bool utf8 = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);

//257 "/home/""quoted""" is current directory
Zstring parsePwdResponse(const std::string& pwdResponse); //throw SysError


//"." and ".." are skipped
std::vector<RemoteItem> parseMlsdListing(const std::string& buf); //throw SysError
RemoteItem parseMlstLine(const std::string_view& rawLine);        //throw SysError

//LIST output: Unix "ls -l" or Windows "dir" format
//utcTimeNow: Unix entries showing "hh:mm" instead of a year are dated within the past year
std::vector<RemoteItem> parseListListing(const std::string& buf, time_t utcTimeNow); //throw SysError
}

#endif //FTP_LISTING_H_9023847509238475092

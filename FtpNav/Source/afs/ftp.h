// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include "../base/ftp_url.h"
#include "../base/remote_session.h"


namespace fnav
{
//requires libcurlInit()

/*  connect and log in before returning
    ftps: explicit TLS (AUTH TLS) for control and data connections, certificates are not verified
    timeoutSec: connect, server response and stalled transfers                                   */
std::unique_ptr<RemoteSession> createFtpSession(const ConnectionIdentity& id, int timeoutSec); //throw SysError
}

#endif //FTP_H_745895742383425326568678

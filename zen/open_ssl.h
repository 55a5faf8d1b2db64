// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use! (libcurl uses it for FTPS)
void openSslInit();
void openSslTearDown();
}

#endif //OPEN_SSL_H_801974580936508934568792347506

// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef JSON_IO_H_8914759321263879
#define JSON_IO_H_8914759321263879

#include "json.h"
#include "file_error.h"


//combine zen::Json and zen file i/o
namespace zen
{
JsonValue loadJsonDocument(const Zstring& filePath); //throw FileError

//top-level value must be a JSON object:
JsonValue loadJsonObject(const Zstring& filePath); //throw FileError

void saveJsonDocument(const JsonValue& doc, const Zstring& filePath); //throw FileError
}

#endif //JSON_IO_H_8914759321263879

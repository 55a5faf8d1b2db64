// *****************************************************************************
// * This file is part of the FtpNav project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "json_io.h"
#include "file_access.h"
#include "file_io.h"

using namespace zen;


JsonValue zen::loadJsonDocument(const Zstring& filePath) //throw FileError
{
    std::string buffer = getFileContent(filePath); //throw FileError

    if (startsWith(buffer, BYTE_ORDER_MARK_UTF8)) //allow BOM!
        buffer.erase(0, BYTE_ORDER_MARK_UTF8.size());

    try
    {
        return parseJson(buffer); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw FileError(
            replaceCpy(replaceCpy(replaceCpy(_("Error parsing file %x, row %y, column %z."),
                                             L"%x", fmtPath(filePath)),
                                  L"%y", numberTo<std::wstring>(e.row + 1)),
                       L"%z", numberTo<std::wstring>(e.col + 1)));
    }
}


JsonValue zen::loadJsonObject(const Zstring& filePath) //throw FileError
{
    JsonValue doc = loadJsonDocument(filePath); //throw FileError

    if (doc.type != JsonValue::Type::object)
        throw FileError(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));
    return doc;
}


void zen::saveJsonDocument(const JsonValue& doc, const Zstring& filePath) //throw FileError
{
    const std::string stream = serializeJson(doc); //noexcept

    //only update json file if there are real changes
    try
    {
        if (itemExists(filePath)) //throw FileError
            if (getFileContent(filePath) == stream) //throw FileError
                return;
    }
    catch (FileError&) {}

    if (const std::optional<Zstring> parentPath = getParentFolderPath(filePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(filePath, stream); //throw FileError
}

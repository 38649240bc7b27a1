// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_path.h"
    #include <cstdlib>

using namespace zen;


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = normalizePath(itemPath);
    if (path.empty() || path == Zstr("/"))
        return std::nullopt;

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos) //relative path without parent
        return std::nullopt;
    if (pos == 0)
        return Zstring(Zstr("/"));

    return path.substr(0, pos);
}


Zstring zen::appendSeparator(Zstring path) //support rvalue references!
{
    if (!endsWith(path, FILE_NAME_SEPARATOR))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise!
}


bool zen::isValidRelPath(const Zstring& relPath)
{
    //relPath is expected to use FILE_NAME_SEPARATOR!
    if (relPath.empty() || startsWith(relPath, FILE_NAME_SEPARATOR) || endsWith(relPath, FILE_NAME_SEPARATOR))
        return false;

    bool valid = true;
    split(relPath, FILE_NAME_SEPARATOR, [&](const Zstring& itemName)
    {
        if (itemName.empty() || itemName == Zstr(".") || itemName == Zstr(".."))
            valid = false;
    });
    return valid;
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath;
    if (basePath.empty())
        return relPath;

    if (startsWith(relPath, FILE_NAME_SEPARATOR))
    {
        if (endsWith(basePath, FILE_NAME_SEPARATOR))
            return basePath + (relPath.c_str() + 1);
        return basePath + relPath;
    }
    return appendSeparator(basePath) + relPath;
}


Zstring zen::normalizePath(const Zstring& itemPath)
{
    if (itemPath.empty())
        return itemPath;

    Zstring output;
    if (startsWith(itemPath, FILE_NAME_SEPARATOR))
        output += FILE_NAME_SEPARATOR;

    bool first = true;
    split(itemPath, FILE_NAME_SEPARATOR, [&](const Zstring& itemName)
    {
        if (itemName.empty() || itemName == Zstr("."))
            return;
        if (!first)
            output += FILE_NAME_SEPARATOR;
        output += itemName;
        first = false;
    });

    if (output.empty()) //e.g. "."
        return Zstr(".");
    return output;
}


bool zen::isSubPathOf(const Zstring& itemPath, const Zstring& folderPath)
{
    const Zstring item   = normalizePath(itemPath);
    const Zstring folder = normalizePath(folderPath);

    if (item == folder)
        return true;
    return startsWith(item, appendSeparator(folder));
}


std::optional<Zstring> zen::getEnvironmentVar(const ZstringView name)
{
    const char* buffer = ::getenv(Zstring(name).c_str()); //no ownership transfer + no extended error reporting
    if (!buffer)
        return {};
    Zstring value(buffer);

    //some postprocessing (good idea!? Is this even needed!?
    if (value.size() >= 2 && startsWith(value, Zstr('"')) && endsWith(value, Zstr('"'))) //remove leading, trailing double quotes
        value = value.substr(1, value.size() - 2);

    return value;
}

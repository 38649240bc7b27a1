// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "zstring.h"
#include "string_tools.h"


namespace zen
{
    const Zchar FILE_NAME_SEPARATOR = '/';

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root path

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendSeparator(Zstring path); //support rvalue references!

bool isValidRelPath(const Zstring& relPath);

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//collapse duplicate separators and "/./", remove trailing separator (except for root)
Zstring normalizePath(const Zstring& itemPath);

//------------------------------------------------------------------------------------------
//Linux: byte-wise comparison
inline bool equalNativePath(const Zstring& lhs, const Zstring& rhs) { return normalizePath(lhs) == normalizePath(rhs); }

//true if "itemPath" equals "folderPath" or lies somewhere below it
bool isSubPathOf(const Zstring& itemPath, const Zstring& folderPath);

//------------------------------------------------------------------------------------------

std::optional<Zstring> getEnvironmentVar(const ZstringView name);
}

#endif //FILE_PATH_H_3984678473567247567

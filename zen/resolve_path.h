// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RESOLVE_PATH_H_817402834713454
#define RESOLVE_PATH_H_817402834713454

#include "file_error.h"


namespace zen
{
/*  - expand macros: %Date%, %Time%, %TimeStamp%, %Year%, %Month%, %Day%, environment variables
    - trim whitespace
    - "~" => home directory
    - convert relative paths into absolute
    - remove trailing separator                 */
Zstring getResolvedFilePath(const Zstring& pathPhrase); //noexcept

//macro substitution only
Zstring expandMacros(const Zstring& text);
}

#endif //RESOLVE_PATH_H_817402834713454

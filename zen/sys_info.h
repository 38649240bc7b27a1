// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYSTEM_H_4189731847832147508915
#define SYSTEM_H_4189731847832147508915

#include "file_error.h"


namespace zen
{
//running with sudo: reports the *login* user, not root
Zstring getLoginUser(); //throw FileError

Zstring getUserHome(); //throw FileError

//$XDG_CONFIG_HOME or ~/.config
Zstring getUserDataPath(); //throw FileError

//root obtained via sudo (consider "root login" like "UAC disabled" on Windows)
bool runningElevated(); //throw FileError
}

#endif //SYSTEM_H_4189731847832147508915

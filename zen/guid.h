// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GUID_H_80425780237502345
#define GUID_H_80425780237502345

    #include <unistd.h> //getentropy
    #include "sys_error.h"
    //#include <uuid/uuid.h> -> avoid additional dependency on uuid-dev


namespace zen
{
inline
std::string generateGUID() //creates a 16-byte GUID
{
    std::string guid(16, '\0');

    if (::getentropy(guid.data(), guid.size()) != 0)  //"The maximum permitted value for the length argument is 256"
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Failed to generate GUID." + "\n\n" +
                                 utfTo<std::string>(formatSystemError("getentropy", getLastError())));
    return guid;
}


//32 lower-case hex digits: used for job and backup IDs
inline
std::string generateGuidHex() { return formatAsHexString(generateGUID()); }
}

#endif //GUID_H_80425780237502345

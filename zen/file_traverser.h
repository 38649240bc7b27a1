// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILER_TRAVERSER_H_127463214871234
#define FILER_TRAVERSER_H_127463214871234

#include <functional>
#include <sys/types.h> //mode_t
#include "file_error.h"

namespace zen
{
struct FileInfo
{
    Zstring itemName;
    Zstring fullPath;
    uint64_t fileSize = 0; //[bytes]
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
};

struct FolderInfo
{
    Zstring itemName;
    Zstring fullPath;
};

struct SymlinkInfo
{
    Zstring itemName;
    Zstring fullPath;
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
};

//named pipe, socket, character or block device: open() may block!
struct OtherInfo
{
    Zstring itemName;
    Zstring fullPath;
    std::wstring typeName; //e.g. "FIFO, named pipe"
};

//- non-recursive
void traverseFolder(const Zstring& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,    /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder,  /*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink, /*optional*/
                    const std::function<void(const OtherInfo&   oi)>& onOther);  /*optional*/ //throw FileError

std::wstring getItemTypeName(mode_t mode); //"FIFO, named pipe", "socket", ...
}

#endif //FILER_TRAVERSER_H_127463214871234

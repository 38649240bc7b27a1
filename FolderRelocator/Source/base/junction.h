// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef JUNCTION_H_2093845720938457
#define JUNCTION_H_2093845720938457

#include "relocation_error.h"
#include "../afs/abstract.h"


namespace frl
{
//keeps the original folder path usable: directory symlink "originalPath" -> "destinationPath"
class JunctionManager
{
public:
    explicit JunctionManager(const AbstractFileSystem& afs) : afs_(afs) {}

    //precondition: originalPath does not exist or is an empty folder (removed first)
    //link is read back and compared; a half-created link is removed on failure
    void link(const Zstring& originalPath, const Zstring& destinationPath) const; //throw JunctionCreationError

    //error if originalPath is not a symlink
    void unlink(const Zstring& originalPath) const; //throw JunctionCreationError

    bool isJunctionTo(const Zstring& originalPath, const Zstring& destinationPath) const; //throw FileError

private:
    const AbstractFileSystem& afs_;
};
}

#endif //JUNCTION_H_2093845720938457

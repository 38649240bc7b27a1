// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef OVERWRITE_POLICY_H_3409857203948572
#define OVERWRITE_POLICY_H_3409857203948572

#include "structures.h"


namespace frl
{
enum class ConflictKind
{
    fileConflict,   //destination file or symlink exists where a file is copied
    folderConflict, //destination item exists where a sub-folder is created
};

enum class ConflictDecision
{
    replace,
    skip,
    fail,
};

std::wstring getDecisionLabel(ConflictDecision decision);

/*  policy  | FileConflict | FolderConflict
    --------+--------------+---------------
    None    | Fail         | Fail
    Files   | Replace      | Fail
    Folders | Fail         | Replace
    All     | Replace      | Replace          */
struct OverwritePolicyResolver
{
    virtual ~OverwritePolicyResolver() {}

    virtual ConflictDecision resolve(OverwritePolicy policy, ConflictKind conflict) const;
};
}

#endif //OVERWRITE_POLICY_H_3409857203948572

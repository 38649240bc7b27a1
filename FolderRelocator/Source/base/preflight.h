// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef PREFLIGHT_H_3209487502938475
#define PREFLIGHT_H_3209487502938475

#include <functional>
#include "relocation_error.h"
#include "../afs/abstract.h"


namespace frl
{
struct PreflightResult
{
    bool ok = true;
    std::vector<ErrorEntry> reasons; //all failed checks

    uint64_t estimatedBytes = 0;   //0 if already relocated
    bool alreadyRelocated = false; //source resolves to the destination folder
};


//"/", "/usr", "/lib64", ... and anything below (except for "/")
bool isProtectedSystemPath(const Zstring& folderPath);


class PreflightValidator
{
public:
    //privilegeCheck: nullptr => zen::runningElevated()
    explicit PreflightValidator(const std::shared_ptr<const AbstractFileSystem>& afs, const std::function<bool()>& privilegeCheck = nullptr) :
        afs_(afs), privilegeCheck_(privilegeCheck) {}

    //no side effects except for a write probe file which is removed immediately
    PreflightResult validate(const RelocationJob& job) const;

private:
    const std::shared_ptr<const AbstractFileSystem> afs_; //shared with a hanging source check: abandoned, not joined
    const std::function<bool()> privilegeCheck_;
};
}

#endif //PREFLIGHT_H_3209487502938475

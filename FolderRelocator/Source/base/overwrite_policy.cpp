// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "overwrite_policy.h"

using namespace zen;
using namespace frl;


std::wstring frl::getDecisionLabel(ConflictDecision decision)
{
    switch (decision)
    {
        //*INDENT-OFF*
        case ConflictDecision::replace: return L"Replace";
        case ConflictDecision::skip:    return L"Skip";
        case ConflictDecision::fail:    return L"Fail";
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


ConflictDecision OverwritePolicyResolver::resolve(OverwritePolicy policy, ConflictKind conflict) const
{
    switch (policy)
    {
        case OverwritePolicy::none:
            return ConflictDecision::fail;

        case OverwritePolicy::files:
            return conflict == ConflictKind::fileConflict ? ConflictDecision::replace : ConflictDecision::fail;

        case OverwritePolicy::folders:
            return conflict == ConflictKind::folderConflict ? ConflictDecision::replace : ConflictDecision::fail;

        case OverwritePolicy::all:
            return ConflictDecision::replace;
    }
    assert(false);
    return ConflictDecision::fail;
}

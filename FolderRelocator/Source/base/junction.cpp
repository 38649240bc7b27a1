// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "junction.h"

using namespace zen;
using namespace frl;


namespace
{
std::wstring getLinkErrorMsg(const Zstring& originalPath, const Zstring& destinationPath)
{
    return replaceCpy(replaceCpy(_("Cannot create junction %x pointing to %y."), L"%x", L'\n' + fmtPath(originalPath)), L"%y", L'\n' + fmtPath(destinationPath));
}
}


void JunctionManager::link(const Zstring& originalPath, const Zstring& destinationPath) const //throw JunctionCreationError
{
    const std::wstring errorMsg = getLinkErrorMsg(originalPath, destinationPath);
    try
    {
        if (const std::optional<AFS::ItemType> type = afs_.getItemTypeIfExists(originalPath)) //throw FileError
        {
            if (*type != AFS::ItemType::folder)
                throw JunctionCreationError(errorMsg, replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(originalPath))), originalPath);

            bool folderEmpty = true;
            afs_.traverseFolder(originalPath, //throw FileError
            [&](const AFS::FileInfo&    ) { folderEmpty = false; },
            [&](const AFS::FolderInfo&  ) { folderEmpty = false; },
            [&](const AFS::SymlinkInfo& ) { folderEmpty = false; },
            [&](const AFS::OtherInfo&   ) { folderEmpty = false; });

            if (!folderEmpty)
                throw JunctionCreationError(errorMsg, replaceCpy(_("The folder %x is not empty."), L"%x", fmtPath(originalPath)), originalPath);

            afs_.removeFolderPlain(originalPath); //throw FileError
        }

        afs_.createSymlink(originalPath, destinationPath); //throw FileError, ErrorTargetExisting

        //allow only consistent objects to be created
        ZEN_ON_SCOPE_FAIL(try { afs_.removeSymlinkPlain(originalPath); }
        catch (const FileError& e) { logExtraError(e.toString()); });

        const Zstring linkContent = afs_.getSymlinkContent(originalPath); //throw FileError
        if (!equalNativePath(linkContent, destinationPath))
            throw JunctionCreationError(errorMsg, replaceCpy(replaceCpy(_("The link points to %x instead of %y."),
                                                                        L"%x", fmtPath(linkContent)),
                                                             L"%y", fmtPath(destinationPath)), originalPath);
    }
    catch (const JunctionCreationError&) { throw; }
    catch (const FileError& e)
    {
        throw JunctionCreationError(errorMsg, replaceCpy(e.toString(), L"\n\n", L'\n'), originalPath, e.errorCode());
    }
}


void JunctionManager::unlink(const Zstring& originalPath) const //throw JunctionCreationError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot remove junction %x."), L"%x", fmtPath(originalPath));
    try
    {
        if (afs_.getItemType(originalPath) != AFS::ItemType::symlink) //throw FileError
            throw JunctionCreationError(errorMsg, _("The item is not a symbolic link."), originalPath);

        afs_.removeSymlinkPlain(originalPath); //throw FileError
    }
    catch (const JunctionCreationError&) { throw; }
    catch (const FileError& e)
    {
        throw JunctionCreationError(errorMsg, replaceCpy(e.toString(), L"\n\n", L'\n'), originalPath, e.errorCode());
    }
}


bool JunctionManager::isJunctionTo(const Zstring& originalPath, const Zstring& destinationPath) const //throw FileError
{
    if (afs_.getItemTypeIfExists(originalPath) != AFS::ItemType::symlink) //throw FileError
        return false;

    return equalNativePath(afs_.getSymlinkContent(originalPath), destinationPath); //throw FileError
}

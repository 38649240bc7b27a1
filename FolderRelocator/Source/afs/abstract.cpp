// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "abstract.h"

using namespace zen;
using namespace frl;


void AFS::createFolderIfMissingRecursion(const Zstring& folderPath) const //throw FileError
{
    auto getItemType2 = [&](const Zstring& itemPath) //throw FileError
    {
        try
        { return getItemType(itemPath); } //throw FileError
        catch (const FileError& e) //need to add context!
        {
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(folderPath)),
                            replaceCpy(e.toString(), L"\n\n", L'\n'), e.errorCode());
        }
    };

    try
    {
        //- path most likely already exists => check first
        //- do NOT use getItemTypeIfExists()! race condition when multiple threads are creating the same hierarchy
        //- find first existing + accessible parent folder (backwards iteration):
        Zstring folderPathEx = folderPath;
        std::vector<Zstring> folderNames; //reverse order; caveat: 1. might have been created in the meantime 2. getItemType2() may have failed with access error
        for (;;)
            try
            {
                if (getItemType2(folderPathEx) == ItemType::file /*obscure, but possible*/) //throw FileError
                    throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPathEx))));
                break;
            }
            catch (FileError&) //not yet existing or access error
            {
                const std::optional<Zstring> parentPath = getParentFolderPath(folderPathEx);
                if (!parentPath) //device root => quick access test
                    throw;
                folderNames.push_back(getItemName(folderPathEx));
                folderPathEx = *parentPath;
            }
        //-----------------------------------------------------------

        Zstring folderPathNew = folderPathEx;
        for (auto it = folderNames.rbegin(); it != folderNames.rend(); ++it)
            try
            {
                folderPathNew = appendPath(folderPathNew, *it);

                createFolderPlain(folderPathNew); //throw FileError, ErrorTargetExisting
            }
            catch (FileError&)
            {
                try
                {
                    if (getItemType2(folderPathNew) == ItemType::file /*obscure, but possible*/) //throw FileError
                        throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPathNew))));
                    else
                        continue; //already existing => possible, if createFolderIfMissingRecursion() is run in parallel
                }
                catch (FileError&) {} //not yet existing or access error

                throw;
            }
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(folderPath)), e.toString());
    }
}


void AFS::removeFolderIfExistsRecursion(const Zstring& folderPath) const //throw FileError
{
    std::function<void(const Zstring& folderPath2)> removeFolderRecursionImpl;
    removeFolderRecursionImpl = [this, &removeFolderRecursionImpl](const Zstring& folderPath2) //throw FileError
    {
        std::vector<Zstring> folderNames;
        {
            std::vector<Zstring> fileNames; //including "other" items
            std::vector<Zstring> symlinkNames;
            try
            {
                traverseFolder(folderPath2, //throw FileError
                [&](const    FileInfo& fi) {    fileNames.push_back(fi.itemName); },
                [&](const  FolderInfo& fi) {  folderNames.push_back(fi.itemName); },
                [&](const SymlinkInfo& si) { symlinkNames.push_back(si.itemName); },
                [&](const   OtherInfo& oi) {    fileNames.push_back(oi.itemName); });
            }
            catch (const FileError& e) //add context
            {
                throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(folderPath2)),
                                replaceCpy(e.toString(), L"\n\n", L'\n'), e.errorCode());
            }

            for (const Zstring& fileName : fileNames)
                removeFilePlain(appendPath(folderPath2, fileName)); //throw FileError

            for (const Zstring& symlinkName : symlinkNames)
                removeSymlinkPlain(appendPath(folderPath2, symlinkName)); //throw FileError
        } //=> save stack space and allow deletion of extremely deep hierarchies!

        for (const Zstring& folderName : folderNames)
            removeFolderRecursionImpl(appendPath(folderPath2, folderName)); //throw FileError

        removeFolderPlain(folderPath2); //throw FileError
    };
    //--------------------------------------------------------------------------------------------------------------

    const std::optional<ItemType> type = [&]
    {
        try
        {
            return getItemTypeIfExists(folderPath); //throw FileError
        }
        catch (const FileError& e) //add context
        {
            throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(folderPath)),
                            replaceCpy(e.toString(), L"\n\n", L'\n'), e.errorCode());
        }
    }();

    if (type)
    {
        if (*type == ItemType::symlink) //don't follow!
            removeSymlinkPlain(folderPath); //throw FileError
        else
            removeFolderRecursionImpl(folderPath); //throw FileError
    }
    //no error situation if directory is not existing!
}


std::vector<AFS::FolderEntry> AFS::getFolderContentRecursive(const Zstring& folderPath) const //throw FileError
{
    std::vector<FolderEntry> entries;

    std::function<void(const Zstring& relPath)> traverseImpl;
    traverseImpl = [&](const Zstring& relPath) //throw FileError
    {
        auto makeRelPath = [&](const Zstring& itemName) { return relPath.empty() ? itemName : appendPath(relPath, itemName); };

        std::vector<Zstring> subFolders;

        traverseFolder(relPath.empty() ? folderPath : appendPath(folderPath, relPath), //throw FileError
        [&](const FileInfo& fi)
        {
            entries.push_back({.type = EntryType::file, .relPath = makeRelPath(fi.itemName), .fileSize = fi.fileSize, .modTime = fi.modTime});
        },
        [&](const FolderInfo& fi)
        {
            entries.push_back({.type = EntryType::folder, .relPath = makeRelPath(fi.itemName)});
            subFolders.push_back(entries.back().relPath);
        },
        [&](const SymlinkInfo& si)
        {
            entries.push_back({.type = EntryType::symlink, .relPath = makeRelPath(si.itemName), .modTime = si.modTime});
        },
        [&](const OtherInfo& oi)
        {
            entries.push_back({.type = EntryType::other, .relPath = makeRelPath(oi.itemName), .typeName = oi.typeName});
        });

        for (const Zstring& subRelPath : subFolders)
            traverseImpl(subRelPath); //throw FileError
    };
    traverseImpl(Zstring());

    return entries;
}

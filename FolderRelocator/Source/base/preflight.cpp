// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "preflight.h"
#include <zen/format_unit.h>
#include <zen/sys_info.h>
#include <zen/thread.h>

using namespace zen;
using namespace frl;


namespace
{
struct SourceStatus
{
    Zstring resolvedPath;
    uint64_t bytesTotal = 0;
};


Zstring getExistingAncestor(const AbstractFileSystem& afs, const Zstring& itemPath) //throw FileError
{
    Zstring path = itemPath;
    for (;;)
    {
        if (afs.itemExists(path)) //throw FileError
            return path;

        const std::optional<Zstring> parentPath = getParentFolderPath(path);
        if (!parentPath)
            return path; //not existing root: let the caller fail
        path = *parentPath;
    }
}
}


bool frl::isProtectedSystemPath(const Zstring& folderPath)
{
    const Zstring path = normalizePath(folderPath);
    if (path == Zstr("/"))
        return true;

    if (!startsWith(path, FILE_NAME_SEPARATOR))
        return false;

    const Zstring topLevel = beforeFirst(Zstring(path.c_str() + 1), FILE_NAME_SEPARATOR, IfNotFoundReturn::all);

    for (const Zchar* const name : {Zstr("bin"), Zstr("boot"), Zstr("dev"), Zstr("etc"), Zstr("lib"), Zstr("lib32"), Zstr("lib64"), Zstr("libx32"),
                                    Zstr("proc"), Zstr("run"), Zstr("sbin"), Zstr("sys"), Zstr("usr"), Zstr("var")})
        if (topLevel == name)
            return true;
    return false;
}


PreflightResult PreflightValidator::validate(const RelocationJob& job) const
{
    const RelocationConfig& cfg = *job.config;
    PreflightResult result;

    auto addReason = [&](ErrorEntry entry)
    {
        entry.stage = JobStatus::validating;
        result.reasons.push_back(std::move(entry));
        result.ok = false;
    };

    //------------------------- privilege -------------------------
    try
    {
        const bool elevated = privilegeCheck_ ? privilegeCheck_() : runningElevated(); //throw FileError
        if (!elevated)
            addReason(makeErrorEntry(PermissionError(_("Administrative privileges are required to relocate user folders."),
                                                     _("Please run the program with root rights, e.g. via sudo.")), JobStatus::validating));
    }
    catch (const FileError& e)
    {
        addReason(makeErrorEntry(PermissionError(_("Cannot determine whether the program is running with administrative privileges."),
                                                 replaceCpy(e.toString(), L"\n\n", L'\n'), Zstring(), e.errorCode()), JobStatus::validating));
    }

    //------------------------- paths -------------------------
    if (isProtectedSystemPath(job.destinationPath))
        addReason(makeErrorEntry(InvalidPathError(replaceCpy(_("The destination folder %x is inside a protected system folder."), L"%x", fmtPath(job.destinationPath)),
                                                  job.destinationPath), JobStatus::validating));

    //- source exists, is a folder, is enumerable
    //- may hang on stale network mounts => run asynchronously and give up after a timeout
    std::optional<SourceStatus> sourceStatus;
    {
        auto ftSource = runAsync([afs = afs_, sourcePath = job.sourcePath]
        {
            setCurrentThreadName(Zstr("Preflight: ") + sourcePath);

            SourceStatus status;
            status.resolvedPath = afs->getResolvedPath(sourcePath); //throw FileError

            if (afs->getItemType(status.resolvedPath) != AFS::ItemType::folder) //throw FileError
                throw PathNotFoundError(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(sourcePath)),
                                        replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(sourcePath))), sourcePath);

            for (const AFS::FolderEntry& entry : afs->getFolderContentRecursive(sourcePath)) //throw FileError
                status.bytesTotal += entry.fileSize;
            return status;
        });

        if (ftSource.wait_for(cfg.fileOperationTimeout) != std::future_status::ready)
            addReason(makeErrorEntry(PathNotFoundError(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(job.sourcePath)),
                                                       replaceCpy(_("Operation timed out after %x ms."), L"%x", numberTo<std::wstring>(cfg.fileOperationTimeout.count())),
                                                       job.sourcePath), JobStatus::validating));
        else
            try
            {
                sourceStatus = ftSource.get(); //throw FileError
            }
            catch (const FileError& e)
            {
                ErrorEntry entry = makeErrorEntry(e, ErrorKind::pathNotFound, job.sourcePath, JobStatus::validating);
                entry.kind = ErrorKind::pathNotFound;
                addReason(entry);
            }
    }

    if (sourceStatus)
        try
        {
            if (const std::optional<AFS::ItemType> type = afs_->getItemTypeIfExists(job.destinationPath)) //throw FileError
                if (*type != AFS::ItemType::file)
                    result.alreadyRelocated = equalNativePath(sourceStatus->resolvedPath, afs_->getResolvedPath(job.destinationPath)); //throw FileError
        }
        catch (const FileError& e) { addReason(makeErrorEntry(e, ErrorKind::pathNotFound, job.destinationPath, JobStatus::validating)); }

    if (!result.alreadyRelocated && !equalNativePath(job.sourcePath, job.destinationPath))
    {
        bool nested = isSubPathOf(job.destinationPath, job.sourcePath) || isSubPathOf(job.sourcePath, job.destinationPath);
        if (sourceStatus)
            nested = nested || isSubPathOf(job.destinationPath, sourceStatus->resolvedPath) || isSubPathOf(sourceStatus->resolvedPath, job.destinationPath);

        if (nested)
            addReason(makeErrorEntry(InvalidPathError(replaceCpy(replaceCpy(_("The folders %x and %y must not be nested inside each other."),
                                                                            L"%x", fmtPath(job.sourcePath)),
                                                                 L"%y", fmtPath(job.destinationPath)), job.destinationPath), JobStatus::validating));
    }

    //------------------------- write access -------------------------
    //the junction replaces the source folder
    if (const std::optional<Zstring> sourceParentPath = getParentFolderPath(job.sourcePath))
        try
        {
            afs_->checkFolderWriteAccess(*sourceParentPath); //throw FileError
        }
        catch (const FileError& e)
        {
            addReason(makeErrorEntry(PermissionError(replaceCpy(_("Cannot write to folder %x."), L"%x", fmtPath(*sourceParentPath)),
                                                     replaceCpy(e.toString(), L"\n\n", L'\n'), *sourceParentPath, e.errorCode()), JobStatus::validating));
        }

    Zstring destAncestorPath;
    try
    {
        destAncestorPath = getExistingAncestor(*afs_, job.destinationPath); //throw FileError
        afs_->checkFolderWriteAccess(destAncestorPath); //throw FileError
    }
    catch (const FileError& e)
    {
        const Zstring& errorPath = destAncestorPath.empty() ? job.destinationPath : destAncestorPath;
        addReason(makeErrorEntry(PermissionError(replaceCpy(_("Cannot write to folder %x."), L"%x", fmtPath(errorPath)),
                                                 replaceCpy(e.toString(), L"\n\n", L'\n'), errorPath, e.errorCode()), JobStatus::validating));
    }

    //------------------------- free space -------------------------
    if (sourceStatus)
    {
        result.estimatedBytes = result.alreadyRelocated ? 0 : sourceStatus->bytesTotal;
        try
        {
            const int64_t freeSpace = afs_->getFreeDiskSpace(job.destinationPath); //throw FileError
            const int64_t required = static_cast<int64_t>(result.estimatedBytes) + cfg.minFreeSpaceMargin;

            if (freeSpace >= 0 && freeSpace < required) //< 0: not available
                addReason(makeErrorEntry(InsufficientSpaceError(replaceCpy(_("Not enough free disk space available in %x."), L"%x", fmtPath(job.destinationPath)),
                                                                _("Required:")  + L' ' + formatFilesizeShort(required) + L'\n' +
                                                                _("Available:") + L' ' + formatFilesizeShort(freeSpace),
                                                                job.destinationPath), JobStatus::validating));
        }
        catch (const FileError& e) { addReason(makeErrorEntry(e, ErrorKind::insufficientSpace, job.destinationPath, JobStatus::validating)); }
    }
    return result;
}

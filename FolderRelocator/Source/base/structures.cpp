// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "structures.h"
#include <zen/string_tools.h>

using namespace zen;
using namespace frl;


const std::vector<FolderType>& frl::getAllFolderTypes()
{
    static const std::vector<FolderType> folderTypes
    {
        FolderType::desktop,
        FolderType::documents,
        FolderType::downloads,
        FolderType::music,
        FolderType::pictures,
        FolderType::videos,
        FolderType::templates,
        FolderType::publicShare,
        FolderType::appData,
    };
    return folderTypes;
}


Zstring frl::getFolderName(FolderType type)
{
    switch (type)
    {
        //*INDENT-OFF*
        case FolderType::desktop:     return Zstr("Desktop");
        case FolderType::documents:   return Zstr("Documents");
        case FolderType::downloads:   return Zstr("Downloads");
        case FolderType::music:       return Zstr("Music");
        case FolderType::pictures:    return Zstr("Pictures");
        case FolderType::videos:      return Zstr("Videos");
        case FolderType::templates:   return Zstr("Templates");
        case FolderType::publicShare: return Zstr("Public");
        case FolderType::appData:     return Zstr("AppData");
        //*INDENT-ON*
    }
    assert(false);
    return Zstr("Error");
}


std::optional<Zstring> frl::getXdgKey(FolderType type)
{
    switch (type)
    {
        //*INDENT-OFF*
        case FolderType::desktop:     return Zstr("XDG_DESKTOP_DIR");
        case FolderType::documents:   return Zstr("XDG_DOCUMENTS_DIR");
        case FolderType::downloads:   return Zstr("XDG_DOWNLOAD_DIR");
        case FolderType::music:       return Zstr("XDG_MUSIC_DIR");
        case FolderType::pictures:    return Zstr("XDG_PICTURES_DIR");
        case FolderType::videos:      return Zstr("XDG_VIDEOS_DIR");
        case FolderType::templates:   return Zstr("XDG_TEMPLATES_DIR");
        case FolderType::publicShare: return Zstr("XDG_PUBLICSHARE_DIR");
        case FolderType::appData:     return std::nullopt;
        //*INDENT-ON*
    }
    assert(false);
    return std::nullopt;
}


std::optional<FolderType> frl::parseFolderType(const std::string& name)
{
    const std::string nameTrm = trimCpy(name);

    for (const FolderType type : getAllFolderTypes())
        if (equalAsciiNoCase(nameTrm, getFolderName(type)))
            return type;

    if (equalAsciiNoCase(nameTrm, "PublicShare"))
        return FolderType::publicShare;

    return std::nullopt;
}


std::wstring frl::getPolicyName(OverwritePolicy policy)
{
    switch (policy)
    {
        //*INDENT-OFF*
        case OverwritePolicy::none:    return L"None";
        case OverwritePolicy::files:   return L"Files";
        case OverwritePolicy::folders: return L"Folders";
        case OverwritePolicy::all:     return L"All";
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::optional<OverwritePolicy> frl::parseOverwritePolicy(const std::string& name)
{
    for (const OverwritePolicy policy : {OverwritePolicy::none, OverwritePolicy::files, OverwritePolicy::folders, OverwritePolicy::all})
        if (equalAsciiNoCase(trimCpy(name), utfTo<std::string>(getPolicyName(policy))))
            return policy;
    return std::nullopt;
}


std::wstring frl::getStatusLabel(JobStatus status)
{
    switch (status)
    {
        //*INDENT-OFF*
        case JobStatus::idle:              return L"Idle";
        case JobStatus::validating:        return L"Validating";
        case JobStatus::backingUpRegistry: return L"BackingUpRegistry";
        case JobStatus::transferring:      return L"Transferring";
        case JobStatus::verifying:         return L"Verifying";
        case JobStatus::committing:        return L"Committing";
        case JobStatus::cleaningUp:        return L"CleaningUp";
        case JobStatus::completed:         return L"Completed";
        case JobStatus::failed:            return L"Failed";
        case JobStatus::rolledBack:        return L"RolledBack";
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::wstring frl::getErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
        //*INDENT-OFF*
        case ErrorKind::permission:        return L"PermissionError";
        case ErrorKind::insufficientSpace: return L"InsufficientSpaceError";
        case ErrorKind::pathNotFound:      return L"PathNotFoundError";
        case ErrorKind::fileInUse:         return L"FileInUseError";
        case ErrorKind::checksumMismatch:  return L"ChecksumMismatchError";
        case ErrorKind::registryAccess:    return L"RegistryAccessError";
        case ErrorKind::junctionCreation:  return L"JunctionCreationError";
        case ErrorKind::partialFailure:    return L"PartialFailureError";
        case ErrorKind::invalidPath:       return L"InvalidPathError";
        case ErrorKind::cancelled:         return L"CancelledError";
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::wstring frl::getFileStatusLabel(FileStatus status)
{
    switch (status)
    {
        //*INDENT-OFF*
        case FileStatus::pending:  return L"Pending";
        case FileStatus::copied:   return L"Copied";
        case FileStatus::verified: return L"Verified";
        case FileStatus::failed:   return L"Failed";
        case FileStatus::skipped:  return L"Skipped";
        //*INDENT-ON*
    }
    assert(false);
    return _("Error");
}


std::wstring frl::formatErrorEntry(const ErrorEntry& entry)
{
    std::wstring msg = getErrorKindName(entry.kind) + L" [" + getStatusLabel(entry.stage) + L"] " +
                       replaceCpy(trimCpy(entry.message), L"\n\n", L'\n');
    if (entry.errorCode != 0)
        msg += L" (errno " + numberTo<std::wstring>(entry.errorCode) + L')';
    return msg;
}

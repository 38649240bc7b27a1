// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef RELOCATION_ERROR_H_4357029834750923845
#define RELOCATION_ERROR_H_4357029834750923845

#include <zen/file_error.h>
#include "structures.h"


namespace frl
{
//FileError + classification for the job report
class RelocationError : public zen::FileError
{
public:
    RelocationError(ErrorKind kind, const std::wstring& msg, const Zstring& path, zen::ErrorCode ec = 0) :
        FileError(msg, ec), kind_(kind), path_(path) {}
    RelocationError(ErrorKind kind, const std::wstring& msg, const std::wstring& details, const Zstring& path, zen::ErrorCode ec = 0) :
        FileError(msg, details, ec), kind_(kind), path_(path) {}

    ErrorKind getKind() const { return kind_; }
    const Zstring& getPath() const { return path_; }

private:
    ErrorKind kind_;
    Zstring path_;
};

#define DEFINE_NEW_RELOCATION_ERROR(X, KIND) struct X : public frl::RelocationError { \
        explicit X(const std::wstring& msg, const Zstring& path = Zstring(), zen::ErrorCode ec = 0) : RelocationError(KIND, msg, path, ec) {} \
        X(const std::wstring& msg, const std::wstring& details, const Zstring& path = Zstring(), zen::ErrorCode ec = 0) : RelocationError(KIND, msg, details, path, ec) {} };

DEFINE_NEW_RELOCATION_ERROR(PermissionError,        ErrorKind::permission)
DEFINE_NEW_RELOCATION_ERROR(InsufficientSpaceError, ErrorKind::insufficientSpace)
DEFINE_NEW_RELOCATION_ERROR(PathNotFoundError,      ErrorKind::pathNotFound)
DEFINE_NEW_RELOCATION_ERROR(FileInUseError,         ErrorKind::fileInUse)
DEFINE_NEW_RELOCATION_ERROR(ChecksumMismatchError,  ErrorKind::checksumMismatch)
DEFINE_NEW_RELOCATION_ERROR(RegistryAccessError,    ErrorKind::registryAccess)
DEFINE_NEW_RELOCATION_ERROR(JunctionCreationError,  ErrorKind::junctionCreation)
DEFINE_NEW_RELOCATION_ERROR(PartialFailureError,    ErrorKind::partialFailure)
DEFINE_NEW_RELOCATION_ERROR(InvalidPathError,       ErrorKind::invalidPath)
DEFINE_NEW_RELOCATION_ERROR(CancelledError,         ErrorKind::cancelled)

//-------------------------------------------------------------------------------------------

inline
ErrorEntry makeErrorEntry(const RelocationError& e, JobStatus stage)
{
    return {.kind = e.getKind(), .stage = stage, .path = e.getPath(), .errorCode = e.errorCode(), .message = e.toString()};
}


//plain FileError raised by a lower layer: classify by errno
inline
ErrorEntry makeErrorEntry(const zen::FileError& e, ErrorKind defaultKind, const Zstring& path, JobStatus stage)
{
    if (const auto re = dynamic_cast<const RelocationError*>(&e))
        return makeErrorEntry(*re, stage);

    ErrorKind kind = defaultKind;
    switch (e.errorCode())
    {
        case EACCES:
        case EPERM:
        case EROFS:
            kind = ErrorKind::permission;
            break;
        case ENOSPC:
        case EDQUOT:
            kind = ErrorKind::insufficientSpace;
            break;
        case ENOENT:
        case ENOTDIR:
            kind = ErrorKind::pathNotFound;
            break;
        case EBUSY:
        case ETXTBSY:
            kind = ErrorKind::fileInUse;
            break;
    }
    return {.kind = kind, .stage = stage, .path = path, .errorCode = e.errorCode(), .message = e.toString()};
}
}

#endif //RELOCATION_ERROR_H_4357029834750923845

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "integrity.h"
#include <zen/file_access.h> //FAT_FILE_TIME_PRECISION_SEC
#include <zen/open_ssl.h>

using namespace zen;
using namespace frl;


std::string IntegrityVerifier::getFileChecksum(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) const //throw FileError, X
{
    const std::unique_ptr<AFS::InputStream> streamIn = afs_.getInputStream(filePath); //throw FileError, ErrorFileLocked

    const size_t blockSize = streamIn->getBlockSize(); //throw FileError
    std::vector<std::byte> buf(blockSize);
    try
    {
        Sha256Hasher hasher; //throw SysError
        for (;;)
        {
            const size_t bytesRead = streamIn->tryRead(buf.data(), blockSize, notifyUnbufferedIO); //throw FileError, ErrorFileLocked, X; may return short; only 0 means EOF
            if (bytesRead == 0) //end of file
                break;
            hasher.update(buf.data(), bytesRead); //throw SysError
        }
        return formatAsHexString(hasher.finalize()); //throw SysError
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot calculate the checksum of %x."), L"%x", fmtPath(filePath)), e.toString(), e.errorCode());
    }
}


bool IntegrityVerifier::verify(const Zstring& sourcePath, const Zstring& destPath, VerifyMode mode, //throw FileError, X
                               const IoCallback& notifyUnbufferedIO /*throw X*/,
                               std::string* sourceChecksum) const
{
    switch (mode)
    {
        case VerifyMode::checksum:
        {
            const std::string checksumSource = getFileChecksum(sourcePath, notifyUnbufferedIO); //throw FileError, X
            const std::string checksumTarget = getFileChecksum(destPath,   notifyUnbufferedIO); //
            if (sourceChecksum)
                *sourceChecksum = checksumSource;
            return checksumSource == checksumTarget;
        }

        case VerifyMode::sizeAndTime:
        {
            const AFS::StreamAttributes attrSource = afs_.getFileAttributes(sourcePath); //throw FileError
            const AFS::StreamAttributes attrTarget = afs_.getFileAttributes(destPath);   //
            return attrSource.fileSize == attrTarget.fileSize &&
                   sameFileTime(attrSource.modTime, attrTarget.modTime, FAT_FILE_TIME_PRECISION_SEC);
        }
    }
    assert(false);
    return false;
}


bool IntegrityVerifier::verifySymlink(const Zstring& sourcePath, const Zstring& destPath) const //throw FileError
{
    return afs_.getSymlinkContent(sourcePath) == afs_.getSymlinkContent(destPath); //throw FileError
}


void IntegrityVerifier::verifyJobCompleteness(const std::vector<FileRecord>& records, size_t enumeratedCount) const //throw PartialFailureError
{
    size_t countVerified = 0;
    size_t countSkipped  = 0;
    size_t countFailed   = 0;
    size_t countPending  = 0; //including Copied, but not Verified

    for (const FileRecord& rec : records)
        switch (rec.status)
        {
            case FileStatus::verified:
                ++countVerified;
                break;
            case FileStatus::skipped:
                ++countSkipped;
                break;
            case FileStatus::failed:
                ++countFailed;
                break;
            case FileStatus::pending:
            case FileStatus::copied:
                ++countPending;
                break;
        }

    if (countFailed > 0 || countPending > 0 || countVerified + countSkipped != enumeratedCount)
    {
        std::wstring msg = replaceCpy(replaceCpy(_("Only %x of %y items were transferred and verified."),
                                                 L"%x", numberTo<std::wstring>(countVerified + countSkipped)),
                                      L"%y", numberTo<std::wstring>(enumeratedCount));
        if (countFailed > 0)
            msg += L' ' + replaceCpy(_("Failed: %x"), L"%x", numberTo<std::wstring>(countFailed));
        if (countPending > 0)
            msg += L' ' + replaceCpy(_("Not processed: %x"), L"%x", numberTo<std::wstring>(countPending));

        throw PartialFailureError(msg);
    }
}

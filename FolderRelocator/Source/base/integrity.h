// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef INTEGRITY_H_0745823094587230945
#define INTEGRITY_H_0745823094587230945

#include <limits>
#include "relocation_error.h"
#include "../afs/abstract.h"


namespace frl
{
enum class VerifyMode
{
    checksum,    //SHA-256 of both files
    sizeAndTime, //weaker: equal size + modification time within FAT precision
};


inline
bool sameFileTime(time_t lhs, time_t rhs, int tolerance)
{
    assert(tolerance >= 0);

    if (lhs < rhs)
        std::swap(lhs, rhs);

    if (rhs > std::numeric_limits<time_t>::max() - tolerance) //protect against overflow!
        return true;

    return lhs <= rhs + tolerance;
}


class IntegrityVerifier
{
public:
    explicit IntegrityVerifier(const AbstractFileSystem& afs) : afs_(afs) {}
    virtual ~IntegrityVerifier() {}

    //sourceChecksum: optional; SHA-256 of the source (lower-case hex), checksum mode only
    virtual bool verify(const Zstring& sourcePath, const Zstring& destPath, VerifyMode mode, //throw FileError, X
                        const zen::IoCallback& notifyUnbufferedIO /*throw X*/,
                        std::string* sourceChecksum = nullptr) const;

    //compare symlink target text
    bool verifySymlink(const Zstring& sourcePath, const Zstring& destPath) const; //throw FileError

    std::string getFileChecksum(const Zstring& filePath, const zen::IoCallback& notifyUnbufferedIO /*throw X*/) const; //throw FileError, X

    //requires: Verified + Skipped == enumeratedCount, no Failed or Pending record
    void verifyJobCompleteness(const std::vector<FileRecord>& records, size_t enumeratedCount) const; //throw PartialFailureError

private:
    const AbstractFileSystem& afs_;
};
}

#endif //INTEGRITY_H_0745823094587230945

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef TRANSFER_H_2834750923847509
#define TRANSFER_H_2834750923847509

#include <atomic>
#include "integrity.h"
#include "overwrite_policy.h"
#include "progress.h"


namespace frl
{
struct TransferResult
{
    std::vector<FileRecord> records; //one per file, symlink and special item; folders are structural
    size_t enumeratedCount = 0;
    uint64_t bytesTotal = 0;
    std::vector<Zstring> foldersCreated; //relative paths, parents first; created by this job
    std::vector<ErrorEntry> errors;      //all errors, including the abort reason
    std::optional<ErrorEntry> abortReason; //failFast, cancellation, failed enumeration
    std::vector<std::wstring> warnings;
};


/*  copy-then-verify:
      1. enumerate source recursively
      2. create folders (calling thread), resolve FolderConflicts
      3. per file, in a bounded worker pool:
           FileConflict? => resolver | copy to temp name | verify (one retry on mismatch) | atomic rename over target
      - source files are never modified
      - a copy without progress for fileOperationTimeout fails with FileInUseError, even if blocked inside the kernel
      - failFast: first Failed record stops issuing tasks and aborts in-flight copies (temp files removed)
      - requestCancel(): stops issuing tasks, in-flight copies finish; unprocessed records stay Pending  */
class TransferEngine
{
public:
    explicit TransferEngine(const std::shared_ptr<const AbstractFileSystem>& afs) : afs_(afs) {}

    //dryRun: enumerate + resolve conflicts only
    TransferResult transfer(const RelocationJob& job,
                            const OverwritePolicyResolver& resolver,
                            const IntegrityVerifier& verifier,
                            ProgressChannel& progress,
                            bool dryRun = false);

    //context of any thread
    void requestCancel() { cancelRequested_ = true; }
    bool cancelRequested() const { return cancelRequested_; }

private:
    TransferEngine           (const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    const std::shared_ptr<const AbstractFileSystem> afs_; //shared with abandoned copies
    std::atomic<bool> cancelRequested_{false};
};
}

#endif //TRANSFER_H_2834750923847509

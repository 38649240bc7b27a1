// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "transfer.h"
#include <zen/file_io.h> //getPathWithTempName
#include <zen/scope_guard.h>
#include <zen/thread.h>

using namespace zen;
using namespace frl;


namespace
{
class TransferAbortRequest {}; //failFast: thrown from IoCallback of in-flight copies


//verification IoCallback: delta == 0 means "no progress"
class StallGuard
{
public:
    StallGuard(std::chrono::milliseconds timeout, const Zstring& filePath, const std::atomic<bool>& abortRequested) :
        timeout_(timeout), filePath_(filePath), abortRequested_(abortRequested) {}

    void notify(int64_t bytesDelta) //throw FileInUseError, TransferAbortRequest
    {
        if (abortRequested_)
            throw TransferAbortRequest();

        const auto now = std::chrono::steady_clock::now();
        if (bytesDelta != 0)
            lastProgress_ = now;
        else if (now - lastProgress_ >= timeout_)
            throw FileInUseError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath_)),
                                 replaceCpy(_("Operation timed out: no data was transferred for %x ms."), L"%x", numberTo<std::wstring>(timeout_.count())),
                                 filePath_);
    }

private:
    const std::chrono::milliseconds timeout_;
    const Zstring filePath_;
    const std::atomic<bool>& abortRequested_;
    std::chrono::steady_clock::time_point lastProgress_ = std::chrono::steady_clock::now();
};


struct FileTransferContext
{
    const std::shared_ptr<const AbstractFileSystem>& afs;
    const IntegrityVerifier& verifier;
    const OverwritePolicyResolver& resolver;
    const RelocationJob& job;
    const bool dryRun;
    const std::atomic<bool>& abortRequested;
    const std::function<void(const std::wstring& msg)> reportWarning; //context of any thread
};


enum class CopyState
{
    running,
    finished,
    abandoned,
};

//shared with the copy thread: may outlive the caller
struct CopyWatch
{
    std::atomic<int64_t> bytesCopied{0};
    std::atomic<bool> abortRequested{false};
    std::atomic<CopyState> state{CopyState::running};
};


/*  a read blocked inside the kernel never reaches the IoCallback:
    => copy on a detached thread and give up when no data was transferred for "fileOperationTimeout"
    => a failed or abandoned copy removes its target                   */
AFS::FileCopyResult copyFileWatched(const Zstring& sourcePath, const Zstring& targetPath, const FileTransferContext& ctx) //throw FileError, ErrorFileLocked, FileInUseError, TransferAbortRequest
{
    const std::chrono::milliseconds timeout = ctx.job.config->fileOperationTimeout;
    const auto watch = std::make_shared<CopyWatch>();

    auto ftCopy = runAsync([afs = ctx.afs, sourcePath, targetPath, watch]
    {
        setCurrentThreadName(Zstr("Copy: ") + sourcePath);

        bool targetOpened = false; //IoCallback is called only after the target was created
        ZEN_ON_SCOPE_FAIL(if (targetOpened) try
        {
            if (afs->itemExists(targetPath)) //throw FileError
                afs->removeFilePlain(targetPath); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); });

        const AFS::FileCopyResult result = afs->copyNewFile(sourcePath, targetPath, //throw FileError, ErrorTargetExisting, ErrorFileLocked, TransferAbortRequest
        [&](int64_t bytesDelta)
        {
            targetOpened = true;
            if (watch->abortRequested || watch->state == CopyState::abandoned)
                throw TransferAbortRequest();
            watch->bytesCopied += bytesDelta;
        });
        targetOpened = true;

        CopyState expected = CopyState::running;
        if (!watch->state.compare_exchange_strong(expected, CopyState::finished)) //caller is gone
            throw TransferAbortRequest();
        return result;
    });

    int64_t bytesSeen = 0;
    auto lastProgress = std::chrono::steady_clock::now();

    while (ftCopy.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
    {
        if (ctx.abortRequested) //failFast: the IoCallback throws, the copy removes its target
            watch->abortRequested = true;

        const auto now = std::chrono::steady_clock::now();
        if (const int64_t bytesCopied = watch->bytesCopied;
            bytesCopied != bytesSeen)
        {
            bytesSeen = bytesCopied;
            lastProgress = now;
        }
        else if (now - lastProgress >= timeout)
        {
            CopyState expected = CopyState::running;
            if (watch->state.compare_exchange_strong(expected, CopyState::abandoned))
                throw FileInUseError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(sourcePath)),
                                     replaceCpy(_("Operation timed out: no data was transferred for %x ms."), L"%x", numberTo<std::wstring>(timeout.count())),
                                     sourcePath);
            break; //finished just now
        }
    }
    return ftCopy.get(); //throw FileError, ErrorTargetExisting, ErrorFileLocked, TransferAbortRequest
}


AFS::FileCopyResult copyFileWithRetry(const Zstring& sourcePath, const Zstring& targetPath, const FileTransferContext& ctx) //throw FileError, FileInUseError, TransferAbortRequest
{
    for (int attempt = 1;; ++attempt) //locked source: one retry after a delay
        try
        {
            return copyFileWatched(sourcePath, targetPath, ctx); //throw FileError, ErrorTargetExisting, ErrorFileLocked, FileInUseError, TransferAbortRequest
        }
        catch (const ErrorFileLocked& e)
        {
            if (attempt >= 2)
                throw FileInUseError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(sourcePath)), replaceCpy(e.toString(), L"\n\n", L'\n'), sourcePath, e.errorCode());

            interruptibleSleep(ctx.job.config->lockedFileRetryDelay); //throw ThreadStopRequest
        }
}


void transferRegularFile(FileRecord& rec, const Zstring& sourcePath, const Zstring& targetPath, const FileTransferContext& ctx) //throw FileError, TransferAbortRequest
{
    const VerifyMode verifyMode = ctx.job.checksumEnabled() ? VerifyMode::checksum : VerifyMode::sizeAndTime;

    for (int attempt = 1;; ++attempt) //verification mismatch: one retry with a fresh copy
    {
        //write to temp name first: an interrupted copy never leaves a truncated file at the target path
        const Zstring tmpPath = getPathWithTempName(targetPath);

        const AFS::FileCopyResult copyResult = copyFileWithRetry(sourcePath, tmpPath, ctx); //throw FileError, FileInUseError, TransferAbortRequest

        bool tmpExisting = true;
        ZEN_ON_SCOPE_FAIL(if (tmpExisting) try { ctx.afs->removeFilePlain(tmpPath); }
                          catch (const FileError& e) { logExtraError(e.toString()); });

        rec.status = FileStatus::copied;

        if (copyResult.errorModTime)
            ctx.reportWarning(copyResult.errorModTime->toString());

        StallGuard stallGuard(ctx.job.config->fileOperationTimeout, sourcePath, ctx.abortRequested);
        std::string sourceChecksum;

        if (ctx.verifier.verify(sourcePath, tmpPath, verifyMode, //throw FileError, X
        [&](int64_t bytesDelta) { stallGuard.notify(bytesDelta); }, &sourceChecksum)) //throw FileInUseError, TransferAbortRequest
        {
            if (verifyMode == VerifyMode::checksum)
                rec.checksum = sourceChecksum;

            ctx.afs->moveAndRenameItem(tmpPath, targetPath, rec.replacedExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
            tmpExisting = false;

            rec.status = FileStatus::verified;
            return;
        }

        ctx.afs->removeFilePlain(tmpPath); //throw FileError
        tmpExisting = false;
        rec.status = FileStatus::pending;

        if (attempt >= 2)
            throw ChecksumMismatchError(replaceCpy(replaceCpy(_("Data verification error: %x and %y have different content."),
                                                              L"%x", L'\n' + fmtPath(sourcePath)),
                                                   L"%y", L'\n' + fmtPath(targetPath)), sourcePath);
    }
}


void transferSymlink(FileRecord& rec, const Zstring& sourcePath, const Zstring& targetPath, const FileTransferContext& ctx) //throw FileError
{
    const Zstring tmpPath = getPathWithTempName(targetPath);

    ctx.afs->copySymlink(sourcePath, tmpPath); //throw FileError

    bool tmpExisting = true;
    ZEN_ON_SCOPE_FAIL(if (tmpExisting) try { ctx.afs->removeSymlinkPlain(tmpPath); }
                      catch (const FileError& e) { logExtraError(e.toString()); });

    rec.status = FileStatus::copied;

    if (!ctx.verifier.verifySymlink(sourcePath, tmpPath)) //throw FileError
        throw ChecksumMismatchError(replaceCpy(replaceCpy(_("Data verification error: %x and %y have different content."),
                                                          L"%x", L'\n' + fmtPath(sourcePath)),
                                               L"%y", L'\n' + fmtPath(targetPath)), sourcePath);

    ctx.afs->moveAndRenameItem(tmpPath, targetPath, rec.replacedExisting); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
    tmpExisting = false;

    rec.status = FileStatus::verified;
}


void transferItem(FileRecord& rec, const FileTransferContext& ctx) //throw FileError, TransferAbortRequest
{
    const Zstring sourcePath = appendPath(ctx.job.sourcePath,      rec.relPath);
    const Zstring targetPath = appendPath(ctx.job.destinationPath, rec.relPath);

    if (const std::optional<AFS::ItemType> type = ctx.afs->getItemTypeIfExists(targetPath)) //throw FileError
    {
        if (*type == AFS::ItemType::folder)
            throw InvalidPathError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetPath)),
                                   replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(targetPath))), targetPath);

        switch (ctx.resolver.resolve(ctx.job.overwritePolicy(), ConflictKind::fileConflict))
        {
            case ConflictDecision::replace:
                rec.replacedExisting = true;
                break;

            case ConflictDecision::skip:
                rec.status = FileStatus::skipped;
                rec.note = _("The existing item at the destination was kept.");
                return;

            case ConflictDecision::fail:
                throw InvalidPathError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(targetPath)),
                                       replaceCpy(_("The item %x already exists at the destination."), L"%x", fmtPath(getItemName(targetPath))), targetPath);
        }
    }
    else
        rec.createdByJob = true;

    if (ctx.dryRun)
    {
        if (rec.replacedExisting)
            rec.note = _("The existing item at the destination would be replaced.");
        return;
    }

    if (rec.kind == ItemKind::symlink)
        transferSymlink(rec, sourcePath, targetPath, ctx); //throw FileError
    else
        transferRegularFile(rec, sourcePath, targetPath, ctx); //throw FileError, TransferAbortRequest
}


//relative paths are '/'-separated
const Zstring* findParentFolder(const std::vector<Zstring>& folderRelPaths, const Zstring& relPath)
{
    for (const Zstring& folderRelPath : folderRelPaths)
        if (startsWith(relPath, appendSeparator(folderRelPath)))
            return &folderRelPath;
    return nullptr;
}
}


TransferResult TransferEngine::transfer(const RelocationJob& job,
                                        const OverwritePolicyResolver& resolver,
                                        const IntegrityVerifier& verifier,
                                        ProgressChannel& progress,
                                        bool dryRun)
{
    const RelocationConfig& cfg = *job.config;
    const bool failFast = !dryRun && cfg.errorHandling == ErrorHandling::failFast; //dry run: show all conflicts

    TransferResult result;

    std::mutex lockResult; //protect result.errors, result.warnings, result.abortReason against worker threads
    std::atomic<bool> abortRequested = false;

    auto reportFailure = [&](const ErrorEntry& entry)
    {
        {
            std::lock_guard dummy(lockResult);
            result.errors.push_back(entry);
            if (failFast && !result.abortReason)
                result.abortReason = entry;
        }
        if (failFast)
            abortRequested = true;
        progress.reportError(entry);
    };

    auto reportWarning = [&](const std::wstring& msg)
    {
        std::lock_guard dummy(lockResult);
        result.warnings.push_back(msg);
    };

    //------------------------- enumerate -------------------------
    std::vector<AFS::FolderEntry> entries;
    try
    {
        entries = afs_->getFolderContentRecursive(job.sourcePath); //throw FileError
    }
    catch (const FileError& e)
    {
        const ErrorEntry entry = makeErrorEntry(e, ErrorKind::pathNotFound, job.sourcePath, JobStatus::transferring);
        result.errors.push_back(entry);
        result.abortReason = entry;
        progress.reportError(entry);
        return result;
    }

    std::vector<Zstring> folderRelPaths; //parents first
    int specialCount = 0;

    for (const AFS::FolderEntry& entry : entries)
        switch (entry.type)
        {
            case AFS::EntryType::folder:
                folderRelPaths.push_back(entry.relPath);
                break;

            case AFS::EntryType::file:
                result.records.push_back({.relPath = entry.relPath, .kind = ItemKind::file, .fileSize = entry.fileSize, .modTime = entry.modTime});
                result.bytesTotal += entry.fileSize;
                break;

            case AFS::EntryType::symlink:
                result.records.push_back({.relPath = entry.relPath, .kind = ItemKind::symlink, .modTime = entry.modTime});
                break;

            case AFS::EntryType::other:
                result.records.push_back({.relPath = entry.relPath, .kind = ItemKind::special, .modTime = entry.modTime,
                                          .status = FileStatus::skipped,
                                          .note = replaceCpy(_("Items of type %x are not copied."), L"%x", entry.typeName)});
                result.warnings.push_back(replaceCpy(replaceCpy(_("Skipped %x: items of type %y are not copied."),
                                                                L"%x", fmtPath(appendPath(job.sourcePath, entry.relPath))),
                                                     L"%y", entry.typeName));
                ++specialCount;
                break;
        }
    result.enumeratedCount = result.records.size();

    progress.updateDataTotal(static_cast<int>(result.records.size()), static_cast<int64_t>(result.bytesTotal));
    progress.updateDataProcessed(specialCount, 0);

    //------------------------- folders: calling thread, parents first -------------------------
    std::vector<Zstring> failedFolders;  //everything beneath fails, too
    std::vector<Zstring> skippedFolders; //

    for (const Zstring& relPath : folderRelPaths)
    {
        if (cancelRequested_ || abortRequested)
            break;

        if (findParentFolder(failedFolders, relPath) || findParentFolder(skippedFolders, relPath))
            continue;

        const Zstring sourceFolder = appendPath(job.sourcePath,      relPath);
        const Zstring targetFolder = appendPath(job.destinationPath, relPath);
        try
        {
            if (const std::optional<AFS::ItemType> type = afs_->getItemTypeIfExists(targetFolder)) //throw FileError
                switch (resolver.resolve(job.overwritePolicy(), ConflictKind::folderConflict))
                {
                    case ConflictDecision::replace:
                        if (*type != AFS::ItemType::folder && !dryRun) //existing folder: merge content
                        {
                            if (*type == AFS::ItemType::symlink)
                                afs_->removeSymlinkPlain(targetFolder); //throw FileError
                            else
                                afs_->removeFilePlain(targetFolder); //throw FileError

                            afs_->copyNewFolder(sourceFolder, targetFolder); //throw FileError, ErrorTargetExisting
                            result.foldersCreated.push_back(relPath);
                        }
                        break;

                    case ConflictDecision::skip:
                        skippedFolders.push_back(relPath);
                        break;

                    case ConflictDecision::fail:
                        throw InvalidPathError(replaceCpy(_("Cannot create folder %x."), L"%x", fmtPath(targetFolder)),
                                               replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(targetFolder))), targetFolder);
                }
            else if (!dryRun)
            {
                afs_->copyNewFolder(sourceFolder, targetFolder); //throw FileError, ErrorTargetExisting
                result.foldersCreated.push_back(relPath);
            }
        }
        catch (const FileError& e)
        {
            failedFolders.push_back(relPath);
            reportFailure(makeErrorEntry(e, ErrorKind::partialFailure, targetFolder, JobStatus::transferring));
        }
    }

    for (FileRecord& rec : result.records)
        if (rec.status == FileStatus::pending)
        {
            if (const Zstring* folderRelPath = findParentFolder(failedFolders, rec.relPath))
            {
                rec.status = FileStatus::failed;
                rec.note = replaceCpy(_("Parent folder %x could not be created."), L"%x", fmtPath(*folderRelPath));
                progress.updateDataProcessed(1, 0);
            }
            else if (const Zstring* folderRelPath2 = findParentFolder(skippedFolders, rec.relPath))
            {
                rec.status = FileStatus::skipped;
                rec.note = replaceCpy(_("Parent folder %x was skipped."), L"%x", fmtPath(*folderRelPath2));
                progress.updateDataProcessed(1, 0);
            }
        }

    //------------------------- files: bounded worker pool -------------------------
    if (!cancelRequested_ && !abortRequested)
    {
        const FileTransferContext ctx{afs_, verifier, resolver, job, dryRun, abortRequested, reportWarning};

        ThreadGroup<std::function<void()>> tg(std::max<size_t>(cfg.parallelOps, 1), Zstr("Transfer ") + getFolderName(job.folderType));

        for (FileRecord& rec : result.records)
            if (rec.status == FileStatus::pending)
                tg.run([&, &rec = rec]
            {
                if (cancelRequested_ || abortRequested) //not started: stays Pending
                    return;

                progress.setCurrentItem(rec.relPath);
                try
                {
                    transferItem(rec, ctx); //throw FileError, TransferAbortRequest
                    progress.updateDataProcessed(1, rec.status == FileStatus::verified ? static_cast<int64_t>(rec.fileSize) : 0);
                }
                catch (TransferAbortRequest&)
                {
                    rec.status = FileStatus::pending; //temp file already removed
                }
                catch (const FileError& e)
                {
                    rec.status = FileStatus::failed;
                    rec.note = replaceCpy(e.toString(), L"\n\n", L'\n');
                    reportFailure(makeErrorEntry(e, ErrorKind::partialFailure, appendPath(job.sourcePath, rec.relPath), JobStatus::transferring));
                    progress.updateDataProcessed(1, 0);
                }
            });

        tg.wait();
    }

    if (cancelRequested_ && !result.abortReason)
    {
        const ErrorEntry entry{.kind = ErrorKind::cancelled, .stage = JobStatus::transferring, .path = job.sourcePath, .message = _("Stopped on user request.")};
        result.errors.push_back(entry);
        result.abortReason = entry;
        progress.reportError(entry);
    }
    return result;
}

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "relocation.h"
#include <algorithm>
#include <map>
#include <zen/extra_log.h>
#include <zen/format_unit.h>
#include <zen/scope_guard.h>
#include "folder_lock.h"
#include "log_file.h"
#include "return_codes.h"

using namespace zen;
using namespace frl;


namespace
{
bool isEmptyFolder(const AbstractFileSystem& afs, const Zstring& folderPath) //throw FileError
{
    bool folderEmpty = true;
    afs.traverseFolder(folderPath, //throw FileError
    [&](const AFS::FileInfo&    ) { folderEmpty = false; },
    [&](const AFS::FolderInfo&  ) { folderEmpty = false; },
    [&](const AFS::SymlinkInfo& ) { folderEmpty = false; },
    [&](const AFS::OtherInfo&   ) { folderEmpty = false; });
    return folderEmpty;
}


void removeItem(const AbstractFileSystem& afs, const Zstring& itemPath, ItemKind kind) //throw FileError
{
    if (kind == ItemKind::symlink)
        afs.removeSymlinkPlain(itemPath); //throw FileError
    else
        afs.removeFilePlain(itemPath); //throw FileError
}
}


RelocationOrchestrator::RelocationOrchestrator(const RelocationJob& job,
                                               const std::shared_ptr<const AbstractFileSystem>& afs,
                                               RegistryBackupManager& backupManager,
                                               const std::function<bool()>& privilegeCheck,
                                               const std::shared_ptr<ProgressObserver>& observer) :
    job_(job),
    afs_(afs),
    backupManager_(backupManager),
    privilegeCheck_(privilegeCheck),
    observer_(observer),
    resolver_(),
    verifier_(*afs),
    junction_(*afs)
{
    if (!job_.config)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void RelocationOrchestrator::requestCancel()
{
    cancelRequested_ = true;

    std::lock_guard dummy(lockEngine_);
    if (activeEngine_)
        activeEngine_->requestCancel();
}


TransferReport RelocationOrchestrator::run()
{
    const auto startTime = std::chrono::steady_clock::now();

    TransferReport report;
    report.jobId           = job_.jobId;
    report.folderType      = job_.folderType;
    report.sourcePath      = job_.sourcePath;
    report.destinationPath = job_.destinationPath;
    report.dryRun          = job_.config->dryRun;
    report.startTime       = std::time(nullptr);
    {
        ProgressChannel progress(observer_);

        //at most one active job per folder type: hold for the entire run
        FolderTypeLock typeLock(job_.folderType, [&]
        {
            logInfo(replaceCpy(_("Waiting while another job relocates %x..."), L"%x", utfTo<std::wstring>(getFolderName(job_.folderType))), report);
        });

        logInfo(replaceCpy(replaceCpy(_("Relocating %x to %y"), L"%x", fmtPath(job_.sourcePath)), L"%y", fmtPath(job_.destinationPath)), report);

        runStateMachine(report, progress);

        for (const FileRecord& rec : report.records)
            if (rec.status == FileStatus::verified)
            {
                ++report.filesMoved;
                report.bytesMoved += rec.fileSize;
            }
            else if (rec.status == FileStatus::skipped)
                ++report.filesSkipped;

        //errors while an exception was in flight, cleanup errors
        for (const LogEntry& entry : fetchExtraLog())
            report.log.push_back(entry);

        report.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime).count();

        logInfo(getTaskResultLabel(getTaskResult(report)) + L": " +
                _("Items moved:") + L' ' + formatNumber(report.filesMoved) + L" (" + formatFilesizeShort(static_cast<int64_t>(report.bytesMoved)) + L"), " +
                _("Items skipped:") + L' ' + formatNumber(report.filesSkipped), report);
    } //deliver final progress snapshot

    if (!job_.config->logFolderPath.empty())
        try
        {
            report.logFilePath = saveLogFile(job_.config->logFolderPath, report); //throw FileError
        }
        catch (const FileError& e) { report.logFileError = e.toString(); }

    return report;
}


void RelocationOrchestrator::runStateMachine(TransferReport& report, ProgressChannel& progress)
{
    //------------------------- Validating -------------------------
    setStatus(JobStatus::validating, report, progress);
    if (cancelRequested_)
        return failCancelled(report, progress);

    const PreflightResult preflight = PreflightValidator(afs_, privilegeCheck_).validate(job_);
    if (!preflight.ok)
    {
        for (const ErrorEntry& entry : preflight.reasons)
            reportError(entry, report, progress);
        return setStatus(JobStatus::failed, report, progress); //no side effects, no backup
    }
    alreadyRelocated_ = preflight.alreadyRelocated;

    if (alreadyRelocated_)
        logInfo(replaceCpy(replaceCpy(_("%x already resolves to %y."), L"%x", fmtPath(job_.sourcePath)), L"%y", fmtPath(job_.destinationPath)), report);
    else
        logInfo(_("Data to transfer:") + L' ' + formatFilesizeShort(static_cast<int64_t>(preflight.estimatedBytes)), report);

    if (cancelRequested_)
        return failCancelled(report, progress);

    if (job_.config->dryRun)
        return runDryRun(report, progress);

    //------------------------- BackingUpRegistry -------------------------
    setStatus(JobStatus::backingUpRegistry, report, progress);
    try
    {
        const RegistryBackup backup = backupManager_.backup(job_.folderType, job_.jobId); //throw RegistryAccessError
        report.backupId = backup.backupId;

        logInfo(replaceCpy(_("Created registry backup %x."), L"%x", utfTo<std::wstring>(backup.backupId)), report);
    }
    catch (const FileError& e)
    {
        reportError(makeErrorEntry(e, ErrorKind::registryAccess, backupManager_.getStorePath(), JobStatus::backingUpRegistry), report, progress);
        return setStatus(JobStatus::failed, report, progress);
    }

    //------------------------- Transferring, Verifying -------------------------
    if (!runTransfer(report, progress))
        return;

    //------------------------- Committing -------------------------
    setStatus(JobStatus::committing, report, progress);
    if (cancelRequested_) //last chance: no cancellation while the registry is written
        return failCancelled(report, progress);

    CommitState cs;
    try
    {
        commit(report, cs); //throw FileError
    }
    catch (const FileError& e)
    {
        reportError(makeErrorEntry(e, ErrorKind::partialFailure, job_.sourcePath, JobStatus::committing), report, progress);
        return rollback(cs, report, progress);
    }

    //------------------------- CleaningUp -------------------------
    setStatus(JobStatus::cleaningUp, report, progress);
    cleanUp(cs, report); //errors are non-fatal

    setStatus(JobStatus::completed, report, progress);
}


void RelocationOrchestrator::addAlreadyPresentRecords(TransferReport& report) //throw FileError
{
    for (const AFS::FolderEntry& entry : afs_->getFolderContentRecursive(job_.sourcePath)) //throw FileError
        if (entry.type != AFS::EntryType::folder)
        {
            FileRecord rec;
            rec.relPath  = entry.relPath;
            rec.kind     = entry.type == AFS::EntryType::symlink ? ItemKind::symlink :
                           entry.type == AFS::EntryType::file    ? ItemKind::file : ItemKind::special;
            rec.fileSize = entry.fileSize;
            rec.modTime  = entry.modTime;
            rec.status   = FileStatus::skipped;
            rec.note     = _("Already present at the destination.");
            report.records.push_back(std::move(rec));
        }

    enumeratedCount_ = report.records.size();
}


TransferResult RelocationOrchestrator::runEngine(ProgressChannel& progress, bool dryRun)
{
    TransferEngine engine(afs_);
    {
        std::lock_guard dummy(lockEngine_);
        activeEngine_ = &engine;
        if (cancelRequested_)
            engine.requestCancel();
    }
    ZEN_ON_SCOPE_EXIT(std::lock_guard dummy(lockEngine_); activeEngine_ = nullptr);

    return engine.transfer(job_, resolver_, verifier_, progress, dryRun);
}


bool RelocationOrchestrator::runTransfer(TransferReport& report, ProgressChannel& progress)
{
    setStatus(JobStatus::transferring, report, progress);
    if (cancelRequested_)
    {
        failCancelled(report, progress);
        return false;
    }

    std::optional<ErrorEntry> abortReason;

    if (alreadyRelocated_)
        try
        {
            addAlreadyPresentRecords(report); //throw FileError
        }
        catch (const FileError& e)
        {
            reportError(makeErrorEntry(e, ErrorKind::pathNotFound, job_.sourcePath, JobStatus::transferring), report, progress);
            setFailed(report, progress);
            return false;
        }
    else
    {
        try
        {
            if (!afs_->itemExists(job_.destinationPath)) //throw FileError
            {
                if (const std::optional<Zstring> parentPath = getParentFolderPath(job_.destinationPath))
                    afs_->createFolderIfMissingRecursion(*parentPath); //throw FileError

                afs_->copyNewFolder(job_.sourcePath, job_.destinationPath); //throw FileError, ErrorTargetExisting
                destinationCreated_ = true;

                logInfo(replaceCpy(_("Created folder %x."), L"%x", fmtPath(job_.destinationPath)), report);
            }
        }
        catch (const FileError& e)
        {
            reportError(makeErrorEntry(e, ErrorKind::permission, job_.destinationPath, JobStatus::transferring), report, progress);
            setFailed(report, progress);
            return false;
        }

        TransferResult result = runEngine(progress, false /*dryRun*/);

        for (const std::wstring& msg : result.warnings)
            logWarning(msg, report);
        for (const ErrorEntry& entry : result.errors) //observer was already notified
            logError(entry, report);

        report.records   = std::move(result.records);
        enumeratedCount_ = result.enumeratedCount;
        foldersCreated_  = std::move(result.foldersCreated);
        abortReason      = result.abortReason;
    }

    //------------------------- Verifying -------------------------
    setStatus(JobStatus::verifying, report, progress);
    try
    {
        verifier_.verifyJobCompleteness(report.records, enumeratedCount_); //throw PartialFailureError
    }
    catch (const RelocationError& e)
    {
        reportError(makeErrorEntry(e, JobStatus::verifying), report, progress);
        setFailed(report, progress);
        return false;
    }

    if (abortReason) //e.g. cancelled after the last file
    {
        setFailed(report, progress);
        return false;
    }
    return true;
}


void RelocationOrchestrator::runDryRun(TransferReport& report, ProgressChannel& progress)
{
    setStatus(JobStatus::transferring, report, progress);

    if (alreadyRelocated_)
        try
        {
            addAlreadyPresentRecords(report); //throw FileError
        }
        catch (const FileError& e)
        {
            reportError(makeErrorEntry(e, ErrorKind::pathNotFound, job_.sourcePath, JobStatus::transferring), report, progress);
            return setStatus(JobStatus::failed, report, progress);
        }
    else
    {
        TransferResult result = runEngine(progress, true /*dryRun*/);

        for (const std::wstring& msg : result.warnings)
            logWarning(msg, report);
        for (const ErrorEntry& entry : result.errors)
            logError(entry, report);

        report.records = std::move(result.records);

        if (result.abortReason) //cancelled or source not readable
            return setStatus(JobStatus::failed, report, progress);
    }

    logInfo(_("Dry run: no changes were made."), report);
    setStatus(JobStatus::completed, report, progress);
}


Zstring RelocationOrchestrator::getStagingPath() const //throw FileError
{
    const std::optional<Zstring> parentPath = getParentFolderPath(job_.sourcePath);
    if (!parentPath)
        throw FileError(replaceCpy(_("Cannot move folder %x."), L"%x", fmtPath(job_.sourcePath)), _("The folder has no parent folder."));

    const Zstring itemName = getItemName(job_.sourcePath);

    if (job_.deleteOriginals()) //hidden, removed during cleanup
        return appendPath(*parentPath, Zstr('.') + itemName + Zstr(".relocating-") + job_.jobId);

    Zstring backupPath = appendPath(*parentPath, itemName + Zstr("_backup"));
    for (int i = 2; afs_->itemExists(backupPath); ++i) //throw FileError
        backupPath = appendPath(*parentPath, itemName + Zstr("_backup_") + numberTo<Zstring>(i));
    return backupPath;
}


bool RelocationOrchestrator::isUnchangedSinceVerification(const Zstring& itemPath, const AFS::FolderEntry& entry, const FileRecord& rec) const //throw FileError
{
    if (rec.kind == ItemKind::symlink)
        return entry.type == AFS::EntryType::symlink &&
               verifier_.verifySymlink(itemPath, appendPath(job_.destinationPath, rec.relPath)); //throw FileError

    if (entry.type != AFS::EntryType::file ||
        entry.fileSize != rec.fileSize ||
        entry.modTime  != rec.modTime)
        return false;

    //same size and time: content may still differ
    if (job_.checksumEnabled() && rec.checksum)
        return verifier_.getFileChecksum(itemPath, nullptr /*notifyUnbufferedIO*/) == *rec.checksum; //throw FileError
    return true;
}


void RelocationOrchestrator::deleteVerifiedOriginals(const std::vector<FileRecord>& records, CommitState& cs) //throw FileError
{
    //check everything before deleting anything: a modified original fails the commit => rollback
    {
        std::map<Zstring, AFS::FolderEntry> currentEntries;
        for (const AFS::FolderEntry& entry : afs_->getFolderContentRecursive(job_.sourcePath)) //throw FileError
            currentEntries.emplace(entry.relPath, entry);

        for (const FileRecord& rec : records)
            if (rec.status == FileStatus::verified)
                if (auto it = currentEntries.find(rec.relPath);
                    it != currentEntries.end())
                {
                    const Zstring itemPath = appendPath(job_.sourcePath, rec.relPath);
                    if (!isUnchangedSinceVerification(itemPath, it->second, rec)) //throw FileError
                        throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(itemPath)),
                                        _("The file was modified after it was verified."));
                }
    }

    for (const FileRecord& rec : records)
        if (rec.status == FileStatus::verified)
        {
            removeItem(*afs_, appendPath(job_.sourcePath, rec.relPath), rec.kind); //throw FileError
            cs.deletedOriginals.push_back(&rec);
        }

    //children first; remaining (skipped) items make this fail
    const std::vector<AFS::FolderEntry> entries = afs_->getFolderContentRecursive(job_.sourcePath); //throw FileError
    for (auto it = entries.rbegin(); it != entries.rend(); ++it)
        if (it->type == AFS::EntryType::folder)
        {
            afs_->removeFolderPlain(appendPath(job_.sourcePath, it->relPath)); //throw FileError
            cs.deletedFolders.push_back(it->relPath);
        }
}


void RelocationOrchestrator::commit(TransferReport& report, CommitState& cs) //throw FileError
{
    if (alreadyRelocated_)
    {
        if (junction_.isJunctionTo(job_.sourcePath, job_.destinationPath)) //throw FileError
            logInfo(replaceCpy(_("Keeping existing junction %x."), L"%x", fmtPath(job_.sourcePath)), report);
    }
    else
    {
        //1. clear the original path: same-volume rename deletes nothing
        const Zstring stagedPath = getStagingPath(); //throw FileError
        try
        {
            afs_->moveAndRenameItem(job_.sourcePath, stagedPath, false /*replaceExisting*/); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
            cs.stagedPath = stagedPath;

            logInfo(replaceCpy(_("Moved original folder to %x."), L"%x", fmtPath(stagedPath)), report);
        }
        catch (const ErrorMoveUnsupported& e) //e.g. mount point
        {
            if (!job_.deleteOriginals())
                throw FileError(replaceCpy(_("Cannot keep the original folder %x."), L"%x", fmtPath(job_.sourcePath)), replaceCpy(e.toString(), L"\n\n", L'\n'), e.errorCode());

            logWarning(replaceCpy(_("Cannot move %x. Deleting verified original files instead."), L"%x", fmtPath(job_.sourcePath)) + L"\n" + e.toString(), report);

            deleteVerifiedOriginals(report.records, cs); //throw FileError
        }

        //2. junction
        junction_.link(job_.sourcePath, job_.destinationPath); //throw JunctionCreationError
        cs.junctionCreated = true;

        logInfo(replaceCpy(replaceCpy(_("Created junction %x pointing to %y."), L"%x", fmtPath(job_.sourcePath)), L"%y", fmtPath(job_.destinationPath)), report);
    }

    //3. registry: protected by the backup taken in BackingUpRegistry
    if (job_.config->setAsDefaultLocation)
    {
        backupManager_.commit(job_.folderType, job_.destinationPath); //throw RegistryAccessError

        logInfo(replaceCpy(replaceCpy(_("Set %x as default location of %y."), L"%x", fmtPath(job_.destinationPath)),
                           L"%y", utfTo<std::wstring>(getFolderName(job_.folderType))), report);
    }
}


void RelocationOrchestrator::rollback(const CommitState& cs, TransferReport& report, ProgressChannel& progress)
{
    logInfo(_("Rolling back changes..."), report);

    bool rollbackFailed = false;
    auto onRollbackError = [&](const FileError& e, ErrorKind defaultKind, const Zstring& path)
    {
        reportError(makeErrorEntry(e, defaultKind, path, JobStatus::committing), report, progress);
        rollbackFailed = true;
    };

    if (cs.junctionCreated)
        try
        {
            junction_.unlink(job_.sourcePath); //throw JunctionCreationError
        }
        catch (const FileError& e) { onRollbackError(e, ErrorKind::junctionCreation, job_.sourcePath); }

    if (!report.backupId.empty())
        try
        {
            backupManager_.restore(report.backupId); //throw RegistryAccessError
            logInfo(replaceCpy(_("Restored registry backup %x."), L"%x", utfTo<std::wstring>(report.backupId)), report);
        }
        catch (const FileError& e) { onRollbackError(e, ErrorKind::registryAccess, backupManager_.getStorePath()); }

    //the destination is never deleted: it holds the only copy after the fallback deletion
    if (!cs.stagedPath.empty())
        try
        {
            afs_->moveAndRenameItem(cs.stagedPath, job_.sourcePath, false /*replaceExisting*/); //throw FileError, ErrorMoveUnsupported, ErrorTargetExisting
            logInfo(replaceCpy(_("Moved original folder back to %x."), L"%x", fmtPath(job_.sourcePath)), report);
        }
        catch (const FileError& e) { onRollbackError(e, ErrorKind::partialFailure, cs.stagedPath); }
    else if (!cs.deletedOriginals.empty() || !cs.deletedFolders.empty())
        try
        {
            afs_->createFolderIfMissingRecursion(job_.sourcePath); //throw FileError

            for (auto it = cs.deletedFolders.rbegin(); it != cs.deletedFolders.rend(); ++it) //parents first
                afs_->createFolderIfMissingRecursion(appendPath(job_.sourcePath, *it)); //throw FileError

            for (const FileRecord* rec : cs.deletedOriginals)
            {
                const Zstring verifiedPath = appendPath(job_.destinationPath, rec->relPath);
                const Zstring originalPath = appendPath(job_.sourcePath,      rec->relPath);

                if (rec->kind == ItemKind::symlink)
                    afs_->copySymlink(verifiedPath, originalPath); //throw FileError
                else
                    afs_->copyNewFile(verifiedPath, originalPath, nullptr /*notifyUnbufferedIO*/); //throw FileError, ErrorTargetExisting, ErrorFileLocked
            }
            logInfo(replaceCpy(_("Copied %x items back to the original folder."), L"%x", formatNumber(static_cast<int64_t>(cs.deletedOriginals.size()))), report);
        }
        catch (const FileError& e) { onRollbackError(e, ErrorKind::partialFailure, job_.sourcePath); }

    setStatus(rollbackFailed ? JobStatus::failed : JobStatus::rolledBack, report, progress);
}


void RelocationOrchestrator::cleanUp(const CommitState& cs, TransferReport& report)
{
    if (cs.stagedPath.empty()) //already relocated, or originals deleted during commit
        return;

    if (!job_.deleteOriginals())
        return logInfo(replaceCpy(_("The original files were kept in %x."), L"%x", fmtPath(cs.stagedPath)), report);

    std::map<Zstring, const FileRecord*> verifiedRecords;
    for (const FileRecord& rec : report.records)
        if (rec.status == FileStatus::verified)
            verifiedRecords.emplace(rec.relPath, &rec);

    bool itemsRemaining = false;
    try
    {
        const std::vector<AFS::FolderEntry> entries = afs_->getFolderContentRecursive(cs.stagedPath); //throw FileError

        for (const AFS::FolderEntry& entry : entries)
            if (entry.type != AFS::EntryType::folder)
            {
                auto itRec = verifiedRecords.find(entry.relPath);
                if (itRec == verifiedRecords.end()) //source is deleted only after the destination was verified
                {
                    itemsRemaining = true;
                    continue;
                }
                try
                {
                    const Zstring itemPath = appendPath(cs.stagedPath, entry.relPath);

                    if (!isUnchangedSinceVerification(itemPath, entry, *itRec->second)) //throw FileError
                    {
                        logWarning(replaceCpy(_("%x was modified after it was verified and was kept."), L"%x", fmtPath(itemPath)), report);
                        itemsRemaining = true;
                        continue;
                    }
                    removeItem(*afs_, itemPath, entry.type == AFS::EntryType::symlink ? ItemKind::symlink : ItemKind::file); //throw FileError
                }
                catch (const FileError& e)
                {
                    logWarning(e.toString(), report);
                    itemsRemaining = true;
                }
            }

        for (auto it = entries.rbegin(); it != entries.rend(); ++it) //children first
            if (it->type == AFS::EntryType::folder)
            {
                const Zstring folderPath = appendPath(cs.stagedPath, it->relPath);
                if (isEmptyFolder(*afs_, folderPath)) //throw FileError
                    afs_->removeFolderPlain(folderPath); //throw FileError
                else
                    itemsRemaining = true;
            }

        if (!itemsRemaining)
            afs_->removeFolderPlain(cs.stagedPath); //throw FileError
    }
    catch (const FileError& e)
    {
        logWarning(e.toString(), report);
        itemsRemaining = true;
    }

    if (itemsRemaining)
    {
        report.partialCleanup = true;
        logWarning(replaceCpy(_("The original folder could not be deleted completely. Remaining items were kept in %x."), L"%x", fmtPath(cs.stagedPath)), report);
    }
    else
        logInfo(_("Deleted original files."), report);
}


void RelocationOrchestrator::purgeDestination(TransferReport& report)
{
    int itemsRemoved = 0;

    for (const FileRecord& rec : report.records)
        if (rec.createdByJob && rec.status == FileStatus::verified)
            try
            {
                removeItem(*afs_, appendPath(job_.destinationPath, rec.relPath), rec.kind); //throw FileError
                ++itemsRemoved;
            }
            catch (const FileError& e) { logWarning(e.toString(), report); }

    std::vector<Zstring> folderPaths;
    for (const Zstring& relPath : foldersCreated_)
        folderPaths.push_back(appendPath(job_.destinationPath, relPath));
    std::reverse(folderPaths.begin(), folderPaths.end()); //children first

    if (destinationCreated_)
        folderPaths.push_back(job_.destinationPath);

    for (const Zstring& folderPath : folderPaths)
        try
        {
            if (isEmptyFolder(*afs_, folderPath)) //throw FileError
            {
                afs_->removeFolderPlain(folderPath); //throw FileError
                ++itemsRemoved;
            }
        }
        catch (const FileError& e) { logWarning(e.toString(), report); }

    logInfo(replaceCpy(_("Deleted %x items created by this job at the destination."), L"%x", formatNumber(itemsRemoved)), report);
}


void RelocationOrchestrator::setStatus(JobStatus status, TransferReport& report, ProgressChannel& progress)
{
    job_.status = status;
    status_ = status;
    report.finalStatus = status;

    logInfo(replaceCpy(_("Status: %x"), L"%x", getStatusLabel(status)), report);
    progress.setPhase(status);
}


void RelocationOrchestrator::setFailed(TransferReport& report, ProgressChannel& progress)
{
    if (job_.config->purgeDestinationOnFailure && !job_.config->dryRun)
        purgeDestination(report);

    setStatus(JobStatus::failed, report, progress);
}


void RelocationOrchestrator::failCancelled(TransferReport& report, ProgressChannel& progress)
{
    reportError(makeErrorEntry(CancelledError(_("Stopped on user request."), job_.sourcePath), status_), report, progress);
    setFailed(report, progress);
}


void RelocationOrchestrator::logInfo(const std::wstring& msg, TransferReport& report) const
{
    logMsg(report.log, L'[' + utfTo<std::wstring>(job_.jobId) + L"] " + msg, MSG_TYPE_INFO);
}


void RelocationOrchestrator::logWarning(const std::wstring& msg, TransferReport& report) const
{
    logMsg(report.log, L'[' + utfTo<std::wstring>(job_.jobId) + L"] " + msg, MSG_TYPE_WARNING);
}


void RelocationOrchestrator::logError(const ErrorEntry& entry, TransferReport& report) const
{
    report.errors.push_back(entry);

    std::wstring msg = L'[' + utfTo<std::wstring>(job_.jobId) + L"] " + formatErrorEntry(entry);
    if (!entry.path.empty())
        msg += L'\n' + _("Path:") + L' ' + fmtPath(entry.path);

    logMsg(report.log, msg, MSG_TYPE_ERROR);
}


void RelocationOrchestrator::reportError(const ErrorEntry& entry, TransferReport& report, ProgressChannel& progress) const
{
    logError(entry, report);
    progress.reportError(entry);
}

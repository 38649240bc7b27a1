// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef RELOCATION_H_8753409283475098234
#define RELOCATION_H_8753409283475098234

#include "junction.h"
#include "preflight.h"
#include "registry_backup.h"
#include "transfer.h"


namespace frl
{
/*  Idle -> Validating -> BackingUpRegistry -> Transferring -> Verifying -> Committing -> CleaningUp -> Completed
                 |               |                  |              |            |
                 +---------------+------------------+--------------+--> Failed  +--> RolledBack (Failed if rollback fails)

    - one job per folder type at a time: FolderTypeLock is held for the entire run
    - the original folder is moved aside (same volume rename) before the junction is created
    - errors after the original was touched trigger rollback: junction removed, registry restored, original moved back */
class RelocationOrchestrator
{
public:
    RelocationOrchestrator(const RelocationJob& job,
                           const std::shared_ptr<const AbstractFileSystem>& afs,
                           RegistryBackupManager& backupManager,
                           const std::function<bool()>& privilegeCheck = nullptr, //nullptr => zen::runningElevated()
                           const std::shared_ptr<ProgressObserver>& observer = nullptr);

    //execute the state machine once; context of any thread
    TransferReport run();

    //context of any thread: effective in Validating, Transferring and at the start of Committing
    void requestCancel();

    JobStatus getStatus() const { return status_; } //context of any thread

private:
    RelocationOrchestrator           (const RelocationOrchestrator&) = delete;
    RelocationOrchestrator& operator=(const RelocationOrchestrator&) = delete;

    struct CommitState
    {
        Zstring stagedPath; //original folder moved aside; empty: not moved
        std::vector<const FileRecord*> deletedOriginals; //fallback: originals deleted one by one
        std::vector<Zstring> deletedFolders;             //relative paths, children first
        bool junctionCreated = false;
    };

    void runStateMachine(TransferReport& report, ProgressChannel& progress);

    bool runTransfer(TransferReport& report, ProgressChannel& progress); //false: job failed
    void runDryRun  (TransferReport& report, ProgressChannel& progress);

    void addAlreadyPresentRecords(TransferReport& report); //throw FileError
    TransferResult runEngine(ProgressChannel& progress, bool dryRun);

    void commit(TransferReport& report, CommitState& cs); //throw FileError
    void rollback(const CommitState& cs, TransferReport& report, ProgressChannel& progress); //=> RolledBack or Failed
    void cleanUp(const CommitState& cs, TransferReport& report);
    void purgeDestination(TransferReport& report);

    Zstring getStagingPath() const; //throw FileError
    void deleteVerifiedOriginals(const std::vector<FileRecord>& records, CommitState& cs); //throw FileError

    //original still matches the record that was verified: edits made after verification must survive
    bool isUnchangedSinceVerification(const Zstring& itemPath, const AFS::FolderEntry& entry, const FileRecord& rec) const; //throw FileError

    void setStatus(JobStatus status, TransferReport& report, ProgressChannel& progress);
    void setFailed(TransferReport& report, ProgressChannel& progress);
    void failCancelled(TransferReport& report, ProgressChannel& progress);

    void logInfo   (const std::wstring& msg, TransferReport& report) const;
    void logWarning(const std::wstring& msg, TransferReport& report) const;
    void logError  (const ErrorEntry& entry, TransferReport& report) const;
    void reportError(const ErrorEntry& entry, TransferReport& report, ProgressChannel& progress) const; //log + notify observer

    RelocationJob job_;
    const std::shared_ptr<const AbstractFileSystem> afs_;
    RegistryBackupManager& backupManager_;
    const std::function<bool()> privilegeCheck_;
    const std::shared_ptr<ProgressObserver> observer_;

    const OverwritePolicyResolver resolver_;
    const IntegrityVerifier verifier_;
    const JunctionManager junction_;

    std::atomic<JobStatus> status_{JobStatus::idle};
    std::atomic<bool> cancelRequested_{false};

    std::mutex lockEngine_;
    TransferEngine* activeEngine_ = nullptr; //bound during Transferring only

    std::vector<Zstring> foldersCreated_; //relative to destination, parents first
    bool destinationCreated_ = false;
    bool alreadyRelocated_ = false;
    size_t enumeratedCount_ = 0;
};
}

#endif //RELOCATION_H_8753409283475098234

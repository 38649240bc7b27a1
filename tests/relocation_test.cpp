// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include <algorithm>
#include <sys/stat.h> //mkfifo
#include <zen/open_ssl.h>
#include <zen/thread.h>
#include "base/config.h"
#include "base/relocation.h"
#include "base/return_codes.h"
#include "test_tools.h"

using namespace zen;
using namespace frl;


namespace
{
std::vector<std::string> getStatusTrail(const TransferReport& report)
{
    const std::string_view marker = "] Status: ";

    std::vector<std::string> trail;
    for (const LogEntry& entry : report.log)
        if (const size_t pos = entry.message.find(marker);
            pos != std::string::npos)
            trail.push_back(entry.message.substr(pos + marker.size()));
    return trail;
}


bool hasError(const TransferReport& report, ErrorKind kind, JobStatus stage)
{
    return std::any_of(report.errors.begin(), report.errors.end(), [&](const ErrorEntry& entry) { return entry.kind == kind && entry.stage == stage; });
}


int countStatus(const TransferReport& report, FileStatus status)
{
    return static_cast<int>(std::count_if(report.records.begin(), report.records.end(), [&](const FileRecord& rec) { return rec.status == status; }));
}


bool logContains(const TransferReport& report, const std::string& text, MessageType type)
{
    return std::any_of(report.log.begin(), report.log.end(), [&](const LogEntry& entry) { return entry.type == type && contains(entry.message, text); });
}


class PhaseRecorder : public ProgressObserver
{
public:
    void onProgress(const ProgressEvent& event) override
    {
        std::lock_guard dummy(lock_);
        lastEvent_ = event;
        ++eventCount_;
    }

    ProgressEvent getLastEvent() const { std::lock_guard dummy(lock_); return lastEvent_; }
    int getEventCount() const { std::lock_guard dummy(lock_); return eventCount_; }

private:
    mutable std::mutex lock_;
    ProgressEvent lastEvent_;
    int eventCount_ = 0;
};

const std::vector<std::string> STATUS_TRAIL_COMPLETED
{
    "Validating", "BackingUpRegistry", "Transferring", "Verifying", "Committing", "CleaningUp", "Completed"
};
}


class RelocationTest : public testing::Test
{
protected:
    void SetUp() override
    {
        openSslInit();

        writeTestFile(tmp_("home/Documents/letter.txt"), "Dear reader");
        writeTestFile(tmp_("home/Documents/Taxes/notes.txt"), "deductible");
        createDirectory(tmp_("target"));
    }

    RelocationConfig makeConfig() const { return makeTestConfig(tmp_("target")); }

    RelocationJob makeJob(const RelocationConfig& cfg)
    {
        const std::vector<RelocationJob> jobs = createRelocationJobs(cfg, backupManager_);
        EXPECT_EQ(jobs.size(), 1U);
        return jobs[0];
    }

    TransferReport runJob(const RelocationJob& job, const std::shared_ptr<ProgressObserver>& observer = nullptr)
    {
        RelocationOrchestrator orchestrator(job, afs_, backupManager_, [] { return true; }, observer);
        const TransferReport report = orchestrator.run();
        EXPECT_EQ(orchestrator.getStatus(), report.finalStatus);
        return report;
    }

    TransferReport runJob(const RelocationConfig& cfg) { return runJob(makeJob(cfg)); }

    //original folder is in place and unchanged
    void expectSourceIntact()
    {
        EXPECT_EQ(getItemType(tmp_("home/Documents")), ItemType::folder);
        EXPECT_EQ(readTestFile(tmp_("home/Documents/letter.txt")), "Dear reader");
        EXPECT_EQ(readTestFile(tmp_("home/Documents/Taxes/notes.txt")), "deductible");
        EXPECT_EQ(getRelPaths(afs_->getFolderContentRecursive(tmp_("home"))),
                  (std::set<Zstring>{"Documents", "Documents/letter.txt", "Documents/Taxes", "Documents/Taxes/notes.txt"}));
    }

    void expectRelocated()
    {
        EXPECT_TRUE(JunctionManager(*afs_).isJunctionTo(tmp_("home/Documents"), tmp_("target/Documents")));
        EXPECT_EQ(getItemType(tmp_("target/Documents")), ItemType::folder);
        EXPECT_EQ(readTestFile(tmp_("target/Documents/letter.txt")), "Dear reader");
        EXPECT_EQ(readTestFile(tmp_("home/Documents/Taxes/notes.txt")), "deductible"); //through the junction
    }

    TempFolder tmp_;
    const std::shared_ptr<FaultyFileSystem> afs_ = std::make_shared<FaultyFileSystem>();
    InMemoryFolderRegistry registry_{tmp_("home")};
    RegistryBackupManager backupManager_{registry_, tmp_("store/RegistryBackups.db")};
};


TEST_F(RelocationTest, RelocatePictures)
{
    for (int i = 0; i < 10; ++i)
        writeTestFile(tmp_("home/Pictures/img" + numberTo<Zstring>(i) + ".raw"), makeTestData(5 * 1024 * 1024, i));

    writeTestFile(tmp_("target/Pictures/img0.raw"), "outdated copy");

    RelocationConfig cfg = makeConfig();
    cfg.folderTypes = {FolderType::pictures};
    cfg.overwritePolicy = OverwritePolicy::files;

    const auto observer = std::make_shared<PhaseRecorder>();
    const TransferReport report = runJob(makeJob(cfg), observer);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.filesMoved, 10);
    EXPECT_EQ(report.bytesMoved, 10U * 5 * 1024 * 1024);
    EXPECT_EQ(report.filesSkipped, 0);
    EXPECT_FALSE(report.partialCleanup);
    EXPECT_EQ(getStatusTrail(report), STATUS_TRAIL_COMPLETED);
    EXPECT_EQ(getTaskResult(report), TaskResult::success);

    for (const FileRecord& rec : report.records)
    {
        EXPECT_EQ(rec.status, FileStatus::verified);
        EXPECT_TRUE(rec.checksum);
        EXPECT_EQ(rec.replacedExisting, rec.relPath == "img0.raw");
    }

    //junction + registry
    EXPECT_TRUE(JunctionManager(*afs_).isJunctionTo(tmp_("home/Pictures"), tmp_("target/Pictures")));
    EXPECT_EQ(registry_.getRawValue(FolderType::pictures), tmp_("target/Pictures"));

    //content reachable via the old path
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(readTestFile(tmp_("home/Pictures/img" + numberTo<Zstring>(i) + ".raw")), makeTestData(5 * 1024 * 1024, i));

    //originals deleted, staging folder removed
    EXPECT_EQ(getRelPaths(afs_->getFolderContentRecursive(tmp_("home"))),
              (std::set<Zstring>{"Documents", "Documents/letter.txt", "Documents/Taxes", "Documents/Taxes/notes.txt", "Pictures"}));

    //backup of the original (absent) value
    const std::vector<RegistryBackup> backups = backupManager_.list();
    ASSERT_EQ(backups.size(), 1U);
    EXPECT_EQ(backups[0].backupId, report.backupId);
    EXPECT_EQ(backups[0].jobId, report.jobId);
    EXPECT_FALSE(backups[0].restored);
    ASSERT_EQ(backups[0].values.size(), 1U);
    EXPECT_FALSE(backups[0].values[0].data);

    //final progress snapshot
    ASSERT_GT(observer->getEventCount(), 0);
    const ProgressEvent lastEvent = observer->getLastEvent();
    EXPECT_EQ(lastEvent.phase, JobStatus::completed);
    EXPECT_EQ(lastEvent.filesDone, 10);
    EXPECT_EQ(lastEvent.filesTotal, 10);
    EXPECT_EQ(lastEvent.bytesDone, 10LL * 5 * 1024 * 1024);
}


TEST_F(RelocationTest, InsufficientSpace)
{
    afs_->setFreeDiskSpace(1LL * 1024 * 1024 * 1024); //1 GiB

    RelocationConfig cfg = makeConfig();
    cfg.minFreeSpaceMargin = 5LL * 1024 * 1024 * 1024; //5 GiB

    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    ASSERT_EQ(report.errors.size(), 1U);
    EXPECT_EQ(report.errors[0].kind, ErrorKind::insufficientSpace);
    EXPECT_EQ(report.errors[0].stage, JobStatus::validating);
    EXPECT_EQ(getStatusTrail(report), (std::vector<std::string>{"Validating", "Failed"}));
    EXPECT_EQ(getTaskResult(report), TaskResult::error);

    //no side effects
    EXPECT_TRUE(report.backupId.empty());
    EXPECT_TRUE(backupManager_.list().empty());
    EXPECT_FALSE(itemExists(tmp_("target/Documents")));
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    expectSourceIntact();
}


TEST_F(RelocationTest, SourceNotExisting)
{
    registry_.setFolderPath(FolderType::documents, tmp_("home/Missing"));

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::pathNotFound, JobStatus::validating));
    EXPECT_TRUE(backupManager_.list().empty());
}


TEST_F(RelocationTest, RerunIsIdempotent)
{
    RelocationConfig cfg = makeConfig();
    cfg.overwritePolicy = OverwritePolicy::all;

    const RelocationJob job = makeJob(cfg);
    ASSERT_EQ(runJob(job).finalStatus, JobStatus::completed);
    expectRelocated();

    //registry now points to the destination: source == destination
    {
        const RelocationJob job2 = makeJob(cfg);
        EXPECT_EQ(job2.sourcePath, job2.destinationPath);

        const TransferReport report = runJob(job2);
        EXPECT_EQ(report.finalStatus, JobStatus::completed);
        EXPECT_TRUE(report.errors.empty());
        EXPECT_EQ(report.filesMoved, 0);
        EXPECT_EQ(report.filesSkipped, 2);
        EXPECT_EQ(countStatus(report, FileStatus::skipped), 2);
        EXPECT_EQ(afs_->getCopyCount(), 2); //first run only
    }

    //same job again, e.g. after a crash before the report was seen: junction already in place
    {
        const TransferReport report = runJob(job);
        EXPECT_EQ(report.finalStatus, JobStatus::completed);
        EXPECT_TRUE(report.errors.empty());
        EXPECT_EQ(report.filesMoved, 0);
        EXPECT_EQ(afs_->getCopyCount(), 2);
    }

    expectRelocated();
    EXPECT_EQ(registry_.getRawValue(FolderType::documents), tmp_("target/Documents"));
    EXPECT_EQ(getRelPaths(afs_->getFolderContentRecursive(tmp_("target"))),
              (std::set<Zstring>{"Documents", "Documents/letter.txt", "Documents/Taxes", "Documents/Taxes/notes.txt"}));
}


TEST_F(RelocationTest, JunctionFailureRollsBack)
{
    afs_->setFailSymlinkCreation(true);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::rolledBack);
    EXPECT_TRUE(hasError(report, ErrorKind::junctionCreation, JobStatus::committing));
    EXPECT_EQ(getTaskResult(report), TaskResult::error);

    const std::vector<std::string> trail = getStatusTrail(report);
    ASSERT_FALSE(trail.empty());
    EXPECT_EQ(trail.back(), "RolledBack");

    //registry restored
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    const std::vector<RegistryBackup> backups = backupManager_.list();
    ASSERT_EQ(backups.size(), 1U);
    EXPECT_TRUE(backups[0].restored);

    expectSourceIntact();

    //verified copies are kept
    EXPECT_EQ(readTestFile(tmp_("target/Documents/letter.txt")), "Dear reader");
}


TEST_F(RelocationTest, RegistryCommitFailureRollsBack)
{
    registry_.setFailWrites(true);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::rolledBack);
    EXPECT_TRUE(hasError(report, ErrorKind::registryAccess, JobStatus::committing));
    EXPECT_TRUE(logContains(report, "Restored registry backup", MSG_TYPE_INFO));

    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    expectSourceIntact(); //junction removed, original moved back
}


TEST_F(RelocationTest, BackupFailureStopsJob)
{
    writeTestFile(tmp_("store/RegistryBackups.db"), "garbage");

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::registryAccess, JobStatus::backingUpRegistry));
    EXPECT_EQ(afs_->getCopyCount(), 0);
    EXPECT_FALSE(itemExists(tmp_("target/Documents")));
    expectSourceIntact();
}


TEST_F(RelocationTest, ConflictPolicyNone)
{
    writeTestFile(tmp_("target/Documents/letter.txt"), "already there");

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::invalidPath,    JobStatus::transferring));
    EXPECT_TRUE(hasError(report, ErrorKind::partialFailure, JobStatus::verifying));

    EXPECT_EQ(readTestFile(tmp_("target/Documents/letter.txt")), "already there");
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    expectSourceIntact();

    //backup was taken, but never needed
    const std::vector<RegistryBackup> backups = backupManager_.list();
    ASSERT_EQ(backups.size(), 1U);
    EXPECT_FALSE(backups[0].restored);
}


TEST_F(RelocationTest, ConflictPolicyFiles)
{
    writeTestFile(tmp_("target/Documents/letter.txt"), "already there");
    writeTestFile(tmp_("target/Documents/unrelated.txt"), "keep me");

    RelocationConfig cfg = makeConfig();
    cfg.overwritePolicy = OverwritePolicy::files;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_EQ(report.filesMoved, 2);
    expectRelocated();
    EXPECT_EQ(readTestFile(tmp_("target/Documents/unrelated.txt")), "keep me");
}


TEST_F(RelocationTest, ConflictPolicyFilesRejectsFolderConflict)
{
    writeTestFile(tmp_("target/Documents/Taxes"), "file blocking a folder");

    RelocationConfig cfg = makeConfig();
    cfg.overwritePolicy = OverwritePolicy::files;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::invalidPath, JobStatus::transferring));
    expectSourceIntact();
}


TEST_F(RelocationTest, ConflictPolicyAll)
{
    writeTestFile(tmp_("target/Documents/letter.txt"), "already there");
    writeTestFile(tmp_("target/Documents/Taxes"), "file blocking a folder");

    RelocationConfig cfg = makeConfig();
    cfg.overwritePolicy = OverwritePolicy::all;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    expectRelocated();
    EXPECT_EQ(getItemType(tmp_("target/Documents/Taxes")), ItemType::folder);
}


TEST_F(RelocationTest, LockedFileIsRetried)
{
    afs_->setLocked("notes.txt", 1);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_EQ(report.filesMoved, 2);
    expectRelocated();
}


TEST_F(RelocationTest, LockedFileFailsJob)
{
    afs_->setLocked("notes.txt", 2);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::fileInUse, JobStatus::transferring));
    EXPECT_EQ(getTaskResult(report), TaskResult::error);
    expectSourceIntact();
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
}


TEST_F(RelocationTest, ChecksumMismatchFailsJob)
{
    afs_->setCorrupt("notes.txt", 2);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::checksumMismatch, JobStatus::transferring));
    EXPECT_FALSE(itemExists(tmp_("target/Documents/Taxes/notes.txt")));
    expectSourceIntact();
}


TEST_F(RelocationTest, ChecksumMismatchIsRetried)
{
    afs_->setCorrupt("notes.txt", 1);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    expectRelocated();
    EXPECT_EQ(readTestFile(tmp_("target/Documents/Taxes/notes.txt")), "deductible");
}


TEST_F(RelocationTest, StalledTransferFailsJob)
{
    afs_->setStalled("notes.txt", std::chrono::seconds(3));

    RelocationConfig cfg = makeConfig();
    cfg.fileOperationTimeout = std::chrono::milliseconds(300);
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::fileInUse, JobStatus::transferring));
    expectSourceIntact();
}


TEST_F(RelocationTest, ContinueOnError)
{
    for (int i = 0; i < 20; ++i)
        writeTestFile(tmp_("home/Documents/Bulk/file" + numberTo<Zstring>(i) + ".txt"), "bulk");
    afs_->setLocked("letter.txt", 100);

    RelocationConfig cfg = makeConfig();
    cfg.errorHandling = ErrorHandling::continueOnError;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_EQ(countStatus(report, FileStatus::failed),   1);
    EXPECT_EQ(countStatus(report, FileStatus::verified), 21);
    EXPECT_EQ(countStatus(report, FileStatus::pending),  0);
    EXPECT_TRUE(hasError(report, ErrorKind::fileInUse,      JobStatus::transferring));
    EXPECT_TRUE(hasError(report, ErrorKind::partialFailure, JobStatus::verifying));

    //never commit a partial transfer
    EXPECT_EQ(getItemType(tmp_("home/Documents")), ItemType::folder);
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
}


TEST_F(RelocationTest, FailFast)
{
    for (int i = 0; i < 20; ++i)
        writeTestFile(tmp_("home/Documents/Bulk/file" + numberTo<Zstring>(i) + ".txt"), "bulk");
    afs_->setLocked("letter.txt", 100);

    RelocationConfig cfg = makeConfig();
    cfg.parallelOps = 1;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_EQ(countStatus(report, FileStatus::failed), 1);
    EXPECT_EQ(std::count_if(report.errors.begin(), report.errors.end(), [](const ErrorEntry& e) { return e.kind == ErrorKind::fileInUse; }), 1);
    EXPECT_EQ(getItemType(tmp_("home/Documents")), ItemType::folder);
}


TEST_F(RelocationTest, CancelBeforeRun)
{
    RelocationOrchestrator orchestrator(makeJob(makeConfig()), afs_, backupManager_, [] { return true; });
    orchestrator.requestCancel();

    const TransferReport report = orchestrator.run();

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    ASSERT_EQ(report.errors.size(), 1U);
    EXPECT_EQ(report.errors[0].kind, ErrorKind::cancelled);
    EXPECT_EQ(report.errors[0].stage, JobStatus::validating);
    EXPECT_EQ(getTaskResult(report), TaskResult::cancelled);
    EXPECT_TRUE(report.backupId.empty());
    expectSourceIntact();
}


TEST_F(RelocationTest, CancelDuringTransfer)
{
    for (int i = 0; i < 20; ++i)
        writeTestFile(tmp_("home/Documents/Bulk/file" + numberTo<Zstring>(i) + ".txt"), "bulk");

    RelocationConfig cfg = makeConfig();
    cfg.parallelOps = 1;

    RelocationOrchestrator orchestrator(makeJob(cfg), afs_, backupManager_, [] { return true; });
    afs_->setOnCopy([&](const Zstring& /*sourcePath*/) { orchestrator.requestCancel(); });

    const TransferReport report = orchestrator.run();

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_TRUE(hasError(report, ErrorKind::cancelled, JobStatus::transferring));
    EXPECT_EQ(getTaskResult(report), TaskResult::cancelled);
    EXPECT_EQ(afs_->getCopyCount(), 1);
    EXPECT_GT(countStatus(report, FileStatus::pending), 0);

    EXPECT_EQ(getItemType(tmp_("home/Documents")), ItemType::folder);
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
}


TEST_F(RelocationTest, DryRun)
{
    writeTestFile(tmp_("target/Documents/letter.txt"), "already there");

    RelocationConfig cfg = makeConfig();
    cfg.dryRun = true;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_TRUE(report.dryRun);
    EXPECT_EQ(getStatusTrail(report), (std::vector<std::string>{"Validating", "Transferring", "Completed"}));

    //conflict is reported, nothing is changed
    EXPECT_TRUE(hasError(report, ErrorKind::invalidPath, JobStatus::transferring));
    EXPECT_EQ(getTaskResult(report), TaskResult::warning);
    EXPECT_EQ(report.filesMoved, 0);
    EXPECT_EQ(afs_->getCopyCount(), 0);
    EXPECT_TRUE(report.backupId.empty());
    EXPECT_TRUE(backupManager_.list().empty());
    EXPECT_FALSE(itemExists(tmp_("target/Documents/Taxes")));
    EXPECT_EQ(readTestFile(tmp_("target/Documents/letter.txt")), "already there");
    expectSourceIntact();
}


TEST_F(RelocationTest, KeepOriginals)
{
    createDirectory(tmp_("home/Documents_backup")); //left over by an earlier run

    RelocationConfig cfg = makeConfig();
    cfg.deleteOriginals = false;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    expectRelocated();

    EXPECT_EQ(readTestFile(tmp_("home/Documents_backup_2/letter.txt")), "Dear reader");
    EXPECT_EQ(readTestFile(tmp_("home/Documents_backup_2/Taxes/notes.txt")), "deductible");
    EXPECT_TRUE(afs_->getFolderContentRecursive(tmp_("home/Documents_backup")).empty());
}


TEST_F(RelocationTest, UnverifiedItemsAreNotDeleted)
{
    ASSERT_EQ(::mkfifo(tmp_("home/Documents/pipe").c_str(), 0600), 0);

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_EQ(report.filesMoved, 2);
    EXPECT_EQ(report.filesSkipped, 1);
    EXPECT_TRUE(report.partialCleanup);
    EXPECT_EQ(getTaskResult(report), TaskResult::warning);
    expectRelocated();

    //remaining item is kept in the staging folder
    bool pipeFound = false;
    for (const AFS::FolderEntry& entry : afs_->getFolderContentRecursive(tmp_("home")))
        if (entry.type == AFS::EntryType::other && endsWith(entry.relPath, "/pipe"))
            pipeFound = true;
    EXPECT_TRUE(pipeFound);
}


namespace
{
std::optional<Zstring> findStagedFile(const AbstractFileSystem& afs, const Zstring& homePath, const Zstring& fileName)
{
    for (const AFS::FolderEntry& entry : afs.getFolderContentRecursive(homePath))
        if (entry.type == AFS::EntryType::file && startsWith(entry.relPath, Zstr(".Documents.relocating-")) &&
            endsWith(entry.relPath, Zstr('/') + fileName))
            return appendPath(homePath, entry.relPath);
    return std::nullopt;
}
}


TEST_F(RelocationTest, OriginalEditedAfterVerificationIsKept)
{
    afs_->setOnMove([&](const Zstring& pathFrom)
    {
        if (pathFrom == tmp_("home/Documents")) //user saves the document while the job is committing
            writeTestFile(tmp_("home/Documents/letter.txt"), "Dear reader, see you soon");
    });

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_TRUE(report.partialCleanup);
    EXPECT_EQ(getTaskResult(report), TaskResult::warning);
    EXPECT_TRUE(logContains(report, "was modified after it was verified", MSG_TYPE_WARNING));
    expectRelocated();

    const std::optional<Zstring> keptPath = findStagedFile(*afs_, tmp_("home"), "letter.txt");
    ASSERT_TRUE(keptPath);
    EXPECT_EQ(readTestFile(*keptPath), "Dear reader, see you soon");
    EXPECT_FALSE(findStagedFile(*afs_, tmp_("home"), "notes.txt")); //unchanged => deleted
}


TEST_F(RelocationTest, EditWithSameSizeAndTimeIsDetectedByChecksum)
{
    afs_->setOnMove([&](const Zstring& pathFrom)
    {
        if (pathFrom == tmp_("home/Documents"))
        {
            const Zstring filePath = tmp_("home/Documents/letter.txt");
            struct stat fileInfo = {};
            ASSERT_EQ(::stat(filePath.c_str(), &fileInfo), 0);

            writeTestFile(filePath, "Dear READER");
            setFileTime(filePath, fileInfo.st_mtime, ProcSymlink::follow); //throw FileError
        }
    });

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_TRUE(report.partialCleanup);

    const std::optional<Zstring> keptPath = findStagedFile(*afs_, tmp_("home"), "letter.txt");
    ASSERT_TRUE(keptPath);
    EXPECT_EQ(readTestFile(*keptPath), "Dear READER");
    EXPECT_EQ(readTestFile(tmp_("target/Documents/letter.txt")), "Dear reader");
}


TEST_F(RelocationTest, MoveUnsupportedWithEditedOriginalRollsBack)
{
    afs_->setMoveUnsupported(tmp_("home/Documents"));
    afs_->setOnMove([&](const Zstring& pathFrom)
    {
        if (pathFrom == tmp_("home/Documents"))
            writeTestFile(tmp_("home/Documents/letter.txt"), "Dear reader, see you soon");
    });

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::rolledBack);
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    EXPECT_EQ(getItemType(tmp_("home/Documents")), ItemType::folder);
    EXPECT_EQ(readTestFile(tmp_("home/Documents/letter.txt")), "Dear reader, see you soon");
    EXPECT_EQ(readTestFile(tmp_("home/Documents/Taxes/notes.txt")), "deductible");
}

TEST_F(RelocationTest, PurgeDestinationOnFailure)
{
    writeTestFile(tmp_("target/Documents/keep.txt"), "not created by the job");
    afs_->setLocked("notes.txt", 2);

    RelocationConfig cfg = makeConfig();
    cfg.errorHandling = ErrorHandling::continueOnError;
    cfg.purgeDestinationOnFailure = true;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_EQ(getRelPaths(afs_->getFolderContentRecursive(tmp_("target"))), (std::set<Zstring>{"Documents", "Documents/keep.txt"}));
    expectSourceIntact();
}


TEST_F(RelocationTest, PurgeRemovesCreatedDestination)
{
    afs_->setLocked("notes.txt", 2);

    RelocationConfig cfg = makeConfig();
    cfg.errorHandling = ErrorHandling::continueOnError;
    cfg.purgeDestinationOnFailure = true;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_FALSE(itemExists(tmp_("target/Documents")));
}


TEST_F(RelocationTest, NoPurgeKeepsVerifiedCopies)
{
    afs_->setLocked("notes.txt", 2);

    RelocationConfig cfg = makeConfig();
    cfg.errorHandling = ErrorHandling::continueOnError;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::failed);
    EXPECT_EQ(readTestFile(tmp_("target/Documents/letter.txt")), "Dear reader");
}


TEST_F(RelocationTest, MoveUnsupportedDeletesVerifiedOriginals)
{
    afs_->setMoveUnsupported(tmp_("home/Documents"));

    const TransferReport report = runJob(makeConfig());

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_TRUE(logContains(report, "Deleting verified original files instead", MSG_TYPE_WARNING));
    EXPECT_EQ(getTaskResult(report), TaskResult::warning);
    expectRelocated();
    EXPECT_EQ(getRelPaths(afs_->getFolderContentRecursive(tmp_("home"))), (std::set<Zstring>{"Documents"}));
}


TEST_F(RelocationTest, MoveUnsupportedWithKeepOriginalsRollsBack)
{
    afs_->setMoveUnsupported(tmp_("home/Documents"));

    RelocationConfig cfg = makeConfig();
    cfg.deleteOriginals = false;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::rolledBack);
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    expectSourceIntact();
}


TEST_F(RelocationTest, JunctionOnly)
{
    RelocationConfig cfg = makeConfig();
    cfg.setAsDefaultLocation = false;
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    expectRelocated();
    EXPECT_FALSE(registry_.getRawValue(FolderType::documents));
    EXPECT_FALSE(report.backupId.empty());
}


TEST_F(RelocationTest, ConcurrentJobsForDifferentFolders)
{
    writeTestFile(tmp_("home/Music/song.flac"), makeTestData(100'000, 7));

    RelocationConfig cfg = makeConfig();
    cfg.folderTypes = {FolderType::documents, FolderType::music};
    const std::vector<RelocationJob> jobs = createRelocationJobs(cfg, backupManager_);
    ASSERT_EQ(jobs.size(), 2U);

    std::vector<std::future<TransferReport>> futures;
    for (const RelocationJob& job : jobs)
        futures.push_back(runAsync([&, job] { return RelocationOrchestrator(job, afs_, backupManager_, [] { return true; }).run(); }));

    for (std::future<TransferReport>& ft : futures)
        EXPECT_EQ(ft.get().finalStatus, JobStatus::completed);

    expectRelocated();
    EXPECT_EQ(readTestFile(tmp_("home/Music/song.flac")), makeTestData(100'000, 7));
    EXPECT_EQ(registry_.getRawValue(FolderType::music), tmp_("target/Music"));
    EXPECT_EQ(backupManager_.list().size(), 2U);
}


TEST_F(RelocationTest, SameFolderTypeIsSerialized)
{
    const RelocationJob job = makeJob(makeConfig());

    std::vector<std::future<TransferReport>> futures;
    for (int i = 0; i < 2; ++i)
        futures.push_back(runAsync([&] { return RelocationOrchestrator(job, afs_, backupManager_, [] { return true; }).run(); }));

    for (std::future<TransferReport>& ft : futures)
        EXPECT_EQ(ft.get().finalStatus, JobStatus::completed); //second run finds the folder already relocated

    expectRelocated();
    EXPECT_EQ(afs_->getCopyCount(), 2);
}


TEST_F(RelocationTest, LogFileIsWritten)
{
    RelocationConfig cfg = makeConfig();
    cfg.logFolderPath = tmp_("logs");
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    ASSERT_FALSE(report.logFilePath.empty());
    EXPECT_TRUE(report.logFileError.empty());

    const std::string logText = readTestFile(report.logFilePath);
    EXPECT_NE(logText.find(report.jobId), std::string::npos);
    EXPECT_NE(logText.find("Completed successfully"), std::string::npos);
}


TEST_F(RelocationTest, LogFileErrorDoesNotFailJob)
{
    writeTestFile(tmp_("blocker"), "not a folder");

    RelocationConfig cfg = makeConfig();
    cfg.logFolderPath = tmp_("blocker/logs");
    const TransferReport report = runJob(cfg);

    EXPECT_EQ(report.finalStatus, JobStatus::completed);
    EXPECT_TRUE(report.logFilePath.empty());
    EXPECT_FALSE(report.logFileError.empty());
}


TEST_F(RelocationTest, LogLinesCarryJobId)
{
    const TransferReport report = runJob(makeConfig());

    ASSERT_FALSE(report.log.empty());
    for (const LogEntry& entry : report.log)
        EXPECT_TRUE(startsWith(entry.message, '[' + report.jobId + ']')) << entry.message;
}

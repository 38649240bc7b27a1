// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include <zen/sys_info.h>
#include "base/config.h"
#include "base/user_dirs.h"
#include "test_tools.h"

using namespace zen;
using namespace frl;


namespace
{
RelocationConfig makeValidConfig()
{
    RelocationConfig cfg;
    cfg.targetPath  = Zstr("/mnt/storage");
    cfg.folderTypes = {FolderType::documents, FolderType::music};
    return cfg;
}
}


TEST(Config, Defaults)
{
    const RelocationConfig cfg;
    EXPECT_EQ(cfg.overwritePolicy, OverwritePolicy::none);
    EXPECT_EQ(cfg.errorHandling, ErrorHandling::failFast);
    EXPECT_EQ(cfg.minFreeSpaceMargin, 5LL * 1024 * 1024 * 1024);
    EXPECT_EQ(cfg.parallelOps, 4U);
    EXPECT_FALSE(cfg.skipChecksum);
    EXPECT_TRUE(cfg.deleteOriginals);
    EXPECT_TRUE(cfg.setAsDefaultLocation);
    EXPECT_FALSE(cfg.dryRun);
    EXPECT_FALSE(cfg.purgeDestinationOnFailure);
}


TEST(Config, ValidateAccepts)
{
    EXPECT_NO_THROW(validateConfig(makeValidConfig()));

    RelocationConfig cfg = makeValidConfig();
    cfg.parallelOps = PARALLEL_OPS_MAX;
    cfg.minFreeSpaceMargin = 0;
    cfg.logFolderPath = Zstr("/var/log/FolderRelocator");
    EXPECT_NO_THROW(validateConfig(cfg));
}


TEST(Config, ValidateRejects)
{
    auto expectInvalid = [](const std::function<void(RelocationConfig& cfg)>& modify)
    {
        RelocationConfig cfg = makeValidConfig();
        modify(cfg);
        try
        {
            validateConfig(cfg);
            ADD_FAILURE() << "InvalidPathError expected";
        }
        catch (const InvalidPathError& e)
        {
            EXPECT_EQ(e.getKind(), ErrorKind::invalidPath);
            EXPECT_FALSE(e.toString().empty());
        }
    };

    expectInvalid([](RelocationConfig& cfg) { cfg.targetPath = Zstr("  "); });
    expectInvalid([](RelocationConfig& cfg) { cfg.targetPath = Zstr("relative/path"); });
    expectInvalid([](RelocationConfig& cfg) { cfg.folderTypes.clear(); });
    expectInvalid([](RelocationConfig& cfg) { cfg.folderTypes = {FolderType::music, FolderType::videos, FolderType::music}; });
    expectInvalid([](RelocationConfig& cfg) { cfg.parallelOps = 0; });
    expectInvalid([](RelocationConfig& cfg) { cfg.parallelOps = PARALLEL_OPS_MAX + 1; });
    expectInvalid([](RelocationConfig& cfg) { cfg.minFreeSpaceMargin = -1; });
    expectInvalid([](RelocationConfig& cfg) { cfg.fileOperationTimeout = std::chrono::milliseconds(0); });
    expectInvalid([](RelocationConfig& cfg) { cfg.lockedFileRetryDelay = std::chrono::milliseconds(-1); });
    expectInvalid([](RelocationConfig& cfg) { cfg.logFolderPath = Zstr("logs"); });
}


TEST(Config, FreeSpaceMargin)
{
    EXPECT_EQ(parseFreeSpaceMargin(Zstr("0")), 0);
    EXPECT_EQ(parseFreeSpaceMargin(Zstr("2")), 2LL * 1024 * 1024 * 1024);
    EXPECT_EQ(parseFreeSpaceMargin(Zstr("8589934591")), 8589934591LL * 1024 * 1024 * 1024); //largest value fitting into int64_t

    EXPECT_THROW(parseFreeSpaceMargin(Zstr("8589934592")), FileError);
    EXPECT_THROW(parseFreeSpaceMargin(Zstr("9000000000")), FileError);
    EXPECT_THROW(parseFreeSpaceMargin(Zstr("18446744073709551617")), FileError); //wraps around in size_t
    EXPECT_THROW(parseFreeSpaceMargin(Zstr("")), FileError);
    EXPECT_THROW(parseFreeSpaceMargin(Zstr("-1")), FileError);
    EXPECT_THROW(parseFreeSpaceMargin(Zstr("1.5")), FileError);
}

TEST(Config, DestinationRoot)
{
    RelocationConfig cfg = makeValidConfig();
    cfg.targetPath = Zstr("/mnt/storage/");
    EXPECT_EQ(getDestinationRoot(cfg), "/mnt/storage");

    cfg.appendUserName = true;
    EXPECT_EQ(getDestinationRoot(cfg), "/mnt/storage/" + getLoginUser());
}


TEST(Config, CreateJobs)
{
    TempFolder tmp;
    InMemoryFolderRegistry registry(Zstr("/home/zenju"));
    registry.setFolderPath(FolderType::music, "/mnt/old/Music/");
    RegistryBackupManager backupManager(registry, tmp("store.db"));

    RelocationConfig cfg = makeValidConfig();
    cfg.overwritePolicy = OverwritePolicy::files;

    const std::vector<RelocationJob> jobs = createRelocationJobs(cfg, backupManager);
    ASSERT_EQ(jobs.size(), 2U);

    EXPECT_EQ(jobs[0].folderType,      FolderType::documents);
    EXPECT_EQ(jobs[0].sourcePath,      "/home/zenju/Documents");
    EXPECT_EQ(jobs[0].destinationRoot, "/mnt/storage");
    EXPECT_EQ(jobs[0].destinationPath, "/mnt/storage/Documents");
    EXPECT_EQ(jobs[0].status,          JobStatus::idle);
    EXPECT_EQ(jobs[0].overwritePolicy(), OverwritePolicy::files);
    EXPECT_TRUE(jobs[0].checksumEnabled());

    EXPECT_EQ(jobs[1].folderType,      FolderType::music);
    EXPECT_EQ(jobs[1].sourcePath,      "/mnt/old/Music");
    EXPECT_EQ(jobs[1].destinationPath, "/mnt/storage/Music");

    EXPECT_EQ(jobs[0].jobId.size(), 32U);
    EXPECT_NE(jobs[0].jobId, jobs[1].jobId);
    EXPECT_EQ(jobs[0].config, jobs[1].config); //shared, immutable

    //no side effects
    EXPECT_TRUE(backupManager.list().empty());
}


TEST(Config, CreateJobsInvalidConfig)
{
    TempFolder tmp;
    InMemoryFolderRegistry registry(Zstr("/home/zenju"));
    RegistryBackupManager backupManager(registry, tmp("store.db"));

    RelocationConfig cfg = makeValidConfig();
    cfg.folderTypes.clear();
    EXPECT_THROW(createRelocationJobs(cfg, backupManager), InvalidPathError);
}


TEST(Config, CreateJobsRegistryError)
{
    TempFolder tmp;
    XdgUserDirsRegistry registry(tmp("user-dirs.dirs"), Zstr("/home/zenju"));
    RegistryBackupManager backupManager(registry, tmp("store.db"));

    RelocationConfig cfg = makeValidConfig();
    cfg.folderTypes = {FolderType::appData};
    EXPECT_THROW(createRelocationJobs(cfg, backupManager), RegistryAccessError);
}

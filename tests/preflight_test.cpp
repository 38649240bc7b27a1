// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "base/preflight.h"
#include "test_tools.h"

using namespace zen;
using namespace frl;


namespace
{
bool hasReason(const PreflightResult& result, ErrorKind kind)
{
    return std::any_of(result.reasons.begin(), result.reasons.end(), [&](const ErrorEntry& entry) { return entry.kind == kind; });
}
}


class PreflightTest : public testing::Test
{
protected:
    void SetUp() override
    {
        writeTestFile(tmp_("home/Documents/a.txt"), std::string(1000, 'a'));
        writeTestFile(tmp_("home/Documents/sub/b.txt"), std::string(234, 'b'));
        createDirectory(tmp_("target"));
    }

    PreflightResult validate(const RelocationJob& job) const
    {
        return PreflightValidator(afs_, [] { return true; }).validate(job);
    }

    TempFolder tmp_;
    const std::shared_ptr<FaultyFileSystem> afs_ = std::make_shared<FaultyFileSystem>();
};


TEST_F(PreflightTest, Ok)
{
    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target"), makeTestConfig(tmp_("target")));
    const PreflightResult result = validate(job);

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.reasons.empty());
    EXPECT_EQ(result.estimatedBytes, 1234U);
    EXPECT_FALSE(result.alreadyRelocated);

    //no side effects
    EXPECT_FALSE(itemExists(tmp_("target/Documents")));
    EXPECT_TRUE(afs_->getFolderContentRecursive(tmp_("target")).empty());
    EXPECT_EQ(getRelPaths(afs_->getFolderContentRecursive(tmp_("home"))), (std::set<Zstring>{"Documents", "Documents/a.txt", "Documents/sub", "Documents/sub/b.txt"}));
}


TEST_F(PreflightTest, DestinationRootNotYetExisting)
{
    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target/zenju"), makeTestConfig(tmp_("target")));
    EXPECT_TRUE(validate(job).ok);
}


TEST_F(PreflightTest, PrivilegesMissing)
{
    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target"), makeTestConfig(tmp_("target")));
    const PreflightResult result = PreflightValidator(afs_, [] { return false; }).validate(job);

    EXPECT_FALSE(result.ok);
    ASSERT_EQ(result.reasons.size(), 1U);
    EXPECT_EQ(result.reasons[0].kind, ErrorKind::permission);
    EXPECT_EQ(result.reasons[0].stage, JobStatus::validating);
}


TEST_F(PreflightTest, SourceNotExisting)
{
    const RelocationJob job = makeTestJob(tmp_("home/Missing"), tmp_("target"), makeTestConfig(tmp_("target")));
    const PreflightResult result = validate(job);

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(hasReason(result, ErrorKind::pathNotFound));
}


TEST_F(PreflightTest, SourceIsFile)
{
    writeTestFile(tmp_("home/Videos"), "not a folder");

    const RelocationJob job = makeTestJob(tmp_("home/Videos"), tmp_("target"), makeTestConfig(tmp_("target")), FolderType::videos);
    const PreflightResult result = validate(job);

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(hasReason(result, ErrorKind::pathNotFound));
}


TEST_F(PreflightTest, NestedFolders)
{
    //destination inside source
    {
        const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("home/Documents/sub"), makeTestConfig(tmp_("home/Documents/sub")));
        const PreflightResult result = validate(job);
        EXPECT_FALSE(result.ok);
        EXPECT_TRUE(hasReason(result, ErrorKind::invalidPath));
    }
    //source inside destination
    {
        writeTestFile(tmp_("home/Documents/Documents/c.txt"), "c");

        const RelocationJob job = makeTestJob(tmp_("home/Documents/Documents"), tmp_("home"), makeTestConfig(tmp_("home")));
        const PreflightResult result = validate(job);
        EXPECT_FALSE(result.ok);
        EXPECT_TRUE(hasReason(result, ErrorKind::invalidPath));
    }
}


TEST_F(PreflightTest, NestedViaSymlink)
{
    createSymlink(tmp_("alias"), tmp_("home"));

    const RelocationJob job = makeTestJob(tmp_("alias/Documents"), tmp_("home/Documents/sub"), makeTestConfig(tmp_("home/Documents/sub")));
    const PreflightResult result = validate(job);

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(hasReason(result, ErrorKind::invalidPath));
}


TEST_F(PreflightTest, InsufficientSpace)
{
    afs_->setFreeDiskSpace(1LL * 1024 * 1024 * 1024); //1 GiB

    RelocationConfig cfg = makeTestConfig(tmp_("target"));
    cfg.minFreeSpaceMargin = DEFAULT_MIN_FREE_SPACE_MARGIN; //5 GiB

    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target"), cfg);
    const PreflightResult result = validate(job);

    EXPECT_FALSE(result.ok);
    ASSERT_EQ(result.reasons.size(), 1U);
    EXPECT_EQ(result.reasons[0].kind, ErrorKind::insufficientSpace);
    EXPECT_EQ(result.reasons[0].path, tmp_("target/Documents"));
}


TEST_F(PreflightTest, FreeSpaceIncludesData)
{
    afs_->setFreeDiskSpace(1233); //data: 1234 bytes

    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target"), makeTestConfig(tmp_("target")));
    EXPECT_TRUE(hasReason(validate(job), ErrorKind::insufficientSpace));

    afs_->setFreeDiskSpace(1234);
    EXPECT_TRUE(validate(job).ok);
}


TEST_F(PreflightTest, AlreadyRelocatedViaJunction)
{
    afs_->moveAndRenameItem(tmp_("home/Documents"), tmp_("target/Documents"), false /*replaceExisting*/);
    createSymlink(tmp_("home/Documents"), tmp_("target/Documents"));

    afs_->setFreeDiskSpace(0); //nothing to transfer
    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target"), makeTestConfig(tmp_("target")));
    const PreflightResult result = validate(job);

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.alreadyRelocated);
    EXPECT_EQ(result.estimatedBytes, 0U);
}


TEST_F(PreflightTest, AlreadyRelocatedViaRegistry)
{
    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("home"), makeTestConfig(tmp_("home")));
    ASSERT_EQ(job.sourcePath, job.destinationPath);

    const PreflightResult result = validate(job);
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.alreadyRelocated);
}


TEST_F(PreflightTest, HangingSourceCheckTimesOut)
{
    auto slowAfs = std::make_shared<FaultyFileSystem>();
    slowAfs->setResolveDelay(std::chrono::milliseconds(500));

    RelocationConfig cfg = makeTestConfig(tmp_("target"));
    cfg.fileOperationTimeout = std::chrono::milliseconds(100);
    const RelocationJob job = makeTestJob(tmp_("home/Documents"), tmp_("target"), cfg);

    const auto startTime = std::chrono::steady_clock::now();
    const PreflightResult result = PreflightValidator(slowAfs, [] { return true; }).validate(job);
    EXPECT_LT(std::chrono::steady_clock::now() - startTime, std::chrono::milliseconds(500));

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(hasReason(result, ErrorKind::pathNotFound));

    //the abandoned check still owns the file system
    const std::weak_ptr<FaultyFileSystem> afsWeak = slowAfs;
    slowAfs.reset();
    EXPECT_FALSE(afsWeak.expired());

    //... and releases it once the delayed call returns
    for (const auto endTime = std::chrono::steady_clock::now() + std::chrono::seconds(5);
         !afsWeak.expired() && std::chrono::steady_clock::now() < endTime;)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(afsWeak.expired());
}


TEST(ProtectedPaths, SystemFolders)
{
    EXPECT_TRUE(isProtectedSystemPath("/"));
    EXPECT_TRUE(isProtectedSystemPath("/usr"));
    EXPECT_TRUE(isProtectedSystemPath("/usr/share/Documents"));
    EXPECT_TRUE(isProtectedSystemPath("/etc/"));
    EXPECT_TRUE(isProtectedSystemPath("/lib64/Documents"));
    EXPECT_TRUE(isProtectedSystemPath("//proc/self"));

    EXPECT_FALSE(isProtectedSystemPath("/home/zenju/Documents"));
    EXPECT_FALSE(isProtectedSystemPath("/mnt/storage/Documents"));
    EXPECT_FALSE(isProtectedSystemPath("/usrdata/Documents"));
    EXPECT_FALSE(isProtectedSystemPath("/media/library"));
}


TEST(ProtectedPaths, LibraryFolders)
{
    EXPECT_TRUE(isProtectedSystemPath("/lib"));
    EXPECT_TRUE(isProtectedSystemPath("/lib32/Documents"));
    EXPECT_TRUE(isProtectedSystemPath("/lib64"));
    EXPECT_TRUE(isProtectedSystemPath("/libx32/Music"));

    EXPECT_FALSE(isProtectedSystemPath("/library"));
    EXPECT_FALSE(isProtectedSystemPath("/library/Documents"));
    EXPECT_FALSE(isProtectedSystemPath("/libraries/Music"));
    EXPECT_FALSE(isProtectedSystemPath("/lib64data/Pictures"));
}

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/progress.h"

using namespace zen;
using namespace frl;


namespace
{
class RecordingObserver : public ProgressObserver
{
public:
    void onProgress(const ProgressEvent& event) override
    {
        std::lock_guard dummy(lock_);
        events_.push_back(event);
    }

    std::vector<ProgressEvent> getEvents() const
    {
        std::lock_guard dummy(lock_);
        return events_;
    }

private:
    mutable std::mutex lock_;
    std::vector<ProgressEvent> events_;
};


class HangingObserver : public ProgressObserver
{
public:
    void onProgress(const ProgressEvent& /*event*/) override
    {
        ++callCount_;
        std::this_thread::sleep_for(std::chrono::seconds(3));
    }

    std::atomic<int> callCount_{0};
};
}


TEST(ProgressChannel, FinalSnapshotIsDelivered)
{
    const auto observer = std::make_shared<RecordingObserver>();
    {
        ProgressChannel progress(observer);
        progress.setPhase(JobStatus::transferring);
        progress.updateDataTotal(10, 1000);
        for (int i = 0; i < 10; ++i)
        {
            progress.setCurrentItem(Zstr("file") + numberTo<Zstring>(i));
            progress.updateDataProcessed(1, 100);
        }
        progress.setPhase(JobStatus::completed);
    }

    const std::vector<ProgressEvent> events = observer->getEvents();
    ASSERT_FALSE(events.empty());

    const ProgressEvent& last = events.back();
    EXPECT_EQ(last.phase, JobStatus::completed);
    EXPECT_EQ(last.filesDone,  10);
    EXPECT_EQ(last.filesTotal, 10);
    EXPECT_EQ(last.bytesDone,  1000);
    EXPECT_EQ(last.bytesTotal, 1000);
    EXPECT_EQ(last.currentFile, "file9");

    //coalesced: far fewer deliveries than updates
    EXPECT_LT(events.size(), 10U);
}


TEST(ProgressChannel, ErrorsAccumulate)
{
    const auto observer = std::make_shared<RecordingObserver>();
    {
        ProgressChannel progress(observer);
        progress.reportError({.kind = ErrorKind::fileInUse, .stage = JobStatus::transferring, .path = Zstr("/a"), .message = L"locked"});
        progress.reportError({.kind = ErrorKind::checksumMismatch, .stage = JobStatus::transferring, .path = Zstr("/b"), .message = L"corrupt"});

        const ProgressEvent snapshot = progress.getSnapshot();
        ASSERT_EQ(snapshot.errors.size(), 2U);
        EXPECT_EQ(snapshot.errors[0].kind, ErrorKind::fileInUse);
        EXPECT_EQ(snapshot.errors[1].kind, ErrorKind::checksumMismatch);
    }
    ASSERT_FALSE(observer->getEvents().empty());
    EXPECT_EQ(observer->getEvents().back().errors.size(), 2U);
}


TEST(ProgressChannel, ErrorIsDeliveredPromptly)
{
    const auto observer = std::make_shared<RecordingObserver>();
    ProgressChannel progress(observer);

    progress.reportError({.kind = ErrorKind::permission, .message = L"access denied"});

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (observer->getEvents().empty() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    ASSERT_FALSE(observer->getEvents().empty());
    EXPECT_EQ(observer->getEvents()[0].errors.size(), 1U);
}


TEST(ProgressChannel, HangingObserverDoesNotBlockPublisher)
{
    const auto observer = std::make_shared<HangingObserver>();

    const auto startTime = std::chrono::steady_clock::now();
    {
        ProgressChannel progress(observer);
        progress.setPhase(JobStatus::transferring); //dispatcher is now stuck in onProgress()

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        for (int i = 0; i < 1000; ++i)
            progress.updateDataProcessed(1, 1);

        EXPECT_EQ(progress.getSnapshot().filesDone, 1000);

        progress.close(std::chrono::milliseconds(100));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - startTime, std::chrono::seconds(2));
    EXPECT_GE(observer->callCount_, 1);
}


TEST(ProgressChannel, NoObserver)
{
    ProgressChannel progress(nullptr);
    progress.updateDataTotal(3, 30);
    progress.updateDataProcessed(1, 10);
    progress.close();

    EXPECT_EQ(progress.getSnapshot().filesDone, 1);
    EXPECT_EQ(progress.getSnapshot().bytesTotal, 30);
}

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef PROGRESS_H_8023475092384750923
#define PROGRESS_H_8023475092384750923

#include <zen/thread.h>
#include "structures.h"


namespace frl
{
constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100); //deliver progress not more often than necessary

struct ProgressEvent
{
    JobStatus phase = JobStatus::idle;
    Zstring currentFile; //relative path
    int filesDone  = 0;
    int filesTotal = 0;
    int64_t bytesDone  = 0;
    int64_t bytesTotal = 0;
    std::vector<ErrorEntry> errors;
};


struct ProgressObserver
{
    virtual ~ProgressObserver() {}

    //context of the dispatcher thread: may block, but no further events are delivered until it returns
    virtual void onProgress(const ProgressEvent& event) = 0;
};


/*  actor pattern: workers publish, a dispatcher thread delivers
    - publishing is non-blocking (short mutex only): the engine never waits for the observer
    - the newest snapshot is delivered every UI_UPDATE_INTERVAL or when signalled; intermediate states are coalesced
    - close(): final snapshot is delivered within a grace period, then the dispatcher is detached if the observer hangs */
class ProgressChannel
{
public:
    explicit ProgressChannel(const std::shared_ptr<ProgressObserver>& observer); //nullptr: discard everything
    ~ProgressChannel() { close(); }

    //context of any thread, non-blocking:
    void setPhase(JobStatus phase);
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta);
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta);
    void setCurrentItem(const Zstring& relPath);
    void reportError(const ErrorEntry& entry); //delivered ASAP

    ProgressEvent getSnapshot() const;

    //context of owning thread:
    void close(std::chrono::milliseconds gracePeriod = std::chrono::seconds(1));

private:
    ProgressChannel           (const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    struct SharedState
    {
        mutable std::mutex lock;
        std::condition_variable conditionNewData;
        std::condition_variable conditionFinalDelivered;
        ProgressEvent latest;
        bool dirty = false;
        bool urgent = false;
        bool closing = false;
        bool finalDelivered = false;
    };

    template <class Function>
    void publish(Function fun, bool urgent);

    const std::shared_ptr<SharedState> state_ = std::make_shared<SharedState>(); //shared with (possibly detached) dispatcher thread
    zen::InterruptibleThread dispatcher_;
};
}

#endif //PROGRESS_H_8023475092384750923

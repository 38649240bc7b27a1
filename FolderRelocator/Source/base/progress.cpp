// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "progress.h"

using namespace zen;
using namespace frl;


ProgressChannel::ProgressChannel(const std::shared_ptr<ProgressObserver>& observer)
{
    if (!observer)
        return;

    //don't capture "this"! consider detach()
    dispatcher_ = InterruptibleThread([state = state_, observer]
    {
        setCurrentThreadName(Zstr("Progress dispatcher"));

        std::unique_lock dummy(state->lock);
        for (;;)
        {
            state->conditionNewData.wait_for(dummy, UI_UPDATE_INTERVAL, [&] { return state->urgent || state->closing; });

            if (state->dirty)
            {
                const ProgressEvent snapshot = state->latest;
                state->dirty  = false;
                state->urgent = false;

                dummy.unlock();
                observer->onProgress(snapshot); //may take arbitrarily long; publishers are not affected
                dummy.lock();
            }

            if (state->closing && !state->dirty)
            {
                state->finalDelivered = true;
                state->conditionFinalDelivered.notify_all();
                return;
            }
        }
    });
}


template <class Function> inline
void ProgressChannel::publish(Function fun, bool urgent)
{
    {
        std::lock_guard dummy(state_->lock);
        fun(state_->latest);
        state_->dirty = true;
        if (urgent)
            state_->urgent = true;
    }
    if (urgent)
        state_->conditionNewData.notify_all();
}


void ProgressChannel::setPhase(JobStatus phase)
{
    publish([&](ProgressEvent& ev) { ev.phase = phase; }, true /*urgent*/);
}


void ProgressChannel::updateDataTotal(int itemsDelta, int64_t bytesDelta)
{
    publish([&](ProgressEvent& ev)
    {
        ev.filesTotal += itemsDelta;
        ev.bytesTotal += bytesDelta;
    }, false /*urgent*/);
}


void ProgressChannel::updateDataProcessed(int itemsDelta, int64_t bytesDelta)
{
    publish([&](ProgressEvent& ev)
    {
        ev.filesDone += itemsDelta;
        ev.bytesDone += bytesDelta;
    }, false /*urgent*/);
}


void ProgressChannel::setCurrentItem(const Zstring& relPath)
{
    publish([&](ProgressEvent& ev) { ev.currentFile = relPath; }, false /*urgent*/);
}


void ProgressChannel::reportError(const ErrorEntry& entry)
{
    publish([&](ProgressEvent& ev) { ev.errors.push_back(entry); }, true /*urgent*/);
}


ProgressEvent ProgressChannel::getSnapshot() const
{
    std::lock_guard dummy(state_->lock);
    return state_->latest;
}


void ProgressChannel::close(std::chrono::milliseconds gracePeriod)
{
    if (!dispatcher_.joinable())
        return;

    bool delivered = false;
    {
        std::unique_lock dummy(state_->lock);
        state_->closing = true;
        state_->dirty   = true; //always deliver the final state
        state_->conditionNewData.notify_all();

        delivered = state_->conditionFinalDelivered.wait_for(dummy, gracePeriod, [&] { return state_->finalDelivered; });
    }

    if (delivered)
        dispatcher_.join();
    else //observer hangs: don't block the engine
        dispatcher_.detach();
}

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef FOLDER_LOCK_H_81740832174954356
#define FOLDER_LOCK_H_81740832174954356

#include <functional>
#include <map>
#include <mutex>
#include <zen/thread.h>
#include "structures.h"


namespace frl
{
/* RAII structure to serialize work on a folder type within this process:
    - at most one active relocation job per folder type; jobs for the same type queue up
    - recursive locking supported: the owning job may call into RegistryBackupManager, which locks again
    - distinct folder types do not block each other                                                 */
class FolderTypeLock
{
public:
    //onWaiting: called once, if the lock is currently held by someone else
    explicit FolderTypeLock(FolderType type, const std::function<void()>& onWaiting = nullptr) : lock_(getTypeMutex(type), std::defer_lock)
    {
        if (!lock_.try_lock())
        {
            if (onWaiting)
                onWaiting();
            lock_.lock();
        }
    }

private:
    FolderTypeLock           (const FolderTypeLock&) = delete;
    FolderTypeLock& operator=(const FolderTypeLock&) = delete;

    static std::recursive_mutex& getTypeMutex(FolderType type)
    {
        static zen::Protected<std::map<FolderType, std::recursive_mutex>> typeMutexes; //thread-safe init
        //std::map: node-based => references stay valid
        return *typeMutexes.access([&](std::map<FolderType, std::recursive_mutex>& mutexes) { return &mutexes[type]; });
    }

    std::unique_lock<std::recursive_mutex> lock_;
};
}

#endif //FOLDER_LOCK_H_81740832174954356

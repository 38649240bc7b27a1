// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "config.h"
#include <algorithm>
#include <limits>
#include <set>
#include <zen/file_path.h>
#include <zen/guid.h>
#include <zen/sys_info.h>

using namespace zen;
using namespace frl;


int64_t frl::parseFreeSpaceMargin(const Zstring& marginGiB) //throw FileError
{
    constexpr int64_t bytesPerGiB = 1024 * 1024 * 1024;
    constexpr int64_t marginMaxGiB = std::numeric_limits<int64_t>::max() / bytesPerGiB;

    auto throwInvalid = [&]
    {
        throw FileError(replaceCpy(_("Invalid free space margin %x."), L"%x", fmtPath(marginGiB)),
                        replaceCpy(_("Expected a number of GiB between 0 and %x."), L"%x", numberTo<std::wstring>(marginMaxGiB)));
    };

    //more digits than marginMaxGiB would overflow stringTo()
    if (marginGiB.empty() || marginGiB.size() > numberTo<Zstring>(marginMaxGiB).size() ||
        !std::all_of(marginGiB.begin(), marginGiB.end(), [](Zchar c) { return isDigit(c); }))
        throwInvalid();

    const int64_t margin = stringTo<int64_t>(marginGiB);
    if (margin > marginMaxGiB)
        throwInvalid();

    return margin * bytesPerGiB;
}


void frl::validateConfig(const RelocationConfig& cfg) //throw InvalidPathError
{
    const std::wstring errorMsg = _("Invalid relocation settings.");

    if (trimCpy(cfg.targetPath).empty())
        throw InvalidPathError(errorMsg, _("No target folder was specified."));

    if (!startsWith(cfg.targetPath, FILE_NAME_SEPARATOR))
        throw InvalidPathError(errorMsg, replaceCpy(_("The target folder %x is not an absolute path."), L"%x", fmtPath(cfg.targetPath)), cfg.targetPath);

    if (cfg.folderTypes.empty())
        throw InvalidPathError(errorMsg, _("No folders were selected for relocation."));

    std::set<FolderType> typesSeen;
    for (const FolderType type : cfg.folderTypes)
        if (!typesSeen.insert(type).second)
            throw InvalidPathError(errorMsg, replaceCpy(_("The folder %x is listed more than once."), L"%x", utfTo<std::wstring>(getFolderName(type))));

    if (cfg.parallelOps < 1 || cfg.parallelOps > PARALLEL_OPS_MAX)
        throw InvalidPathError(errorMsg, replaceCpy(replaceCpy(_("The number of parallel file operations must be between 1 and %x, but is %y."),
                                                               L"%x", numberTo<std::wstring>(PARALLEL_OPS_MAX)),
                                                    L"%y", numberTo<std::wstring>(cfg.parallelOps)));
    if (cfg.minFreeSpaceMargin < 0)
        throw InvalidPathError(errorMsg, _("The free space margin must not be negative."));

    if (cfg.lockedFileRetryDelay.count() < 0 ||
        cfg.fileOperationTimeout.count() <= 0)
        throw InvalidPathError(errorMsg, _("Invalid timeout value."));

    if (!cfg.logFolderPath.empty() && !startsWith(cfg.logFolderPath, FILE_NAME_SEPARATOR))
        throw InvalidPathError(errorMsg, replaceCpy(_("The log folder %x is not an absolute path."), L"%x", fmtPath(cfg.logFolderPath)), cfg.logFolderPath);
}


Zstring frl::getDestinationRoot(const RelocationConfig& cfg) //throw FileError
{
    const Zstring targetPath = normalizePath(cfg.targetPath);

    if (cfg.appendUserName)
        return appendPath(targetPath, getLoginUser()); //throw FileError
    return targetPath;
}


std::vector<RelocationJob> frl::createRelocationJobs(const RelocationConfig& cfg, const RegistryBackupManager& backupManager) //throw FileError, InvalidPathError, RegistryAccessError
{
    validateConfig(cfg); //throw InvalidPathError

    const auto sharedCfg = std::make_shared<const RelocationConfig>(cfg);
    const Zstring destinationRoot = getDestinationRoot(cfg); //throw FileError

    std::vector<RelocationJob> jobs;
    for (const FolderType type : cfg.folderTypes)
    {
        RelocationJob job;
        job.jobId           = generateGuidHex();
        job.folderType      = type;
        job.sourcePath      = normalizePath(backupManager.getCurrentLocation(type)); //throw RegistryAccessError
        job.destinationRoot = destinationRoot;
        job.destinationPath = appendPath(destinationRoot, getFolderName(type));
        job.config          = sharedCfg;
        jobs.push_back(std::move(job));
    }
    return jobs;
}

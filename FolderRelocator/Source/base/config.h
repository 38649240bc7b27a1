// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef CONFIG_H_928374509234875029
#define CONFIG_H_928374509234875029

#include "registry_backup.h"


namespace frl
{
void validateConfig(const RelocationConfig& cfg); //throw InvalidPathError

//command line value in GiB => bytes; rejects values that do not fit into int64_t
int64_t parseFreeSpaceMargin(const Zstring& marginGiB); //throw FileError

//"<target>" or "<target>/<login user>"
Zstring getDestinationRoot(const RelocationConfig& cfg); //throw FileError

//one job per folder type, sharing the (validated) config; sources are resolved via the registry
std::vector<RelocationJob> createRelocationJobs(const RelocationConfig& cfg, const RegistryBackupManager& backupManager); //throw FileError, InvalidPathError, RegistryAccessError
}

#endif //CONFIG_H_928374509234875029

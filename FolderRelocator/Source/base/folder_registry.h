// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef FOLDER_REGISTRY_H_2384750928374502983
#define FOLDER_REGISTRY_H_2384750928374502983

#include "relocation_error.h"


namespace frl
{
struct RegistryValue
{
    Zstring name;                //e.g. "XDG_DOCUMENTS_DIR"
    std::optional<Zstring> data; //verbatim, as stored; none: value is absent

    bool operator==(const RegistryValue&) const = default;
};


//OS database telling where a user folder lives
//THREAD-SAFETY: implementations must be internally synchronized
struct FolderRegistry
{
    virtual ~FolderRegistry() {}

    //raw values, verbatim (including absent ones)
    virtual std::vector<RegistryValue> readValues(FolderType type) const = 0; //throw RegistryAccessError

    //write back raw values: absent values are removed
    virtual void writeValues(FolderType type, const std::vector<RegistryValue>& values) = 0; //throw RegistryAccessError

    //resolved folder path; the platform default if no value is set
    virtual Zstring getFolderPath(FolderType type) const = 0; //throw RegistryAccessError

    virtual void setFolderPath(FolderType type, const Zstring& folderPath) = 0; //throw RegistryAccessError
};
}

#endif //FOLDER_REGISTRY_H_2384750928374502983

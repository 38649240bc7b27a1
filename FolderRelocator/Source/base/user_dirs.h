// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#ifndef USER_DIRS_H_09812374098723450987
#define USER_DIRS_H_09812374098723450987

#include <mutex>
#include "folder_registry.h"


namespace frl
{
/*  XDG user directories database: $XDG_CONFIG_HOME/user-dirs.dirs

        XDG_DOCUMENTS_DIR="$HOME/Documents"
        XDG_MUSIC_DIR="/mnt/data/Music"

    - values are shell-quoted: "$HOME/" prefix or absolute path; \" \\ \$ \` escapes
    - all other lines (comments, unknown keys) are preserved verbatim
    - updates are transactional (temp file + rename)                             */
class XdgUserDirsRegistry : public FolderRegistry
{
public:
    XdgUserDirsRegistry(const Zstring& userDirsFilePath, const Zstring& homePath) :
        userDirsFilePath_(userDirsFilePath), homePath_(homePath) {}

    std::vector<RegistryValue> readValues(FolderType type) const override; //throw RegistryAccessError
    void writeValues(FolderType type, const std::vector<RegistryValue>& values) override; //throw RegistryAccessError

    Zstring getFolderPath(FolderType type) const override; //throw RegistryAccessError
    void setFolderPath(FolderType type, const Zstring& folderPath) override; //throw RegistryAccessError

    const Zstring& getFilePath() const { return userDirsFilePath_; }

    //"$HOME/Music" <-> "/home/zenju/Music"
    static Zstring decodeValue(const Zstring& rawValue, const Zstring& homePath);
    static Zstring encodeValue(const Zstring& folderPath, const Zstring& homePath);

private:
    std::vector<std::string> loadLines() const; //throw RegistryAccessError
    void saveLines(const std::vector<std::string>& lines); //throw RegistryAccessError

    Zstring getKey(FolderType type) const; //throw RegistryAccessError

    const Zstring userDirsFilePath_;
    const Zstring homePath_;
    mutable std::mutex lockFile_; //serialize read-modify-write
};

Zstring getDefaultUserDirsFilePath(); //throw FileError
}

#endif //USER_DIRS_H_09812374098723450987

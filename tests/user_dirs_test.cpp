// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "base/user_dirs.h"
#include "test_tools.h"

using namespace zen;
using namespace frl;


namespace
{
const char USER_DIRS_SAMPLE[] =
    "# This file is written by xdg-user-dirs-update\n"
    "# If you want to change or add directories, just edit the line you're\n"
    "# interested in. All local changes will be retained on the next run.\n"
    "XDG_DESKTOP_DIR=\"$HOME/Desktop\"\n"
    "XDG_DOCUMENTS_DIR=\"$HOME/Documents\"\n"
    "XDG_MUSIC_DIR=\"/mnt/data/Music\"\n"
    "\n"
    "XDG_PICTURES_DIR=\"$HOME/My \\\"Pictures\\\"\"\n";
}


class UserDirsTest : public testing::Test
{
protected:
    void SetUp() override { writeTestFile(dbPath_, USER_DIRS_SAMPLE); }

    TempFolder tmp_;
    const Zstring homePath_ = Zstr("/home/zenju");
    const Zstring dbPath_ = tmp_("config/user-dirs.dirs");
    XdgUserDirsRegistry registry_{dbPath_, homePath_};
};


TEST_F(UserDirsTest, ReadFolderPaths)
{
    EXPECT_EQ(registry_.getFolderPath(FolderType::documents), "/home/zenju/Documents");
    EXPECT_EQ(registry_.getFolderPath(FolderType::music),     "/mnt/data/Music");
    EXPECT_EQ(registry_.getFolderPath(FolderType::pictures),  "/home/zenju/My \"Pictures\"");

    //not listed: xdg-user-dirs default
    EXPECT_EQ(registry_.getFolderPath(FolderType::videos), "/home/zenju/Videos");
}


TEST_F(UserDirsTest, ReadRawValues)
{
    const std::vector<RegistryValue> values = registry_.readValues(FolderType::documents);
    ASSERT_EQ(values.size(), 1U);
    EXPECT_EQ(values[0].name, "XDG_DOCUMENTS_DIR");
    EXPECT_EQ(values[0].data, Zstring("$HOME/Documents"));

    const std::vector<RegistryValue> absent = registry_.readValues(FolderType::videos);
    ASSERT_EQ(absent.size(), 1U);
    EXPECT_FALSE(absent[0].data);
}


TEST_F(UserDirsTest, SetFolderPathPreservesOtherLines)
{
    registry_.setFolderPath(FolderType::documents, "/mnt/storage/zenju/Documents");

    EXPECT_EQ(registry_.getFolderPath(FolderType::documents), "/mnt/storage/zenju/Documents");

    const std::string content = readTestFile(dbPath_);
    EXPECT_NE(content.find("# This file is written by xdg-user-dirs-update\n"), std::string::npos);
    EXPECT_NE(content.find("XDG_DOCUMENTS_DIR=\"/mnt/storage/zenju/Documents\"\n"), std::string::npos);
    EXPECT_NE(content.find("XDG_MUSIC_DIR=\"/mnt/data/Music\"\n"), std::string::npos);
    EXPECT_EQ(content.find("$HOME/Documents"), std::string::npos);

    //value is replaced in place
    EXPECT_LT(content.find("XDG_DESKTOP_DIR"), content.find("XDG_DOCUMENTS_DIR"));
    EXPECT_LT(content.find("XDG_DOCUMENTS_DIR"), content.find("XDG_MUSIC_DIR"));
}


TEST_F(UserDirsTest, SetFolderPathBelowHome)
{
    registry_.setFolderPath(FolderType::videos, "/home/zenju/Media/Videos");

    EXPECT_NE(readTestFile(dbPath_).find("XDG_VIDEOS_DIR=\"$HOME/Media/Videos\"\n"), std::string::npos);
    EXPECT_EQ(registry_.getFolderPath(FolderType::videos), "/home/zenju/Media/Videos");
}


TEST_F(UserDirsTest, WriteValuesVerbatim)
{
    const std::vector<RegistryValue> before = registry_.readValues(FolderType::pictures);

    registry_.setFolderPath(FolderType::pictures, "/mnt/storage/Pictures");
    registry_.writeValues(FolderType::pictures, before);

    EXPECT_EQ(registry_.readValues(FolderType::pictures), before);
    EXPECT_EQ(registry_.getFolderPath(FolderType::pictures), "/home/zenju/My \"Pictures\"");
}


TEST_F(UserDirsTest, WriteAbsentValueRemovesLine)
{
    const std::vector<RegistryValue> before = registry_.readValues(FolderType::videos); //absent

    registry_.setFolderPath(FolderType::videos, "/mnt/storage/Videos");
    registry_.writeValues(FolderType::videos, before);

    EXPECT_EQ(readTestFile(dbPath_).find("XDG_VIDEOS_DIR"), std::string::npos);
}


TEST_F(UserDirsTest, WriteForeignValueName)
{
    EXPECT_THROW(registry_.writeValues(FolderType::music, {RegistryValue{.name = Zstr("XDG_VIDEOS_DIR"), .data = Zstring(Zstr("/tmp"))}}), RegistryAccessError);
}


TEST_F(UserDirsTest, MissingDatabase)
{
    XdgUserDirsRegistry registry(tmp_("not existing/user-dirs.dirs"), homePath_);

    EXPECT_EQ(registry.getFolderPath(FolderType::downloads), "/home/zenju/Downloads");

    registry.setFolderPath(FolderType::downloads, "/mnt/storage/Downloads");
    EXPECT_EQ(readTestFile(tmp_("not existing/user-dirs.dirs")), "XDG_DOWNLOAD_DIR=\"/mnt/storage/Downloads\"\n");
}


TEST_F(UserDirsTest, SetFolderPathKeepsOwnerAndMode)
{
    ASSERT_EQ(::chmod(dbPath_.c_str(), 0640), 0);
    const struct stat infoOld = getItemStat(dbPath_, ProcSymlink::follow);

    registry_.setFolderPath(FolderType::documents, "/mnt/storage/Documents");

    const struct stat infoNew = getItemStat(dbPath_, ProcSymlink::follow);
    EXPECT_NE(infoNew.st_ino, infoOld.st_ino); //replaced, not rewritten in place
    EXPECT_EQ(infoNew.st_mode & 07777, 0640U);
    EXPECT_EQ(infoNew.st_uid, infoOld.st_uid);
    EXPECT_EQ(infoNew.st_gid, infoOld.st_gid);
}


TEST_F(UserDirsTest, NewDatabaseTakesOwnerOfParent)
{
    XdgUserDirsRegistry registry(tmp_("profile/.config/user-dirs.dirs"), homePath_);
    registry.setFolderPath(FolderType::downloads, "/mnt/storage/Downloads");

    const struct stat infoParent = getItemStat(tmp_.path(), ProcSymlink::follow);
    for (const char* relPath : {"profile", "profile/.config", "profile/.config/user-dirs.dirs"})
    {
        const struct stat info = getItemStat(tmp_(relPath), ProcSymlink::follow);
        EXPECT_EQ(info.st_uid, infoParent.st_uid) << relPath;
        EXPECT_EQ(info.st_gid, infoParent.st_gid) << relPath;
    }
}


TEST_F(UserDirsTest, AppDataHasNoEntry)
{
    try
    {
        registry_.getFolderPath(FolderType::appData);
        ADD_FAILURE() << "RegistryAccessError expected";
    }
    catch (const RegistryAccessError& e)
    {
        EXPECT_EQ(e.getKind(), ErrorKind::registryAccess);
    }
    EXPECT_THROW(registry_.setFolderPath(FolderType::appData, "/mnt/storage/AppData"), RegistryAccessError);
}


TEST(UserDirs, DecodeValue)
{
    const Zstring home = Zstr("/home/zenju");

    EXPECT_EQ(XdgUserDirsRegistry::decodeValue("$HOME/Music",   home), "/home/zenju/Music");
    EXPECT_EQ(XdgUserDirsRegistry::decodeValue("${HOME}/Music", home), "/home/zenju/Music");
    EXPECT_EQ(XdgUserDirsRegistry::decodeValue("$HOME",         home), "/home/zenju");
    EXPECT_EQ(XdgUserDirsRegistry::decodeValue("$HOME/",        home), "/home/zenju");
    EXPECT_EQ(XdgUserDirsRegistry::decodeValue("/mnt/data/",    home), "/mnt/data");
    EXPECT_EQ(XdgUserDirsRegistry::decodeValue("/mnt/\\$cash",  home), "/mnt/$cash");
}


TEST(UserDirs, EncodeValue)
{
    const Zstring home = Zstr("/home/zenju");

    EXPECT_EQ(XdgUserDirsRegistry::encodeValue("/home/zenju/Music",  home), "$HOME/Music");
    EXPECT_EQ(XdgUserDirsRegistry::encodeValue("/home/zenju",        home), "$HOME/");
    EXPECT_EQ(XdgUserDirsRegistry::encodeValue("/home/zenjux/Music", home), "/home/zenjux/Music");
    EXPECT_EQ(XdgUserDirsRegistry::encodeValue("/mnt/a \"b\" $c",    home), "/mnt/a \\\"b\\\" \\$c");

    for (const Zstring path : {Zstring(Zstr("/home/zenju/My \"Pictures\"")), Zstring(Zstr("/mnt/`cmd`/x"))})
        EXPECT_EQ(XdgUserDirsRegistry::decodeValue(XdgUserDirsRegistry::encodeValue(path, home), home), path);
}


TEST(UserDirs, DefaultDatabasePath)
{
    EXPECT_TRUE(endsWith(getDefaultUserDirsFilePath(), "/user-dirs.dirs"));
}

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_info.h"
#include <vector>
#include "file_path.h"

    #include <unistd.h> //getuid()
    #include <pwd.h>    //getpwuid_r()

using namespace zen;


namespace
{
//ugh, the world's stupidest API:
template <class Function>
passwd getPasswordEntry(Function getpw /*int(passwd*, char*, size_t, passwd**)*/, std::vector<char>& buf, const std::string& functionName) //throw FileError
{
    buf.resize(std::max<long>(10000, ::sysconf(_SC_GETPW_R_SIZE_MAX))); //::sysconf may return long(-1) or even a too small size!! WTF!
    passwd buf2 = {};
    passwd* pwEntry = nullptr;
    if (const int rv = getpw(&buf2, buf.data(), buf.size(), &pwEntry);
        rv != 0 || !pwEntry)
    {
        //"If an error occurs, errno is set appropriately" => why, then, also return errno as return value!?
        errno = rv != 0 ? rv : ENOENT;
        THROW_LAST_FILE_ERROR(_("Cannot get process information."), functionName);
    }
    return *pwEntry; //string members point into "buf"
}
}


Zstring zen::getLoginUser() //throw FileError
{
    auto tryGetNonRootUser = [](const char* varName) -> std::optional<Zstring>
    {
        if (const std::optional<Zstring> username = getEnvironmentVar(varName))
            if (!username->empty() && *username != "root")
                return *username;
        return {};
    };

    if (const uid_t userIdNo = ::getuid(); //never fails
        userIdNo != 0) //nofail; non-root
    {
        std::vector<char> buf;
        const passwd pwEntry = getPasswordEntry([userIdNo](passwd* pwd, char* b, size_t len, passwd** result)
        { return ::getpwuid_r(userIdNo, pwd, b, len, result); }, buf, "getpwuid_r(" + numberTo<std::string>(userIdNo) + ')'); //throw FileError
        return pwEntry.pw_name;
    }
    //else: root(0) => consider as request for elevation, NOT impersonation!

    //getlogin() is smarter than simply evaluating $LOGNAME! even in contexts without
    //$LOGNAME, e.g. "sudo su" on Ubuntu, it returns the correct non-root user!
    if (const char* loginUser = ::getlogin()) //https://linux.die.net/man/3/getlogin
        if (loginUser[0] != 0 && Zstring(loginUser) != "root")
            return loginUser;
    //BUT: getlogin() can fail with ENOENT on Linux Mint: https://freefilesync.org/forum/viewtopic.php?t=8181

    if (const std::optional<Zstring> username = tryGetNonRootUser("SUDO_USER")) return *username;
    if (const std::optional<Zstring> username = tryGetNonRootUser("USER"))      return *username;
    if (const std::optional<Zstring> username = tryGetNonRootUser("LOGNAME"))   return *username;

    //apparently the current user really IS root: https://freefilesync.org/forum/viewtopic.php?t=8405
    assert(::getuid() == 0);
    return "root";
}


Zstring zen::getUserHome() //throw FileError
{
    if (::getuid() != 0) //nofail; non-root
        /*   https://linux.die.net/man/3/getpwuid: An application that wants to determine its user's home directory
           should inspect the value of HOME (rather than the value getpwuid(getuid())->pw_dir) since this allows
           the user to modify their notion of "the home directory" during a login session.                       */
        if (const std::optional<Zstring> homeDirPath = getEnvironmentVar("HOME"))
            return *homeDirPath;

    //root(0) => consider as request for elevation, NOT impersonation!
    //=> "HOME=/root" :(
    const Zstring loginUser = getLoginUser(); //throw FileError

    std::vector<char> buf;
    const passwd pwEntry = getPasswordEntry([&](passwd* pwd, char* b, size_t len, passwd** result)
    { return ::getpwnam_r(loginUser.c_str(), pwd, b, len, result); }, buf, "getpwnam_r(" + utfTo<std::string>(loginUser) + ')'); //throw FileError

    return pwEntry.pw_dir; //home directory
}


Zstring zen::getUserDataPath() //throw FileError
{
    if (::getuid() != 0) //nofail; non-root
        if (const std::optional<Zstring> xdgCfgPath = getEnvironmentVar("XDG_CONFIG_HOME");
            xdgCfgPath && !xdgCfgPath->empty())
            return *xdgCfgPath;
    //root(0) => consider as request for elevation, NOT impersonation

    return appendPath(getUserHome(), ".config"); //throw FileError
}


bool zen::runningElevated() //throw FileError
{
    if (::geteuid() != 0) //nofail; non-root
        return false;

    return getLoginUser() != "root"; //throw FileError
}

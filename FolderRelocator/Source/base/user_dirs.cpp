// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FolderRelocator contributors - All Rights Reserved          *
// *****************************************************************************

#include "user_dirs.h"
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/sys_info.h>

using namespace zen;
using namespace frl;


namespace
{
const ZstringView XDG_HOME_VAR       = Zstr("$HOME");
const ZstringView XDG_HOME_VAR_BRACE = Zstr("${HOME}");


struct ParsedLine
{
    std::string key;
    std::string rawValue; //without quotes, still escaped
};

//KEY="value" or KEY=value
std::optional<ParsedLine> parseLine(const std::string& line)
{
    const std::string lineTrm = trimCpy(line);
    if (lineTrm.empty() || startsWith(lineTrm, '#'))
        return std::nullopt;

    const size_t posEq = lineTrm.find('=');
    if (posEq == std::string::npos || posEq == 0)
        return std::nullopt;

    std::string key   = trimCpy(lineTrm.substr(0, posEq));
    std::string value = trimCpy(lineTrm.substr(posEq + 1));

    if (value.size() >= 2 && startsWith(value, '"') && endsWith(value, '"'))
        value = value.substr(1, value.size() - 2);

    return ParsedLine{std::move(key), std::move(value)};
}


std::string unescapeShell(const std::string& str)
{
    std::string output;
    for (auto it = str.begin(); it != str.end(); ++it)
        if (*it == '\\' && it + 1 != str.end())
            output += *++it;
        else
            output += *it;
    return output;
}


std::string escapeShell(const std::string& str)
{
    std::string output;
    for (const char c : str)
    {
        if (c == '"' || c == '\\' || c == '$' || c == '`')
            output += '\\';
        output += c;
    }
    return output;
}
}


Zstring XdgUserDirsRegistry::decodeValue(const Zstring& rawValue, const Zstring& homePath)
{
    //"$HOME" is the only variable the database format supports (besides absolute paths)
    Zstring value = rawValue;
    if (startsWith(value, XDG_HOME_VAR_BRACE))
        value = Zstring(XDG_HOME_VAR) + value.substr(XDG_HOME_VAR_BRACE.size());

    if (value == XDG_HOME_VAR)
        return homePath;

    if (startsWith(value, Zstring(XDG_HOME_VAR) + FILE_NAME_SEPARATOR))
        return appendPath(homePath, unescapeShell(value.substr(XDG_HOME_VAR.size() + 1)));

    value = unescapeShell(value);
    if (startsWith(value, FILE_NAME_SEPARATOR))
        return normalizePath(value);

    return appendPath(homePath, value); //relative paths are relative to $HOME
}


Zstring XdgUserDirsRegistry::encodeValue(const Zstring& folderPath, const Zstring& homePath)
{
    const Zstring pathNorm = normalizePath(folderPath);
    const Zstring homeNorm = normalizePath(homePath);

    if (!homeNorm.empty() && isSubPathOf(pathNorm, homeNorm))
    {
        if (pathNorm == homeNorm)
            return Zstring(XDG_HOME_VAR) + FILE_NAME_SEPARATOR;

        return Zstring(XDG_HOME_VAR) + FILE_NAME_SEPARATOR + escapeShell(pathNorm.substr(appendSeparator(homeNorm).size()));
    }
    return escapeShell(pathNorm);
}


Zstring XdgUserDirsRegistry::getKey(FolderType type) const //throw RegistryAccessError
{
    if (const std::optional<Zstring> key = getXdgKey(type))
        return *key;

    throw RegistryAccessError(replaceCpy(_("The folder type %x has no entry in the XDG user directories database."),
                                         L"%x", utfTo<std::wstring>(getFolderName(type))), userDirsFilePath_);
}


std::vector<std::string> XdgUserDirsRegistry::loadLines() const //throw RegistryAccessError
{
    std::string content;
    try
    {
        content = getFileContent(userDirsFilePath_, nullptr /*notifyUnbufferedIO*/); //throw FileError
    }
    catch (const FileError& e)
    {
        if (e.errorCode() == ENOENT) //not yet existing: all values absent
            return {};

        throw RegistryAccessError(replaceCpy(_("Cannot read the XDG user directories database %x."), L"%x", fmtPath(userDirsFilePath_)),
                                  replaceCpy(e.toString(), L"\n\n", L'\n'), userDirsFilePath_, e.errorCode());
    }

    std::vector<std::string> lines = splitCpy(content, '\n', SplitOnEmpty::allow);
    if (!lines.empty() && lines.back().empty()) //trailing newline
        lines.pop_back();
    return lines;
}


void XdgUserDirsRegistry::saveLines(const std::vector<std::string>& lines) //throw RegistryAccessError
{
    std::string content;
    for (const std::string& line : lines)
        content += line + '\n';

    try
    {
        if (const std::optional<Zstring> parentPath = getParentFolderPath(userDirsFilePath_))
            createDirectoryIfMissingRecursion(*parentPath); //throw FileError

        setFileContent(userDirsFilePath_, content, nullptr /*notifyUnbufferedIO*/); //throw FileError
    }
    catch (const FileError& e)
    {
        throw RegistryAccessError(replaceCpy(_("Cannot write the XDG user directories database %x."), L"%x", fmtPath(userDirsFilePath_)),
                                  replaceCpy(e.toString(), L"\n\n", L'\n'), userDirsFilePath_, e.errorCode());
    }
}


std::vector<RegistryValue> XdgUserDirsRegistry::readValues(FolderType type) const //throw RegistryAccessError
{
    const Zstring key = getKey(type); //throw RegistryAccessError

    std::lock_guard dummy(lockFile_);

    RegistryValue value{.name = key};
    for (const std::string& line : loadLines()) //throw RegistryAccessError
        if (const std::optional<ParsedLine> pl = parseLine(line))
            if (pl->key == key)
                value.data = pl->rawValue; //last one wins, like the shell would do

    return {value};
}


void XdgUserDirsRegistry::writeValues(FolderType type, const std::vector<RegistryValue>& values) //throw RegistryAccessError
{
    const Zstring key = getKey(type); //throw RegistryAccessError

    std::lock_guard dummy(lockFile_);

    std::vector<std::string> lines = loadLines(); //throw RegistryAccessError

    for (const RegistryValue& val : values)
    {
        if (val.name != key)
            throw RegistryAccessError(replaceCpy(replaceCpy(_("Value %x does not belong to folder type %y."),
                                                            L"%x", fmtPath(val.name)),
                                                 L"%y", utfTo<std::wstring>(getFolderName(type))), userDirsFilePath_);

        std::vector<std::string> linesNew;
        bool written = false;
        for (const std::string& line : lines)
            if (const std::optional<ParsedLine> pl = parseLine(line); pl && pl->key == val.name)
            {
                if (val.data && !written) //replace first occurrence in place, drop duplicates
                {
                    linesNew.push_back(val.name + "=\"" + *val.data + '"');
                    written = true;
                }
            }
            else
                linesNew.push_back(line);

        if (val.data && !written)
            linesNew.push_back(val.name + "=\"" + *val.data + '"');

        lines.swap(linesNew);
    }

    saveLines(lines); //throw RegistryAccessError
}


Zstring XdgUserDirsRegistry::getFolderPath(FolderType type) const //throw RegistryAccessError
{
    for (const RegistryValue& val : readValues(type)) //throw RegistryAccessError
        if (val.data)
            return decodeValue(*val.data, homePath_);

    return appendPath(homePath_, getFolderName(type)); //xdg-user-dirs default
}


void XdgUserDirsRegistry::setFolderPath(FolderType type, const Zstring& folderPath) //throw RegistryAccessError
{
    writeValues(type, {RegistryValue{.name = getKey(type), .data = encodeValue(folderPath, homePath_)}}); //throw RegistryAccessError
}


Zstring frl::getDefaultUserDirsFilePath() //throw FileError
{
    return appendPath(getUserDataPath(), Zstr("user-dirs.dirs")); //throw FileError
}

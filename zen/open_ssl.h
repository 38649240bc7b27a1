// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include <memory>
#include "sys_error.h"


namespace zen
{
//init OpenSSL before use!
void openSslInit();


//streaming SHA-256 (OpenSSL EVP): feed blocks via update(), then finalize() once
class Sha256Hasher
{
public:
    Sha256Hasher(); //throw SysError
    ~Sha256Hasher();

    void update(const void* buffer, size_t bytes); //throw SysError

    std::string finalize(); //throw SysError; returns the raw 32-byte digest

private:
    Sha256Hasher           (const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    struct Impl;
    const std::unique_ptr<Impl> pimpl_;
};

std::string getSha256(const std::string_view bytes); //throw SysError; raw digest
}

#endif //OPEN_SSL_H_801974580936508934568792347506

// *****************************************************************************
// * This file is part of the FolderRelocator project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include "thread.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>


using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error FFS, we are royally screwed!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void zen::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    assert(runningOnMainThread());
    //explicitly init OpenSSL on main thread: seems to initialize atomically! But it still might help to avoid issues
    if (::OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_crypto"));
}


namespace
{
//OpenSSL 1.1.0+ deprecates all clean up functions, except for per-thread data
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}

//================================================================================

struct Sha256Hasher::Impl
{
    EVP_MD_CTX* mdctx = nullptr;
    bool finalized = false;
};


Sha256Hasher::Sha256Hasher() : pimpl_(std::make_unique<Impl>()) //throw SysError
{
    pimpl_->mdctx = ::EVP_MD_CTX_new();
    if (!pimpl_->mdctx)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"No more error details.")); //no more error details

    //https://www.openssl.org/docs/manmaster/man3/EVP_DigestInit.html
    if (::EVP_DigestInit_ex(pimpl_->mdctx,   //EVP_MD_CTX* ctx
                            ::EVP_sha256(),  //const EVP_MD* type
                            nullptr) != 1)   //ENGINE* impl
    {
        const std::wstring errorMsg = formatLastOpenSSLError("EVP_DigestInit_ex");
        ::EVP_MD_CTX_free(pimpl_->mdctx);
        throw SysError(errorMsg);
    }
}


Sha256Hasher::~Sha256Hasher() { ::EVP_MD_CTX_free(pimpl_->mdctx); }


void Sha256Hasher::update(const void* buffer, size_t bytes) //throw SysError
{
    if (pimpl_->finalized)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (::EVP_DigestUpdate(pimpl_->mdctx, //EVP_MD_CTX* ctx
                           buffer,        //const void*
                           bytes) != 1)   //size_t cnt
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string Sha256Hasher::finalize() //throw SysError
{
    if (pimpl_->finalized)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    pimpl_->finalized = true;

    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    if (::EVP_DigestFinal_ex(pimpl_->mdctx,                                   //EVP_MD_CTX* ctx
                             reinterpret_cast<unsigned char*>(output.data()), //unsigned char* md
                             &bytesWritten) != 1)                             //unsigned int* s
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    output.resize(bytesWritten);
    return output;
}


std::string zen::getSha256(const std::string_view bytes) //throw SysError
{
    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    //https://www.openssl.org/docs/manmaster/man3/EVP_Digest.html
    if (::EVP_Digest(bytes.data(),  //const void* data
                     bytes.size(),  //size_t count
                     reinterpret_cast<unsigned char*>(output.data()), //unsigned char* md
                     &bytesWritten, //unsigned int* size
                     ::EVP_sha256(),//const EVP_MD* type
                     nullptr) != 1) //ENGINE* impl
        throw SysError(formatLastOpenSSLError("EVP_Digest"));

    output.resize(bytesWritten);
    return output;
}

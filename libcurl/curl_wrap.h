// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CURL_WRAP_H_2879058325032785032789645
#define CURL_WRAP_H_2879058325032785032789645

#include <cstdint>
#include <zen/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace zen
{
void libcurlInit();     //call once per process (nestable) before creating sessions
void libcurlTearDown(); //


struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


//RAII: init on first use, reuse connection between calls
class CurlEasyHandle
{
public:
    CurlEasyHandle() {}
    ~CurlEasyHandle() { if (easyHandle_) ::curl_easy_cleanup(easyHandle_); }

    CURL* getOrReset(); //throw SysError
    CURL* get() { return easyHandle_; } //nullptr if not yet initialized

    void setOption(const CurlOption& curlOpt); //throw SysError

private:
    CurlEasyHandle           (const CurlEasyHandle&) = delete;
    CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;

    CURL* easyHandle_ = nullptr;
};


std::wstring formatCurlStatusCode(CURLcode sc);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_2879058325032785032789645

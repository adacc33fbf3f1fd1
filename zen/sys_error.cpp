// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
    #include <cstring>

using namespace zen;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes seen by file and network operations of this client
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(EPERM);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOENT);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINTR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EIO);
            ZEN_CHECK_CASE_FOR_CONSTANT(EBADF);
            ZEN_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            ZEN_CHECK_CASE_FOR_CONSTANT(EACCES);
            ZEN_CHECK_CASE_FOR_CONSTANT(EBUSY);
            ZEN_CHECK_CASE_FOR_CONSTANT(EEXIST);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EISDIR);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINVAL);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENFILE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EMFILE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EFBIG);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            ZEN_CHECK_CASE_FOR_CONSTANT(EROFS);
            ZEN_CHECK_CASE_FOR_CONSTANT(EPIPE);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            ZEN_CHECK_CASE_FOR_CONSTANT(ELOOP);
            ZEN_CHECK_CASE_FOR_CONSTANT(EPROTO);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            ZEN_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            ZEN_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            ZEN_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            ZEN_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            ZEN_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            ZEN_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            ZEN_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            ZEN_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            ZEN_CHECK_CASE_FOR_CONSTANT(ECANCELED);
        default:
            return replaceCpy<std::wstring>(L"Error code %x", L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring zen::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    ZEN_ON_SCOPE_EXIT(errno = ecCurrent);

    char buffer[1024] = {};
    //GNU strerror_r() may return a static string instead of filling the buffer
    const char* msg = ::strerror_r(ec, buffer, sizeof(buffer));

    std::wstring errorMsg = utfTo<std::wstring>(msg ? msg : buffer);
    trim(errorMsg);
    return errorMsg;
}


std::wstring zen::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring zen::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}

// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_COMMAND_H_3109674523019846
#define FTP_COMMAND_H_3109674523019846

#include <exception>
#include <functional>
#include <zen/file_error.h>
#include <zen/extra_log.h>
#include "ftp_mode.h"


namespace nftp
{
/*  run a command-shaped operation on the caller's thread:
        1. log "NAME args" (debug)
        2. invoke
        3. on exception: log "NAME failed: details" (error) and rethrow unchanged

    Example: invokeFtpCommand("cwd", [&](const std::string& path) { ... }, folderPath);   */
template <class Function, class... Args>
decltype(auto) invokeFtpCommand(std::string_view cmdName, Function&& fun, Args&&... args);






//######################## implementation ##########################
namespace impl
{
inline std::wstring formatCommandArg(std::string_view  arg) { return zen::utfTo<std::wstring>(arg); }
inline std::wstring formatCommandArg(std::wstring_view arg) { return std::wstring(arg); }
inline std::wstring formatCommandArg(const char*       arg) { return zen::utfTo<std::wstring>(arg); }
inline std::wstring formatCommandArg(TransferMode   mode) { return getModeName(mode); }
inline std::wstring formatCommandArg(ConnectionMode mode) { return getModeName(mode); }

template <class Num, std::enable_if_t<std::is_arithmetic_v<Num>, int> = 0>
std::wstring formatCommandArg(Num num) { return zen::numberTo<std::wstring>(num); }


inline
std::wstring formatCommandName(std::string_view cmdName)
{
    std::wstring name;
    for (const char c : cmdName)
        name += static_cast<wchar_t>(zen::asciiToUpper(c));
    return name;
}
}


template <class Function, class... Args> inline
decltype(auto) invokeFtpCommand(std::string_view cmdName, Function&& fun, Args&&... args)
{
    using namespace zen;

    std::wstring cmdTrace = impl::formatCommandName(cmdName);
    ((cmdTrace += L' ' + impl::formatCommandArg(args)), ...);

    logExtraDebug(cmdTrace);

    auto logFailure = [&](const std::wstring& details)
    {
        logExtraError(impl::formatCommandName(cmdName) + L" failed: " + replaceCpy(details, L"\n\n", L"\n"));
    };

    try
    {
        return std::invoke(std::forward<Function>(fun), std::forward<Args>(args)...);
    }
    catch (const SysError& e)          { logFailure(e.toString()); throw; }
    catch (const FileError& e)         { logFailure(e.toString()); throw; }
    catch (const std::exception& e)    { logFailure(utfTo<std::wstring>(std::string_view(e.what()))); throw; }
    catch (...)                        { logFailure(L"Unknown exception."); throw; }
}
}

#endif //FTP_COMMAND_H_3109674523019846

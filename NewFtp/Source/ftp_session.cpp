// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_session.h"
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "proto/ftp_address.h"
#include "proto/ftp_command.h"

using namespace zen;
using namespace nftp;


struct FtpSession::CurlRequest
{
    curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;
    std::vector<CurlOption> extraOptions;
};


namespace
{
//log data connection endpoint announced by "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
void logPassiveAddress(const std::string& headerData)
{
    for (const std::string_view line : splitFtpResponse(headerData))
        if (startsWith(line, "227 "))
            try
            {
                const FtpAddress addr = parsePassiveAddress(line); //throw SysErrorMalformedAddress
                logExtraDebug(L"Passive data connection: " + utfTo<std::wstring>(addr.host) + L':' + numberTo<std::wstring>(addr.port));
            }
            catch (const SysErrorMalformedAddress& e) { logExtraWarning(e.toString()); }
}
}


FtpFeatures nftp::parseFeatResponse(const std::string& featResponse)
{
    FtpFeatures output; //FEAT command: https://tools.ietf.org/html/rfc2389#page-4
    const std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string_view line) { return startsWith(line, "211-") || startsWith(line, "211 "); });
    if (it != lines.end())
    {
        ++it;
        for (; it != lines.end(); ++it)
        {
            if (equalAsciiNoCase     (*it, "211 End") || //Serv-U: "211 End (for details use "HELP commmand" where command is the command of interest)"
                startsWithAsciiNoCase(*it, "211 End "))  //Home Ftp Server: "211 End of extentions."
                break;

            std::string line(*it);
            //ProFTPD with "MultilineRFC2228 = on"
            if (startsWith(line, "211-"))
                line = ' ' + afterFirst(line, '-', IfNotFoundReturn::none);

            //https://tools.ietf.org/html/rfc3659#section-7.8
            //"there is no distinct FEAT output for MLSD. The presence of the MLST feature indicates that both MLST and MLSD are supported"
            if (equalAsciiNoCase     (line, " MLST")  ||
                startsWithAsciiNoCase(line, " MLST ") || //SP "MLST" [SP factlist] CRLF
                equalAsciiNoCase     (line, " MLSD"))    //non-compliant servers
                output.mlsd = true;

            else if (equalAsciiNoCase(line, " UTF8") ||
                     equalAsciiNoCase(line, " UTF8 ON") ||
                     equalAsciiNoCase(line, " UTF-8"))
                output.utf8 = true;

            else if (equalAsciiNoCase(line, " CLNT"))
                output.clnt = true;
        }
    }
    return output;
}


std::string nftp::parsePwdResponse(const std::string& pwdResponse) //throw SysError
{
    for (const std::string_view line : splitFtpResponse(pwdResponse))
        if (startsWith(line, "257 "))
        {
            /* 257<space>[rubbish]"<directory-name>"<space><commentary>

               "The directory name can contain any character; embedded double-quotes should be escaped by
               double-quotes (the "quote-doubling" convention)." https://tools.ietf.org/html/rfc959        */
            auto itBegin = std::find(line.begin(), line.end(), '"');
            if (itBegin != line.end())
                for (auto it = ++itBegin; it != line.end(); ++it)
                    if (*it == '"')
                    {
                        if (it + 1 != line.end() && it[1] == '"')
                            ++it; //skip double quote
                        else
                            return replaceCpy(std::string(itBegin, it), "\"\"", '"');
                    }
            break;
        }
    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(pwdResponse) + L')');
}


FtpSession::FtpSession(const FtpSessionCfg& sessionCfg) :
    sessionCfg_(sessionCfg),
    easyHandle_(std::make_unique<CurlEasyHandle>()) {}


FtpSession::~FtpSession() {}


std::string FtpSession::getCurlUrlPath(const std::string& serverPath, bool isDir) //throw SysError
{
    std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!)

    split(serverPath, '/', [&](std::string_view comp)
    {
        if (!comp.empty())
        {
            char* compFmt = ::curl_easy_escape(easyHandle_->get(), comp.data(), static_cast<int>(comp.size()));
            if (!compFmt)
                throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', L"", L"Conversion failure"));
            ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

            if (!curlRelPath.empty())
                curlRelPath += '/';
            curlRelPath += compFmt;
        }
    });

    if (trimCpy(sessionCfg_.server).empty())
        throw SysError(L"Server name must not be empty.");

    /*  1. CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs
        2. CURLFTPMETHOD_SINGLECWD requires absolute paths to skip one needless "CWD entry path"
          => https://curl.se/docs/faq.html#How_do_I_list_the_root_directory                    */
    std::string path = "ftp://" + sessionCfg_.server + "//" + curlRelPath;

    if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
        path += '/';
    return path;
}


std::string FtpSession::perform(const std::string& serverPath, bool isDir, const CurlRequest& request) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
{
    CURL* easyHandle = easyHandle_->getOrReset(); //throw SysError

    char curlErrorBuf[CURL_ERROR_SIZE] = {};
    easyHandle_->setOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

    std::string headerData;
    curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        auto& output = *static_cast<std::string*>(callbackData);
        output.append(buffer, size * nitems);
        return size * nitems;
    };
    easyHandle_->setOption({CURLOPT_HEADERDATA, &headerData});         //throw SysError
    easyHandle_->setOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //

    const std::string curlUrl = getCurlUrlPath(serverPath, isDir); //throw SysError
    easyHandle_->setOption({CURLOPT_URL, curlUrl.c_str()}); //throw SysError

    assert(request.pathMethod != CURLFTPMETHOD_MULTICWD); //too slow!
    easyHandle_->setOption({CURLOPT_FTP_FILEMETHOD, request.pathMethod}); //throw SysError

    if (!sessionCfg_.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
    {
        easyHandle_->setOption({CURLOPT_USERNAME, sessionCfg_.username.c_str()}); //throw SysError
        easyHandle_->setOption({CURLOPT_PASSWORD, sessionCfg_.password.c_str()}); //
    }

    easyHandle_->setOption({CURLOPT_PORT, sessionCfg_.port}); //throw SysError

    //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
    easyHandle_->setOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

    switch (sessionCfg_.connectionMode)
    {
        case ConnectionMode::passive:
            //allow PASV IP: some FTP servers really use IP different from control connection
            easyHandle_->setOption({CURLOPT_FTP_SKIP_PASV_IP, 0}); //throw SysError
            easyHandle_->setOption({CURLOPT_FTP_USE_EPSV, 0});     //PASV only
            break;

        case ConnectionMode::active:
            easyHandle_->setOption({CURLOPT_FTPPORT, "-"});    //throw SysError; "-": default IP address of control connection
            easyHandle_->setOption({CURLOPT_FTP_USE_EPRT, 0}); //PORT only
            break;
    }

    easyHandle_->setOption({CURLOPT_TRANSFERTEXT, sessionCfg_.transferMode == TransferMode::ascii ? 1 : 0}); //throw SysError

    easyHandle_->setOption({CURLOPT_CONNECTTIMEOUT, sessionCfg_.timeoutSec}); //throw SysError

    //CURLOPT_TIMEOUT: "Since this puts a hard limit for how long time a request is allowed to take, it has limited use in dynamic use cases with varying transfer times."
    easyHandle_->setOption({CURLOPT_LOW_SPEED_TIME, sessionCfg_.timeoutSec}); //throw SysError
    easyHandle_->setOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/});          //
    //can't use "0" which means "inactive", so use some low number

    easyHandle_->setOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, sessionCfg_.timeoutSec}); //throw SysError
    //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time

    easyHandle_->setOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

    for (const CurlOption& option : request.extraOptions)
        easyHandle_->setOption(option); //throw SysError

    //=======================================================================================================
    const CURLcode rcPerf = ::curl_easy_perform(easyHandle);
    //curl_easy_perform() considers FTP response codes >= 400 as failure
    //=> prefix FTP commands with * to ignore: https://curl.se/libcurl/c/CURLOPT_QUOTE.html
    //=======================================================================================================

    if (rcPerf != CURLE_OK)
    {
        std::wstring errorMsg = trimCpy(utfTo<std::wstring>(std::string_view(curlErrorBuf))); //optional

        if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
            !headerLines.empty())
            if (const std::string_view response = trimCpy(headerLines.back()); //that *should* be the server's error response
                !response.empty())
                errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

        if (rcPerf == CURLE_LOGIN_DENIED)
            throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

        long ftpStatusCode = 0; //optional
        /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
        //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
        if (ftpStatusCode != 0)
            throw SysErrorFtpProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg) +
                                      L'\n' + formatFtpStatus(static_cast<int>(ftpStatusCode)), ftpStatusCode);

        throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
    }

    logPassiveAddress(headerData);
    return headerData;
}


std::string FtpSession::runSingleFtpCommand(const std::string& ftpCmd) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
{
    curl_slist* quote = nullptr;
    ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
    quote = ::curl_slist_append(quote, ftpCmd.c_str());
    if (!quote)
        throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

    CurlRequest request;
    request.pathMethod = CURLFTPMETHOD_NOCWD; //avoid needless CWDs
    request.extraOptions =
    {
        {CURLOPT_NOBODY, 1L},
        {CURLOPT_QUOTE, quote},
    };
    return perform("", true /*isDir*/, request); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
}


const FtpFeatures& FtpSession::getFeaturesCached() //throw SysError
{
    if (!featureCache_)
        //*: ignore error if server does not support/allow FEAT
        featureCache_ = parseFeatResponse(runSingleFtpCommand("*FEAT")); //throw SysError
    return *featureCache_;
}


FtpReply FtpSession::runCommand(const std::string& ftpCmd) //throw SysError, SysErrorPassword
{
    return invokeFtpCommand("quote", [&](const std::string& cmd)
    {
        if (trimCpy(cmd).empty())
            throw SysError(L"FTP command must not be empty.");

        //*: negative server replies are returned to the caller
        const std::string response = runSingleFtpCommand('*' + cmd); //throw SysError, SysErrorPassword

        if (const std::optional<FtpReply> reply = parseLastFtpReply(response))
            return *reply;

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(response) + L')');
    }, ftpCmd);
}


FtpFeatures FtpSession::getFeatures() //throw SysError
{
    return invokeFtpCommand("feat", [&] { return getFeaturesCached(); }); //throw SysError
}


std::vector<FtpListingEntry> FtpSession::listDirectory(const std::string& dirPath) //throw SysError
{
    return invokeFtpCommand("list", [&](const std::string& path)
    {
        std::string rawListing; //get raw FTP directory listing

        curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };

        CurlRequest request;
        request.extraOptions =
        {
            {CURLOPT_WRITEDATA, &rawListing},
            {CURLOPT_WRITEFUNCTION, onBytesReceived},
        };

        const bool useMlsd = getFeaturesCached().mlsd; //throw SysError
        if (useMlsd)
        {
            request.extraOptions.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

            //some servers process wildcards characters inside the MLSD "dirpath": http://www.proftpd.org/docs/howto/Globbing.html
            const bool pathHasWildcards =
                contains(afterFirst(path, '[', IfNotFoundReturn::none), ']') ||
                contains(path, '*') ||
                contains(path, '?');

            if (!pathHasWildcards)
                request.pathMethod = CURLFTPMETHOD_NOCWD;
        }
        //else: use "LIST" + CURLFTPMETHOD_SINGLECWD

        perform(path, true /*isDir*/, request); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

        return parseListing(splitFtpResponse(rawListing), useMlsd ? ListingFormat::mlsd : ListingFormat::list);
    }, dirPath);
}


std::string FtpSession::getWorkingDirectory() //throw SysError
{
    return invokeFtpCommand("pwd", [&]
    {
        return parsePwdResponse(runSingleFtpCommand("PWD")); //throw SysError
    });
}


void FtpSession::setTransferMode(TransferMode mode) //throw SysError
{
    invokeFtpCommand("type", [&](TransferMode newMode)
    {
        runSingleFtpCommand(getTypeCommand(newMode)); //throw SysError
        sessionCfg_.transferMode = newMode;
    }, mode);
}


void FtpSession::setConnectionMode(ConnectionMode mode) //nothrow
{
    invokeFtpCommand(getCommandFamily(mode), [&](ConnectionMode newMode) { sessionCfg_.connectionMode = newMode; }, mode);
}


void FtpSession::testConnection() //throw SysError
{
    invokeFtpCommand("feat", [&]
    {
        //'*': as long as we get an FTP response - *any* FTP response (including 550) - the connection itself is fine!
        const std::string& featBuf = runSingleFtpCommand("*FEAT"); //throw SysError

        for (const std::string_view line : splitFtpResponse(featBuf))
            if (startsWith(line, "211 ") ||
                startsWith(line, "500 ") ||
                startsWith(line, "550 "))
                return;

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(featBuf) + L')');
    });
}

// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_SESSION_H_1356092847520931
#define FTP_SESSION_H_1356092847520931

#include <memory>
#include "proto/ftp_listing.h"
#include "proto/ftp_mode.h"
#include "proto/ftp_reply.h"


namespace zen { class CurlEasyHandle; }

namespace nftp
{
const int DEFAULT_PORT_FTP = 21;


struct FtpSessionCfg
{
    std::string server;
    int port = DEFAULT_PORT_FTP;
    std::string username; //empty: anonymous login
    std::string password;
    int timeoutSec = 30;
    ConnectionMode connectionMode = ConnectionMode::passive;
    TransferMode   transferMode   = TransferMode::binary;
};


struct SysErrorFtpProtocol : public zen::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)


struct FtpFeatures
{
    bool mlsd = false;
    bool utf8 = false;
    bool clnt = false;

    bool operator==(const FtpFeatures&) const = default;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);

//"257 "/home/""user" is current directory." => /home/"user
std::string parsePwdResponse(const std::string& pwdResponse); //throw SysError


//libcurl-backed FTP control connection; login, sockets and data connections are handled by libcurl
//not thread-safe: one session per thread
class FtpSession
{
public:
    explicit FtpSession(const FtpSessionCfg& sessionCfg);
    ~FtpSession();

    const FtpSessionCfg& getSessionCfg() const { return sessionCfg_; }

    //send raw command; negative replies are returned, not thrown
    FtpReply runCommand(const std::string& ftpCmd); //throw SysError, SysErrorPassword

    FtpFeatures getFeatures(); //throw SysError

    //MLSD if supported, LIST otherwise
    std::vector<FtpListingEntry> listDirectory(const std::string& dirPath); //throw SysError

    std::string getWorkingDirectory(); //throw SysError

    void setTransferMode(TransferMode mode); //throw SysError
    TransferMode getTransferMode() const { return sessionCfg_.transferMode; }

    void setConnectionMode(ConnectionMode mode); //nothrow: effective for the next command
    ConnectionMode getConnectionMode() const { return sessionCfg_.connectionMode; }

    void testConnection(); //throw SysError

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    struct CurlRequest;

    //returns server response (header data)
    std::string perform(const std::string& serverPath, bool isDir, const CurlRequest& request); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    std::string runSingleFtpCommand(const std::string& ftpCmd); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

    std::string getCurlUrlPath(const std::string& serverPath, bool isDir); //throw SysError
    const FtpFeatures& getFeaturesCached(); //throw SysError

    FtpSessionCfg sessionCfg_;
    std::unique_ptr<zen::CurlEasyHandle> easyHandle_;
    std::optional<FtpFeatures> featureCache_;
};
}

#endif //FTP_SESSION_H_1356092847520931

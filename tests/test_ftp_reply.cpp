// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "../NewFtp/Source/proto/ftp_reply.h"
#include "test_common.h"

using namespace zen;
using namespace nftp;
using namespace test;


// =================== A. Single Reply Lines ===================
void testParseReply(TestStats& stats)
{
    std::cout << "\n[A. Single Reply Lines]\n";

    FtpReply reply = parseFtpReply("230 Login successful.");
    check(stats, reply.code == 230 && reply.message == "Login successful.", "230 reply with message");

    reply = parseFtpReply("226 ");
    check(stats, reply.code == 226 && reply.message.empty(), "226 reply with empty message");

    reply = parseFtpReply("200");
    check(stats, reply.code == 200 && reply.message.empty(), "bare code without message");

    reply = parseFtpReply("550   Not found.  \r\n");
    check(stats, reply.code == 550 && reply.message == "Not found.", "message is trimmed");

    reply = parseFtpReply("230-Welcome to the server");
    check(stats, reply.code == 230 && reply.message == "-Welcome to the server", "continuation marker is part of the message");

    reply = parseFtpReply("227 Entering Passive Mode (192,168,1,10,4,1).");
    check(stats, reply.code == FTP_REPLY_PASSIVE_MODE, "227 matches named constant");
}


// =================== B. Unparsable Lines ===================
void testUnparsableReply(TestStats& stats)
{
    std::cout << "\n[B. Unparsable Lines]\n";

    fetchExtraLog(); //discard previous entries

    FtpReply reply = parseFtpReply("xyz bad");
    check(stats, !reply.code && reply.message == "xyz bad", "non-digit code => sentinel, raw line kept");
    check(stats, logContains(fetchExtraLog(), MSG_TYPE_ERROR, "xyz bad"), "error diagnostic recorded");

    reply = parseFtpReply("12");
    check(stats, !reply.code && reply.message == "12", "too short => sentinel");

    reply = parseFtpReply("");
    check(stats, !reply.code && reply.message.empty(), "empty line => sentinel");

    reply = parseFtpReply(" 230 Login successful.");
    check(stats, !reply.code && reply.message == " 230 Login successful.", "leading blank => sentinel, line unmodified");

    reply = parseFtpReply("2x0 odd");
    check(stats, !reply.code, "digit in the middle missing => sentinel");
}


// =================== C. Reply Categories ===================
void testReplyCategory(TestStats& stats)
{
    std::cout << "\n[C. Reply Categories]\n";

    check(stats, getReplyCategory(FTP_REPLY_FILE_STATUS_OK) == ReplyCategory::positivePreliminary, "150 is positive preliminary");
    check(stats, getReplyCategory(FTP_REPLY_TRANSFER_COMPLETE) == ReplyCategory::positiveCompletion, "226 is positive completion");
    check(stats, getReplyCategory(FTP_REPLY_NEED_PASSWORD) == ReplyCategory::positiveIntermediate, "331 is positive intermediate");
    check(stats, getReplyCategory(421) == ReplyCategory::transientNegative, "421 is transient negative");
    check(stats, getReplyCategory(FTP_REPLY_NOT_LOGGED_IN) == ReplyCategory::permanentNegative, "530 is permanent negative");
    check(stats, getReplyCategory(99)  == ReplyCategory::none, "99 has no category");
    check(stats, getReplyCategory(650) == ReplyCategory::none, "650 has no category");

    check(stats, formatFtpStatus(550) == L"FTP status 550: File unavailable, e.g. file not found, no access.", "known status is described");
    check(stats, formatFtpStatus(299) == L"FTP status 299.", "unknown status shows code only");
}


// =================== D. Server Buffers ===================
void testServerBuffer(TestStats& stats)
{
    std::cout << "\n[D. Server Buffers]\n";

    const std::string greeting = "220 Service ready\r\n331 Password required\r\n230 Logged in\r\n";
    const std::vector<std::string_view> lines = splitFtpResponse(greeting);
    check(stats, lines.size() == 3 && lines[0] == "220 Service ready" && lines[2] == "230 Logged in", "CR/LF separated lines, no empty blocks");

    const std::string feat = "211-Features:\r\n MLST size*;modify*;\r\n UTF8\r\n211 End\r\n";
    std::optional<FtpReply> last = parseLastFtpReply(feat);
    check(stats, last && last->code == 211 && last->message == "End", "multi-line reply => final line");

    const std::string banner = "230-Welcome\r\n230-Have fun\r\n";
    check(stats, !parseLastFtpReply(banner), "continuation lines only => no final reply");

    const std::string empty;
    check(stats, !parseLastFtpReply(empty), "empty buffer => no reply");
}


int main()
{
    setExtraLogLevel(MSG_TYPE_DEBUG);

    TestStats stats;
    testParseReply(stats);
    testUnparsableReply(stats);
    testReplyCategory(stats);
    testServerBuffer(stats);

    stats.print();
    return stats.exitCode();
}

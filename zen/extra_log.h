// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include <functional>
#include "error_log.h"
#include "thread.h"

/*  process-wide diagnostic log, safe for concurrent writes:
    - entries below the minimum level are dropped
    - with a sink installed, each accepted entry is passed on (sink must be nothrow!)
    - otherwise entries are buffered until fetchExtraLog(): without a sink, callers must drain the log;
      when the buffer is full, the oldest half is discarded                            */

namespace zen
{
const size_t EXTRA_LOG_BUFFER_MAX = 10000; //entries

void setExtraLogLevel(MessageType minLevel);
MessageType getExtraLogLevel();

void setExtraLogSink(const std::function<void(const LogEntry& entry)>& sink); //pass nullptr to buffer again

ErrorLog fetchExtraLog();

void logExtraDebug  (const std::wstring& msg); //
void logExtraInfo   (const std::wstring& msg); //nothrow!
void logExtraWarning(const std::wstring& msg); //
void logExtraError  (const std::wstring& msg); //






//######################## implementation ##########################
namespace impl
{
class ExtraLog
{
public:
    void setMinLevel(MessageType minLevel) { minLevel_ = minLevel; }
    MessageType getMinLevel() const { return minLevel_; }

    void setSink(const std::function<void(const LogEntry& entry)>& sink) { sink_ = sink; }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    //returns sink to be called outside the lock: sink may log again
    std::function<void(const LogEntry& entry)> add(const LogEntry& entry)
    {
        if (entry.type < minLevel_)
            return nullptr;

        if (sink_)
            return sink_;

        if (log_.size() >= EXTRA_LOG_BUFFER_MAX)
            log_.erase(log_.begin(), log_.begin() + EXTRA_LOG_BUFFER_MAX / 2);

        log_.push_back(entry);
        return nullptr;
    }

private:
    ErrorLog log_;
    MessageType minLevel_ = MSG_TYPE_INFO;
    std::function<void(const LogEntry& entry)> sink_;
};


inline
Protected<ExtraLog>& refGlobalExtraLog()
{
    static Protected<ExtraLog> globalExtraLog; //thread-safe initialization
    return globalExtraLog;
}


inline
void logExtraMsg(const std::wstring& msg, MessageType type) //nothrow!
{
    const LogEntry entry{std::time(nullptr), type, utfTo<std::string>(msg)};

    const std::function<void(const LogEntry& entry)> sink = refGlobalExtraLog().access([&](ExtraLog& el) { return el.add(entry); });
    if (sink)
        sink(entry);
}
}


inline
void setExtraLogLevel(MessageType minLevel)
{
    impl::refGlobalExtraLog().access([&](impl::ExtraLog& el) { el.setMinLevel(minLevel); });
}


inline
MessageType getExtraLogLevel()
{
    return impl::refGlobalExtraLog().access([](impl::ExtraLog& el) { return el.getMinLevel(); });
}


inline
void setExtraLogSink(const std::function<void(const LogEntry& entry)>& sink)
{
    impl::refGlobalExtraLog().access([&](impl::ExtraLog& el) { el.setSink(sink); });
}


inline
ErrorLog fetchExtraLog()
{
    return impl::refGlobalExtraLog().access([](impl::ExtraLog& el) { return el.fetchLog(); });
}


inline void logExtraDebug  (const std::wstring& msg) { impl::logExtraMsg(msg, MSG_TYPE_DEBUG  ); }
inline void logExtraInfo   (const std::wstring& msg) { impl::logExtraMsg(msg, MSG_TYPE_INFO   ); }
inline void logExtraWarning(const std::wstring& msg) { impl::logExtraMsg(msg, MSG_TYPE_WARNING); }
inline void logExtraError  (const std::wstring& msg) { impl::logExtraMsg(msg, MSG_TYPE_ERROR  ); }
}

#endif //EXTRA_LOG_H_601673246392441846218957402563

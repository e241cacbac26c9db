#pragma once
///@file

#include "buildjail/libutil/types.hh"
#include "buildjail/libutil/error.hh"

namespace buildjail {

class Logger
{
public:

    virtual ~Logger() { }

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    inline void cout(const Args & ... args)
    {
        writeToStdout(fmt(args...));
    }
};

extern Logger * logger;

Logger * makeSimpleLogger();

/**
 * Wrap `prevLogger` so that every message becomes a single
 * `@buildjail {...}` JSON line.
 */
Logger * makeJSONLogger(Logger & prevLogger);

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)                           \
    do {                                                            \
        if ((level) <= ::buildjail::verbosity) {                    \
            ::buildjail::logger->logEI((level), errorInfo);         \
        }                                                           \
    } while (0)

#define logError(errorInfo...) logErrorInfo(::buildjail::lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(::buildjail::lvlWarn, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily. The format string *must* be a literal.
 */
#define printMsgUsing(loggerParam, level, fs, args...)                                                \
    do {                                                                                              \
        auto _bj_logger_print_lvl = level;                                                            \
        const char * _bj_format = []<size_t N>(const char(&_bj_fs)[N]) { return _bj_fs; }(fs);       \
        if (_bj_logger_print_lvl <= ::buildjail::verbosity) {                                         \
            loggerParam->log(_bj_logger_print_lvl, ::buildjail::HintFmt(_bj_format, ##args).str());   \
        }                                                                                             \
    } while (0)
#define printMsg(level, fs, args...) printMsgUsing(::buildjail::logger, level, fs, ##args)

#define printWarning(fs, args...) printMsg(::buildjail::lvlWarn, fs, ##args)
#define printError(fs, args...) printMsg(::buildjail::lvlError, fs, ##args)
#define notice(fs, args...) printMsg(::buildjail::lvlNotice, fs, ##args)
#define printInfo(fs, args...) printMsg(::buildjail::lvlInfo, fs, ##args)
#define printTalkative(fs, args...) printMsg(::buildjail::lvlTalkative, fs, ##args)
#define debug(fs, args...) printMsg(::buildjail::lvlDebug, fs, ##args)
#define vomit(fs, args...) printMsg(::buildjail::lvlVomit, fs, ##args)

#define printTaggedWarning(fs, args...) \
    printWarning(ANSI_WARNING "warning:" ANSI_NORMAL " " fs, ##args)

void writeLogsToStderr(std::string_view s);

}

#include "buildjail/libutil/environment-variables.hh"
#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/json.hh"
#include "buildjail/libutil/terminal.hh"

#include <algorithm>
#include <sstream>

namespace buildjail {

Logger * logger = makeSimpleLogger();

void Logger::writeToStdout(std::string_view s)
{
    writeFull(STDOUT_FILENO, filterANSIEscapes(s, !shouldANSI(StandardOutputStream::Stdout)));
    writeFull(STDOUT_FILENO, "\n");
}

class SimpleLogger : public Logger
{
public:

    bool systemd, tty;

    SimpleLogger()
    {
        systemd = getEnv("IN_SYSTEMD") == "1";
        tty = shouldANSI();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity) return;

        std::string prefix;

        if (systemd) {
            char c;
            switch (lvl) {
            case lvlError: c = '3'; break;
            case lvlWarn: c = '4'; break;
            case lvlNotice: case lvlInfo: c = '5'; break;
            case lvlTalkative: case lvlChatty: c = '6'; break;
            case lvlDebug: case lvlVomit:
            default: c = '7'; break;
            }
            prefix = std::string("<") + c + ">";
        }

        writeLogsToStderr(prefix + filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::stringstream oss;
        showErrorInfo(oss, ei);

        log(ei.level, oss.str());
    }
};

Verbosity verbosity = lvlInfo;

Verbosity verbosityFromIntClamped(int val)
{
    int clamped = std::clamp(val, int(lvlError), int(lvlVomit));
    return static_cast<Verbosity>(clamped);
}

Logger * makeSimpleLogger()
{
    return new SimpleLogger();
}

struct JSONLogger : Logger {
    Logger & prevLogger;

    JSONLogger(Logger & prevLogger) : prevLogger(prevLogger) { }

    void write(const JSON & json)
    {
        prevLogger.log(lvlError, "@buildjail " + json.dump(-1, ' ', false, JSON::error_handler_t::replace));
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        JSON json;
        json["action"] = "msg";
        json["level"] = lvl;
        json["msg"] = filterANSIEscapes(s, true);
        write(json);
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);

        JSON json;
        json["action"] = "msg";
        json["level"] = ei.level;
        json["msg"] = filterANSIEscapes(oss.str(), true);
        json["raw_msg"] = filterANSIEscapes(ei.msg.str(), true);
        json["status"] = ei.status;

        if (!ei.traces.empty()) {
            JSON traces = JSON::array();
            for (auto & trace : ei.traces)
                traces.push_back(filterANSIEscapes(trace.hint.str(), true));
            json["trace"] = traces;
        }

        write(json);
    }
};

Logger * makeJSONLogger(Logger & prevLogger)
{
    return new JSONLogger(prevLogger);
}

void writeLogsToStderr(std::string_view s)
{
    try {
        writeFull(STDERR_FILENO, s, false);
    } catch (SysError & e) {
        /* Ignore failing writes to stderr.  We need to ignore write
           errors to ensure that cleanup code that logs to stderr runs
           to completion if the other side of stderr has been closed
           unexpectedly. */
    }
}

}

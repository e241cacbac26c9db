#include "buildjail/libmain/loggers.hh"
#include "buildjail/libutil/logging.hh"

namespace buildjail {

LogFormat defaultLogFormat = LogFormat::Raw;

std::optional<LogFormat> parseLogFormat(std::string_view str)
{
    if (str == "raw")
        return LogFormat::Raw;
    if (str == "json")
        return LogFormat::Json;
    return std::nullopt;
}

void setLogFormat(LogFormat logFormat)
{
    defaultLogFormat = logFormat;
    createDefaultLogger();
}

void createDefaultLogger()
{
    logger = getLoggerByFormat(defaultLogFormat);
}

Logger * getLoggerByFormat(LogFormat logFormat)
{
    switch (logFormat) {
    case LogFormat::Raw:
        return makeSimpleLogger();
    case LogFormat::Json:
        return makeJSONLogger(*makeSimpleLogger());
    }
    throw Error("unknown log format %d", static_cast<int>(logFormat));
}

}

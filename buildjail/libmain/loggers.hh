#pragma once
///@file

#include "buildjail/libutil/types.hh"

#include <optional>
#include <string_view>

namespace buildjail {

class Logger;

enum class LogFormat {
    Raw,
    Json,
};

std::optional<LogFormat> parseLogFormat(std::string_view str);

/** Overrides the current log format, and re-creates the current logger. */
void setLogFormat(LogFormat logFormat);

void createDefaultLogger();

Logger * getLoggerByFormat(LogFormat logFormat);

}

#pragma once
///@file

#include "buildjail/libutil/exit.hh"
#include "buildjail/libutil/types.hh"

#include <functional>

namespace buildjail {

int handleExceptions(const std::string & programName, std::function<int()> fun);

/**
 * Don't forget to call initBuildjail()! before doing anything else.
 */
void initBuildjail();

std::string getArg(const std::string & opt,
    Strings::iterator & i, const Strings::iterator & end);

/**
 * Print the program name and version, then exit.
 */
[[noreturn]]
void printVersion(const std::string & programName);

/**
 * Print `usage` to stdout, then exit.
 */
[[noreturn]]
void printHelp(const std::string & usage);

}

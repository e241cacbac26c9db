#pragma once
///@file

#include <limits>
#include <string>
#include <unistd.h>

namespace buildjail {

enum class StandardOutputStream {
    Stdout = STDOUT_FILENO,
    Stderr = STDERR_FILENO,
};

/**
 * Determine whether the output is a real terminal (i.e. not dumb, not a pipe).
 *
 * This is probably not what you want, you may want shouldANSI() or something
 * more specific. Think about how the output should work with a pager or
 * entirely non-interactive scripting use.
 */
bool isOutputARealTerminal(StandardOutputStream fileno);

/**
 * Determine whether ANSI escape sequences are appropriate for the
 * present output.
 *
 * This follows the rules described on https://bixense.com/clicolors/
 * with CLICOLOR defaulted to enabled (and thus ignored).
 */
bool shouldANSI(StandardOutputStream fileno = StandardOutputStream::Stderr);

/**
 * Remove ANSI escape sequences from `s`. Colour codes (`CSI ... m`) are
 * kept unless `filterAll` is set.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

}

#pragma once
///@file

#include "buildjail/libutil/types.hh"

#include <sys/types.h>

namespace buildjail {

/**
 * Name of the user the process is running as, from the passwd entry of
 * the effective uid, or `$USER` if there is none.
 */
std::string getUserName();

/**
 * @return $XDG_RUNTIME_DIR if set and non-empty.
 */
std::optional<Path> getRuntimeDir();

}

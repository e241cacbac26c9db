#include "buildjail/libutil/environment-variables.hh"
#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/users.hh"

#include <pwd.h>
#include <unistd.h>

namespace buildjail {

std::string getUserName()
{
    auto pw = getpwuid(geteuid());
    std::string name = pw ? pw->pw_name : getEnv("USER").value_or("");
    if (name.empty())
        throw Error("cannot figure out user name");
    return name;
}

std::optional<Path> getRuntimeDir()
{
    return getEnvNonEmpty("XDG_RUNTIME_DIR");
}

}

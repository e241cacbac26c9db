#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/users.hh"

#include <unistd.h>

namespace buildjail {

const std::string buildjailVersion = BUILDJAIL_VERSION;

const std::string defaultTimezone = "Asia/Kolkata";

Architecture parseArchitecture(std::string_view s)
{
    if (s == "32") return Architecture::x86;
    if (s == "64") return Architecture::x86_64;
    throw UsageError("unknown architecture '%s', expected '32' or '64'", s);
}

std::string_view architectureBits(Architecture arch)
{
    return arch == Architecture::x86 ? "32" : "64";
}

std::string_view debianArchitecture(Architecture arch)
{
    return arch == Architecture::x86 ? "i386" : "amd64";
}

std::string_view chrootPersonality(Architecture arch)
{
    return arch == Architecture::x86 ? "linux32" : "linux64";
}

Path Settings::getDefaultLockDir()
{
    return getRuntimeDir().value_or("/tmp");
}

Path Settings::getDefaultToolsDir()
{
    try {
        return dirOf(dirOf(readLink("/proc/self/exe")));
    } catch (SysError & e) {
        debug("cannot determine the location of the executable: %s", e.msg());
        return getCwd();
    }
}

ContainerLayout ContainerLayout::forBase(const Path & base, Architecture arch)
{
    ContainerLayout layout;
    layout.base = absPath(base);
    layout.outputDir = layout.base + "/b/linux/" + std::string(architectureBits(arch));
    layout.chrootDir = realPathOrCanon(layout.outputDir + "/chroot");
    layout.imagePath = layout.chrootDir + ".img";
    layout.swDir = layout.outputDir + "/sw";
    layout.sourcesDir = layout.base + "/b/sources-cache";
    layout.tempParent = layout.base + "/b";
    layout.configFile = layout.base + "/linux.conf";
    return layout;
}

void ContainerLayout::ensureDirs() const
{
    for (auto & dir : {outputDir, swDir, sourcesDir})
        createDirs(dir);
}

HostIdentity HostIdentity::current()
{
    return HostIdentity{
        .user = getUserName(),
        .uid = geteuid(),
        .gid = getegid(),
    };
}

}

#pragma once
///@file

#include "buildjail/libutil/config.hh"
#include "buildjail/libutil/types.hh"

#include <cstdint>
#include <string_view>

#include <sys/types.h>

namespace buildjail {

extern const std::string buildjailVersion;

extern const std::string defaultTimezone;

/**
 * Word size of the container. Each one gets its own image, lock and
 * chroot personality.
 */
enum class Architecture { x86, x86_64 };

/**
 * Parse `32` or `64`. Anything else is a UsageError.
 */
Architecture parseArchitecture(std::string_view s);

/**
 * `32` or `64`.
 */
std::string_view architectureBits(Architecture arch);

/**
 * The Debian name of the architecture, used in base image URLs.
 */
std::string_view debianArchitecture(Architecture arch);

/**
 * The `setarch` personality command run inside the chroot.
 */
std::string_view chrootPersonality(Architecture arch);

class Settings : public Config
{
    static Path getDefaultLockDir();

    static Path getDefaultToolsDir();

public:

    Settings() = default;
    Settings(const Settings &) = delete;
    Settings & operator=(const Settings &) = delete;

    Setting<std::string> image{this,
        "https://partner-images.canonical.com/core/xenial/current/ubuntu-xenial-core-cloudimg-{}-root.tar.gz",
        "image",
        R"(
          URL of the base root filesystem archive. `{}` is replaced by
          the Debian architecture name (`amd64` or `i386`). The second
          `-`-separated field of the file name is the release codename.
        )"};

    Setting<Strings> deps{this, {}, "deps",
        "Extra packages installed into the container with `apt-get`."};

    Setting<uint64_t> imageSize{this, 2ULL * 1024 * 1024 * 1024, "image-size",
        R"(
          Size of the loopback image file. Accepts a `K`, `M`, `G` or
          `T` suffix.
        )"};

    PathSetting downloadCache{this, "/tmp", "download-cache",
        "Directory where downloaded base images are cached, keyed by file name."};

    PathSetting lockDir{this, getDefaultLockDir(), "lock-dir",
        "Directory holding the per-architecture session lock files."};

    Setting<std::string> privilegeCommand{this, "sudo", "privilege-command",
        R"(
          Command prefixed to every privileged operation. When empty,
          privileged operations run directly, which only works as root.
        )"};

    Setting<Strings> toolchainPackages{this,
        Strings{
            "build-essential", "software-properties-common", "nasm", "chrpath", "zsh", "git",
            "uuid-dev", "libmount-dev", "apt-transport-https", "dh-autoreconf", "gperf",
        },
        "toolchain-packages",
        "Packages that make up the base toolchain of every container."};

    Setting<std::string> timezone{this, defaultTimezone, "timezone",
        "Time zone (`Area/Zone`) pre-seeded for the `tzdata` package."};

    PathSetting buildShell{this, "/bin/zsh", "build-shell",
        "Login shell of the build user inside the container."};

    Setting<Strings> entryCommand{this, {}, "entry-command",
        R"(
          Command prefixed to the arguments of every run inside the
          container, for instance the path of a build driver script
          below `tools-mount-point`.
        )"};

    PathSetting toolsDir{this, getDefaultToolsDir(), "tools-dir",
        "Host directory mounted read-only into the container."};

    PathSetting toolsMountPoint{this, "/buildjail", "tools-mount-point",
        "Where `tools-dir` appears inside the container."};

    Setting<uint64_t> connectTimeout{this, 0, "connect-timeout",
        R"(
          Timeout in seconds for establishing the connection when
          downloading the base image. `0` keeps the curl default.
        )"};
};

/**
 * Every path belonging to the container of one architecture.
 */
struct ContainerLayout
{
    Path base;
    Path outputDir;
    /**
     * The mount point of the image, symlinks resolved.
     */
    Path chrootDir;
    Path imagePath;
    Path swDir;
    Path sourcesDir;
    /**
     * Parent of per-session temporary directories. Not `/tmp`, which
     * may be a small tmpfs.
     */
    Path tempParent;
    Path configFile;

    static ContainerLayout forBase(const Path & base, Architecture arch);

    /**
     * Create the output, software and sources directories.
     */
    void ensureDirs() const;
};

/**
 * The user the build runs as inside the container.
 */
struct HostIdentity
{
    std::string user;
    uid_t uid;
    gid_t gid;

    static HostIdentity current();
};

/**
 * Everything a session needs to know, fixed at start-up.
 */
struct SessionConfig
{
    Architecture arch;
    ContainerLayout layout;
    const Settings & settings;
    HostIdentity host;
    /**
     * The source tree, mounted read-only at `/src`.
     */
    Path workDir;
    Path toolsDir;
};

}

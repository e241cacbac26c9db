#pragma once
///@file

#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libcontainer/globals.hh"

#include <optional>

namespace buildjail {

/**
 * Runs commands inside the mounted container.
 */
class ChrootRunner
{
    const SessionConfig & config;
    CommandExecutor & executor;

public:
    ChrootRunner(const SessionConfig & config, CommandExecutor & executor);

    const Path & root() const { return config.layout.chrootDir; }

    /**
     * The complete environment of a command run inside the container.
     */
    StringMap environment(bool asRoot, bool forInstall) const;

    /**
     * The host command that runs `cmd` inside the container. Has no
     * side effects.
     */
    Command buildInvocation(const Strings & cmd, bool asRoot, bool forInstall) const;

    /**
     * Run `cmd` inside the container, as the build user unless
     * `asRoot`. A non-zero exit is an ExecError carrying the exit
     * code of `cmd`.
     *
     * @param forInstall Tell Debian tooling not to ask questions.
     * @param input Fed to the command's stdin.
     */
    void run(const Strings & cmd, bool asRoot = false, bool forInstall = false,
        std::optional<std::string> input = {});

    /**
     * Like the above, but `cmd` is split into words with shell
     * quoting rules.
     */
    void run(const std::string & cmd, bool asRoot = false, bool forInstall = false,
        std::optional<std::string> input = {});

    /**
     * Replace the file `path` inside the container (absolute, relative
     * to the container root) with `contents`.
     */
    void writeFile(const Path & path, std::string_view contents);

    /**
     * Copy the host's terminfo entry for the current terminal and its
     * `/etc/resolv.conf` into the container.
     */
    void refreshHostFiles();
};

}

#include "buildjail/libcontainer/chroot.hh"
#include "buildjail/libutil/environment-variables.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/processes.hh"
#include "buildjail/libutil/shlex.hh"
#include "buildjail/libutil/strings.hh"

namespace buildjail {

ChrootRunner::ChrootRunner(const SessionConfig & config, CommandExecutor & executor)
    : config(config)
    , executor(executor)
{
}

StringMap ChrootRunner::environment(bool asRoot, bool forInstall) const
{
    StringMap env{
        {"PATH", "/sbin:/usr/sbin:/usr/local/bin:/bin:/usr/bin"},
        {"HOME", asRoot ? "/root" : "/home/" + config.host.user},
        {"USER", asRoot ? "root" : config.host.user},
        {"TERM", getEnvNonEmpty("TERM").value_or("xterm-256color")},
        {"BUILDJAIL_ARCH", std::string(architectureBits(config.arch)) + "-bit"},
    };
    if (forInstall)
        env["DEBIAN_FRONTEND"] = "noninteractive";
    return env;
}

Command ChrootRunner::buildInvocation(const Strings & cmd, bool asRoot, bool forInstall) const
{
    auto env = environment(asRoot, forInstall);

    Strings args;
    if (!asRoot)
        args.push_back(fmt("--userspec=%d:%d", config.host.uid, config.host.gid));
    args.push_back(root());
    args.push_back(std::string(chrootPersonality(config.arch)));
    args.push_back("--");
    args.push_back("env");
    for (auto & [name, value] : env)
        args.push_back(name + "=" + value);
    args.insert(args.end(), cmd.begin(), cmd.end());

    return Command{
        .program = "chroot",
        .args = std::move(args),
        .privileged = true,
        .environment = std::move(env),
        .logLevel = lvlChatty,
    };
}

void ChrootRunner::run(const Strings & cmd, bool asRoot, bool forInstall, std::optional<std::string> input)
{
    if (cmd.empty())
        throw UsageError("no command to run inside the container");

    refreshHostFiles();

    printInfo("in-chroot: %s", Uncolored(showCommandLine(cmd.front(), Strings(std::next(cmd.begin()), cmd.end()))));

    auto invocation = buildInvocation(cmd, asRoot, forInstall);
    invocation.input = std::move(input);

    auto res = executor.execute(invocation);
    if (!statusOk(res.status))
        throw ExecError(res.status, "command '%1%' %2% inside the container",
            Uncolored(showCommandLine(cmd.front(), Strings(std::next(cmd.begin()), cmd.end()))),
            statusToString(res.status));
}

void ChrootRunner::run(const std::string & cmd, bool asRoot, bool forInstall, std::optional<std::string> input)
{
    auto words = shell_split(cmd);
    run(Strings(words.begin(), words.end()), asRoot, forInstall, std::move(input));
}

void ChrootRunner::writeFile(const Path & path, std::string_view contents)
{
    executor.run({
        .program = "tee",
        .args = {root() + canonPath("/" + path)},
        .privileged = true,
        .input = std::string(contents),
        .discardStdout = true,
        .logLevel = lvlChatty,
    });
}

void ChrootRunner::refreshHostFiles()
{
    auto infocmp = executor.execute({
        .program = "infocmp",
        .captureStdout = true,
        .logLevel = lvlChatty,
    });

    /* The first line reads `#	Reconstructed via infocmp from file: <path>`. */
    auto firstLine = getLine(infocmp.output).first;
    auto colon = firstLine.find(':');
    std::string entry = colon == firstLine.npos ? "" : trim(firstLine.substr(colon + 1));

    if (!statusOk(infocmp.status))
        debug("not copying terminfo: infocmp %s", statusToString(infocmp.status));
    else if (entry.empty() || !pathExists(entry))
        debug("not copying terminfo: no terminfo file in '%s'", firstLine);
    else {
        auto dest = root() + "/usr/share/terminfo/" + std::string(baseNameOf(dirOf(entry)));
        executor.run({.program = "mkdir", .args = {"-p", dest}, .privileged = true, .logLevel = lvlChatty});
        executor.run({.program = "cp", .args = {"-a", entry, dest}, .privileged = true, .logLevel = lvlChatty});
    }

    executor.run({
        .program = "cp",
        .args = {"/etc/resolv.conf", root() + "/etc"},
        .privileged = true,
        .logLevel = lvlChatty,
    });
}

}

#include "tests/recording-executor.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/strings.hh"

#include <algorithm>

namespace buildjail {

std::string showCommand(const Command & cmd)
{
    return (cmd.privileged ? "sudo " : "") + showCommandLine(cmd.program, cmd.args);
}

CommandResult RecordingExecutor::execute(const Command & cmd)
{
    commands.push_back(cmd);

    if (handler)
        if (auto res = handler(cmd))
            return *res;

    std::vector<std::string> args(cmd.args.begin(), cmd.args.end());

    if (cmd.program == "mount") {
        if (args.size() == 3 && args[0] == "--bind")
            mounts.insert_or_assign(args[2], args[1]);
        else if (args.size() == 4 && args[0] == "-t")
            mounts.insert_or_assign(args[3], args[2]);
        else if (args.size() == 2)
            mounts.insert_or_assign(args[1], args[0]);
        else if (args.size() == 3 && args[0] == "-o") {
            if (!mounts.contains(args[2]))
                return {.status = 32 << 8};
        }
        return {};
    }

    if (cmd.program == "umount") {
        if (args.empty() || !mounts.erase(args.back()))
            return {.status = 32 << 8};
        return {};
    }

    /* ImageStore checks that the old mount point is really gone. */
    if (cmd.program == "rm" && args.size() == 2 && args[0] == "-rf") {
        deletePath(args[1]);
        return {};
    }

    /* Behave like a host without terminfo. */
    if (cmd.program == "infocmp")
        return {.status = 1 << 8};

    return {};
}

Strings RecordingExecutor::commandLines() const
{
    Strings res;
    for (auto & cmd : commands)
        res.push_back(showCommand(cmd));
    return res;
}

Strings innerCommand(const Command & invocation)
{
    auto i = std::find(invocation.args.begin(), invocation.args.end(), "env");
    if (i == invocation.args.end())
        return {};
    ++i;
    std::advance(i, std::min<size_t>(
        invocation.environment ? invocation.environment->size() : 0,
        std::distance(i, invocation.args.end())));
    return Strings(i, invocation.args.end());
}

std::vector<Strings> RecordingExecutor::chrootCommands() const
{
    std::vector<Strings> res;
    for (auto & cmd : commands)
        if (cmd.program == "chroot")
            res.push_back(innerCommand(cmd));
    return res;
}

MountTable FakeMountTableReader::currentMounts()
{
    if (broken)
        throw SysError(EIO, "reading the mount table");
    return mounts;
}

void FakeFileTransfer::download(const std::string & uri, const Path & destination)
{
    downloads.push_back(uri);
    if (failure)
        throw FileTransferError(*failure, {}, "unable to download '%s': simulated failure", uri);
    writeFile(destination, "base image of " + uri);
}

}

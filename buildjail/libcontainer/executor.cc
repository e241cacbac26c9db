#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/processes.hh"
#include "buildjail/libutil/shlex.hh"
#include "buildjail/libutil/strings.hh"

namespace buildjail {

std::string CommandExecutor::run(const Command & cmd)
{
    auto res = execute(cmd);
    if (!statusOk(res.status))
        throw ExecError(res.status, "command '%1%' %2%",
            Uncolored(showCommandLine(cmd.program, cmd.args)),
            statusToString(res.status));
    return std::move(res.output);
}

ProcessExecutor::ProcessExecutor(const std::string & privilegeCommand)
{
    for (auto & word : shell_split(privilegeCommand))
        this->privilegeCommand.push_back(word);
}

CommandResult ProcessExecutor::execute(const Command & cmd)
{
    RunOptions opts{
        .program = cmd.program,
        .args = cmd.args,
        .environment = cmd.environment,
        .input = cmd.input,
        .captureStdout = cmd.captureStdout,
        .discardStdout = cmd.discardStdout,
    };

    if (cmd.privileged && !privilegeCommand.empty()) {
        opts.args.push_front(opts.program);
        auto prefix = privilegeCommand;
        opts.program = prefix.front();
        prefix.pop_front();
        opts.args.splice(opts.args.begin(), prefix);
    }

    printMsg(cmd.logLevel, "%s", Uncolored(showCommandLine(opts.program, opts.args)));

    auto [status, output] = runProgram(std::move(opts));
    return CommandResult{.status = status, .output = std::move(output)};
}

}

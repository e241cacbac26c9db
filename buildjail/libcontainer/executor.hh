#pragma once
///@file

#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/types.hh"

#include <optional>

namespace buildjail {

/**
 * One external command, run synchronously to completion.
 */
struct Command
{
    Path program;
    Strings args = {};

    /**
     * Run through the privilege command (`sudo`).
     */
    bool privileged = false;

    /**
     * Replaces the environment of the child when set.
     */
    std::optional<StringMap> environment = {};

    /**
     * Fed to the child's stdin when set. Otherwise stdin is inherited.
     */
    std::optional<std::string> input = {};

    bool captureStdout = false;
    bool discardStdout = false;

    /**
     * Level at which the command line is logged before it runs.
     */
    Verbosity logLevel = lvlInfo;
};

struct CommandResult
{
    /**
     * Wait status, as returned by waitpid().
     */
    int status = 0;
    std::string output;
};

/**
 * Runs external commands on behalf of the container components.
 */
class CommandExecutor
{
public:
    virtual ~CommandExecutor() = default;

    /**
     * Run `cmd` and report how it ended. Only failures to start the
     * command are thrown.
     */
    virtual CommandResult execute(const Command & cmd) = 0;

    /**
     * Like execute(), but a non-zero exit is an ExecError. Returns
     * the captured output.
     */
    std::string run(const Command & cmd);
};

/**
 * Executes commands as child processes of this one.
 */
class ProcessExecutor : public CommandExecutor
{
    Strings privilegeCommand;

public:
    /**
     * @param privilegeCommand Shell-style command line prefixed to
     * privileged commands. Empty means no escalation.
     */
    explicit ProcessExecutor(const std::string & privilegeCommand);

    CommandResult execute(const Command & cmd) override;
};

}

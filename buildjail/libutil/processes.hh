#pragma once
///@file

#include "buildjail/libutil/types.hh"
#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/file-descriptor.hh"

#include <sys/types.h>
#include <unistd.h>
#include <signal.h>

#include <functional>
#include <map>
#include <optional>

namespace buildjail {

class Pid
{
    pid_t pid = -1;
    int killSignal = SIGKILL;
public:
    Pid();
    explicit Pid(pid_t pid): pid(pid) {}
    Pid(Pid && other);
    Pid & operator=(Pid && other);
    ~Pid() noexcept(false);
    explicit operator bool() const { return pid != -1; }
    int kill();
    int wait();

    pid_t release();
    pid_t get() const { return pid; }
};

/**
 * Fork a process that runs the given function, and return the child
 * pid to the caller.
 */
struct ProcessOptions
{
    bool dieWithParent = true;
};

[[nodiscard]]
Pid startProcess(std::function<void()> fun, const ProcessOptions & options = ProcessOptions());

struct RunOptions
{
    Path program;
    bool searchPath = true;
    std::optional<std::string> argv0;
    Strings args = {};
    std::optional<uid_t> uid = {};
    std::optional<uid_t> gid = {};
    std::optional<Path> chdir = {};
    std::optional<std::map<std::string, std::string>> environment = {};
    /**
     * Written to the child's stdin, which is then closed. Without it the
     * child inherits our stdin.
     */
    std::optional<std::string> input = {};
    bool dieWithParent = true;
    bool captureStdout = false;
    /**
     * Send the child's stdout to /dev/null.
     */
    bool discardStdout = false;
};

struct [[nodiscard("you must call RunningProgram::wait()")]] RunningProgram
{
    friend RunningProgram runProgram2(const RunOptions & options);

private:
    Path program;
    Pid pid;
    AutoCloseFD childStdout;
    AutoCloseFD childStdin;

    RunningProgram(PathView program, Pid pid, AutoCloseFD childStdout, AutoCloseFD childStdin);

public:
    RunningProgram() = default;
    RunningProgram(RunningProgram &&) = default;
    RunningProgram & operator=(RunningProgram &&) = default;

    explicit operator bool() const { return bool(pid); }

    int kill();
    [[nodiscard]]
    int wait();
    void waitAndCheck();

    /**
     * Feed `input` to the child's stdin and drain its stdout (if
     * captured) until both are done.
     */
    std::string communicate(std::optional<std::string_view> input);
};

/**
 * Run a program and return its stdout in a string (i.e., like the
 * shell backtick operator). Throws ExecError on a non-zero status.
 */
std::string runProgram(
    Path program,
    bool searchPath = false,
    const Strings args = Strings()
);

/**
 * Run a program to completion. Output = wait status + captured stdout.
 */
std::pair<int, std::string> runProgram(RunOptions options);

RunningProgram runProgram2(const RunOptions & options);

/**
 * Exit code the current process should use to report a child that
 * ended with wait status `status`: its exit code, 128 + signal number
 * if it was killed, 1 otherwise.
 */
unsigned int statusToExitCode(int status);

class ExecError : public Error
{
public:
    /**
     * Raw wait status of the child.
     */
    int status;

    template<typename... Args>
    ExecError(int status, const Args & ... args)
        : Error(args...), status(status)
    {
        withExitStatus(statusToExitCode(status));
    }
};

/**
 * Convert the exit status of a child as returned by wait() into an
 * error string.
 */
std::string statusToString(int status);

bool statusOk(int status);

}

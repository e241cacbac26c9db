#include "buildjail/libutil/environment-variables.hh"
#include "buildjail/libutil/finally.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/processes.hh"
#include "buildjail/libutil/strings.hh"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <thread>

#include <grp.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace buildjail {

Pid::Pid()
{
}


Pid::Pid(Pid && other) : pid(other.pid), killSignal(other.killSignal)
{
    other.pid = -1;
}


Pid & Pid::operator=(Pid && other)
{
    Pid tmp(std::move(other));
    std::swap(pid, tmp.pid);
    std::swap(killSignal, tmp.killSignal);
    return *this;
}


Pid::~Pid() noexcept(false)
{
    if (pid != -1) kill();
}


int Pid::kill()
{
    debug("killing process %1%", pid);

    if (::kill(pid, killSignal) != 0)
        logError(SysError("killing process %d", pid).info());

    return wait();
}


int Pid::wait()
{
    if (pid == -1)
        throw Error("waiting for a process that was already reaped");
    while (1) {
        int status;
        int res = waitpid(pid, &status, 0);
        if (res == pid) {
            pid = -1;
            return status;
        }
        if (errno != EINTR)
            throw SysError("cannot get exit status of PID %d", pid);
    }
}


pid_t Pid::release()
{
    pid_t p = pid;
    pid = -1;
    return p;
}


//////////////////////////////////////////////////////////////////////


Pid startProcess(std::function<void()> fun, const ProcessOptions & options)
{
    pid_t pid = fork();
    if (pid == -1) throw SysError("unable to fork");
    if (pid != 0) return Pid{pid};

    logger = makeSimpleLogger();
    try {
        if (options.dieWithParent && prctl(PR_SET_PDEATHSIG, SIGKILL) == -1)
            throw SysError("setting death signal");
        fun();
    } catch (std::exception & e) {
        try {
            std::cerr << e.what() << "\n";
        } catch (...) { }
    } catch (...) { }
    _exit(1);
}

std::string runProgram(Path program, bool searchPath, const Strings args)
{
    auto res = runProgram(RunOptions{
        .program = program, .searchPath = searchPath, .args = args, .captureStdout = true
    });

    if (!statusOk(res.first))
        throw ExecError(res.first, "program '%1%' %2%", program, statusToString(res.first));

    return res.second;
}

std::pair<int, std::string> runProgram(RunOptions options)
{
    auto proc = runProgram2(options);
    auto childStdout = proc.communicate(options.input);
    int status = proc.wait();
    return {status, std::move(childStdout)};
}

RunningProgram::RunningProgram(PathView program, Pid pid, AutoCloseFD childStdout, AutoCloseFD childStdin)
    : program(program)
    , pid(std::move(pid))
    , childStdout(std::move(childStdout))
    , childStdin(std::move(childStdin))
{
}

int RunningProgram::kill()
{
    return pid.kill();
}

int RunningProgram::wait()
{
    return pid.wait();
}

void RunningProgram::waitAndCheck()
{
    if (std::uncaught_exceptions() == 0) {
        int status = pid.wait();
        if (status)
            throw ExecError(status, "program '%1%' %2%", program, statusToString(status));
    } else {
        pid.kill();
        debug("killed subprocess %1% during exception handling", program);
    }
}

std::string RunningProgram::communicate(std::optional<std::string_view> input)
{
    std::string result;
    std::exception_ptr writeError;

    {
        std::thread writerThread;
        Finally doJoin([&]() {
            if (writerThread.joinable()) writerThread.join();
        });

        if (childStdin) {
            writerThread = std::thread([&]() {
                try {
                    if (input) writeFull(childStdin.get(), *input);
                } catch (SysError & e) {
                    /* The child is free not to read all of its input. */
                    if (e.errNo != EPIPE)
                        writeError = std::current_exception();
                } catch (Error &) {
                    writeError = std::current_exception();
                }
                try {
                    childStdin.close();
                } catch (Error &) {
                    if (!writeError) writeError = std::current_exception();
                }
            });
        }

        if (childStdout) {
            result = drainFD(childStdout.get());
            childStdout.close();
        }
    }

    if (writeError) std::rethrow_exception(writeError);

    return result;
}

RunningProgram runProgram2(const RunOptions & options)
{
    Pipe out, in;
    if (options.captureStdout) out.create();
    if (options.input) in.create();

    printMsg(lvlChatty, "running command: %s", Uncolored(showCommandLine(options.program, options.args)));

    Pid pid{startProcess([&]() {
        if (options.environment)
            replaceEnv(*options.environment);
        if (options.input && dup2(in.readSide.get(), STDIN_FILENO) == -1)
            throw SysError("dupping stdin");
        if (options.captureStdout && dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
            throw SysError("dupping stdout");
        if (options.discardStdout && !options.captureStdout) {
            AutoCloseFD devNull{open("/dev/null", O_WRONLY | O_CLOEXEC)};
            if (!devNull || dup2(devNull.get(), STDOUT_FILENO) == -1)
                throw SysError("redirecting stdout to /dev/null");
        }

        if (options.chdir && chdir((*options.chdir).c_str()) == -1)
            throw SysError("chdir failed");

        if (options.gid && setgid(*options.gid) == -1)
            throw SysError("setgid failed");
        /* Drop all other groups if we're setgid. */
        if (options.gid && setgroups(0, 0) == -1)
            throw SysError("setgroups failed");
        if (options.uid && setuid(*options.uid) == -1)
            throw SysError("setuid failed");

        Strings args_(options.args);
        args_.push_front(options.argv0.value_or(options.program));

        if (options.searchPath)
            execvp(options.program.c_str(), stringsToCharPtrs(args_).data());
        else
            execv(options.program.c_str(), stringsToCharPtrs(args_).data());

        throw SysError("executing '%1%'", options.program);
    }, ProcessOptions{.dieWithParent = options.dieWithParent})};

    out.writeSide.close();
    in.readSide.close();

    return RunningProgram{
        options.program,
        std::move(pid),
        options.captureStdout ? std::move(out.readSide) : AutoCloseFD{},
        options.input ? std::move(in.writeSide) : AutoCloseFD{}
    };
}

unsigned int statusToExitCode(int status)
{
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0)
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return 1;
}

std::string statusToString(int status)
{
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (WIFEXITED(status))
            return fmt("failed with exit code %1%", WEXITSTATUS(status));
        else if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            return fmt("failed due to signal %1% (%2%)", sig, strsignal(sig));
        }
        else
            return "died abnormally";
    } else return "succeeded";
}


bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}

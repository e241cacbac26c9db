#include "buildjail/libmain/shared.hh"
#include "buildjail/libmain/loggers.hh"
#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libutil/ansicolor.hh"
#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/logging.hh"

#include <iostream>

#include <signal.h>
#include <sys/stat.h>

namespace buildjail {

std::string getArg(const std::string & opt,
    Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end) throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void initBuildjail()
{
    createDefaultLogger();

    /* Reset SIGCHLD to its default. */
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;

    act.sa_handler = SIG_DFL;
    if (sigaction(SIGCHLD, &act, 0))
        throw SysError("resetting SIGCHLD");

    /* A dead `tee` must not kill us; writeFull() reports EPIPE. */
    act.sa_handler = SIG_IGN;
    if (sigaction(SIGPIPE, &act, 0))
        throw SysError("ignoring SIGPIPE");

    umask(0022);
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% %2%", programName, buildjailVersion) << std::endl;
    throw Exit();
}

void printHelp(const std::string & usage)
{
    std::cout << usage;
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<int()> fun)
{
    try {
        return fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1%' for more information.", programName + " --help");
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (const std::bad_alloc & e) {
        printError(ANSI_RED "error:" ANSI_NORMAL " out of memory");
        return 1;
    }
    // Other std exceptions are left to std::terminate, which produces
    // a more useful crash than anything we could print here.
}

}

#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libcontainer/filetransfer.hh"
#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libcontainer/session.hh"
#include "buildjail/libmain/loggers.hh"
#include "buildjail/libmain/shared.hh"
#include "buildjail/libutil/environment-variables.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/mount.hh"

#include <chrono>

namespace buildjail {

static const std::string usage = R"(Usage: buildjail [options] [32|64] [shutdown | container | show-config | <command>...]

Run a command inside a chroot build container, creating the container
first if it does not exist yet. The architecture defaults to 64.

Requests:
  shutdown            remove all mounts of the container and exit
  container           rebuild the container image
  show-config         print the effective settings as JSON
  <command>...        run the command inside the container (default)

Options:
  --base-dir <dir>        directory holding linux.conf and the build output
                          (default: $BUILDJAIL_BASE_DIR or ./bypy)
  -v, --verbose           increase verbosity, may be repeated
  --quiet                 decrease verbosity
  --log-format raw|json   format of log messages on stderr
  --option <name> <value> override a setting of linux.conf
  --help                  show this help
  --version               show the version
)";

enum class Request { Run, Shutdown, Container, ShowConfig };

static int main_buildjail(const std::string & programName, Strings argv)
{
    initBuildjail();

    Path baseDir = getEnvNonEmpty("BUILDJAIL_BASE_DIR").value_or(getCwd() + "/bypy");
    std::optional<Architecture> arch;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<Request> request;
    Strings args;

    auto end = argv.end();
    for (auto arg = argv.begin(); arg != end; ++arg) {
        if (request) {
            if (*request != Request::Run)
                throw UsageError("'%s' does not take arguments", *arg);
            args.push_back(*arg);
        }
        else if (*arg == "--help")
            printHelp(usage);
        else if (*arg == "--version")
            printVersion(programName);
        else if (*arg == "--base-dir")
            baseDir = getArg(*arg, arg, end);
        else if (*arg == "-v" || *arg == "--verbose")
            verbosity = verbosityFromIntClamped(int(verbosity) + 1);
        else if (*arg == "--quiet")
            verbosity = verbosityFromIntClamped(int(verbosity) - 1);
        else if (*arg == "--log-format") {
            auto s = getArg(*arg, arg, end);
            auto format = parseLogFormat(s);
            if (!format)
                throw UsageError("unknown log format '%s', expected 'raw' or 'json'", s);
            setLogFormat(*format);
        }
        else if (*arg == "--option") {
            auto name = getArg(*arg, arg, end);
            auto value = getArg(*arg, arg, end);
            overrides.emplace_back(name, value);
        }
        else if (*arg == "--")
            request = Request::Run;
        else if (!arch && (*arg == "32" || *arg == "64"))
            arch = parseArchitecture(*arg);
        else if (arg->starts_with("-"))
            throw UsageError("unrecognised flag '%1%'", *arg);
        else if (*arg == "shutdown")
            request = Request::Shutdown;
        else if (*arg == "container")
            request = Request::Container;
        else if (*arg == "show-config")
            request = Request::ShowConfig;
        else {
            request = Request::Run;
            args.push_back(*arg);
        }
    }

    auto layout = ContainerLayout::forBase(baseDir, arch.value_or(Architecture::x86_64));

    Settings settings;
    settings.applyConfigFile(layout.configFile);
    for (auto & [name, value] : overrides)
        if (!settings.set(name, value))
            throw UsageError("unknown setting '%s'", name);
    settings.warnUnknownSettings();

    if (request == Request::ShowConfig) {
        logger->cout("%s", settings.toJSON().dump(2));
        return 0;
    }

    const SessionConfig config{
        .arch = arch.value_or(Architecture::x86_64),
        .layout = layout,
        .settings = settings,
        .host = HostIdentity::current(),
        .workDir = getCwd(),
        .toolsDir = settings.toolsDir,
    };

    ProcessExecutor executor(settings.privilegeCommand);
    ProcMountTableReader mountReader;
    auto transfer = makeCurlFileTransfer(std::chrono::seconds(settings.connectTimeout.get()));

    Session session(config, executor, mountReader, *transfer);
    session.acquireLock();
    layout.ensureDirs();

    switch (request.value_or(Request::Run)) {
    case Request::Shutdown:
        session.shutdown();
        break;
    case Request::Container:
        session.rebuild();
        break;
    default:
        session.ensureImage();
        session.run(args);
        break;
    }

    session.teardown();
    return 0;
}

}

int main(int argc, char ** argv)
{
    std::string programName = std::string(buildjail::baseNameOf(argv[0]));
    return buildjail::handleExceptions(programName, [&]() {
        return buildjail::main_buildjail(programName, buildjail::Strings(argv + 1, argv + argc));
    });
}

#include "buildjail/libcontainer/provisioner.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/strings.hh"

namespace buildjail {

std::string imageName(std::string_view url)
{
    auto fields = tokenizeString<std::vector<std::string>>(uriFileName(url), "-");
    if (fields.size() < 2)
        throw UsageError("cannot determine the release name of base image '%s'", url);
    return fields[1];
}

bool isLegacyImage(std::string_view name)
{
    return name == "xenial" || name == "bionic";
}

DeviceBinds::DeviceBinds(CommandExecutor & executor, const Path & root)
    : executor(executor)
{
    try {
        for (auto dev : {"random", "urandom"}) {
            auto source = fmt("/dev/%s", dev);
            auto target = root + source;
            executor.run({.program = "touch", .args = {target}, .privileged = true, .logLevel = lvlChatty});
            executor.run({.program = "mount", .args = {"--bind", source, target}, .privileged = true, .logLevel = lvlChatty});
            mounted.push_back(target);
        }
    } catch (...) {
        release();
        throw;
    }
}

void DeviceBinds::release()
{
    while (!mounted.empty()) {
        auto target = mounted.back();
        mounted.pop_back();
        try {
            executor.run({.program = "umount", .args = {"-l", target}, .privileged = true, .logLevel = lvlChatty});
        } catch (Error & e) {
            logError(e.info());
        }
    }
}

DeviceBinds::~DeviceBinds()
{
    try {
        release();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

Provisioner::Provisioner(
    const SessionConfig & config,
    ImageStore & image,
    ChrootRunner & chroot,
    CommandExecutor & executor,
    FileTransfer & transfer)
    : config(config)
    , image(image)
    , chroot(chroot)
    , executor(executor)
    , transfer(transfer)
{
}

std::string Provisioner::imageUrl() const
{
    return replaceStrings(config.settings.image, "{}", std::string(debianArchitecture(config.arch)));
}

void Provisioner::provision()
{
    auto url = imageUrl();
    auto name = imageName(url);

    notice("building a %s-bit container image from '%s'", architectureBits(config.arch), url);

    auto archive = downloadCached(transfer, url, config.settings.downloadCache);

    image.create(config.settings.imageSize);
    image.mount();

    executor.run({
        .program = "tar",
        .args = {"-C", image.root(), "-xpf", archive},
        .privileged = true,
        .logLevel = lvlTalkative,
    });

    createBuildUser();
    disableServices();

    /* Translations only slow down `apt-get update`. */
    chroot.writeFile("/etc/apt/apt.conf.d/chroot-no-languages", "Acquire::Languages \"none\";");

    {
        DeviceBinds devices(executor, image.root());
        installPackages(name);
    }

    notice("container image '%s' is ready", image.image());
}

void Provisioner::createBuildUser()
{
    auto & host = config.host;
    if (host.gid != 100)
        chroot.run(Strings{"groupadd", "-f", "-g", std::to_string(host.gid), "crusers"}, true);
    chroot.run(Strings{
        "useradd",
        "--home-dir=/home/" + host.user,
        "--create-home",
        fmt("--uid=%d", host.uid),
        fmt("--gid=%d", host.gid),
        host.user,
    }, true);
}

void Provisioner::disableServices()
{
    chroot.writeFile("/usr/sbin/policy-rc.d", "#!/bin/sh\nexit 101");
    chroot.run("chmod +x /usr/sbin/policy-rc.d", true);
    /* Upstart jobs ignore policy-rc.d. */
    chroot.run("dpkg-divert --local --rename --add /sbin/initctl", true);
    chroot.run("cp -a /usr/sbin/policy-rc.d /sbin/initctl", true);
    chroot.run("sed -i 's/^exit.*/exit 0/' /sbin/initctl", true);
}

void Provisioner::installPackages(const std::string & name)
{
    auto install = [&](const std::string & cmd, std::optional<std::string> input = {}) {
        chroot.run(cmd, true, true, std::move(input));
    };
    auto aptInstall = [&](const Strings & packages) {
        Strings cmd{"apt-get", "install", "-y"};
        cmd.insert(cmd.end(), packages.begin(), packages.end());
        chroot.run(cmd, true, true);
    };

    const std::string & timezone = config.settings.timezone;
    auto slash = timezone.find('/');
    if (slash == timezone.npos || slash == 0 || slash + 1 == timezone.size())
        throw UsageError("setting 'timezone' has invalid value '%s', expected 'Area/Zone'", timezone);
    auto area = timezone.substr(0, slash);
    auto zone = timezone.substr(slash + 1);

    install("debconf-set-selections", fmt("tzdata tzdata/Areas select %s\n", area));
    install("debconf-set-selections", fmt("tzdata tzdata/Zones/%s select %s\n", area, zone));
    install("debconf-show tzdata");
    install("apt-get update");
    /* tzdata still asks for the area and zone number on some releases.
       The menu numbers are only known for the default zone, other zones
       rely on the debconf selections. */
    std::optional<std::string> tzdataAnswers;
    if (timezone == defaultTimezone)
        tzdataAnswers = "6\n44\n";
    install("apt-get install -y tzdata", tzdataAnswers);

    if (!config.settings.toolchainPackages.get().empty())
        aptInstall(config.settings.toolchainPackages);

    if (isLegacyImage(name)) {
        debug("'%s' needs Python and CMake from third-party repositories", name);

        install("add-apt-repository ppa:deadsnakes/ppa -y");
        install("apt-get update");
        install("apt-get install -y python3.9 python3.9-venv");
        install("sh -c 'ln -sf `which python3.9` `which python3`'");
        install("python3 -m ensurepip --upgrade --default-pip");

        const Path keyring = "/usr/share/keyrings/kitware-archive-keyring.gpg";
        chroot.run(Strings{"sh", "-c",
            "curl https://apt.kitware.com/keys/kitware-archive-latest.asc | gpg --dearmor - > " + keyring},
            true, true);
        chroot.run(Strings{"sh", "-c",
            fmt("echo 'deb [signed-by=%s] https://apt.kitware.com/ubuntu/ %s main' > /etc/apt/sources.list.d/kitware.list",
                keyring, name)},
            true, true);
        install("apt-get update");
        chroot.run(Strings{"rm", keyring}, true, true);
        install("apt-get install -y kitware-archive-keyring");
        install("apt-get install -y cmake");
    } else {
        install("apt-get install -y python-is-python3 python3-pip");
        install("apt-get install -y cmake");
    }

    install("python3 -m pip install ninja");
    install("python3 -m pip install meson");

    if (!config.settings.deps.get().empty())
        aptInstall(config.settings.deps);

    install("apt-get clean");
    chroot.run(Strings{"chsh", "-s", config.settings.buildShell, config.host.user}, true, true);
}

}

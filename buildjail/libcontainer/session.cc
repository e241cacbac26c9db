#include "buildjail/libcontainer/session.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/hash.hh"
#include "buildjail/libutil/logging.hh"

namespace buildjail {

Path sessionLockPath(const SessionConfig & config)
{
    return fmt("%s/buildjail-%s-%s",
        config.settings.lockDir.get(),
        architectureBits(config.arch),
        compressHash(hashString(HashType::SHA256, config.workDir), 8)
            .to_string(HashFormat::Base16, false));
}

Session::Session(
    const SessionConfig & config,
    CommandExecutor & executor,
    MountTableReader & mountReader,
    FileTransfer & transfer)
    : config(config)
    , image(config.layout.imagePath, config.layout.chrootDir, executor, mountReader)
    , orchestrator(config, executor, mountReader, image)
    , chroot(config, executor)
    , provisioner(config, image, chroot, executor, transfer)
{
}

Session::~Session()
{
    try {
        teardown();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void Session::acquireLock()
{
    createDirs(config.settings.lockDir);
    lock = tryLockPath(sessionLockPath(config));
    if (!lock)
        throw LockContention("Another instance of the linux container is running");
    state = SessionState::LockAcquired;
}

void Session::ensureImage()
{
    state = SessionState::ImageChecked;
    if (!image.exists()) {
        printInfo("no container image at '%s'", image.image());
        provisionImage();
    } else
        image.mount();
    state = SessionState::Mounted;
}

void Session::rebuild()
{
    provisionImage();
    state = SessionState::Mounted;
}

void Session::provisionImage()
{
    state = SessionState::Provisioning;

    /* Leftovers of a crashed session would keep the old image busy. */
    orchestrator.unmountAll();

    try {
        provisioner.provision();
    } catch (BaseError & e) {
        quarantineImage();
        throw ProvisioningFailure(e.info());
    } catch (std::exception &) {
        quarantineImage();
        throw;
    }
}

void Session::quarantineImage()
{
    try {
        orchestrator.unmountAll();
    } catch (Error & e) {
        logError(e.info());
    }
    image.quarantine();
}

void Session::run(const Strings & args)
{
    Strings cmd = config.settings.entryCommand.get();
    cmd.insert(cmd.end(), args.begin(), args.end());
    if (cmd.empty())
        cmd.push_back(config.settings.buildShell.get());

    auto tempDir = createTempSubdir(config.layout.tempParent, "tmp");
    AutoDelete deleteTempDir(tempDir);

    state = SessionState::Running;
    try {
        orchestrator.mountAll(tempDir);
        chroot.run(cmd);
    } catch (...) {
        try {
            orchestrator.unmountAll();
        } catch (Error & e) {
            logError(e.info());
        }
        throw;
    }
    orchestrator.unmountAll();
}

void Session::shutdown()
{
    orchestrator.unmountAll();
}

void Session::teardown()
{
    if (state == SessionState::TornDown)
        return;
    image.unmount();
    lock.reset();
    state = SessionState::TornDown;
}

}

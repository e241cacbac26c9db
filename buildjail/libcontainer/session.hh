#pragma once
///@file

#include "buildjail/libcontainer/chroot.hh"
#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libcontainer/filetransfer.hh"
#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libcontainer/image-store.hh"
#include "buildjail/libcontainer/mount-orchestrator.hh"
#include "buildjail/libcontainer/pathlocks.hh"
#include "buildjail/libcontainer/provisioner.hh"
#include "buildjail/libutil/mount.hh"

#include <optional>

namespace buildjail {

MakeError(LockContention, Error);

enum class SessionState {
    Idle,
    LockAcquired,
    ImageChecked,
    Provisioning,
    Mounted,
    Running,
    TornDown,
};

/**
 * The lock file (without the `.lock` suffix) guarding the container
 * of `config.arch` for `config.workDir`.
 */
Path sessionLockPath(const SessionConfig & config);

/**
 * One invocation of the container: lock, image, mounts, command,
 * teardown.
 */
class Session
{
    const SessionConfig & config;
    ImageStore image;
    MountOrchestrator orchestrator;
    ChrootRunner chroot;
    Provisioner provisioner;
    std::optional<PathLock> lock;
    SessionState state = SessionState::Idle;

    void provisionImage();

    /**
     * Unmount whatever a failed provisioning left behind and move the
     * image out of the way.
     */
    void quarantineImage();

public:
    Session(
        const SessionConfig & config,
        CommandExecutor & executor,
        MountTableReader & mountReader,
        FileTransfer & transfer);

    Session(const Session &) = delete;

    ~Session();

    /**
     * Take the lock of this architecture and working directory, or
     * throw LockContention if another session holds it.
     */
    void acquireLock();

    /**
     * Build the image if there is none, otherwise mount it.
     */
    void ensureImage();

    /**
     * Build a fresh image, replacing the current one.
     */
    void rebuild();

    /**
     * Run `entry-command` followed by `args` inside the container as
     * the build user, with the session mounts in place. They are
     * removed again however the command ends.
     */
    void run(const Strings & args);

    /**
     * Remove every mount of this container, including ones left
     * behind by earlier sessions.
     */
    void shutdown();

    /**
     * Unmount the image and release the lock. Idempotent.
     */
    void teardown();

    SessionState getState() const { return state; }

    ImageStore & getImage() { return image; }
};

}

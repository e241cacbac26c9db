#include "buildjail/libcontainer/image-store.hh"
#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"

#include <fcntl.h>
#include <unistd.h>

namespace buildjail {

ImageStore::ImageStore(Path imagePath, Path mountPoint, CommandExecutor & executor, MountTableReader & mountReader)
    : imagePath(std::move(imagePath))
    , mountPoint(std::move(mountPoint))
    , executor(executor)
    , mountReader(mountReader)
{
}

bool ImageStore::exists() const
{
    return pathExists(imagePath);
}

void ImageStore::create(uint64_t sizeBytes)
{
    if (isMounted())
        throw StorageError("refusing to recreate image '%s' while '%s' is mounted", imagePath, mountPoint);

    /* A previous image may have left root-owned files behind. */
    if (pathExists(mountPoint))
        executor.run({.program = "rm", .args = {"-rf", mountPoint}, .privileged = true});
    if (pathExists(imagePath)) {
        try {
            deletePath(imagePath);
        } catch (SysError & e) {
            debug("%s", e.msg());
        }
    }
    if (pathExists(mountPoint))
        throw StorageError("could not remove the old mount point '%s'", mountPoint);
    if (pathExists(imagePath))
        throw StorageError("could not remove the old image '%s'", imagePath);

    createDirs(mountPoint);

    {
        AutoCloseFD fd{open(imagePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644)};
        if (!fd)
            throw SysError("creating image file '%s'", imagePath);
        if (ftruncate(fd.get(), sizeBytes) == -1)
            throw SysError("allocating %d bytes for image file '%s'", sizeBytes, imagePath);
        fd.close();
    }

    executor.run({.program = "mkfs.ext4", .args = {imagePath}});
}

void ImageStore::mount()
{
    if (isMounted()) {
        debug("'%s' is already mounted", mountPoint);
        return;
    }
    executor.run({.program = "mount", .args = {imagePath, mountPoint}, .privileged = true});
    state = MountState::Mounted;
}

void ImageStore::unmount()
{
    if (!isMounted())
        return;
    executor.run({.program = "umount", .args = {mountPoint}, .privileged = true});
    state = MountState::Unmounted;
}

bool ImageStore::isMounted()
{
    try {
        auto mounted = mountReader.currentMounts().contains(mountPoint);
        state = mounted ? MountState::Mounted : MountState::Unmounted;
        return mounted;
    } catch (SysError & e) {
        debug("cannot read the mount table, assuming '%s' is %s: %s",
            mountPoint, state == MountState::Mounted ? "mounted" : "not mounted", e.msg());
        return state == MountState::Mounted;
    }
}

void ImageStore::quarantine()
{
    if (!pathExists(imagePath))
        return;
    auto failed = imagePath + ".failed";
    printError("moving the broken image '%s' to '%s'", imagePath, failed);
    renameFile(imagePath, failed);
}

}

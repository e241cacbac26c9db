#pragma once
///@file

#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/mount.hh"
#include "buildjail/libutil/types.hh"

#include <cstdint>

namespace buildjail {

MakeError(StorageError, Error);

enum class MountState { Unmounted, Mounted };

/**
 * The loopback image file of one container and its mount point.
 *
 * The mount state is never persisted. `isMounted()` asks the live
 * mount table; the state tracked by this object is only used when the
 * table cannot be read.
 */
class ImageStore
{
    Path imagePath;
    Path mountPoint;
    CommandExecutor & executor;
    MountTableReader & mountReader;
    MountState state = MountState::Unmounted;

public:
    ImageStore(Path imagePath, Path mountPoint, CommandExecutor & executor, MountTableReader & mountReader);

    const Path & image() const { return imagePath; }
    const Path & root() const { return mountPoint; }

    /**
     * Whether the image file is present.
     */
    bool exists() const;

    /**
     * Replace any existing image with a freshly formatted, empty one
     * of `sizeBytes`, and recreate an empty mount point.
     */
    void create(uint64_t sizeBytes);

    void mount();

    void unmount();

    bool isMounted();

    /**
     * Move a (possibly half-built) image out of the way, to
     * `<image>.failed`.
     */
    void quarantine();

    /**
     * Record that the mount point has been unmounted by someone else.
     */
    void markUnmounted() { state = MountState::Unmounted; }

    MountState mountState() const { return state; }
};

}

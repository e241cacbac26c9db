#pragma once
///@file

#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libcontainer/image-store.hh"
#include "buildjail/libutil/mount.hh"

#include <vector>

namespace buildjail {

struct MountEntry
{
    Path source;
    /**
     * Relative to the container root.
     */
    Path destination;
    bool readOnly = false;
    /**
     * Empty for bind mounts.
     */
    std::string fsType = "";
};

/**
 * Sets up and tears down the mounts a build needs inside the
 * container, on top of the image mount owned by the ImageStore.
 */
class MountOrchestrator
{
    const SessionConfig & config;
    CommandExecutor & executor;
    MountTableReader & mountReader;
    ImageStore & image;

public:
    MountOrchestrator(
        const SessionConfig & config,
        CommandExecutor & executor,
        MountTableReader & mountReader,
        ImageStore & image);

    /**
     * The mounts of a session using `tempDir` as its `/tmp`, in the
     * order they are applied.
     */
    std::vector<MountEntry> mountEntries(const Path & tempDir) const;

    /**
     * Where `entry` ends up on the host.
     */
    Path hostDestination(const MountEntry & entry) const;

    /**
     * Apply every entry of mountEntries() whose destination is not a
     * mount point yet.
     */
    void mountAll(const Path & tempDir);

    /**
     * Lazily unmount everything at or below the container root,
     * deepest first, except what lives below the `/src` alias. This
     * includes the image itself.
     */
    void unmountAll();
};

}

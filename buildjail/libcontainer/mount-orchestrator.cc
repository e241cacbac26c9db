#include "buildjail/libcontainer/mount-orchestrator.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"

#include <algorithm>

namespace buildjail {

MountOrchestrator::MountOrchestrator(
    const SessionConfig & config,
    CommandExecutor & executor,
    MountTableReader & mountReader,
    ImageStore & image)
    : config(config)
    , executor(executor)
    , mountReader(mountReader)
    , image(image)
{
}

std::vector<MountEntry> MountOrchestrator::mountEntries(const Path & tempDir) const
{
    return {
        {.source = tempDir, .destination = "/tmp"},
        {.source = config.layout.swDir, .destination = "/sw"},
        {.source = config.workDir, .destination = "/src", .readOnly = true},
        {.source = config.layout.sourcesDir, .destination = "/sources"},
        {.source = config.toolsDir, .destination = config.settings.toolsMountPoint, .readOnly = true},
        {.source = "/dev", .destination = "/dev"},
        {.source = "proc", .destination = "/proc", .fsType = "proc"},
        {.source = "sys", .destination = "/sys", .fsType = "sysfs"},
        {.source = "/dev/shm", .destination = "/dev/shm"},
    };
}

Path MountOrchestrator::hostDestination(const MountEntry & entry) const
{
    /* Canonicalised against `/` so `..` cannot leave the container.
       Not resolving symlinks: they would be interpreted relative to
       the host root. */
    auto dest = canonPath("/" + entry.destination);
    return dest == "/" ? image.root() : image.root() + dest;
}

void MountOrchestrator::mountAll(const Path & tempDir)
{
    auto mounts = mountReader.currentMounts();

    auto privileged = [&](Path program, Strings args) {
        executor.run({
            .program = std::move(program),
            .args = std::move(args),
            .privileged = true,
            .logLevel = lvlChatty,
        });
    };

    for (auto & entry : mountEntries(tempDir)) {
        auto dest = hostDestination(entry);
        if (mounts.contains(dest)) {
            debug("'%s' is already mounted", dest);
            continue;
        }

        debug("mounting '%s' on '%s'", entry.source, dest);

        if (entry.fsType.empty()) {
            privileged("mkdir", {"-p", dest});
            privileged("mount", {"--bind", entry.source, dest});
            if (entry.readOnly)
                privileged("mount", {"-o", "remount,ro,bind", dest});
            if (entry.destination == "/dev/shm")
                privileged("chmod", {"a+w", dest});
        } else
            privileged("mount", {"-t", entry.fsType, entry.source, dest});

        mounts.emplace(dest, entry.source);
    }
}

void MountOrchestrator::unmountAll()
{
    auto & root = image.root();
    auto protectedDir = root + "/src";

    /* A mount point can carry several stacked mounts, but not an
       unbounded number of them. */
    constexpr unsigned int maxAttempts = 16;
    std::map<Path, unsigned int> attempts;

    while (true) {
        auto mounts = mountReader.currentMounts();

        std::vector<Path> points;
        for (auto & [point, source] : mounts)
            if (isDirOrInDir(point, root) && !isInDir(point, protectedDir))
                points.push_back(point);

        if (points.empty())
            break;

        auto deepest = std::max_element(points.begin(), points.end(),
            [](const Path & a, const Path & b) { return a.size() < b.size(); });

        if (++attempts[*deepest] > maxAttempts)
            throw Error("'%s' is still mounted after unmounting it %d times", *deepest, maxAttempts);

        executor.run({
            .program = "umount",
            .args = {"-l", *deepest},
            .privileged = true,
            .logLevel = lvlChatty,
        });
    }

    image.markUnmounted();
}

}

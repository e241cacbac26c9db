#include "buildjail/libcontainer/pathlocks.hh"
#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/types.hh"

#include <cerrno>

#include <fcntl.h>
#include <optional>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/file.h>


namespace buildjail {


AutoCloseFD openLockFile(const Path & path, bool create)
{
    AutoCloseFD fd{open(path.c_str(), O_CLOEXEC | O_RDWR | (create ? O_CREAT : 0), 0600)};
    if (!fd && (create || errno != ENOENT))
        throw SysError("opening lock file '%1%'", path);

    return fd;
}


static int convertLockType(LockType lockType)
{
    if (lockType == ltRead) return LOCK_SH;
    return LOCK_EX;
}

void lockFile(int fd, LockType lockType)
{
    int type = convertLockType(lockType);

    while (flock(fd, type) != 0) {
        if (errno != EINTR)
            throw SysError("acquiring lock");
    }
}

bool tryLockFile(int fd, LockType lockType)
{
    int type = convertLockType(lockType);

    while (flock(fd, type | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) return false;
        if (errno != EINTR)
            throw SysError("acquiring lock");
    }

    return true;
}

void unlockFile(int fd)
{
    while (flock(fd, LOCK_UN) != 0) {
        if (errno != EINTR) {
            throw SysError("releasing lock");
        }
    }
}


static bool isPathLockValid(AutoCloseFD & fd, const Path & lockPath)
{
    /* Check that the lock file hasn't become stale (i.e.,
       hasn't been unlinked). */
    struct stat st;
    if (fstat(fd.get(), &st) == -1)
        throw SysError("statting lock file '%1%'", lockPath);
    if (st.st_nlink == 0) {
        /* The previous holder unlinked the file after we opened it,
           so somebody else may already hold a lock on a fresh file
           at `lockPath`. Retry. */
        debug("open lock file '%1%' has become stale", lockPath);
        return false;
    } else {
        return true;
    }
}

std::optional<PathLock>
PathLock::lockImpl(const Path & path, std::string_view waitMsg, bool wait)
{
    Path lockPath = path + ".lock";

    debug("locking path '%1%'", path);

    while (1) {

        /* Open/create the lock file. */
        auto fd = openLockFile(lockPath, true);

        /* Acquire an exclusive lock. */
        if (!tryLockFile(fd.get(), ltWrite)) {
            if (wait) {
                if (waitMsg != "") {
                    printError("%1%", Uncolored(waitMsg));
                }
                lockFile(fd.get(), ltWrite);
            } else {
                return std::nullopt;
            }
        }

        debug("lock acquired on '%1%'", lockPath);
        if (isPathLockValid(fd, lockPath))
            return PathLock{std::move(fd), lockPath};
    }
}

PathLock lockPath(const Path & path, std::string_view waitMsg)
{
    return std::move(*PathLock::lockImpl(path, waitMsg, true));
}

std::optional<PathLock> tryLockPath(const Path & path)
{
    return PathLock::lockImpl(path, "", false);
}


PathLock::~PathLock()
{
    try {
        unlock();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}


void PathLock::unlock()
{
    if (fd) {
        /* Unlink before closing: a process that opened the old file
           will notice the zero link count and start over. */
        unlink(path.c_str());

        if (close(fd.release()) == -1) {
            printError("error (ignored): cannot close lock file on '%1%'", path);
        }

        debug("lock released on '%1%'", path);
    }
}

}

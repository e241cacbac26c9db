#pragma once
///@file

#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/types.hh"

#include <optional>

namespace buildjail {

/**
 * Open (possibly create) a lock file and return the file descriptor.
 * -1 is returned if create is false and the lock could not be opened
 * because it doesn't exist.  Any other error throws an exception.
 */
AutoCloseFD openLockFile(const Path & path, bool create);

enum LockType { ltRead, ltWrite };

void lockFile(int fd, LockType lockType);
bool tryLockFile(int fd, LockType lockType);
void unlockFile(int fd);

/**
 * An exclusive lock on `<path>.lock`. The lock file is removed again
 * when the lock is released; a holder that dies releases it implicitly.
 */
class PathLock
{
    friend PathLock lockPath(const Path & path, std::string_view waitMsg);
    friend std::optional<PathLock> tryLockPath(const Path & path);

    AutoCloseFD fd;
    Path path;

    PathLock(AutoCloseFD fd, const Path & path): fd(std::move(fd)), path(path) {}

    static std::optional<PathLock>
    lockImpl(const Path & path, std::string_view waitMsg, bool wait);

public:
    PathLock(PathLock &&) = default;
    PathLock & operator=(PathLock &&) = default;
    ~PathLock();

    void unlock();

    const Path & lockFilePath() const { return path; }
};

PathLock lockPath(const Path & path, std::string_view waitMsg = "");

/**
 * Like lockPath(), but returns nothing instead of waiting when the
 * lock is held elsewhere.
 */
std::optional<PathLock> tryLockPath(const Path & path);

}

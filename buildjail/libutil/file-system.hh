#pragma once
/**
 * @file
 *
 * Utilities for working with the file system and file paths.
 */

#include "buildjail/libutil/types.hh"
#include "buildjail/libutil/file-descriptor.hh"

#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

#include <climits>
#include <memory>
#include <optional>

namespace buildjail {

/**
 * Get the current working directory.
 *
 * Throw an error if the current directory cannot get got.
 */
Path getCwd();

/**
 * @return An absolutized path, resolving paths relative to the
 * specified directory, or the current directory otherwise.  The path
 * is also canonicalised.
 */
Path absPath(Path path,
    std::optional<PathView> dir = {},
    bool resolveSymlinks = false);

/**
 * Canonicalise a path by removing all `.` or `..` components and
 * double or trailing slashes.  Optionally resolves all symlink
 * components such that each component of the resulting path is *not*
 * a symbolic link.
 */
Path canonPath(PathView path, bool resolveSymlinks = false);

/**
 * Resolves a file path to a fully absolute path with no symbolic links.
 * Every component must exist.
 */
Path realPath(Path const & path);

/**
 * Like realPath(), but tolerates paths that do not exist (any more):
 * the longest existing prefix is resolved and the rest is appended in
 * canonical form.
 */
Path realPathOrCanon(Path const & path);

/**
 * @return The directory part of the given canonical path, i.e.,
 * everything before the final `/`.  If the path is the root or an
 * immediate child thereof (e.g., `/foo`), this means `/`
 * is returned.
 */
Path dirOf(const PathView path);

/**
 * @return the base name of the given canonical path, i.e., everything
 * following the final `/` (trailing slashes are removed).
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Check whether 'path' is a descendant of 'dir'. Both paths must be
 * canonicalized.
 */
bool isInDir(std::string_view path, std::string_view dir);

/**
 * Check whether 'path' is equal to 'dir' or a descendant of
 * 'dir'. Both paths must be canonicalized.
 */
bool isDirOrInDir(std::string_view path, std::string_view dir);

struct stat lstat(const Path & path);

/**
 * `lstat` the given path if it exists.
 * @return std::nullopt if the path doesn't exist, or an optional containing the result of `lstat` otherwise
 */
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * @return true iff the given path exists.
 */
bool pathExists(const Path & path);

/**
 * Read the contents (target) of a symbolic link.  The result is not
 * in any way canonicalised.
 */
Path readLink(const Path & path);

bool isLink(const Path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const Path & path);

/**
 * Write a string to a file.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

/**
 * Delete a path; i.e., in the case of a directory, it is deleted
 * recursively. It's not an error if the path does not exist.
 */
void deletePath(const Path & path);

/**
 * Create a directory and all its parents, if necessary.  Returns the
 * list of created directories, in order of creation.
 */
Paths createDirs(const Path & path);

void renameFile(const Path & src, const Path & dst);

/**
 * Automatic cleanup of resources.
 */
class AutoDelete
{
    Path path;
    bool del;
    bool recursive = true;
public:
    AutoDelete(const AutoDelete &) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;

    AutoDelete();
    AutoDelete(const Path & p, bool recursive = true);
    ~AutoDelete();
    void cancel();
    void reset(const Path & p, bool recursive = true);
    operator Path() const { return path; }
    operator PathView() const { return path; }
};

struct DIRDeleter
{
    void operator()(DIR * dir) const {
        closedir(dir);
    }
};

typedef std::unique_ptr<DIR, DIRDeleter> AutoCloseDir;

/**
 * Create a temporary directory in a given parent directory. The name
 * is `<prefix>-<pid>-<counter>`.
 */
Path createTempSubdir(const Path & parent, const Path & prefix = "tmp",
    bool includePid = true, mode_t mode = 0755);

/**
 * Return temporary path constructed by appending a suffix to a root path.
 *
 * The constructed path looks like `<root><suffix>-<pid>-<unique>`.
 */
Path makeTempPath(const Path & root, const Path & suffix = ".tmp");

}

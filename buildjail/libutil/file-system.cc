#include <atomic>
#include <cstdlib>
#include <fcntl.h>
#include <random>

#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/finally.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/strings.hh"

namespace buildjail {

Path getCwd() {
    char buf[PATH_MAX];
    if (!getcwd(buf, sizeof(buf))) {
        throw SysError("cannot get cwd");
    }
    return Path(buf);
}

Path absPath(Path path, std::optional<PathView> dir, bool resolveSymlinks)
{
    if (path.empty() || path[0] != '/') {
        if (!dir) {
            path = getCwd() + "/" + path;
        } else {
            path = std::string(*dir) + "/" + path;
        }
    }
    return canonPath(path, resolveSymlinks);
}


Path canonPath(PathView path, bool resolveSymlinks)
{
    if (path == "" || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    std::string s;
    s.reserve(256);

    std::string temp;

    /* Count the number of times we follow a symlink and stop at some
       arbitrary (but high) limit to prevent infinite loops. */
    unsigned int followCount = 0, maxFollow = 1024;

    while (1) {

        /* Skip slashes. */
        while (!path.empty() && path[0] == '/') path.remove_prefix(1);
        if (path.empty()) break;

        /* Ignore `.'. */
        if (path == "." || path.substr(0, 2) == "./")
            path.remove_prefix(1);

        /* If `..', delete the last component. */
        else if (path == ".." || path.substr(0, 3) == "../")
        {
            if (!s.empty()) s.erase(s.rfind('/'));
            path.remove_prefix(2);
        }

        /* Normal component; copy it. */
        else {
            s += '/';
            if (const auto slash = path.find('/'); slash == std::string::npos) {
                s += path;
                path = {};
            } else {
                s += path.substr(0, slash);
                path = path.substr(slash);
            }

            /* If s points to a symlink, resolve it and continue from there */
            if (resolveSymlinks && isLink(s)) {
                if (++followCount >= maxFollow)
                    throw Error("infinite symlink recursion in path '%1%'", path);
                temp = readLink(s) + path;
                path = temp;
                if (!temp.empty() && temp[0] == '/') {
                    s.clear();  /* restart for symlinks pointing to absolute path */
                } else {
                    s = dirOf(s);
                    if (s == "/") {
                        s.clear();
                    }
                }
            }
        }
    }

    return s.empty() ? "/" : std::move(s);
}

Path realPath(Path const & path)
{
    char * resolved = realpath(path.c_str(), nullptr);
    int saved = errno;
    if (resolved == nullptr) {
        throw SysError(saved, "cannot get realpath for '%s'", path);
    }

    Finally const _free([&] { free(resolved); });

    return Path(resolved);
}

Path realPathOrCanon(Path const & path)
{
    auto canon = absPath(path);
    try {
        return realPath(canon);
    } catch (SysError & e) {
        if (e.errNo != ENOENT && e.errNo != ENOTDIR && e.errNo != EACCES)
            throw;
        if (canon == "/")
            return canon;
        /* Resolve the part of the path that does exist. */
        auto parent = realPathOrCanon(dirOf(canon));
        return (parent == "/" ? "" : parent) + "/" + std::string(baseNameOf(canon));
    }
}

Path dirOf(const PathView path)
{
    Path::size_type pos = path.rfind('/');
    if (pos == std::string::npos)
        return ".";
    return pos == 0 ? "/" : Path(path, 0, pos);
}


std::string_view baseNameOf(std::string_view path)
{
    if (path.empty())
        return "";

    auto last = path.size() - 1;
    if (path[last] == '/' && last > 0)
        last -= 1;

    auto pos = path.rfind('/', last);
    if (pos == std::string::npos)
        pos = 0;
    else
        pos += 1;

    return path.substr(pos, last - pos + 1);
}


bool isInDir(std::string_view path, std::string_view dir)
{
    return path.substr(0, 1) == "/"
        && path.substr(0, dir.size()) == dir
        && path.size() >= dir.size() + 2
        && path[dir.size()] == '/';
}


bool isDirOrInDir(std::string_view path, std::string_view dir)
{
    return path == dir || isInDir(path, dir);
}


struct stat lstat(const Path & path)
{
    struct stat st;
    if (lstat(path.c_str(), &st))
        throw SysError("getting status of '%1%'", path);
    return st;
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (lstat(path.c_str(), &*st))
    {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%s'", path);
    }
    return st;
}

bool pathExists(const Path & path)
{
    return maybeLstat(path).has_value();
}


Path readLink(const Path & path)
{
    std::vector<char> buf;
    for (ssize_t bufSize = PATH_MAX/4; true; bufSize += bufSize/2) {
        buf.resize(bufSize);
        ssize_t rlSize = readlink(path.c_str(), buf.data(), bufSize);
        if (rlSize == -1)
            if (errno == EINVAL)
                throw Error("'%1%' is not a symlink", path);
            else
                throw SysError("reading symbolic link '%1%'", path);
        else if (rlSize < bufSize)
            return std::string(buf.data(), rlSize);
    }
}


bool isLink(const Path & path)
{
    struct stat st = lstat(path);
    return S_ISLNK(st.st_mode);
}


std::string readFile(const Path & path)
{
    AutoCloseFD fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}


void writeFile(const Path & path, std::string_view s, mode_t mode)
{
    AutoCloseFD fd{open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode)};
    if (!fd)
        throw SysError("opening file '%1%'", path);

    try {
        writeFull(fd.get(), s);
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }

    /* Close explicitly to propagate the exceptions. */
    fd.close();
}


static void _deletePath(int parentfd, const std::string & name)
{
    struct stat st;
    if (fstatat(parentfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == -1) {
        if (errno == ENOENT) return;
        throw SysError("getting status of '%1%'", name);
    }

    if (S_ISDIR(st.st_mode)) {
        /* Make the directory accessible. */
        const auto PERM_MASK = S_IRUSR | S_IWUSR | S_IXUSR;
        if ((st.st_mode & PERM_MASK) != PERM_MASK) {
            if (fchmodat(parentfd, name.c_str(), st.st_mode | PERM_MASK, 0) == -1) {
                throw SysError("chmod '%1%'", name);
            }
        }

        int fd = openat(parentfd, name.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW);
        if (fd == -1)
            throw SysError("opening directory '%1%'", name);
        AutoCloseDir dir(fdopendir(fd));
        if (!dir) {
            close(fd);
            throw SysError("opening directory '%1%'", name);
        }

        Strings children;
        struct dirent * dirent;
        while (errno = 0, dirent = readdir(dir.get())) { /* sic */
            std::string child = dirent->d_name;
            if (child == "." || child == "..") continue;
            children.push_back(child);
        }
        if (errno) throw SysError("reading directory '%1%'", name);

        for (auto & child : children)
            _deletePath(dirfd(dir.get()), child);
    }

    int flags = S_ISDIR(st.st_mode) ? AT_REMOVEDIR : 0;
    if (unlinkat(parentfd, name.c_str(), flags) == -1) {
        if (errno == ENOENT) return;
        throw SysError("cannot unlink '%1%'", name);
    }
}


void deletePath(const Path & path)
{
    Path dir = dirOf(path);

    AutoCloseFD dirfd{open(dir.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!dirfd) {
        if (errno == ENOENT) return;
        throw SysError("opening directory '%1%'", path);
    }

    try {
        _deletePath(dirfd.get(), std::string(baseNameOf(path)));
    } catch (Error & e) {
        e.addTrace("while deleting '%1%'", path);
        throw;
    }
}


Paths createDirs(const Path & path)
{
    Paths created;
    if (path == "/") return created;

    struct stat st;
    if (lstat(path.c_str(), &st) == -1) {
        created = createDirs(dirOf(path));
        if (mkdir(path.c_str(), 0777) == -1 && errno != EEXIST)
            throw SysError("creating directory '%1%'", path);
        st = lstat(path);
        created.push_back(path);
    }

    if (S_ISLNK(st.st_mode) && stat(path.c_str(), &st) == -1)
        throw SysError("statting symlink '%1%'", path);

    if (!S_ISDIR(st.st_mode)) throw Error("'%1%' is not a directory", path);

    return created;
}


void renameFile(const Path & oldName, const Path & newName)
{
    if (rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", oldName, newName);
}


//////////////////////////////////////////////////////////////////////

AutoDelete::AutoDelete() : del{false} {}

AutoDelete::AutoDelete(const std::string & p, bool recursive) : path(p)
{
    del = true;
    this->recursive = recursive;
}

AutoDelete::~AutoDelete()
{
    try {
        if (del) {
            if (recursive)
                deletePath(path);
            else {
                if (remove(path.c_str()) == -1)
                    throw SysError("cannot unlink '%1%'", path);
            }
        }
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::cancel()
{
    del = false;
}

void AutoDelete::reset(const Path & p, bool recursive) {
    path = p;
    this->recursive = recursive;
    del = true;
}

//////////////////////////////////////////////////////////////////////

Path createTempSubdir(const Path & parent, const Path & prefix,
    bool includePid, mode_t mode)
{
    static std::atomic<unsigned int> counter = 0;

    auto tmpRoot = canonPath(parent, true);

    while (1) {
        Path tmpDir = includePid
            ? fmt("%1%/%2%-%3%-%4%", tmpRoot, prefix, getpid(), counter++)
            : fmt("%1%/%2%-%3%", tmpRoot, prefix, counter++);
        if (mkdir(tmpDir.c_str(), mode) == 0)
            return tmpDir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", tmpDir);
    }
}

Path makeTempPath(const Path & root, const Path & suffix)
{
    // start the counter at a random value to minimize issues with preexisting temp paths
    static std::atomic_uint_fast32_t counter(std::random_device{}());
    return fmt("%1%%2%-%3%-%4%", root, suffix, getpid(), counter.fetch_add(1, std::memory_order_relaxed));
}

}

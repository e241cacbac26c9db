#include "buildjail/libutil/file-descriptor.hh"
#include "buildjail/libutil/logging.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <sys/poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace buildjail {

std::string readFile(int fd)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("statting file");

    // st_size is signed and some pseudo-filesystems report nonsense, so
    // clamp the reservation at zero.
    return drainFD(fd, (size_t) std::max((off_t) 0, st.st_size));
}


void writeFull(int fd, std::string_view s, bool retryOnBlock)
{
    while (!s.empty()) {
        ssize_t res = write(fd, s.data(), s.size());
        if (res == -1) {
            if (retryOnBlock && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd pfd = {.fd = fd, .events = POLLOUT, .revents = 0};
                if (poll(&pfd, 1, -1) < 0) {
                    throw SysError("polling for writing to file");
                }
            } else if (errno != EINTR) {
                throw SysError("writing to file");
            }
        }
        if (res > 0)
            s.remove_prefix(res);
    }
}


std::string drainFD(int fd, const size_t reserveSize)
{
    std::string result;
    result.reserve(reserveSize);
    std::array<char, 64 * 1024> buf;
    while (1) {
        ssize_t rd = read(fd, buf.data(), buf.size());
        if (rd == -1) {
            if (errno != EINTR)
                throw SysError("reading from file");
        }
        else if (rd == 0) break;
        else result.append(buf.data(), rd);
    }
    return result;
}

AutoCloseFD::AutoCloseFD() : fd{-1} {}


AutoCloseFD::AutoCloseFD(int fd) : fd{fd} {}


AutoCloseFD::AutoCloseFD(AutoCloseFD && that) : fd{that.fd}
{
    that.fd = -1;
}


AutoCloseFD & AutoCloseFD::operator =(AutoCloseFD && that) noexcept(false)
{
    close();
    fd = that.fd;
    that.fd = -1;
    return *this;
}


AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}


int AutoCloseFD::get() const
{
    return fd;
}


void AutoCloseFD::close()
{
    if (fd != -1) {
        if (::close(fd) == -1)
            /* This should never happen. */
            throw SysError("closing file descriptor %1%", fd);
        fd = -1;
    }
}


AutoCloseFD::operator bool() const
{
    return fd != -1;
}


int AutoCloseFD::release()
{
    int oldFD = fd;
    fd = -1;
    return oldFD;
}


void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) throw SysError("creating pipe");
    readSide = AutoCloseFD{fds[0]};
    writeSide = AutoCloseFD{fds[1]};
}


void Pipe::close()
{
    readSide.close();
    writeSide.close();
}

}

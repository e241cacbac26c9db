#pragma once
///@file

#include "buildjail/libutil/error.hh"

namespace buildjail {

/**
 * Read the contents of a file into a string.
 */
std::string readFile(int fd);

/**
 * Wrapper around write() that writes exactly the requested number of
 * bytes.
 */
void writeFull(int fd, std::string_view s, bool retryOnBlock = true);

/**
 * Read a file descriptor until EOF occurs.
 */
std::string drainFD(int fd, const size_t reserveSize = 0);

class AutoCloseFD
{
    int fd;
public:
    AutoCloseFD();
    explicit AutoCloseFD(int fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD&& fd);
    ~AutoCloseFD();
    AutoCloseFD& operator =(const AutoCloseFD & fd) = delete;
    AutoCloseFD& operator =(AutoCloseFD&& fd) noexcept(false);
    int get() const;
    explicit operator bool() const;
    int release();
    void close();
    void reset() { *this = {}; }
};

class Pipe
{
public:
    AutoCloseFD readSide, writeSide;
    void create();
    void close();
};

MakeError(EndOfFile, Error);

}

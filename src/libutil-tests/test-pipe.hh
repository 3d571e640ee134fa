#pragma once
///@file

#include "stripansi/util/error.hh"

#include <string>

#include <unistd.h>

namespace stripansi {

/**
 * A pipe whose ends are closed when it goes out of scope.
 */
struct TestPipe
{
    int readSide = -1, writeSide = -1;

    TestPipe()
    {
        int fds[2];
        if (::pipe(fds) != 0)
            throw SysError("creating pipe");
        readSide = fds[0];
        writeSide = fds[1];
    }

    TestPipe(const TestPipe &) = delete;
    TestPipe & operator=(const TestPipe &) = delete;

    ~TestPipe()
    {
        closeEnd(readSide);
        closeEnd(writeSide);
    }

    static void closeEnd(int & fd)
    {
        if (fd != -1)
            ::close(fd);
        fd = -1;
    }

    /**
     * Close the write side and return everything written to it.
     */
    std::string drain()
    {
        closeEnd(writeSide);
        std::string res;
        char buf[4096];
        ssize_t n;
        while ((n = ::read(readSide, buf, sizeof(buf))) > 0)
            res.append(buf, n);
        if (n == -1)
            throw SysError("reading from pipe");
        return res;
    }
};

} // namespace stripansi

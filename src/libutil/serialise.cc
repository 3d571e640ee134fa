#include "stripansi/util/serialise.hh"
#include "stripansi/util/util.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

namespace stripansi {

void BufferedSink::operator()(std::string_view data)
{
    if (!buffer)
        buffer = std::make_unique<char[]>(bufSize);

    while (!data.empty()) {
        /* Large writes skip the buffer entirely. */
        if (bufPos + data.size() >= bufSize) {
            flush();
            writeUnbuffered(data);
            return;
        }
        size_t n = std::min(bufSize - bufPos, data.size());
        memcpy(buffer.get() + bufPos, data.data(), n);
        data.remove_prefix(n);
        bufPos += n;
        if (bufPos == bufSize)
            flush();
    }
}

void BufferedSink::flush()
{
    if (bufPos == 0)
        return;
    std::string_view pending(buffer.get(), bufPos);
    bufPos = 0;
    writeUnbuffered(pending);
}

FdSink::FdSink(FdSink && s)
    : BufferedSink(s.bufSize)
    , fd(s.fd)
    , _good(s._good)
{
    bufPos = std::exchange(s.bufPos, 0);
    buffer = std::move(s.buffer);
    s.fd = INVALID_DESCRIPTOR;
}

FdSink::~FdSink()
{
    /* A failure has already been reported to whoever wrote to us. */
    if (!_good)
        return;
    try {
        flush();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void FdSink::writeUnbuffered(std::string_view data)
{
    try {
        writeFull(fd, data);
    } catch (SystemError &) {
        _good = false;
        throw;
    }
}

bool FdSink::good()
{
    return _good;
}

void Source::drainInto(Sink & sink)
{
    std::array<char, 8192> buf;
    while (true) {
        size_t n;
        try {
            n = read(buf.data(), buf.size());
        } catch (EndOfFile &) {
            return;
        }
        sink({buf.data(), n});
    }
}

size_t FdSource::read(char * data, size_t len)
{
    ssize_t n;
    do {
        n = ::read(fd, data, len);
    } while (n == -1 && errno == EINTR);
    if (n == -1)
        throw SysError("reading from file");
    if (n == 0)
        throw EndOfFile("unexpected end-of-file");
    return n;
}

void StringSink::operator()(std::string_view data)
{
    s.append(data);
}

} // namespace stripansi

#pragma once
///@file

#include <memory>
#include <string>
#include <string_view>

#include "stripansi/util/file-descriptor.hh"

namespace stripansi {

/**
 * Something bytes can be written to. Write failures are thrown,
 * usually as `SysError`.
 */
struct Sink
{
    virtual ~Sink() {}

    virtual void operator()(std::string_view data) = 0;

    /**
     * Push out anything held back. A no-op for sinks without a buffer.
     */
    virtual void flush() {}

    /**
     * False once a write has failed.
     */
    virtual bool good()
    {
        return true;
    }
};

/**
 * A sink that collects small writes in a fixed-size buffer and hands
 * them to `writeUnbuffered()` in one piece. Not thread-safe.
 */
struct BufferedSink : Sink
{
    size_t bufSize, bufPos = 0;
    std::unique_ptr<char[]> buffer;

    BufferedSink(size_t bufSize = 32 * 1024)
        : bufSize(bufSize)
    {
    }

    void operator()(std::string_view data) override;

    /**
     * The buffer is emptied before `writeUnbuffered()` is called, so
     * its contents are gone even if that call throws.
     */
    void flush() override;

protected:

    virtual void writeUnbuffered(std::string_view data) = 0;
};

/**
 * Something bytes can be read from.
 */
struct Source
{
    virtual ~Source() {}

    /**
     * Read at most `len` bytes into `data`. Blocks until at least one
     * byte is available and throws `EndOfFile` once none will be.
     */
    virtual size_t read(char * data, size_t len) = 0;

    /**
     * Pass everything up to end-of-file to `sink`, in order.
     */
    void drainInto(Sink & sink);
};

/**
 * Buffered writes to a file descriptor that this sink does not own.
 * After a failed write, `good()` is false and destruction no longer
 * tries to flush.
 */
struct FdSink : BufferedSink
{
    Descriptor fd;

    FdSink(Descriptor fd)
        : fd(fd)
    {
    }

    FdSink(FdSink && s);
    FdSink(const FdSink &) = delete;
    FdSink & operator=(const FdSink &) = delete;

    ~FdSink();

    bool good() override;

protected:
    void writeUnbuffered(std::string_view data) override;

private:
    bool _good = true;
};

/**
 * Reads from a file descriptor that this source does not own.
 */
struct FdSource : Source
{
    Descriptor fd;

    FdSource(Descriptor fd)
        : fd(fd)
    {
    }

    size_t read(char * data, size_t len) override;
};

struct StringSink : Sink
{
    std::string s;

    StringSink() {}

    explicit StringSink(size_t reservedSize)
    {
        s.reserve(reservedSize);
    }

    void operator()(std::string_view data) override;
};

} // namespace stripansi

#pragma once
///@file

#include "stripansi/util/serialise.hh"
#include "stripansi/util/util.hh"

#include <string>
#include <utility>

namespace stripansi {

/**
 * A sink that owns another sink `S` and buffers what is written to it,
 * writing the buffer through and flushing `S` whenever a linefeed is
 * written.
 *
 * If `S` throws, the bytes that were not accepted stay in the buffer,
 * so that a later `flush()` can retry them. Whatever is still buffered
 * on destruction is written to `S` (but `S` is not flushed), unless
 * `S` reports that it is no longer `good()`.
 */
template<typename S>
class LineWriter : public Sink
{
    S inner;
    std::string buf;
    size_t capacity;

public:

    explicit LineWriter(S inner, size_t capacity = 1024)
        : inner(std::move(inner))
        , capacity(capacity)
    {
    }

    ~LineWriter()
    {
        /* If `S` has already failed, that failure was reported. */
        if (!inner.good())
            return;
        try {
            writeBuffer(buf.size());
        } catch (...) {
            ignoreExceptionInDestructor();
        }
    }

    void operator()(std::string_view data) override
    {
        auto nl = data.rfind('\n');
        buf.append(data);

        if (nl == data.npos) {
            if (buf.size() >= capacity)
                writeBuffer(buf.size());
            return;
        }

        /* Everything up to and including the last linefeed goes
           through now; the rest waits for the next one. */
        writeBuffer(buf.size() - (data.size() - nl - 1));
        inner.flush();
    }

    void flush() override
    {
        writeBuffer(buf.size());
        inner.flush();
    }

    bool good() override
    {
        return inner.good();
    }

    /**
     * The bytes not yet written to the inner sink.
     */
    std::string_view buffered() const
    {
        return buf;
    }

    const S & get() const
    {
        return inner;
    }

    S & get()
    {
        return inner;
    }

    /**
     * Take the inner sink without flushing. Anything still buffered is
     * discarded.
     */
    S intoInner() &&
    {
        buf.clear();
        return std::move(inner);
    }

private:

    void writeBuffer(size_t n)
    {
        if (n == 0)
            return;
        inner(std::string_view(buf).substr(0, n));
        buf.erase(0, n);
    }
};

} // namespace stripansi

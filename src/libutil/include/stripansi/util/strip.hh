#pragma once
/**
 * @file
 *
 * @brief Removing terminal escape sequences from a byte stream.
 *
 * `strip()` handles a whole string at once. `StripWriter` wraps a sink
 * and strips incrementally, so it can sit in front of a log file or
 * standard output:
 *
 * ```
 * StripWriter<FdSink> writer{FdSink(fd)};
 * writer.write("\e[32mfoo\e[m bar\n"); // "foo bar\n" reaches fd
 * auto sink = std::move(writer).unwrap();
 * ```
 */

#include "stripansi/util/configuration.hh"
#include "stripansi/util/error.hh"
#include "stripansi/util/line-writer.hh"
#include "stripansi/util/logging.hh"
#include "stripansi/util/terminal-parser.hh"

#include <exception>
#include <memory>
#include <utility>

namespace stripansi {

struct StripSettings : Config
{
    Setting<size_t> lineBufferSize{
        this,
        1024,
        "line-buffer-size",
        R"(
          Number of bytes of visible output held back while waiting
          for a linefeed. Output is written through to the destination
          when a linefeed arrives or when this many bytes are pending.
        )"};

    Setting<size_t> oscMaxBytes{
        this,
        1024,
        "osc-max-bytes",
        R"(
          Maximum number of bytes of an operating system command
          (`ESC ] ... BEL`) kept while it is being parsed. The
          sequence is removed from the output either way.
        )"};
};

extern StripSettings stripSettings;

/**
 * Thrown by `StripWriter::unwrap()` when the final flush fails. It
 * owns what the writer owned: the line-buffered sink, with the bytes
 * that could not be written still in its buffer. The caller can retry
 * with `writer().flush()` or take the sink with `intoInner()`.
 */
template<typename S>
class IntoInnerError : public Error
{
    std::shared_ptr<LineWriter<S>> writer_;
    std::exception_ptr cause_;

public:

    IntoInnerError(ErrorInfo info, std::exception_ptr cause, std::shared_ptr<LineWriter<S>> writer)
        : Error(std::move(info))
        , writer_(std::move(writer))
        , cause_(std::move(cause))
    {
    }

    LineWriter<S> & writer() const
    {
        return *writer_;
    }

    S intoInner() const
    {
        return std::move(*writer_).intoInner();
    }

    /**
     * The exception the flush failed with, which need not be an
     * `Error`.
     */
    std::exception_ptr cause() const
    {
        return cause_;
    }
};

/**
 * Receives the tokens of a `terminal::Parser` and forwards the visible
 * ones to a sink: printable characters (as UTF-8) and linefeeds.
 * Everything else is dropped.
 *
 * A sink failure does not propagate out of `perform()`; it is kept
 * until `takeError()`, replacing any earlier one.
 */
class StripPerformer
{
    std::exception_ptr err;

public:

    void perform(Sink & out, const terminal::Token & token);

    std::exception_ptr takeError()
    {
        return std::exchange(err, nullptr);
    }

private:

    void forward(Sink & out, std::string_view data);
};

/**
 * A sink that strips terminal escape sequences from everything written
 * to it and passes the rest on to the sink `S` it owns.
 *
 * Output to `S` is line buffered. A `StripWriter` is consumed by
 * `unwrap()`; using it afterwards throws `UsageError`.
 */
template<typename S>
class StripWriter : public Sink
{
    std::unique_ptr<LineWriter<S>> writer;
    terminal::Parser parser;
    StripPerformer performer;

public:

    explicit StripWriter(S inner, size_t lineBufferSize = stripSettings.lineBufferSize)
        : writer(std::make_unique<LineWriter<S>>(std::move(inner), lineBufferSize))
        , parser(stripSettings.oscMaxBytes)
    {
    }

    /**
     * Strip `data` and pass the visible part on. All of `data` is
     * always consumed, even if passing something on fails halfway; in
     * that case the last failure is thrown once everything has been
     * parsed.
     *
     * @return `data.size()`
     */
    size_t write(std::string_view data)
    {
        auto & out = checkedWriter();
        performer.takeError();

        terminal::Parser::Emit emit = [&](const terminal::Token & token) { performer.perform(out, token); };
        for (auto c : data)
            parser.advance(static_cast<uint8_t>(c), emit);

        if (auto err = performer.takeError())
            std::rethrow_exception(err);
        return data.size();
    }

    void operator()(std::string_view data) override
    {
        write(data);
    }

    void flush() override
    {
        checkedWriter().flush();
    }

    bool good() override
    {
        return writer && writer->good();
    }

    /**
     * Flush and return the inner sink.
     *
     * @throws IntoInnerError<S> if the flush fails.
     */
    S unwrap() &&
    {
        checkedWriter();
        std::shared_ptr<LineWriter<S>> w = std::move(writer);
        try {
            w->flush();
        } catch (Error & e) {
            debug("final flush of stripped output failed: %s", e.message());
            throw IntoInnerError<S>(e.info(), std::current_exception(), std::move(w));
        } catch (std::exception & e) {
            debug("final flush of stripped output failed: %s", e.what());
            throw IntoInnerError<S>(
                ErrorInfo{.level = lvlError, .msg = HintFmt(std::string(e.what()))},
                std::current_exception(),
                std::move(w));
        }
        return std::move(*w).intoInner();
    }

private:

    LineWriter<S> & checkedWriter()
    {
        if (!writer)
            throw UsageError("stripping writer has already been unwrapped");
        return *writer;
    }
};

/**
 * Strip terminal escape sequences from `data`, keeping printable
 * characters and linefeeds.
 */
std::string strip(std::string_view data);

} // namespace stripansi

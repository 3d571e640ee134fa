#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "stripansi/util/strip.hh"
#include "stripansi/util/strings.hh"
#include "test-pipe.hh"

#include <cerrno>
#include <deque>
#include <stdexcept>

namespace stripansi {

/**
 * A sink whose next writes fail, one per entry of `failures`, with
 * that errno.
 */
struct FlakySink : Sink
{
    std::string s;
    std::deque<int> failures;

    FlakySink(std::initializer_list<int> failures = {})
        : failures(failures)
    {
    }

    void operator()(std::string_view data) override
    {
        if (!failures.empty()) {
            int errNo = failures.front();
            failures.pop_front();
            throw SysError(errNo, "writing to test sink");
        }
        s.append(data);
    }
};

/**
 * A sink whose next `failures` writes throw something that is not an
 * `Error`.
 */
struct DiskFullSink : Sink
{
    std::string s;
    size_t failures;

    explicit DiskFullSink(size_t failures)
        : failures(failures)
    {
    }

    void operator()(std::string_view data) override
    {
        if (failures) {
            --failures;
            throw std::runtime_error("disk full");
        }
        s.append(data);
    }
};

/* ----------------------------------------------------------------------------
 * strip
 * --------------------------------------------------------------------------*/

TEST(strip, emptyString)
{
    ASSERT_EQ(strip(""), "");
}

TEST(strip, keepsNewlines)
{
    ASSERT_EQ(strip("foo\nbar\n"), "foo\nbar\n");
}

TEST(strip, removesColorCodes)
{
    ASSERT_EQ(
        strip("\x1b[m\x1b[m\x1b[32m\x1b[1m    Finished\x1b[m dev [unoptimized + debuginfo] target(s) in 0.0 secs"),
        "    Finished dev [unoptimized + debuginfo] target(s) in 0.0 secs");
}

TEST(strip, removesColorCodesAcrossLines)
{
    auto s =
        "\x1b[m\x1b[m\x1b[32m\x1b[1m   Compiling\x1b[m utf8parse v0.1.0\n"
        "\x1b[m\x1b[m\x1b[32m\x1b[1m   Compiling\x1b[m vte v0.3.2\n"
        "\x1b[m\x1b[m\x1b[32m\x1b[1m   Compiling\x1b[m strip-ansi-escapes v0.1.0-pre (file:///build/strip-ansi-escapes)\n"
        "\x1b[m\x1b[m\x1b[32m\x1b[1m    Finished\x1b[m dev [unoptimized + debuginfo] target(s) in 0.66 secs\n";

    ASSERT_EQ(
        strip(s),
        "   Compiling utf8parse v0.1.0\n"
        "   Compiling vte v0.3.2\n"
        "   Compiling strip-ansi-escapes v0.1.0-pre (file:///build/strip-ansi-escapes)\n"
        "    Finished dev [unoptimized + debuginfo] target(s) in 0.66 secs\n");
}

TEST(strip, removesTwoByteEscapes)
{
    ASSERT_EQ(strip("foo\x1b" "7bar"), "foobar");
    ASSERT_EQ(strip("\x1b(Bplain\x1b" "8"), "plain");
}

TEST(strip, removesOperatingSystemCommands)
{
    ASSERT_EQ(strip("\x1b]0;window title\x07text"), "text");
    ASSERT_EQ(strip("\x1b]8;;http://example.org\x1b\\link\x1b]8;;\x1b\\"), "link");
}

TEST(strip, removesDeviceControlStrings)
{
    ASSERT_EQ(strip("a\x1bPq#0;2;0;0;0#1~~@@\x1b\\b"), "ab");
}

TEST(strip, dropsOtherControls)
{
    ASSERT_EQ(strip("a\tb\r\n\x07"), "ab\n");
}

TEST(strip, keepsUtf8)
{
    ASSERT_EQ(strip("f\xc3\xb6\xc3\xb6 \x1b[1m\xf0\x9f\x94\x8d\x1b[0m\n"), "f\xc3\xb6\xc3\xb6 \xf0\x9f\x94\x8d\n");
}

TEST(strip, replacesInvalidUtf8)
{
    ASSERT_EQ(strip("a\xff" "b"), "a\xef\xbf\xbd" "b");
}

TEST(strip, unterminatedSequenceAtEnd)
{
    ASSERT_EQ(strip("done\x1b[1;3"), "done");
}

/* ----------------------------------------------------------------------------
 * StripWriter
 * --------------------------------------------------------------------------*/

TEST(StripWriter, writeConsumesEverything)
{
    StripWriter<StringSink> writer{StringSink()};

    ASSERT_EQ(writer.write("\x1b[32mgreen\x1b[0m"), 14);
    ASSERT_EQ(writer.write(""), 0);
    ASSERT_EQ(std::move(writer).unwrap().s, "green");
}

TEST(StripWriter, sequenceSplitAcrossWrites)
{
    StripWriter<StringSink> writer{StringSink()};

    writer.write("foo\x1b");
    writer.write("[3");
    writer.write("1mbar\xe2\x82");
    writer.write("\xac\n");

    ASSERT_EQ(std::move(writer).unwrap().s, "foobar\xe2\x82\xac\n");
}

TEST(StripWriter, usableAsSink)
{
    TestPipe pipe;
    writeFull(pipe.writeSide, "\x1b[1mbold\x1b[m\n");
    TestPipe::closeEnd(pipe.writeSide);

    StripWriter<StringSink> writer{StringSink()};
    FdSource source(pipe.readSide);
    source.drainInto(writer);

    ASSERT_EQ(std::move(writer).unwrap().s, "bold\n");
}

TEST(StripWriter, sinkFailureIsReportedAfterWholeBuffer)
{
    StripWriter<FlakySink> writer{FlakySink({EIO})};

    /* The first line fails to go through, the second takes both. */
    ASSERT_THROW(writer.write("foo\nbar\n"), SysError);

    ASSERT_EQ(std::move(writer).unwrap().s, "foo\nbar\n");
}

TEST(StripWriter, errorDoesNotCarryOverToNextWrite)
{
    StripWriter<FlakySink> writer{FlakySink({EIO})};

    ASSERT_THROW(writer.write("x\n"), SysError);
    ASSERT_EQ(writer.write("y\n"), 2);

    ASSERT_EQ(std::move(writer).unwrap().s, "x\ny\n");
}

TEST(StripWriter, lastErrorWins)
{
    StripWriter<FlakySink> writer{FlakySink({EIO, ENOSPC})};

    try {
        writer.write("a\nb\nc\n");
        FAIL() << "write should have thrown";
    } catch (SysError & e) {
        ASSERT_EQ(e.errNo, ENOSPC);
    }

    ASSERT_EQ(std::move(writer).unwrap().s, "a\nb\nc\n");
}

TEST(StripWriter, nonErrorFailureIsReportedAfterWholeBuffer)
{
    StripWriter<DiskFullSink> writer{DiskFullSink(1)};

    ASSERT_THROW(writer.write("ab\ncd\n"), std::runtime_error);

    ASSERT_EQ(std::move(writer).unwrap().s, "ab\ncd\n");
}

TEST(StripWriter, destructionAfterNonErrorFailure)
{
    {
        StripWriter<DiskFullSink> writer{DiskFullSink(100)};
        ASSERT_THROW(writer.write("ab\ncd\n"), std::runtime_error);
    }
    SUCCEED();
}

TEST(StripWriter, unwrapWrapsNonErrorFailure)
{
    StripWriter<DiskFullSink> writer{DiskFullSink(1)};
    writer.write("partial");

    try {
        std::move(writer).unwrap();
        FAIL() << "unwrap should have thrown";
    } catch (IntoInnerError<DiskFullSink> & e) {
        ASSERT_EQ(e.message(), "disk full");
        ASSERT_THROW(std::rethrow_exception(e.cause()), std::runtime_error);
        ASSERT_EQ(e.writer().buffered(), "partial");
    }
}

TEST(StripWriter, unwrapFailureKeepsBufferedOutput)
{
    StripWriter<FlakySink> writer{FlakySink({EIO})};

    /* No linefeed, so nothing reaches the sink yet. */
    ASSERT_EQ(writer.write("\x1b[1mabc"), 7);

    try {
        std::move(writer).unwrap();
        FAIL() << "unwrap should have thrown";
    } catch (IntoInnerError<FlakySink> & e) {
        ASSERT_EQ(e.writer().buffered(), "abc");
        ASSERT_THROW(std::rethrow_exception(e.cause()), SysError);
        ASSERT_NE(e.message().find("writing to test sink"), std::string::npos);

        e.writer().flush();
        ASSERT_EQ(e.writer().buffered(), "");
        ASSERT_EQ(e.intoInner().s, "abc");
    }
}

TEST(StripWriter, unusableAfterUnwrap)
{
    StripWriter<StringSink> writer{StringSink()};
    writer.write("x");
    ASSERT_EQ(std::move(writer).unwrap().s, "x");

    ASSERT_FALSE(writer.good());
    ASSERT_THROW(writer.write("y"), UsageError);
    ASSERT_THROW(writer.flush(), UsageError);
    ASSERT_THROW(std::move(writer).unwrap(), UsageError);
}

TEST(StripWriter, respectsLineBufferSize)
{
    StripWriter<StringSink> writer{StringSink(), 4};

    writer.write("abcdef");

    ASSERT_EQ(std::move(writer).unwrap().s, "abcdef");
}

TEST(StripWriter, pendingOutputWrittenOnDestruction)
{
    TestPipe pipe;

    {
        StripWriter<FdSink> writer{FdSink(pipe.writeSide)};
        writer.write("\x1b[1mno linefeed");
    }

    ASSERT_EQ(pipe.drain(), "no linefeed");
}

TEST(strip, c1ControlEndsSequence)
{
    ASSERT_EQ(strip("\x1b[31\x9cm"), "m");
    ASSERT_EQ(strip("\x1b[31\x85x"), "x");
    ASSERT_EQ(strip("\x1b[31\x9b" "1mred"), "red");
    ASSERT_EQ(strip("\x1b(\x9d" "0;title\x07text"), "text");
}

TEST(strip, utf8InsideOscIsNotC1)
{
    /* U+20AC and U+201C have continuation bytes 0x82 and 0x9c. */
    ASSERT_EQ(strip("\x1b]0;\xe2\x82\xac \xe2\x80\x9cq\xe2\x80\x9d\x07ok"), "ok");
}

/* ----------------------------------------------------------------------------
 * Properties
 * --------------------------------------------------------------------------*/

RC_GTEST_PROP(StripWriter, chunkingDoesNotMatter, (const std::string & input, const std::vector<unsigned char> & sizes))
{
    StripWriter<StringSink> writer{StringSink()};

    std::string_view rest{input};
    auto size = sizes.begin();
    while (!rest.empty()) {
        size_t n = size == sizes.end() ? rest.size() : *size++ % 8 + 1;
        n = std::min(n, rest.size());
        RC_ASSERT(writer.write(rest.substr(0, n)) == n);
        rest.remove_prefix(n);
    }

    RC_ASSERT(std::move(writer).unwrap().s == strip(input));
}

RC_GTEST_PROP(
    strip,
    removesCsiSequences,
    (const std::vector<std::pair<std::string, std::vector<unsigned int>>> & pieces))
{
    std::string input, expected;

    for (auto & [text, params] : pieces) {
        std::string printable;
        for (auto c : text)
            printable.push_back(static_cast<char>(' ' + static_cast<unsigned char>(c) % 95));

        std::vector<std::string> ps;
        for (auto p : params)
            ps.push_back(std::to_string(p % 10000));

        input += printable;
        input += "\x1b[" + concatStringsSep(";", ps) + "mHJKABCDfhl"[params.size() % 11];
        expected += printable;
    }

    RC_ASSERT(strip(input) == expected);
}

} // namespace stripansi

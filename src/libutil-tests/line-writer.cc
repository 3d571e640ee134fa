#include <gtest/gtest.h>

#include "stripansi/util/line-writer.hh"
#include "stripansi/util/file-descriptor.hh"

#include <cerrno>
#include <vector>

namespace stripansi {

/**
 * Records each write and flush it receives. The first `failures`
 * writes throw instead.
 */
struct RecordingSink : Sink
{
    std::vector<std::string> writes;
    size_t flushes = 0;
    size_t failures = 0;

    void operator()(std::string_view data) override
    {
        if (failures) {
            --failures;
            throw SysError(EPIPE, "writing to test sink");
        }
        writes.emplace_back(data);
    }

    void flush() override
    {
        ++flushes;
    }
};

TEST(LineWriter, holdsPartialLines)
{
    LineWriter<RecordingSink> writer{RecordingSink()};

    writer("foo");

    ASSERT_TRUE(writer.get().writes.empty());
    ASSERT_EQ(writer.buffered(), "foo");
}

TEST(LineWriter, writesThroughOnLinefeed)
{
    LineWriter<RecordingSink> writer{RecordingSink()};

    writer("foo");
    writer("bar\nbaz");

    ASSERT_EQ(writer.get().writes, std::vector<std::string>{"foobar\n"});
    ASSERT_EQ(writer.get().flushes, 1);
    ASSERT_EQ(writer.buffered(), "baz");

    writer.flush();

    ASSERT_EQ(writer.get().writes, (std::vector<std::string>{"foobar\n", "baz"}));
    ASSERT_EQ(writer.get().flushes, 2);
    ASSERT_EQ(writer.buffered(), "");
}

TEST(LineWriter, writesUpToLastLinefeed)
{
    LineWriter<RecordingSink> writer{RecordingSink()};

    writer("a\nb\nc");

    ASSERT_EQ(writer.get().writes, std::vector<std::string>{"a\nb\n"});
    ASSERT_EQ(writer.buffered(), "c");
}

TEST(LineWriter, writesThroughWhenFull)
{
    LineWriter<RecordingSink> writer{RecordingSink(), 4};

    writer("abc");
    ASSERT_TRUE(writer.get().writes.empty());

    writer("de");
    ASSERT_EQ(writer.get().writes, std::vector<std::string>{"abcde"});
    ASSERT_EQ(writer.get().flushes, 0);
    ASSERT_EQ(writer.buffered(), "");
}

TEST(LineWriter, keepsBufferWhenSinkFails)
{
    RecordingSink sink;
    sink.failures = 1;
    LineWriter<RecordingSink> writer{std::move(sink)};

    ASSERT_THROW(writer("line\n"), SysError);
    ASSERT_EQ(writer.buffered(), "line\n");

    writer.flush();

    ASSERT_EQ(writer.get().writes, std::vector<std::string>{"line\n"});
    ASSERT_EQ(writer.buffered(), "");
}

TEST(LineWriter, intoInnerDropsBuffer)
{
    LineWriter<RecordingSink> writer{RecordingSink()};

    writer("pending");
    auto sink = std::move(writer).intoInner();

    ASSERT_TRUE(sink.writes.empty());
    ASSERT_EQ(sink.flushes, 0);
}

} // namespace stripansi

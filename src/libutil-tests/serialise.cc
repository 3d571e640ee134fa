#include <gtest/gtest.h>

#include "stripansi/util/serialise.hh"
#include "test-pipe.hh"

namespace stripansi {

TEST(FdSink, writesToPipe)
{
    TestPipe pipe;

    {
        FdSink sink(pipe.writeSide);
        sink("hello ");
        sink("world");
        sink.flush();
        ASSERT_TRUE(sink.good());
    }

    ASSERT_EQ(pipe.drain(), "hello world");
}

TEST(FdSink, flushesOnDestruction)
{
    TestPipe pipe;

    {
        FdSink sink(pipe.writeSide);
        sink("buffered");
    }

    ASSERT_EQ(pipe.drain(), "buffered");
}

TEST(FdSink, largeWritesBypassBuffer)
{
    TestPipe pipe;
    std::string big(40000, 'x');

    {
        FdSink sink(pipe.writeSide);
        sink("a");
        sink(big);
        ASSERT_EQ(sink.bufPos, 0);
    }

    ASSERT_EQ(pipe.drain(), "a" + big);
}

TEST(FdSink, moveTransfersBuffer)
{
    TestPipe pipe;

    {
        FdSink sink(pipe.writeSide);
        sink("moved");
        FdSink sink2(std::move(sink));
        ASSERT_EQ(sink.fd, INVALID_DESCRIPTOR);
        ASSERT_EQ(sink.bufPos, 0);
    }

    ASSERT_EQ(pipe.drain(), "moved");
}

TEST(FdSink, reportsWriteErrors)
{
    FdSink sink(INVALID_DESCRIPTOR);
    sink("lost");

    ASSERT_THROW(sink.flush(), SysError);
    ASSERT_FALSE(sink.good());
}

TEST(FdSource, readsUntilEndOfFile)
{
    TestPipe pipe;
    writeFull(pipe.writeSide, "some\ninput");
    TestPipe::closeEnd(pipe.writeSide);

    FdSource source(pipe.readSide);
    StringSink sink;
    source.drainInto(sink);

    ASSERT_EQ(sink.s, "some\ninput");

    char c;
    ASSERT_THROW(source.read(&c, 1), EndOfFile);
}

TEST(FdSource, reportsReadErrors)
{
    FdSource source(INVALID_DESCRIPTOR);
    char c;

    ASSERT_THROW(source.read(&c, 1), SysError);
}

} // namespace stripansi

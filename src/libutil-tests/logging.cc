#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "stripansi/util/logging.hh"
#include "stripansi/util/strip.hh"

#include <sstream>
#include <stdexcept>

namespace stripansi {

/**
 * Collects log lines, stripped of colour, instead of printing them.
 */
class CapturingLogger : public Logger
{
public:
    std::vector<std::string> & lines;

    CapturingLogger(std::vector<std::string> & lines)
        : lines(lines)
    {
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        lines.push_back(strip(s));
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);
        log(ei.level, oss.str());
    }
};

struct LoggingTest : ::testing::Test
{
    std::vector<std::string> lines;
    std::unique_ptr<Logger> saved;
    Verbosity savedVerbosity;

    void SetUp() override
    {
        saved = std::exchange(logger, std::make_unique<CapturingLogger>(lines));
        savedVerbosity = verbosity;
    }

    void TearDown() override
    {
        logger = std::move(saved);
        verbosity = savedVerbosity;
    }
};

TEST_F(LoggingTest, logError)
{
    logError(Error("cannot write '%s'", "out").info());

    ASSERT_EQ(lines, std::vector<std::string>{"error: cannot write 'out'"});
}

TEST_F(LoggingTest, sysErrorAppendsStrerror)
{
    logError(SysError(EPIPE, "writing to file").info());

    ASSERT_EQ(lines.size(), 1);
    ASSERT_THAT(lines[0], testing::StartsWith("error: writing to file: "));
    ASSERT_THAT(lines[0], testing::HasSubstr(strerror(EPIPE)));
}

TEST_F(LoggingTest, warn)
{
    warn("unknown setting '%s'", "foo");

    ASSERT_EQ(lines, std::vector<std::string>{"warning: unknown setting 'foo'"});
}

TEST_F(LoggingTest, verbosityFilters)
{
    verbosity = lvlInfo;
    debug("hidden");
    printError("shown %d", 1);

    ASSERT_EQ(lines, std::vector<std::string>{"shown 1"});
}

TEST_F(LoggingTest, stripLogsNothing)
{
    verbosity = lvlDebug;

    ASSERT_EQ(strip("\x1b[1mbold\x1b[m\x1b]0;t\x07\n"), "bold\n");
    ASSERT_TRUE(lines.empty());
}

struct AlwaysFullSink : Sink
{
    void operator()(std::string_view data) override
    {
        throw std::runtime_error("disk full");
    }
};

TEST_F(LoggingTest, destructorLogsNonErrorFailure)
{
    {
        StripWriter<AlwaysFullSink> writer{AlwaysFullSink()};
        ASSERT_THROW(writer.write("ab\ncd"), std::runtime_error);
    }

    ASSERT_EQ(lines, std::vector<std::string>{"error (ignored): disk full"});
}

TEST_F(LoggingTest, failedFdSinkIsNotFlushedAgain)
{
    {
        FdSink sink(INVALID_DESCRIPTOR);
        sink("lost");
        ASSERT_THROW(sink.flush(), SysError);
        sink("more");
    }

    ASSERT_TRUE(lines.empty());
}

TEST_F(LoggingTest, failedWriterReportsOnce)
{
    {
        StripWriter<FdSink> writer{FdSink(INVALID_DESCRIPTOR)};
        ASSERT_THROW(writer.write(std::string(100000, 'a')), SysError);
    }

    ASSERT_TRUE(lines.empty());
}

TEST(Error, whatIncludesPrefix)
{
    Error e("bad thing %d", 42);

    ASSERT_EQ(e.message(), "bad thing " ANSI_MAGENTA "42" ANSI_NORMAL);
    ASSERT_EQ(strip(e.what()), "error: bad thing 42");
}

} // namespace stripansi

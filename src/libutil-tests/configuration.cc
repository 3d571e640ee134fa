#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "stripansi/util/configuration.hh"
#include "stripansi/util/strip.hh"

namespace stripansi {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

struct TestSettings : Config
{
    Setting<size_t> bufferSize{this, 1024, "buffer-size", "How much to buffer."};
    Setting<size_t> maxLines{this, 10, "max-lines", "\n  How many lines.\n"};
};

TEST(Config, setUnknownSetting)
{
    TestSettings config;

    ASSERT_FALSE(config.set("foo", "bar"));
}

TEST(Config, setKnownSetting)
{
    TestSettings config;

    ASSERT_TRUE(config.set("buffer-size", "2K"));
    ASSERT_EQ(config.bufferSize.get(), 2048);
    ASSERT_EQ(config.maxLines.get(), 10);
}

TEST(Config, setInvalidValue)
{
    TestSettings config;

    ASSERT_THROW(config.set("buffer-size", "lots"), UsageError);
    ASSERT_THROW(config.set("max-lines", "-1"), UsageError);
    ASSERT_EQ(config.bufferSize.get(), 1024);
}

TEST(Config, descriptionIsTrimmed)
{
    TestSettings config;

    ASSERT_EQ(config.maxLines.description, "How many lines.");
}

TEST(Config, applyConfig)
{
    TestSettings config;

    config.applyConfig(
        "# a comment\n"
        "buffer-size = 8K\n"
        "\n"
        "  max-lines   =   3 # trailing comment\n"
        "unknown-setting = 1\n");

    ASSERT_EQ(config.bufferSize.get(), 8192);
    ASSERT_EQ(config.maxLines.get(), 3);
}

TEST(Config, applyConfigSyntaxError)
{
    TestSettings config;

    ASSERT_THROW(config.applyConfig("buffer-size 8K\n", "test.conf"), UsageError);
    ASSERT_THROW(config.applyConfig("max-lines\n", "test.conf"), UsageError);
}

TEST(Config, applyConfigInvalidValue)
{
    TestSettings config;

    try {
        config.applyConfig("max-lines = 2 3\n", "test.conf");
        FAIL() << "applyConfig should have thrown";
    } catch (UsageError & e) {
        ASSERT_THAT(e.message(), testing::HasSubstr("max-lines"));
    }
}

TEST(StripSettings, defaults)
{
    ASSERT_EQ(stripSettings.lineBufferSize.get(), 1024);
    ASSERT_EQ(stripSettings.oscMaxBytes.get(), 1024);
    ASSERT_THAT(stripSettings.lineBufferSize.description, testing::HasSubstr("linefeed"));
}

} // namespace stripansi

#include <gtest/gtest.h>

#include "stripansi/util/strings.hh"
#include "stripansi/util/util.hh"

namespace stripansi {

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    ASSERT_TRUE(tokenizeString<std::vector<std::string>>("").empty());
}

TEST(tokenizeString, collapsesWhitespace)
{
    std::vector<std::string> expected = {"line-buffer-size", "=", "4K"};

    ASSERT_EQ(tokenizeString<std::vector<std::string>>("  line-buffer-size \t=\n 4K\r"), expected);
}

TEST(tokenizeString, customSeparator)
{
    std::vector<std::string> expected = {"0", "title"};

    ASSERT_EQ(tokenizeString<std::vector<std::string>>(";0;;title;", ";"), expected);
}

/* ----------------------------------------------------------------------------
 * splitString
 * --------------------------------------------------------------------------*/

TEST(splitString, keepsEmptyFields)
{
    std::vector<std::string> expected = {"", "a", "", "b", ""};

    ASSERT_EQ(splitString<std::vector<std::string>>("\na\n\nb\n", "\n"), expected);
}

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    ASSERT_EQ(concatStringsSep(",", std::vector<std::string>{}), "");
}

TEST(concatStringsSep, emptyStrings)
{
    ASSERT_EQ(concatStringsSep(",", std::vector<std::string>{"", ""}), ",");
}

TEST(concatStringsSep, params)
{
    ASSERT_EQ(concatStringsSep(";", std::vector<std::string>{"1", "32"}), "1;32");
}

/* ----------------------------------------------------------------------------
 * trim
 * --------------------------------------------------------------------------*/

TEST(trim, whitespace)
{
    ASSERT_EQ(trim("\n  some text\t \n"), "some text");
    ASSERT_EQ(trim(" \n\t"), "");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, valid)
{
    ASSERT_EQ(string2Int<size_t>("0"), 0);
    ASSERT_EQ(string2Int<size_t>("1024"), 1024);
}

TEST(string2Int, invalid)
{
    ASSERT_EQ(string2Int<size_t>("4x"), std::nullopt);
    ASSERT_EQ(string2Int<size_t>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<size_t>(""), std::nullopt);
}

TEST(string2IntWithUnitPrefix, units)
{
    ASSERT_EQ(string2IntWithUnitPrefix<size_t>("16"), 16);
    ASSERT_EQ(string2IntWithUnitPrefix<size_t>("4k"), 4096);
    ASSERT_EQ(string2IntWithUnitPrefix<size_t>("2M"), 2 * 1024 * 1024);
    ASSERT_EQ(string2IntWithUnitPrefix<size_t>("1G"), 1024 * 1024 * 1024);
}

TEST(string2IntWithUnitPrefix, badUnit)
{
    ASSERT_THROW(string2IntWithUnitPrefix<size_t>("3T"), UsageError);
    ASSERT_THROW(string2IntWithUnitPrefix<size_t>("K"), UsageError);
}

} // namespace stripansi

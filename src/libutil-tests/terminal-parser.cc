#include <gtest/gtest.h>

#include "stripansi/util/terminal-parser.hh"

#include <limits>
#include <vector>

namespace stripansi::terminal {

/* ----------------------------------------------------------------------------
 * Parser
 * --------------------------------------------------------------------------*/

static std::vector<Token> parse(Parser & parser, std::string_view input)
{
    std::vector<Token> tokens;
    for (auto c : input)
        parser.advance(static_cast<uint8_t>(c), [&](const Token & t) { tokens.push_back(t); });
    return tokens;
}

static std::vector<Token> parse(std::string_view input)
{
    Parser parser;
    return parse(parser, input);
}

static std::u32string printed(const std::vector<Token> & tokens)
{
    std::u32string res;
    for (auto & t : tokens)
        if (auto p = std::get_if<Print>(&t))
            res.push_back(p->c);
    return res;
}

TEST(Parser, printsAscii)
{
    auto tokens = parse("hi!");

    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(std::get<Print>(tokens[0]).c, U'h');
    EXPECT_EQ(std::get<Print>(tokens[1]).c, U'i');
    EXPECT_EQ(std::get<Print>(tokens[2]).c, U'!');
}

TEST(Parser, executesControls)
{
    auto tokens = parse("a\tb\r\n");

    ASSERT_EQ(tokens.size(), 5);
    EXPECT_EQ(std::get<Execute>(tokens[1]).byte, '\t');
    EXPECT_EQ(std::get<Execute>(tokens[3]).byte, '\r');
    EXPECT_EQ(std::get<Execute>(tokens[4]).byte, '\n');
}

TEST(Parser, csiWithParams)
{
    auto tokens = parse("\x1b[1;32m");

    ASSERT_EQ(tokens.size(), 1);
    auto & csi = std::get<CsiDispatch>(tokens[0]);
    EXPECT_EQ(csi.params, (std::vector<int64_t>{1, 32}));
    EXPECT_EQ(csi.intermediates, "");
    EXPECT_FALSE(csi.ignore);
    EXPECT_EQ(csi.action, 'm');
}

TEST(Parser, csiWithoutParams)
{
    auto tokens = parse("\x1b[m");

    ASSERT_EQ(tokens.size(), 1);
    auto & csi = std::get<CsiDispatch>(tokens[0]);
    EXPECT_EQ(csi.params, (std::vector<int64_t>{0}));
    EXPECT_EQ(csi.action, 'm');
}

TEST(Parser, csiPrivateMarker)
{
    auto tokens = parse("\x1b[?25h");

    ASSERT_EQ(tokens.size(), 1);
    auto & csi = std::get<CsiDispatch>(tokens[0]);
    EXPECT_EQ(csi.params, (std::vector<int64_t>{25}));
    EXPECT_EQ(csi.intermediates, "?");
    EXPECT_EQ(csi.action, 'h');
}

TEST(Parser, csiTooManyParams)
{
    std::string input = "\x1b[";
    for (int i = 0; i < 17; ++i)
        input += "1;";
    input += "1m";

    auto tokens = parse(input);

    ASSERT_EQ(tokens.size(), 1);
    auto & csi = std::get<CsiDispatch>(tokens[0]);
    EXPECT_EQ(csi.params.size(), maxParams);
    EXPECT_TRUE(csi.ignore);
}

TEST(Parser, csiTooManyIntermediates)
{
    auto tokens = parse("\x1b[   q");

    ASSERT_EQ(tokens.size(), 1);
    auto & csi = std::get<CsiDispatch>(tokens[0]);
    EXPECT_EQ(csi.intermediates, "  ");
    EXPECT_TRUE(csi.ignore);
}

TEST(Parser, csiHugeParamSaturates)
{
    auto tokens = parse("\x1b[99999999999999999999999999m");

    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(std::get<CsiDispatch>(tokens[0]).params, (std::vector<int64_t>{std::numeric_limits<int64_t>::max()}));
}

TEST(Parser, escDispatch)
{
    auto tokens = parse("\x1b" "7");

    ASSERT_EQ(tokens.size(), 1);
    auto & esc = std::get<EscDispatch>(tokens[0]);
    EXPECT_EQ(esc.byte, '7');
    EXPECT_EQ(esc.intermediates, "");
}

TEST(Parser, escDispatchWithIntermediate)
{
    auto tokens = parse("\x1b(B");

    ASSERT_EQ(tokens.size(), 1);
    auto & esc = std::get<EscDispatch>(tokens[0]);
    EXPECT_EQ(esc.byte, 'B');
    EXPECT_EQ(esc.intermediates, "(");
}

TEST(Parser, oscTerminatedByBell)
{
    auto tokens = parse("\x1b]0;title\x07");

    ASSERT_EQ(tokens.size(), 1);
    auto & osc = std::get<OscDispatch>(tokens[0]);
    EXPECT_EQ(osc.params, (std::vector<std::string>{"0", "title"}));
    EXPECT_TRUE(osc.bellTerminated);
}

TEST(Parser, oscTerminatedByStringTerminator)
{
    auto tokens = parse("\x1b]8;;http://example.org\x1b\\");

    ASSERT_EQ(tokens.size(), 2);
    auto & osc = std::get<OscDispatch>(tokens[0]);
    EXPECT_EQ(osc.params, (std::vector<std::string>{"8", "", "http://example.org"}));
    EXPECT_FALSE(osc.bellTerminated);
    EXPECT_EQ(std::get<EscDispatch>(tokens[1]).byte, '\\');
}

TEST(Parser, oscEmpty)
{
    auto tokens = parse("\x1b]\x07");

    ASSERT_EQ(tokens.size(), 1);
    EXPECT_TRUE(std::get<OscDispatch>(tokens[0]).params.empty());
}

TEST(Parser, oscIsBounded)
{
    Parser parser(4);
    auto tokens = parse(parser, "\x1b]abcdefgh\x07z");

    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(std::get<OscDispatch>(tokens[0]).params, (std::vector<std::string>{"abcd"}));
    EXPECT_EQ(std::get<Print>(tokens[1]).c, U'z');
}

TEST(Parser, dcs)
{
    auto tokens = parse("\x1bPq#0\x1b\\");

    ASSERT_EQ(tokens.size(), 5);
    EXPECT_EQ(std::get<Hook>(tokens[0]).action, 'q');
    EXPECT_EQ(std::get<Put>(tokens[1]).byte, '#');
    EXPECT_EQ(std::get<Put>(tokens[2]).byte, '0');
    EXPECT_TRUE(std::holds_alternative<Unhook>(tokens[3]));
    EXPECT_EQ(std::get<EscDispatch>(tokens[4]).byte, '\\');
}

TEST(Parser, sosPmApcStringsAreSwallowed)
{
    auto tokens = parse("\x1b_hidden\x1b\\x");

    ASSERT_EQ(tokens.size(), 2);
    EXPECT_TRUE(std::holds_alternative<EscDispatch>(tokens[0]));
    EXPECT_EQ(std::get<Print>(tokens[1]).c, U'x');
}

TEST(Parser, cancelAbortsSequence)
{
    auto tokens = parse("\x1b[12\x18x");

    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(std::get<Execute>(tokens[0]).byte, 0x18);
    EXPECT_EQ(std::get<Print>(tokens[1]).c, U'x');
}

TEST(Parser, escRestartsSequence)
{
    auto tokens = parse("\x1b[12\x1b[m");

    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(std::get<CsiDispatch>(tokens[0]).params, (std::vector<int64_t>{0}));
}

TEST(Parser, utf8)
{
    EXPECT_EQ(printed(parse("f\xc3\xb6\xc3\xb6")), U"föö");
    EXPECT_EQ(printed(parse("\xe2\x82\xac")), U"€");
    EXPECT_EQ(printed(parse("\xf0\x9f\x94\x8d")), U"🔍");
}

TEST(Parser, invalidUtf8)
{
    EXPECT_EQ(printed(parse("\xff")), U"�");
    EXPECT_EQ(printed(parse("\xc3" "A")), U"�" U"A");
    /* Overlong encoding of '/'. */
    EXPECT_EQ(printed(parse("\xc0\xaf")), U"��");
    /* Surrogate half. */
    EXPECT_EQ(printed(parse("\xed\xa0\x80")), U"���");
}

TEST(Parser, invalidUtf8BeforeEscape)
{
    auto tokens = parse("\xe2\x82\x1b[m");

    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(std::get<Print>(tokens[0]).c, replacementCharacter);
    EXPECT_TRUE(std::holds_alternative<CsiDispatch>(tokens[1]));
}

TEST(Parser, highByteAbandonsCsi)
{
    EXPECT_EQ(printed(parse("\x1b[1\xc3\xa9")), U"é");
}

TEST(Parser, stringTerminatorEndsCsi)
{
    auto tokens = parse("\x1b[31\x9cm");

    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(std::get<Print>(tokens[0]).c, U'm');
}

TEST(Parser, c1ControlInsideSequenceIsExecuted)
{
    auto tokens = parse("\x1b[\x85x");

    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(std::get<Execute>(tokens[0]).byte, 0x85);
    EXPECT_EQ(std::get<Print>(tokens[1]).c, U'x');
}

TEST(Parser, c1IntroducerRestartsSequence)
{
    auto tokens = parse("\x1b[12\x9b" "4m");

    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(std::get<CsiDispatch>(tokens[0]).params, (std::vector<int64_t>{4}));
}

TEST(Parser, c1InGroundIsUtf8)
{
    EXPECT_EQ(printed(parse("\x9c")), U"\ufffd");
}

TEST(Parser, stateCarriesAcrossCalls)
{
    Parser parser;

    EXPECT_TRUE(parse(parser, "\x1b[3").empty());
    EXPECT_FALSE(parser.inGround());
    EXPECT_TRUE(parse(parser, "1").empty());

    auto tokens = parse(parser, "mx\xe2\x82");
    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(std::get<CsiDispatch>(tokens[0]).params, (std::vector<int64_t>{31}));
    EXPECT_FALSE(parser.inGround());

    EXPECT_EQ(printed(parse(parser, "\xac")), U"€");
    EXPECT_TRUE(parser.inGround());
}

} // namespace stripansi::terminal

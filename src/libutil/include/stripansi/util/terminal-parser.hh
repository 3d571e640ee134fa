#pragma once
/**
 * @file
 *
 * @brief Byte-level parser for ECMA-48 / VT500 terminal control
 * sequences.
 *
 * The state machine follows the DEC VT500-series parser described by
 * Paul Williams (https://vt100.net/emu/dec_ansi_parser), with UTF-8
 * decoding of printable text in the ground state. It does not
 * interpret anything; it only classifies the input into `Token`s.
 *
 * Bytes 0x80-0x9f are 8-bit C1 controls only inside an escape or
 * control sequence. In ground state and in string payloads they are
 * ordinary (UTF-8) data.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stripansi::terminal {

/**
 * At most this many numeric parameters are kept for CSI and DCS
 * sequences. More set the `ignore` flag of the dispatched token.
 */
constexpr size_t maxParams = 16;

/**
 * At most this many intermediate bytes are kept. More set the `ignore`
 * flag of the dispatched token.
 */
constexpr size_t maxIntermediates = 2;

/**
 * Decoded in place of each invalid UTF-8 sequence.
 */
constexpr char32_t replacementCharacter = 0xfffd;

/**
 * A printable character, decoded from UTF-8.
 */
struct Print
{
    char32_t c;
};

/**
 * A C0 control byte, such as linefeed, carriage return or tab.
 */
struct Execute
{
    uint8_t byte;
};

/**
 * The start of a DCS string (`ESC P params intermediates final`).
 * The string body follows as `Put` tokens, closed by `Unhook`.
 */
struct Hook
{
    std::vector<int64_t> params;
    std::string intermediates;
    bool ignore;
    char action;
};

struct Put
{
    uint8_t byte;
};

struct Unhook
{
};

/**
 * An operating system command (`ESC ] ... BEL` or `ESC ] ... ESC \`),
 * split on `;`.
 */
struct OscDispatch
{
    std::vector<std::string> params;
    bool bellTerminated;
};

/**
 * A control sequence (`ESC [ params intermediates final`).
 */
struct CsiDispatch
{
    std::vector<int64_t> params;
    std::string intermediates;
    bool ignore;
    char action;
};

/**
 * A plain escape sequence (`ESC intermediates final`), e.g. `ESC 7`.
 */
struct EscDispatch
{
    std::string intermediates;
    bool ignore;
    uint8_t byte;
};

using Token = std::variant<Print, Execute, Hook, Put, Unhook, OscDispatch, CsiDispatch, EscDispatch>;

class Parser
{
public:

    /**
     * Receives every token recognised by `advance()`. A single byte
     * may produce zero, one or two tokens (e.g. the `OscDispatch` that
     * an ESC terminates, before the ESC itself starts a new sequence).
     */
    using Emit = std::function<void(const Token &)>;

    /**
     * @param oscMaxBytes Bytes of an OSC string beyond this many are
     * dropped.
     */
    explicit Parser(size_t oscMaxBytes = 1024)
        : oscMaxBytes(oscMaxBytes)
    {
    }

    /**
     * Feed one byte. State carries over between calls, so input may
     * be split anywhere.
     */
    void advance(uint8_t byte, const Emit & emit);

    /**
     * Whether no sequence or UTF-8 character is in progress.
     */
    bool inGround() const
    {
        return state == State::Ground && utf8Remaining == 0;
    }

private:

    enum class State {
        Ground,
        Escape,
        EscapeIntermediate,
        CsiEntry,
        CsiParam,
        CsiIntermediate,
        CsiIgnore,
        DcsEntry,
        DcsParam,
        DcsIntermediate,
        DcsPassthrough,
        DcsIgnore,
        OscString,
        SosPmApcString,
    };

    State state = State::Ground;

    size_t oscMaxBytes;

    std::vector<int64_t> params;
    int64_t param = 0;
    std::string intermediates;
    bool ignoring = false;
    std::string oscRaw;

    char32_t utf8Codepoint = 0;
    unsigned int utf8Remaining = 0;
    uint8_t utf8Lower = 0x80, utf8Upper = 0xbf;

    void transition(State newState, const Emit & emit);
    void c1(uint8_t byte, const Emit & emit);

    void clear();
    void collect(uint8_t byte);
    void addParamDigit(uint8_t byte);
    void finishParam();

    void ground(uint8_t byte, const Emit & emit);
    void decodeUtf8(uint8_t byte, const Emit & emit);

    void escape(uint8_t byte, const Emit & emit);
    void escapeIntermediate(uint8_t byte, const Emit & emit);
    void csiEntry(uint8_t byte, const Emit & emit);
    void csiParam(uint8_t byte, const Emit & emit);
    void csiIntermediate(uint8_t byte, const Emit & emit);
    void csiIgnore(uint8_t byte, const Emit & emit);
    void dcsEntry(uint8_t byte, const Emit & emit);
    void dcsParam(uint8_t byte, const Emit & emit);
    void dcsIntermediate(uint8_t byte, const Emit & emit);
    void dcsPassthrough(uint8_t byte, const Emit & emit);
    void oscString(uint8_t byte, const Emit & emit);

    void escDispatch(uint8_t byte, const Emit & emit);
    void csiDispatch(uint8_t byte, const Emit & emit);
    void hook(uint8_t byte, const Emit & emit);
    void oscDispatch(bool bellTerminated, const Emit & emit);
};

} // namespace stripansi::terminal

#include "stripansi/util/terminal-parser.hh"

#include <limits>

namespace stripansi::terminal {

static bool isC0(uint8_t b)
{
    return b < 0x20;
}

static bool isIntermediate(uint8_t b)
{
    return b >= 0x20 && b <= 0x2f;
}

static bool isDigit(uint8_t b)
{
    return b >= '0' && b <= '9';
}

/* `<`, `=`, `>` and `?`: private-use markers, collected like
   intermediates but only valid directly after the introducer. */
static bool isPrivateMarker(uint8_t b)
{
    return b >= 0x3c && b <= 0x3f;
}

static bool isFinal(uint8_t b)
{
    return b >= 0x40 && b <= 0x7e;
}

void Parser::advance(uint8_t byte, const Emit & emit)
{
    if (state == State::Ground) {
        ground(byte, emit);
        return;
    }

    /* Transitions from anywhere: CAN and SUB abort the sequence, ESC
       starts a new one. */
    switch (byte) {
    case 0x18:
    case 0x1a:
        transition(State::Ground, emit);
        emit(Execute{byte});
        return;
    case 0x1b:
        transition(State::Escape, emit);
        return;
    }

    /* C1 controls interrupt an escape or control sequence. String
       payloads are left alone, since they may carry UTF-8. */
    if (byte >= 0x80 && byte <= 0x9f && state != State::OscString && state != State::DcsPassthrough
        && state != State::DcsIgnore && state != State::SosPmApcString) {
        c1(byte, emit);
        return;
    }

    switch (state) {
    case State::Ground:
        break;
    case State::Escape:
        escape(byte, emit);
        break;
    case State::EscapeIntermediate:
        escapeIntermediate(byte, emit);
        break;
    case State::CsiEntry:
        csiEntry(byte, emit);
        break;
    case State::CsiParam:
        csiParam(byte, emit);
        break;
    case State::CsiIntermediate:
        csiIntermediate(byte, emit);
        break;
    case State::CsiIgnore:
        csiIgnore(byte, emit);
        break;
    case State::DcsEntry:
        dcsEntry(byte, emit);
        break;
    case State::DcsParam:
        dcsParam(byte, emit);
        break;
    case State::DcsIntermediate:
        dcsIntermediate(byte, emit);
        break;
    case State::DcsPassthrough:
        dcsPassthrough(byte, emit);
        break;
    case State::OscString:
        oscString(byte, emit);
        break;
    case State::DcsIgnore:
    case State::SosPmApcString:
        /* Everything up to the string terminator is swallowed. */
        break;
    }
}

void Parser::c1(uint8_t byte, const Emit & emit)
{
    switch (byte) {
    case 0x90: // DCS
        transition(State::DcsEntry, emit);
        break;
    case 0x98: // SOS
    case 0x9e: // PM
    case 0x9f: // APC
        transition(State::SosPmApcString, emit);
        break;
    case 0x9b: // CSI
        transition(State::CsiEntry, emit);
        break;
    case 0x9c: // ST
        transition(State::Ground, emit);
        break;
    case 0x9d: // OSC
        transition(State::OscString, emit);
        break;
    default:
        transition(State::Ground, emit);
        emit(Execute{byte});
        break;
    }
}

void Parser::transition(State newState, const Emit & emit)
{
    if (state == State::DcsPassthrough)
        emit(Unhook{});
    else if (state == State::OscString)
        oscDispatch(false, emit);

    state = newState;

    switch (newState) {
    case State::Escape:
    case State::CsiEntry:
    case State::DcsEntry:
        clear();
        break;
    case State::OscString:
        oscRaw.clear();
        break;
    default:
        break;
    }
}

void Parser::clear()
{
    params.clear();
    param = 0;
    intermediates.clear();
    ignoring = false;
}

void Parser::collect(uint8_t byte)
{
    if (intermediates.size() < maxIntermediates)
        intermediates.push_back(byte);
    else
        ignoring = true;
}

void Parser::addParamDigit(uint8_t byte)
{
    constexpr auto max = std::numeric_limits<int64_t>::max();
    int64_t digit = byte - '0';
    param = param > (max - digit) / 10 ? max : param * 10 + digit;
}

void Parser::finishParam()
{
    if (params.size() < maxParams)
        params.push_back(param);
    else
        ignoring = true;
    param = 0;
}

void Parser::ground(uint8_t byte, const Emit & emit)
{
    if (utf8Remaining || byte >= 0x80)
        decodeUtf8(byte, emit);
    else if (byte == 0x1b)
        transition(State::Escape, emit);
    else if (isC0(byte))
        emit(Execute{byte});
    else
        emit(Print{byte});
}

void Parser::decodeUtf8(uint8_t byte, const Emit & emit)
{
    if (!utf8Remaining) {
        if (byte >= 0xc2 && byte <= 0xdf) {
            utf8Remaining = 1;
            utf8Codepoint = byte & 0x1f;
        } else if (byte >= 0xe0 && byte <= 0xef) {
            utf8Remaining = 2;
            utf8Codepoint = byte & 0x0f;
            /* No overlong encodings, no surrogates. */
            if (byte == 0xe0)
                utf8Lower = 0xa0;
            else if (byte == 0xed)
                utf8Upper = 0x9f;
        } else if (byte >= 0xf0 && byte <= 0xf4) {
            utf8Remaining = 3;
            utf8Codepoint = byte & 0x07;
            /* No overlong encodings, nothing above U+10FFFF. */
            if (byte == 0xf0)
                utf8Lower = 0x90;
            else if (byte == 0xf4)
                utf8Upper = 0x8f;
        } else
            emit(Print{replacementCharacter});
        return;
    }

    if (byte < utf8Lower || byte > utf8Upper) {
        /* The sequence so far is replaced; the byte that broke it is
           looked at again on its own. */
        utf8Remaining = 0;
        utf8Lower = 0x80;
        utf8Upper = 0xbf;
        emit(Print{replacementCharacter});
        ground(byte, emit);
        return;
    }

    utf8Lower = 0x80;
    utf8Upper = 0xbf;
    utf8Codepoint = (utf8Codepoint << 6) | (byte & 0x3f);
    if (--utf8Remaining == 0)
        emit(Print{utf8Codepoint});
}

void Parser::escape(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80) {
        state = State::Ground;
        ground(byte, emit);
    } else if (isC0(byte))
        emit(Execute{byte});
    else if (isIntermediate(byte)) {
        collect(byte);
        state = State::EscapeIntermediate;
    } else if (byte == '[')
        transition(State::CsiEntry, emit);
    else if (byte == ']')
        transition(State::OscString, emit);
    else if (byte == 'P')
        transition(State::DcsEntry, emit);
    else if (byte == 'X' || byte == '^' || byte == '_')
        state = State::SosPmApcString;
    else if (byte != 0x7f)
        escDispatch(byte, emit);
}

void Parser::escapeIntermediate(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80) {
        state = State::Ground;
        ground(byte, emit);
    } else if (isC0(byte))
        emit(Execute{byte});
    else if (isIntermediate(byte))
        collect(byte);
    else if (byte != 0x7f)
        escDispatch(byte, emit);
}

void Parser::csiEntry(uint8_t byte, const Emit & emit)
{
    if (isDigit(byte) || byte == ';' || isPrivateMarker(byte)) {
        state = State::CsiParam;
        if (isPrivateMarker(byte))
            collect(byte);
        else
            csiParam(byte, emit);
    } else
        csiParam(byte, emit);
}

void Parser::csiParam(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80) {
        state = State::Ground;
        ground(byte, emit);
    } else if (isC0(byte))
        emit(Execute{byte});
    else if (isDigit(byte)) {
        state = State::CsiParam;
        addParamDigit(byte);
    } else if (byte == ';') {
        state = State::CsiParam;
        finishParam();
    } else if (byte == ':' || isPrivateMarker(byte))
        state = State::CsiIgnore;
    else if (isIntermediate(byte)) {
        collect(byte);
        state = State::CsiIntermediate;
    } else if (isFinal(byte))
        csiDispatch(byte, emit);
}

void Parser::csiIntermediate(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80) {
        state = State::Ground;
        ground(byte, emit);
    } else if (isC0(byte))
        emit(Execute{byte});
    else if (isIntermediate(byte))
        collect(byte);
    else if (byte >= 0x30 && byte <= 0x3f)
        state = State::CsiIgnore;
    else if (isFinal(byte))
        csiDispatch(byte, emit);
}

void Parser::csiIgnore(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80) {
        state = State::Ground;
        ground(byte, emit);
    } else if (isC0(byte))
        emit(Execute{byte});
    else if (isFinal(byte))
        state = State::Ground;
}

void Parser::dcsEntry(uint8_t byte, const Emit & emit)
{
    if (isDigit(byte) || byte == ';' || isPrivateMarker(byte)) {
        state = State::DcsParam;
        if (isPrivateMarker(byte))
            collect(byte);
        else
            dcsParam(byte, emit);
    } else
        dcsParam(byte, emit);
}

void Parser::dcsParam(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80)
        state = State::DcsIgnore;
    else if (isDigit(byte)) {
        state = State::DcsParam;
        addParamDigit(byte);
    } else if (byte == ';') {
        state = State::DcsParam;
        finishParam();
    } else if (byte == ':' || isPrivateMarker(byte))
        state = State::DcsIgnore;
    else if (isIntermediate(byte)) {
        collect(byte);
        state = State::DcsIntermediate;
    } else if (isFinal(byte))
        hook(byte, emit);
    /* C0 controls and DEL are ignored until the string starts. */
}

void Parser::dcsIntermediate(uint8_t byte, const Emit & emit)
{
    if (byte >= 0x80)
        state = State::DcsIgnore;
    else if (isIntermediate(byte))
        collect(byte);
    else if (byte >= 0x30 && byte <= 0x3f)
        state = State::DcsIgnore;
    else if (isFinal(byte))
        hook(byte, emit);
}

void Parser::dcsPassthrough(uint8_t byte, const Emit & emit)
{
    if (byte != 0x7f)
        emit(Put{byte});
}

void Parser::oscString(uint8_t byte, const Emit & emit)
{
    if (byte == 0x07) {
        /* xterm-style termination by BEL. */
        oscDispatch(true, emit);
        state = State::Ground;
    } else if (isC0(byte) || byte == 0x7f)
        return;
    else if (oscRaw.size() < oscMaxBytes)
        oscRaw.push_back(byte);
}

void Parser::escDispatch(uint8_t byte, const Emit & emit)
{
    emit(EscDispatch{intermediates, ignoring, byte});
    state = State::Ground;
}

void Parser::csiDispatch(uint8_t byte, const Emit & emit)
{
    finishParam();
    emit(CsiDispatch{params, intermediates, ignoring, static_cast<char>(byte)});
    state = State::Ground;
}

void Parser::hook(uint8_t byte, const Emit & emit)
{
    finishParam();
    emit(Hook{params, intermediates, ignoring, static_cast<char>(byte)});
    state = State::DcsPassthrough;
}

void Parser::oscDispatch(bool bellTerminated, const Emit & emit)
{
    OscDispatch osc{.params = {}, .bellTerminated = bellTerminated};
    if (!oscRaw.empty()) {
        /* The last parameter takes the remainder once the limit is
           reached. */
        std::string_view rest{oscRaw};
        while (osc.params.size() + 1 < maxParams) {
            auto semi = rest.find(';');
            if (semi == rest.npos)
                break;
            osc.params.emplace_back(rest.substr(0, semi));
            rest.remove_prefix(semi + 1);
        }
        osc.params.emplace_back(rest);
    }
    oscRaw.clear();
    emit(osc);
}

} // namespace stripansi::terminal

#pragma once
///@file

namespace stripansi {

/**
 * Whether standard error is a terminal that can render escape
 * sequences: it is a tty, `TERM` is set and not "dumb", and neither
 * `NO_COLOR` nor `NOCOLOR` is set.
 *
 * The result is computed once and cached.
 */
bool isTTY();

} // namespace stripansi

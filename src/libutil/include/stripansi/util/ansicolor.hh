#pragma once

/**
 * @file
 *
 * @brief The escape sequences our own diagnostics are decorated with.
 *
 * These are exactly the kind of sequences `strip()` removes again when
 * standard error is not a terminal.
 */

namespace stripansi {

#define ANSI_NORMAL "\e[0m"
#define ANSI_BOLD "\e[1m"
#define ANSI_FAINT "\e[2m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"
#define ANSI_MAGENTA "\e[35;1m"

} // namespace stripansi

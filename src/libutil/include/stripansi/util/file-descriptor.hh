#pragma once
///@file

#include "stripansi/util/error.hh"

#include <string_view>

#include <unistd.h>

namespace stripansi {

using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Write all of `s` to `fd`, retrying on EINTR. Throws `SysError` on
 * any other failure.
 */
void writeFull(Descriptor fd, std::string_view s);

[[gnu::always_inline]]
inline Descriptor getStandardInput()
{
    return STDIN_FILENO;
}

[[gnu::always_inline]]
inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

[[gnu::always_inline]]
inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

MakeError(EndOfFile, Error);

} // namespace stripansi

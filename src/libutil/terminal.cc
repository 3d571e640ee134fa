#include "stripansi/util/terminal.hh"

#include <cstdlib>
#include <string_view>

#include <unistd.h>

namespace stripansi {

bool isTTY()
{
    static const bool tty = [] {
        auto term = getenv("TERM");
        return isatty(STDERR_FILENO) && term && std::string_view(term) != "dumb" && !getenv("NO_COLOR")
               && !getenv("NOCOLOR");
    }();

    return tty;
}

} // namespace stripansi

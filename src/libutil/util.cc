#include "stripansi/util/util.hh"

namespace stripansi {

void ignoreExceptionInDestructor(Verbosity lvl)
{
    /* Nothing may leave this function, not even a failure to log. */
    try {
        try {
            throw;
        } catch (Error & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.message());
        } catch (std::exception & e) {
            printMsg(lvl, ANSI_RED "error (ignored):" ANSI_NORMAL " %s", e.what());
        }
    } catch (...) {
    }
}

} // namespace stripansi

#include "stripansi/main/shared.hh"
#include "stripansi/util/error.hh"
#include "stripansi/util/logging.hh"

#include <signal.h>
#include <new>

namespace stripansi {

void initLibMain()
{
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;

    /* A closed output pipe must show up as EPIPE from write(), so that
       it can be reported like any other I/O error. */
    act.sa_handler = SIG_IGN;
    if (sigaction(SIGPIPE, &act, 0))
        throw SysError("handling SIGPIPE");
}

int handleExceptions(std::function<void()> fun)
{
    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace stripansi

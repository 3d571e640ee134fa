#include "stripansi/util/logging.hh"
#include "stripansi/util/file-descriptor.hh"
#include "stripansi/util/strip.hh"
#include "stripansi/util/terminal.hh"

#include <sstream>

namespace stripansi {

Verbosity verbosity = lvlInfo;

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

class SimpleLogger : public Logger
{
public:

    bool tty;

    SimpleLogger()
    {
        tty = isTTY();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        writeToStderr((tty ? std::string(s) : strip(s)) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);

        log(ei.level, oss.view());
    }
};

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s);
    } catch (SystemError &) {
        /* Standard error is gone; keep going so cleanup still runs. */
    }
}

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

} // namespace stripansi

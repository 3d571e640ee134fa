#pragma once
///@file

#include "stripansi/util/error.hh"

#include <memory>
#include <string_view>

namespace stripansi {

class Logger
{
public:
    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);
};

extern std::unique_ptr<Logger> logger;

/**
 * One line per message on standard error. Escape sequences are
 * stripped from each line unless standard error is a colour terminal.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * Messages above this level are not printed.
 */
extern Verbosity verbosity;

#define logErrorInfo(level, errorInfo...)                 \
    do {                                                  \
        if ((level) <= stripansi::verbosity) {            \
            stripansi::logger->logEI((level), errorInfo); \
        }                                                 \
    } while (0)

#define logError(errorInfo...) logErrorInfo(stripansi::lvlError, errorInfo)

/**
 * The arguments are only formatted if the message will be printed.
 */
#define printMsg(level, args...)                               \
    do {                                                       \
        auto __lvl = level;                                    \
        if (__lvl <= stripansi::verbosity) {                   \
            stripansi::logger->log(__lvl, stripansi::fmt(args)); \
        }                                                      \
    } while (0)

#define printError(args...) printMsg(stripansi::lvlError, args)
#define debug(args...) printMsg(stripansi::lvlDebug, args)

/**
 * Log a message prefixed with `warning:`.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

/**
 * Write `s` to standard error. Failures are ignored, since there is
 * nowhere left to report them.
 */
void writeToStderr(std::string_view s);

} // namespace stripansi

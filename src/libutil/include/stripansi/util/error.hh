#pragma once
/**
 * @file
 *
 * @brief Exception types.
 *
 * Every exception thrown by this library derives from `BaseError`,
 * which carries an `ErrorInfo`: a level, a message and the exit status
 * a program should end with. Rendering (`error: ...`) is left to the
 * logger. I/O failures are thrown as `SysError` and caught as
 * `SystemError` or `Error`.
 */

#include "stripansi/util/fmt.hh"

#include <cerrno>
#include <cstring>
#include <exception>
#include <optional>
#include <string>

namespace stripansi {

typedef enum { lvlError = 0, lvlWarn, lvlInfo, lvlDebug } Verbosity;

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;
    unsigned int status = 1;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

/**
 * Catch `Error`, not this.
 */
class BaseError : public std::exception
{
protected:
    ErrorInfo err;

    /**
     * `what()` as rendered by `showErrorInfo()`, computed on first use.
     */
    mutable std::optional<std::string> what_;

public:
    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(ErrorInfo && e)
        : err(std::move(e))
    {
    }

    /**
     * The message alone, without the level prefix.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override;

    const ErrorInfo & info() const
    {
        return err;
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);
MakeError(SystemError, Error);

/**
 * A failed system call: the message is followed by `strerror(errNo)`.
 */
class SysError : public SystemError
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError("")
        , errNo(errNo)
    {
        err.msg = HintFmt("%1%: %2%", Uncolored(HintFmt(args...).str()), strerror(errNo));
    }

    /**
     * Uses the current `errno`, so nothing may touch it in between.
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

} // namespace stripansi

#pragma once
///@file

#include <boost/format.hpp>
#include <string>

#include "stripansi/util/ansicolor.hh"

namespace stripansi {

template<class F>
inline void formatHelper(F & f)
{
}

template<class F, typename T, typename... Args>
inline void formatHelper(F & f, const T & x, const Args &... args)
{
    formatHelper(f % x, args...);
}

/**
 * Let `boost::format` throw on malformed format strings, but not on a
 * wrong number of arguments.
 */
inline void setExceptions(boost::format & fmt)
{
    fmt.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * A single argument is taken literally, `%` included.
 */
inline std::string fmt(const std::string & s)
{
    return s;
}

template<typename... Args>
inline std::string fmt(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    setExceptions(f);
    formatHelper(f, args...);
    return f.str();
}

/**
 * Prints its value highlighted.
 */
template<class T>
struct Magenta
{
    const T & value;

    Magenta(const T & value)
        : value(value)
    {
    }
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & m)
{
    return out << ANSI_WARNING << m.value << ANSI_NORMAL;
}

/**
 * Opts a `HintFmt` argument out of highlighting.
 */
template<class T>
struct Uncolored
{
    const T & value;

    Uncolored(const T & value)
        : value(value)
    {
    }
};

/**
 * Format string for error messages. Arguments are wrapped in `Magenta`
 * unless they are `Uncolored`.
 */
class HintFmt
{
    boost::format fmt;

public:
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : fmt(format)
    {
        setExceptions(fmt);
        formatHelper(*this, args...);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        fmt % Magenta(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        fmt % value.value;
        return *this;
    }

    std::string str() const
    {
        return fmt.str();
    }
};

} // namespace stripansi

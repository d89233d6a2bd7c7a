#pragma once
///@file

#include <boost/format.hpp>
#include <string>
#include <string_view>

#include "nixops/util/ansicolor.hh"

namespace nixops {

template<class F>
inline void formatHelper(F & f)
{
}

/**
 * Feed `args` to the formatter `f`, as `f % a0 % a1 % ...` would.
 */
template<class F, typename T, typename... Args>
inline void formatHelper(F & f, const T & x, const Args &... args)
{
    formatHelper(f % x, args...);
}

/**
 * Missing or surplus arguments are tolerated; anything else
 * `boost::format` considers an error throws.
 */
inline void setExceptions(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * `boost::format` into a string. A lone argument is returned as is, so
 * that names containing '%' are never taken for directives.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

inline std::string fmt(const char * s)
{
    return s;
}

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
 * Printed in the highlight colour. `HintFmt` wraps its arguments in this.
 */
template<class T>
struct Magenta
{
    Magenta(const T & s)
        : value(s)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & y)
{
    return out << ANSI_WARNING << y.value << ANSI_NORMAL;
}

/**
 * An argument of `HintFmt` that is printed as is, e.g. a rendered value
 * that carries its own quoting.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & s)
        : value(s)
    {
    }

    const T & value;
};

/**
 * The message of an error or a trace frame: a format string whose
 * arguments are highlighted unless they are `Uncolored`.
 */
class HintFmt
{
    boost::format f;

public:

    /**
     * A literal message; '%' is not interpreted.
     */
    HintFmt(const std::string & literal)
        : HintFmt("%s", Uncolored(literal))
    {
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : f(format)
    {
        setExceptions(f);
        formatHelper(*this, args...);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        f % Magenta(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        f % value.value;
        return *this;
    }

    std::string str() const
    {
        return f.str();
    }
};

std::ostream & operator<<(std::ostream & os, const HintFmt & hf);

} // namespace nixops

#pragma once
/**
 * @file
 *
 * Every failure is reported as an exception derived from `Error`. Its
 * `ErrorInfo` holds the message, the context frames added while the
 * exception propagated, and suggestions for misspelled names. The text
 * is only rendered when `what()` is called or the logger prints it.
 */

#include "nixops/util/suggestions.hh"
#include "nixops/util/fmt.hh"

#include <exception>
#include <list>
#include <optional>
#include <string_view>

namespace nixops {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

struct ErrorInfo
{
    Verbosity level = lvlError;
    HintFmt msg;

    /**
     * Context frames, outermost first.
     */
    std::list<HintFmt> traces;

    unsigned int status = 1;

    Suggestions suggestions;
};

/**
 * Render `einfo` as "error: ..." preceded by its traces. Without
 * `showTrace` only the outermost few frames are printed.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace);

/**
 * The root of the exception hierarchy. Catch `Error` instead.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * `what()`, rendered on first use and dropped when a trace is added.
     */
    mutable std::optional<std::string> what_;

public:

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.msg = HintFmt(fs, args...)}
    {
    }

    template<typename... Args>
    BaseError(unsigned int status, const Args &... args)
        : err{.msg = HintFmt(args...), .status = status}
    {
    }

    template<typename... Args>
    BaseError(const Suggestions & sug, const Args &... args)
        : err{.msg = HintFmt(args...), .suggestions = sug}
    {
    }

    BaseError(HintFmt hint)
        : err{.msg = std::move(hint)}
    {
    }

    /**
     * The message without the "error: " prefix or traces.
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

    void withExitStatus(unsigned int status)
    {
        err.status = status;
    }

    /**
     * Add a frame describing what was being done when the error
     * occurred, e.g. "while resolving the option 'subnets'".
     */
    void addTrace(HintFmt hint);

    template<typename... Args>
    void addTrace(std::string_view fs, const Args &... args)
    {
        addTrace(HintFmt(std::string(fs), args...));
    }

    bool hasTrace() const
    {
        return !err.traces.empty();
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

/**
 * Print `msg` and terminate. For broken internal invariants only.
 */
[[noreturn]]
void panic(std::string_view msg);

} // namespace nixops

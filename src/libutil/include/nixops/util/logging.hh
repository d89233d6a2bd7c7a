#pragma once
///@file

#include "nixops/util/error.hh"
#include "nixops/util/configuration.hh"

#include <memory>

namespace nixops {

struct LoggerSettings : Config
{
    Setting<bool> showTrace{
        this,
        false,
        "show-trace",
        R"(
          Whether to print the full context trace of an error (every
          option the failing option was reached through) instead of the
          first few frames.
        )"};
};

extern LoggerSettings loggerSettings;

class Logger
{
public:

    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    /**
     * Print an error, with its traces, at `ei.level`.
     */
    virtual void logEI(const ErrorInfo & ei) = 0;

    virtual void warn(const std::string & msg);
};

extern std::unique_ptr<Logger> logger;

/**
 * Writes to stderr. Colours are stripped when stderr is not a terminal.
 */
std::unique_ptr<Logger> makeSimpleLogger();

/**
 * Messages above this level are discarded.
 */
extern Verbosity verbosity;

/**
 * Log a formatted message at `level`. A macro, so that the arguments
 * are not formatted when the message is discarded.
 */
#define printMsg(level, args...)                      \
    do {                                              \
        auto __lvl = level;                           \
        if (__lvl <= nixops::verbosity)               \
            nixops::logger->log(__lvl, fmt(args));    \
    } while (0)

#define printInfo(args...) printMsg(lvlInfo, args)
#define debug(args...) printMsg(lvlDebug, args)
#define vomit(args...) printMsg(lvlVomit, args)

/**
 * Print "warning: " and the formatted message, if `verbosity` is at
 * least `lvlWarn`.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    logger->warn(fmt(fs, args...));
}

/**
 * Write to stderr, ignoring failures.
 */
void writeToStderr(std::string_view s);

} // namespace nixops

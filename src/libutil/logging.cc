#include "nixops/util/logging.hh"
#include "nixops/util/terminal.hh"

#include <iostream>
#include <sstream>

namespace nixops {

LoggerSettings loggerSettings;

Verbosity verbosity = lvlInfo;

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

class SimpleLogger : public Logger
{
    bool tty = isTTY();

public:

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl <= verbosity)
            writeToStderr(filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace);
        log(ei.level, oss.str());
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

void writeToStderr(std::string_view s)
{
    /* A closed stderr must not turn logging into a failure. */
    std::cerr.write(s.data(), s.size());
    std::cerr.flush();
    std::cerr.clear();
}

} // namespace nixops

#include "nixops/util/error.hh"
#include "nixops/util/logging.hh"
#include "nixops/util/strings.hh"
#include "nixops/util/terminal.hh"

#include <set>
#include <sstream>

namespace nixops {

/* Traces shown when `show-trace` is off. */
static constexpr size_t maxTraces = 3;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

const char * BaseError::what() const noexcept
{
    if (!what_) {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
    }
    return what_->c_str();
}

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(std::move(hint));
    what_.reset();
}

static std::string levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error:" ANSI_NORMAL " ";
    case lvlWarn:
        return ANSI_WARNING "warning:" ANSI_NORMAL " ";
    case lvlNotice:
        return ANSI_RED "note:" ANSI_NORMAL " ";
    case lvlInfo:
        return ANSI_GREEN "info:" ANSI_NORMAL " ";
    case lvlDebug:
        return ANSI_WARNING "debug:" ANSI_NORMAL " ";
    default:
        return ANSI_GREEN "talk:" ANSI_NORMAL " ";
    }
}

/* Prefix the first line of `s` with `first` and the others with `rest`. */
static std::string indent(std::string_view first, std::string_view rest, std::string_view s)
{
    std::string res;
    bool isFirst = true;
    for (auto & line : splitString(s, "\n")) {
        if (!isFirst)
            res += '\n';
        res += chomp(std::string(isFirst ? first : rest) + line);
        isFirst = false;
    }
    return res;
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    auto prefix = levelPrefix(einfo.level);

    std::ostringstream body;

    if (!einfo.traces.empty()) {
        std::set<std::string> seen;
        size_t shown = 0;
        for (auto & trace : einfo.traces) {
            auto hint = trace.str();
            if (hint.empty() || !seen.insert(hint).second)
                continue;
            if (!showTrace && shown == maxTraces) {
                body << "\n" ANSI_WARNING
                        "(stack trace truncated; use 'show-trace = true' to show the full, detailed trace)" ANSI_NORMAL
                        "\n";
                break;
            }
            body << "\n… " << hint << "\n";
            shown++;
        }
        body << "\n" << prefix;
    }

    body << einfo.msg << "\n";

    if (auto suggestions = einfo.suggestions.trim(); !suggestions.suggestions.empty())
        body << "Did you mean " << suggestions << "?\n";

    return out << indent(prefix, std::string(filterANSIEscapes(prefix, true).size(), ' '), chomp(body.str()));
}

void panic(std::string_view msg)
{
    writeToStderr(msg);
    writeToStderr("\n");
    std::terminate();
}

} // namespace nixops

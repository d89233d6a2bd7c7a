#include "nixops/util/terminal.hh"

#include <cstdlib>
#include <unistd.h>

namespace nixops {

bool isTTY()
{
    static const bool tty = [] {
        if (!isatty(STDERR_FILENO) || getenv("NO_COLOR") || getenv("NOCOLOR"))
            return false;
        auto term = getenv("TERM");
        return term && std::string_view(term) != "dumb";
    }();
    return tty;
}

/* Length of the escape sequence at the start of `s`, which begins with
   ESC. A CSI sequence is ESC '[', parameter bytes 0x30-0x3f,
   intermediate bytes 0x20-0x2f and a final byte 0x40-0x7e. */
static size_t escapeLength(std::string_view s, bool & isColour)
{
    isColour = false;
    size_t n = 1;
    if (n < s.size() && s[n] == '[') {
        n++;
        while (n < s.size() && s[n] >= 0x30 && s[n] <= 0x3f)
            n++;
        while (n < s.size() && s[n] >= 0x20 && s[n] <= 0x2f)
            n++;
        if (n < s.size() && s[n] >= 0x40 && s[n] <= 0x7e)
            isColour = s[n++] == 'm';
    } else if (n < s.size() && s[n] >= 0x40 && s[n] <= 0x5f)
        n++;
    return n;
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string res;
    res.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (s[i] == '\e') {
            bool isColour;
            auto n = escapeLength(s.substr(i), isColour);
            if (isColour && !filterAll)
                res += s.substr(i, n);
            i += n;
        } else {
            if (s[i] != '\r' && s[i] != '\a')
                res += s[i];
            i++;
        }
    }

    return res;
}

} // namespace nixops

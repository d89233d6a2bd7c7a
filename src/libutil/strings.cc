#include "nixops/util/strings.hh"

#include <algorithm>

namespace nixops {

Strings tokenizeString(std::string_view s, std::string_view separators)
{
    Strings res;
    for (auto start = s.find_first_not_of(separators); start != s.npos;) {
        auto end = std::min(s.find_first_of(separators, start), s.size());
        res.emplace_back(s.substr(start, end - start));
        start = s.find_first_not_of(separators, end);
    }
    return res;
}

Strings splitString(std::string_view s, std::string_view separators)
{
    Strings res;
    std::string_view::size_type start = 0;
    while (true) {
        auto end = s.find_first_of(separators, start);
        res.emplace_back(s.substr(start, end == s.npos ? s.npos : end - start));
        if (end == s.npos)
            return res;
        start = end + 1;
    }
}

std::string chomp(std::string_view s)
{
    auto end = s.find_last_not_of(" \n\r\t");
    return end == s.npos ? "" : std::string(s.substr(0, end + 1));
}

std::string stripIndentation(std::string_view s)
{
    if (s.empty())
        return "";

    auto lines = splitString(s, "\n");
    if (s.back() == '\n')
        lines.pop_back();

    auto indent = std::string::npos;
    for (auto & line : lines)
        if (auto i = line.find_first_not_of(' '); i != line.npos)
            indent = std::min(indent, i);

    std::string res;
    for (auto & line : lines) {
        if (line.size() > indent)
            res += line.substr(indent);
        res += '\n';
    }
    return res;
}

} // namespace nixops

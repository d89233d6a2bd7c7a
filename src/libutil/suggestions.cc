#include "nixops/util/suggestions.hh"
#include "nixops/util/ansicolor.hh"
#include "nixops/util/terminal.hh"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <vector>

namespace nixops {

int levenshteinDistance(std::string_view first, std::string_view second)
{
    /* Single-row Wagner-Fischer: `row[j]` is the distance between the
       prefix of `first` seen so far and `second[0..j)`. */
    std::vector<int> row(second.size() + 1);
    std::iota(row.begin(), row.end(), 0);

    for (size_t i = 0; i < first.size(); i++) {
        int diagonal = row[0];
        row[0] = i + 1;
        for (size_t j = 0; j < second.size(); j++) {
            int above = row[j + 1];
            row[j + 1] = std::min({above + 1, row[j] + 1, diagonal + (first[i] == second[j] ? 0 : 1)});
            diagonal = above;
        }
    }

    return row.back();
}

Suggestions Suggestions::bestMatches(const StringSet & candidates, std::string_view query)
{
    Suggestions res;
    for (auto & name : candidates)
        res.suggestions.insert({levenshteinDistance(query, name), name});
    return res;
}

Suggestions Suggestions::trim(int limit, int maxDistance) const
{
    Suggestions res;
    for (auto & s : suggestions) {
        if ((int) res.suggestions.size() >= limit || s.distance >= maxDistance)
            break;
        res.suggestions.insert(s);
    }
    return res;
}

std::string Suggestion::to_string() const
{
    return ANSI_WARNING + filterANSIEscapes(suggestion) + ANSI_NORMAL;
}

std::string Suggestions::to_string() const
{
    if (suggestions.empty())
        return "";
    if (suggestions.size() == 1)
        return suggestions.begin()->to_string();

    std::string res = "one of ";
    size_t n = 0;
    for (auto & s : suggestions) {
        if (n > 0)
            res += n + 1 == suggestions.size() ? " or " : ", ";
        res += s.to_string();
        n++;
    }
    return res;
}

Suggestions & Suggestions::operator+=(const Suggestions & other)
{
    suggestions.insert(other.suggestions.begin(), other.suggestions.end());
    return *this;
}

std::ostream & operator<<(std::ostream & str, const Suggestions & suggestions)
{
    return str << suggestions.to_string();
}

} // namespace nixops

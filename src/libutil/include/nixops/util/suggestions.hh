#pragma once
///@file

#include "nixops/util/types.hh"

#include <compare>
#include <string_view>

namespace nixops {

/**
 * The number of single-character insertions, deletions and
 * substitutions that turn `first` into `second`.
 */
int levenshteinDistance(std::string_view first, std::string_view second);

/**
 * A declared name that a misspelled one may have meant. Ordered by
 * distance first, so the closest candidates come first in a set.
 */
struct Suggestion
{
    int distance;
    std::string suggestion;

    std::string to_string() const;

    auto operator<=>(const Suggestion &) const = default;
};

struct Suggestions
{
    std::set<Suggestion> suggestions;

    /**
     * Rank every name in `candidates` against `query`.
     */
    static Suggestions bestMatches(const StringSet & candidates, std::string_view query);

    /**
     * Keep at most `limit` candidates closer than `maxDistance`.
     */
    Suggestions trim(int limit = 5, int maxDistance = 2) const;

    /**
     * "x", or "one of x, y or z"; empty if there is nothing to suggest.
     */
    std::string to_string() const;

    Suggestions & operator+=(const Suggestions & other);
};

std::ostream & operator<<(std::ostream & str, const Suggestions & suggestions);

} // namespace nixops

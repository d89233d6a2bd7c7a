#pragma once
///@file

#include "nixops/util/types.hh"

#include <string_view>

namespace nixops {

/**
 * Split `s` into the non-empty words between runs of `separators`.
 */
Strings tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

/**
 * Split `s` at every separator. Empty fields are kept, so the result
 * has one more element than `s` has separators.
 */
Strings splitString(std::string_view s, std::string_view separators);

template<class C>
std::string concatStringsSep(std::string_view sep, const C & ss)
{
    std::string res;
    bool first = true;
    for (auto & s : ss) {
        if (!first)
            res += sep;
        res += s;
        first = false;
    }
    return res;
}

template<class C, class F>
std::string concatMapStringsSep(std::string_view sep, const C & items, F fn)
{
    std::vector<std::string> strings;
    for (auto & item : items)
        strings.push_back(fn(item));
    return concatStringsSep(sep, strings);
}

/**
 * `s` without trailing whitespace.
 */
std::string chomp(std::string_view s);

/**
 * Remove the indentation shared by all non-blank lines, so that
 * descriptions can be written as indented raw string literals. Every
 * line of the result ends in a newline.
 */
std::string stripIndentation(std::string_view s);

} // namespace nixops

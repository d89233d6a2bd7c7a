#pragma once
///@file

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace nixops {

typedef std::list<std::string> Strings;

/**
 * Sets of names (options, attributes, resources). The transparent
 * comparator allows lookups by `std::string_view`.
 */
using StringSet = std::set<std::string, std::less<>>;

/**
 * Visitor for `std::visit` built from a set of lambdas.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace nixops

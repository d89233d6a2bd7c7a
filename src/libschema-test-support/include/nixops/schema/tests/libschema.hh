#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "nixops/util/fmt.hh"
#include "nixops/util/terminal.hh"
#include "nixops/schema/resolve.hh"
#include "nixops/schema/value.hh"

namespace nixops {

namespace testing {

namespace internal {

/**
 * Matches strings containing `substring` once colours are removed, so
 * that error messages can be checked without their highlighting.
 */
class HasSubstrIgnoreANSIMatcher
{
public:
    explicit HasSubstrIgnoreANSIMatcher(std::string substring)
        : substring(std::move(substring))
    {
    }

    bool MatchAndExplain(const char * s, ::testing::MatchResultListener * listener) const
    {
        return s != nullptr && MatchAndExplain(std::string(s), listener);
    }

    template<typename MatcheeStringType>
    bool MatchAndExplain(const MatcheeStringType & s, [[maybe_unused]] ::testing::MatchResultListener * listener) const
    {
        return filterANSIEscapes(s, /*filterAll=*/true).find(substring) != substring.npos;
    }

    void DescribeTo(::std::ostream * os) const
    {
        *os << "has substring " << substring;
    }

    void DescribeNegationTo(::std::ostream * os) const
    {
        *os << "has no substring " << substring;
    }

private:
    std::string substring;
};

} // namespace internal

inline ::testing::PolymorphicMatcher<internal::HasSubstrIgnoreANSIMatcher>
HasSubstrIgnoreANSIMatcher(const std::string & substring)
{
    return ::testing::MakePolymorphicMatcher(internal::HasSubstrIgnoreANSIMatcher(substring));
}

} // namespace testing

MATCHER(IsNull, "")
{
    return arg.type() == nNull;
}

MATCHER(IsAttrs, "")
{
    return arg.type() == nAttrs;
}

MATCHER_P(IsStringEq, s, fmt("The string is equal to \"%1%\"", s))
{
    if (arg.type() != nString) {
        *result_listener << "Expected a string got " << showType(arg);
        return false;
    }
    return arg.string() == s;
}

MATCHER_P(IsIntEq, v, fmt("The integer is equal to \"%1%\"", v))
{
    if (arg.type() != nInt) {
        return false;
    }
    return arg.integer() == v;
}

MATCHER_P(IsListOfSize, n, fmt("Is a list of size [%1%]", n))
{
    if (arg.type() != nList) {
        *result_listener << "Expected list got " << showType(arg);
        return false;
    } else if (arg.list().size() != (size_t) n) {
        *result_listener << "Expected as list of size " << n << " got " << arg.list().size();
        return false;
    }
    return true;
}

MATCHER_P(IsAttrsWithKeys, keys, "Is a set with exactly the given attribute names")
{
    if (arg.type() != nAttrs) {
        *result_listener << "Expected set got " << showType(arg);
        return false;
    }
    std::vector<std::string> names;
    for (auto & [name, _] : arg.attrs())
        names.push_back(name);
    if (names != std::vector<std::string>(keys)) {
        *result_listener << "The set has the attributes " << arg;
        return false;
    }
    return true;
}

MATCHER_P2(IsResource, kind, name, fmt("Is a handle to the resource '%1%' of type '%2%'", name, kind))
{
    if (arg.type() != nResource) {
        *result_listener << "Expected a resource handle got " << showType(arg);
        return false;
    }
    return arg.resource().kind == kind && arg.resource().name == name;
}

/**
 * Run `f`, which must throw an exception of type `E`, and return the
 * exception for further inspection.
 */
template<typename E, typename F>
E catchError(F && f)
{
    try {
        f();
    } catch (E & e) {
        return e;
    }
    throw std::runtime_error("expected an exception, but none was thrown");
}

} // namespace nixops

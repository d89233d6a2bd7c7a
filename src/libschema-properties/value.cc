#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck/gtest.h>

#include <nlohmann/json.hpp>

#include "nixops/schema/tests/value.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/types.hh"
#include "nixops/schema/value-to-json.hh"

namespace nixops {

/**
 * Attribute sets with a `_type` attribute are ambiguous in JSON.
 */
static bool hasTypeTag(const Value & v)
{
    switch (v.type()) {
    case nList:
        for (auto & elem : v.list())
            if (hasTypeTag(elem))
                return true;
        return false;
    case nAttrs:
        for (auto & [name, value] : v.attrs())
            if (name == "_type" || hasTypeTag(value))
                return true;
        return false;
    default:
        return false;
    }
}

#ifndef COVERAGE

RC_GTEST_PROP(printValueAsJSON, prop_round_trip, (const Value & v))
{
    RC_PRE(!hasTypeTag(v));
    RC_ASSERT(valueFromJSON(printValueAsJSON(v)) == v);
}

RC_GTEST_PROP(validate, prop_total, (const Value & v))
{
    static const std::vector<Type> types{
        types::str(),
        types::integer(),
        types::boolean(),
        types::listOf(types::str()),
        types::attrsOf(types::nullOr(types::integer())),
        types::either(types::str(), types::resource("azure-resource-group")),
        types::nullOr(types::listOf(types::attrsOf(types::boolean()))),
    };

    for (auto & type : types) {
        try {
            RC_ASSERT(validate(type, v) == v);
        } catch (TypeMismatch & e) {
            RC_ASSERT(!e.expected.empty());
        }
    }
}

#endif

} // namespace nixops

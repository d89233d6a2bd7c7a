#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck/gtest.h>

#include "nixops/schema/errors.hh"
#include "nixops/schema/resolve.hh"

#include <algorithm>
#include <set>

namespace nixops {

namespace {

struct Definition
{
    Priority priority;
    std::string value;
};

rc::Gen<Definition> genDefinition()
{
    return rc::gen::build<Definition>(
        rc::gen::set(&Definition::priority, rc::gen::element(Priority::Default, Priority::Normal, Priority::Force)),
        rc::gen::set(&Definition::value, rc::gen::element<std::string>("westus", "eastus", "northeurope")));
}

const OptionSet & options()
{
    static OptionSet options{
        OptionDecl{.name = "location", .type = types::str()},
        OptionDecl{.name = "tags", .type = types::attrsOf(types::str()), .defaultValue = Value::mkAttrs({})},
    };
    return options;
}

std::vector<Override> toOverrides(const std::vector<Definition> & defs)
{
    std::vector<Override> overrides;
    size_t n = 0;
    for (auto & def : defs)
        overrides.push_back(
            mkOverride(def.priority, "location", Value::mkString(def.value), fmt("definition %d", n++)));
    return overrides;
}

} // namespace

#ifndef COVERAGE

RC_GTEST_PROP(resolve, prop_highest_priority_wins, ())
{
    auto defs = *rc::gen::nonEmpty(rc::gen::container<std::vector<Definition>>(genDefinition()));

    auto top = std::max_element(defs.begin(), defs.end(), [](auto & a, auto & b) {
                   return a.priority < b.priority;
               })->priority;
    std::set<std::string> winners;
    for (auto & def : defs)
        if (def.priority == top)
            winners.insert(def.value);

    if (winners.size() == 1)
        RC_ASSERT(resolve(options(), toOverrides(defs)).at("location").string() == *winners.begin());
    else
        RC_ASSERT_THROWS_AS(resolve(options(), toOverrides(defs)), ConflictingOverrides);
}

RC_GTEST_PROP(resolve, prop_order_independent, ())
{
    auto defs = *rc::gen::nonEmpty(rc::gen::container<std::vector<Definition>>(genDefinition()));
    auto shuffled = defs;
    std::reverse(shuffled.begin(), shuffled.end());

    try {
        auto config = resolve(options(), toOverrides(defs));
        RC_ASSERT(resolve(options(), toOverrides(shuffled)) == config);
        RC_ASSERT(resolve(options(), toOverrides(defs)) == config);
    } catch (ConflictingOverrides &) {
        RC_ASSERT_THROWS_AS(resolve(options(), toOverrides(shuffled)), ConflictingOverrides);
    }
}

RC_GTEST_PROP(resolve, prop_idempotent, (const std::map<std::string, std::string> & tags))
{
    auto location = *rc::gen::element<std::string>("westus", "eastus");

    Bindings tagValues;
    for (auto & [name, value] : tags)
        tagValues.emplace(name, Value::mkString(value));

    auto config = resolve(
        options(),
        {
            mkOverride(Priority::Normal, "location", Value::mkString(location)),
            mkOverride(Priority::Normal, "tags", Value::mkAttrs(tagValues)),
        });

    std::vector<Override> again;
    for (auto & [name, value] : config.values())
        again.push_back(mkDefault(name, value));

    RC_ASSERT(resolve(options(), again) == config);
}

#endif

} // namespace nixops

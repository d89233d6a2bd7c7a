#include "nixops/schema/tests/libschema.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/resolve.hh"

namespace nixops {

class ResolveTest : public ::testing::Test
{
protected:

    ref<const OptionSet> subnet = make_ref<const OptionSet>(OptionSet{
        OptionDecl{.name = "addressPrefix", .type = types::str()},
        OptionDecl{
            .name = "securityGroup",
            .type = types::nullOr(types::either(types::str(), types::resource("azure-network-security-group"))),
            .defaultValue = Value::mkNull(),
        },
    });

    OptionSet options{
        OptionDecl{.name = "name", .type = types::str(), .defaultValue = Value::mkString("nixops-1234-net")},
        OptionDecl{.name = "location", .type = types::str()},
        OptionDecl{.name = "addressSpace", .type = types::listOf(types::str())},
        OptionDecl{.name = "tags", .type = types::attrsOf(types::str()), .defaultValue = Value::mkAttrs({})},
        OptionDecl{
            .name = "dnsServers",
            .type = types::nullOr(types::listOf(types::str())),
            .defaultValue = Value::mkList({}),
        },
        OptionDecl{
            .name = "subnets",
            .type = types::attrsOf(types::optionSet(subnet)),
            .defaultValue = Value::mkAttrs({}),
        },
    };

    /**
     * A default for `subnets` that only applies if `addressSpace` is
     * not empty.
     */
    Override defaultSubnet = mkIf(
        Condition{
            .inputs = {"addressSpace"},
            .predicate = [](const Inputs & inputs) { return !inputs["addressSpace"].list().empty(); },
        },
        mkDeferred(
            Priority::Default,
            "subnets",
            {"addressSpace"},
            [](const Inputs & inputs) {
                return Value::mkAttrs(
                    {{"default", Value::mkAttrs({{"addressPrefix", inputs["addressSpace"].list().front()}})}});
            },
            "module"));

    std::vector<Override> required{
        mkOverride(Priority::Normal, "location", Value::mkString("westus"), "user"),
        mkOverride(Priority::Normal, "addressSpace", mkStringList({"10.1.0.0/16"}), "user"),
    };

    std::vector<Override> with(std::vector<Override> extra)
    {
        auto res = required;
        res.insert(res.end(), extra.begin(), extra.end());
        return res;
    }
};

/* ----------------------------------------------------------------------------
 * defaults and mandatory options
 * --------------------------------------------------------------------------*/

TEST_F(ResolveTest, defaultsAreFilledIn)
{
    auto config = resolve(options, required);

    ASSERT_THAT(config.at("name"), IsStringEq("nixops-1234-net"));
    ASSERT_THAT(config.at("location"), IsStringEq("westus"));
    ASSERT_THAT(config.at("tags"), IsAttrsWithKeys(std::vector<std::string>{}));
    ASSERT_THAT(config.at("dnsServers"), IsListOfSize(0));
    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{}));
}

TEST_F(ResolveTest, missingRequiredOption)
{
    auto e = catchError<MissingRequiredOption>(
        [&]() { resolve(options, {mkOverride(Priority::Normal, "addressSpace", mkStringList({}))}); });
    ASSERT_EQ(e.path, "location");
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("the option 'location' is used but not defined"));
}

TEST_F(ResolveTest, missingRequiredNestedOption)
{
    auto e = catchError<MissingRequiredOption>([&]() {
        resolve(options, with({mkOverride(Priority::Normal, "subnets.default.securityGroup", Value::mkString("sg"))}));
    });
    ASSERT_EQ(e.path, "subnets.default.addressPrefix");
}

TEST_F(ResolveTest, nestedDefaultsAreFilledIn)
{
    auto config = resolve(
        options,
        with({mkOverride(
            Priority::Normal,
            "subnets",
            Value::mkAttrs({{"a", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/24")}})}}))}));

    ASSERT_THAT(config.at("subnets.a.addressPrefix"), IsStringEq("10.1.0.0/24"));
    ASSERT_THAT(config.at("subnets.a.securityGroup"), IsNull());
}

/* ----------------------------------------------------------------------------
 * priorities
 * --------------------------------------------------------------------------*/

TEST_F(ResolveTest, forceBeatsNormal)
{
    auto normal = mkOverride(Priority::Normal, "name", Value::mkString("by-user"), "user");
    auto force = mkForce("name", Value::mkString("forced"), "policy");

    ASSERT_THAT(resolve(options, with({normal, force})).at("name"), IsStringEq("forced"));
    ASSERT_THAT(resolve(options, with({force, normal})).at("name"), IsStringEq("forced"));
}

TEST_F(ResolveTest, normalBeatsDefault)
{
    auto config = resolve(
        options,
        with({
            mkDefault("name", Value::mkString("from-module")),
            mkOverride(Priority::Normal, "name", Value::mkString("by-user")),
        }));
    ASSERT_THAT(config.at("name"), IsStringEq("by-user"));
}

TEST_F(ResolveTest, equalDefinitionsDoNotConflict)
{
    auto config = resolve(options, with({mkOverride(Priority::Normal, "location", Value::mkString("westus"), "other")}));
    ASSERT_THAT(config.at("location"), IsStringEq("westus"));
}

TEST_F(ResolveTest, conflictingDefinitions)
{
    auto e = catchError<ConflictingOverrides>([&]() {
        resolve(
            options,
            {
                mkOverride(Priority::Normal, "location", Value::mkString("westus"), "a.nix"),
                mkOverride(Priority::Normal, "location", Value::mkString("eastus"), "b.nix"),
                mkOverride(Priority::Normal, "addressSpace", mkStringList({})),
            });
    });
    ASSERT_EQ(e.path, "location");
    ASSERT_EQ(e.priority, Priority::Normal);
    ASSERT_EQ(e.sources, (std::vector<std::string>{"a.nix", "b.nix"}));
    ASSERT_THAT(
        e.what(),
        testing::HasSubstrIgnoreANSIMatcher(
            "the option 'location' has conflicting definitions at priority 'normal', in 'a.nix', 'b.nix'"));
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("while resolving the option 'location'"));
}

TEST_F(ResolveTest, conflictAtLowerPriorityIsIgnored)
{
    auto config = resolve(
        options,
        with({
            mkDefault("name", Value::mkString("a")),
            mkDefault("name", Value::mkString("b")),
            mkOverride(Priority::Normal, "name", Value::mkString("c")),
        }));
    ASSERT_THAT(config.at("name"), IsStringEq("c"));
}

TEST_F(ResolveTest, attributeSetsAreMerged)
{
    auto config = resolve(
        options,
        with({
            mkOverride(Priority::Normal, "tags", Value::mkAttrs({{"environment", Value::mkString("production")}})),
            mkOverride(Priority::Normal, "tags.owner", Value::mkString("ops")),
        }));
    ASSERT_THAT(config.at("tags"), IsAttrsWithKeys(std::vector<std::string>{"environment", "owner"}));
}

TEST_F(ResolveTest, conflictInsideAttributeSet)
{
    auto e = catchError<ConflictingOverrides>([&]() {
        resolve(
            options,
            with({
                mkOverride(Priority::Normal, "tags", Value::mkAttrs({{"owner", Value::mkString("dev")}})),
                mkOverride(Priority::Normal, "tags.owner", Value::mkString("ops")),
            }));
    });
    ASSERT_EQ(e.path, "tags.owner");
}

TEST_F(ResolveTest, forceOnNestedOptionKeepsSiblings)
{
    auto config = resolve(
        options,
        with({
            mkOverride(Priority::Normal, "subnets.a.addressPrefix", Value::mkString("10.1.0.0/24")),
            mkForce("subnets.a.securityGroup", Value::mkString("sg-a")),
            mkOverride(Priority::Normal, "subnets.b.addressPrefix", Value::mkString("10.1.1.0/24")),
        }));

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"a", "b"}));
    ASSERT_THAT(config.at("subnets.a.addressPrefix"), IsStringEq("10.1.0.0/24"));
    ASSERT_THAT(config.at("subnets.a.securityGroup"), IsStringEq("sg-a"));
    ASSERT_THAT(config.at("subnets.b.addressPrefix"), IsStringEq("10.1.1.0/24"));
    ASSERT_THAT(config.at("subnets.b.securityGroup"), IsNull());
}

TEST_F(ResolveTest, forceOnNestedOptionBeatsWholeDefinition)
{
    auto config = resolve(
        options,
        with({
            mkOverride(
                Priority::Normal,
                "subnets",
                Value::mkAttrs({{"a",
                                 Value::mkAttrs({
                                     {"addressPrefix", Value::mkString("10.1.0.0/24")},
                                     {"securityGroup", Value::mkString("sg-user")},
                                 })}})),
            mkForce("subnets.a.securityGroup", Value::mkString("sg-policy")),
        }));

    ASSERT_THAT(config.at("subnets.a.addressPrefix"), IsStringEq("10.1.0.0/24"));
    ASSERT_THAT(config.at("subnets.a.securityGroup"), IsStringEq("sg-policy"));
}

TEST_F(ResolveTest, defaultOnNestedOptionLosesToWholeDefinition)
{
    auto config = resolve(
        options,
        with({
            mkDefault("tags.owner", Value::mkString("dev")),
            mkOverride(Priority::Normal, "tags", Value::mkAttrs({{"owner", Value::mkString("ops")}})),
        }));

    ASSERT_THAT(config.at("tags.owner"), IsStringEq("ops"));
}

TEST_F(ResolveTest, forcedWholeSetDropsNestedDefinitions)
{
    auto config = resolve(
        options,
        with({
            mkForce(
                "subnets",
                Value::mkAttrs({{"a", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/24")}})}})),
            mkForce("subnets.b.addressPrefix", Value::mkString("10.1.1.0/24")),
        }));

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"a"}));
}

/* ----------------------------------------------------------------------------
 * guards
 * --------------------------------------------------------------------------*/

TEST_F(ResolveTest, falseGuardDropsDefinition)
{
    auto config = resolve(options, with({mkIf(false, mkOverride(Priority::Force, "name", Value::mkString("x")))}));
    ASSERT_THAT(config.at("name"), IsStringEq("nixops-1234-net"));

    config = resolve(options, with({mkIf(true, mkOverride(Priority::Force, "name", Value::mkString("x")))}));
    ASSERT_THAT(config.at("name"), IsStringEq("x"));
}

TEST_F(ResolveTest, guardedDefaultApplies)
{
    auto config = resolve(options, with({defaultSubnet}));

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"default"}));
    ASSERT_THAT(config.at("subnets.default.addressPrefix"), IsStringEq("10.1.0.0/16"));
    ASSERT_THAT(config.at("subnets.default.securityGroup"), IsNull());
}

TEST_F(ResolveTest, guardedDefaultDoesNotApplyToEmptyAddressSpace)
{
    auto config = resolve(
        options,
        {
            mkOverride(Priority::Normal, "location", Value::mkString("westus")),
            mkOverride(Priority::Normal, "addressSpace", mkStringList({})),
            defaultSubnet,
        });

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{}));
}

TEST_F(ResolveTest, guardSeesFinalValueOfInput)
{
    /* The guard is listed before the definitions of its input, and
       `addressSpace` has a lower-priority definition that would
       disable it. */
    auto config = resolve(
        options,
        {
            defaultSubnet,
            mkDefault("addressSpace", mkStringList({})),
            mkOverride(Priority::Normal, "addressSpace", mkStringList({"10.3.0.0/16", "10.1.0.0/16"})),
            mkOverride(Priority::Normal, "location", Value::mkString("westus")),
        });

    ASSERT_THAT(config.at("subnets.default.addressPrefix"), IsStringEq("10.3.0.0/16"));
}

TEST_F(ResolveTest, userSubnetsTakePrecedenceOverGuardedDefault)
{
    auto config = resolve(
        options,
        with({
            defaultSubnet,
            mkOverride(
                Priority::Normal,
                "subnets",
                Value::mkAttrs({{"default", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.5.0/24")}})}}),
                "user"),
        }));

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"default"}));
    ASSERT_THAT(config.at("subnets.default.addressPrefix"), IsStringEq("10.1.5.0/24"));
}

TEST_F(ResolveTest, nestedDefinitionBeatsGuardedDefault)
{
    auto config = resolve(
        options, with({defaultSubnet, mkOverride(Priority::Normal, "subnets.extra.addressPrefix", Value::mkString("10.1.9.0/24"))}));

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"extra"}));
}

TEST_F(ResolveTest, guardCycle)
{
    auto a = mkIf(
        Condition{.inputs = {"location"}, .predicate = [](const Inputs &) { return true; }},
        mkDefault("name", Value::mkString("x")));
    auto b = mkIf(
        Condition{.inputs = {"name"}, .predicate = [](const Inputs &) { return true; }},
        mkDefault("location", Value::mkString("westus")));

    ASSERT_THROW(resolve(options, {a, b, required[1]}), UnresolvableGuard);
}

TEST_F(ResolveTest, guardOnItself)
{
    auto a = mkIf(
        Condition{.inputs = {"name"}, .predicate = [](const Inputs & inputs) { return inputs["name"].isNull(); }},
        mkDefault("name", Value::mkString("x")));

    auto e = catchError<UnresolvableGuard>([&]() { resolve(options, with({a})); });
    ASSERT_EQ(e.path, "name");
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("it depends on itself"));
}

TEST_F(ResolveTest, guardOnUndeclaredOption)
{
    auto a = mkIf(
        Condition{.inputs = {"adressSpace"}, .predicate = [](const Inputs &) { return true; }},
        mkDefault("name", Value::mkString("x")));

    auto e = catchError<UnresolvableGuard>([&]() { resolve(options, with({a})); });
    ASSERT_EQ(e.path, "name");
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("it depends on the undeclared option 'adressSpace'"));
}

TEST_F(ResolveTest, readingAnUndeclaredInput)
{
    auto a = mkIf(
        Condition{.inputs = {}, .predicate = [](const Inputs & inputs) { return inputs["location"].isNull(); }},
        mkDefault("name", Value::mkString("x")));

    ASSERT_THAT(
        [&]() { resolve(options, with({a})); },
        ::testing::ThrowsMessage<Error>(
            testing::HasSubstrIgnoreANSIMatcher("the option 'location' is read but was not declared as an input")));
}

/* ----------------------------------------------------------------------------
 * type errors and unknown options
 * --------------------------------------------------------------------------*/

TEST_F(ResolveTest, typeMismatch)
{
    auto e = catchError<TypeMismatch>(
        [&]() { resolve(options, with({mkOverride(Priority::Normal, "dnsServers", Value::mkString("8.8.8.8"))})); });
    ASSERT_EQ(e.path, "dnsServers");
    ASSERT_EQ(e.expected, "null or (list of string)");
    ASSERT_EQ(e.got, "a string");
}

TEST_F(ResolveTest, typeMismatchInLosingDefinitionIsIgnored)
{
    auto config = resolve(
        options,
        with({
            mkDefault("dnsServers", Value::mkString("8.8.8.8")),
            mkOverride(Priority::Normal, "dnsServers", Value::mkNull()),
        }));
    ASSERT_THAT(config.at("dnsServers"), IsNull());
}

TEST_F(ResolveTest, typeMismatchInNestedOption)
{
    auto e = catchError<TypeMismatch>([&]() {
        resolve(options, with({mkOverride(Priority::Normal, "subnets.default.addressPrefix", Value::mkInt(10))}));
    });
    ASSERT_EQ(e.path, "subnets.default.addressPrefix");
}

TEST_F(ResolveTest, unknownOption)
{
    auto e = catchError<UnknownOption>(
        [&]() { resolve(options, with({mkOverride(Priority::Normal, "adressSpace", mkStringList({}))})); });
    ASSERT_EQ(e.path, "adressSpace");
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("Did you mean addressSpace?"));
}

TEST_F(ResolveTest, unknownNestedOption)
{
    auto e = catchError<UnknownOption>([&]() {
        resolve(options, with({mkOverride(Priority::Normal, "subnets.default.adressPrefix", Value::mkString("x"))}));
    });
    ASSERT_EQ(e.path, "subnets.default.adressPrefix");
}

TEST_F(ResolveTest, pathBelowLeafOption)
{
    auto e = catchError<UnknownOption>(
        [&]() { resolve(options, with({mkOverride(Priority::Normal, "location.region", Value::mkString("x"))})); });
    ASSERT_EQ(e.path, "location.region");
}

/* ----------------------------------------------------------------------------
 * laws
 * --------------------------------------------------------------------------*/

TEST_F(ResolveTest, deterministic)
{
    auto overrides = with({defaultSubnet, mkOverride(Priority::Normal, "tags.environment", Value::mkString("test"))});
    ASSERT_EQ(resolve(options, overrides), resolve(options, overrides));
}

TEST_F(ResolveTest, idempotent)
{
    auto config = resolve(options, with({defaultSubnet}), "azure-virtual-network");

    std::vector<Override> again;
    for (auto & [name, value] : config.values())
        again.push_back(mkDefault(name, value));

    ASSERT_EQ(resolve(options, again, "azure-virtual-network"), config);
}

TEST_F(ResolveTest, resultIsTaggedWithKind)
{
    auto config = resolve(options, required, "azure-virtual-network");
    ASSERT_EQ(config.kind(), "azure-virtual-network");
}

} // namespace nixops

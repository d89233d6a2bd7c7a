#include "nixops/schema/tests/libschema.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/option.hh"
#include "nixops/schema/types.hh"

namespace nixops {

static ref<const OptionSet> subnetOptions()
{
    return make_ref<const OptionSet>(OptionSet{
        OptionDecl{.name = "addressPrefix", .type = types::str()},
        OptionDecl{
            .name = "securityGroup",
            .type = types::nullOr(types::either(types::str(), types::resource("azure-network-security-group"))),
            .defaultValue = Value::mkNull(),
        },
    });
}

/* ----------------------------------------------------------------------------
 * descriptions
 * --------------------------------------------------------------------------*/

TEST(TypeSpec, descriptions)
{
    ASSERT_EQ(types::str()->description(), "string");
    ASSERT_EQ(types::integer()->description(), "signed integer");
    ASSERT_EQ(types::boolean()->description(), "boolean");
    ASSERT_EQ(types::listOf(types::str())->description(), "list of string");
    ASSERT_EQ(types::attrsOf(types::str())->description(), "attribute set of string");
    ASSERT_EQ(types::nullOr(types::listOf(types::str()))->description(), "null or (list of string)");
    ASSERT_EQ(
        types::either(types::str(), types::resource("azure-resource-group"))->description(),
        "string or resource of type 'azure-resource-group'");
    ASSERT_EQ(types::attrsOf(types::optionSet(subnetOptions()))->description(), "attribute set of submodule");
}

TEST(TypeSpec, elemType)
{
    auto t = types::listOf(types::str());
    ASSERT_EQ(t->elemType(), types::str().get_ptr());
    ASSERT_EQ(types::str()->elemType(), nullptr);
    ASSERT_EQ(types::str()->optionSet(), nullptr);
    ASSERT_NE(types::optionSet(subnetOptions())->optionSet(), nullptr);
}

/* ----------------------------------------------------------------------------
 * primitive types
 * --------------------------------------------------------------------------*/

TEST(validate, primitives)
{
    ASSERT_THAT(validate(types::str(), Value::mkString("westus")), IsStringEq("westus"));
    ASSERT_THAT(validate(types::integer(), Value::mkInt(3)), IsIntEq(3));
    ASSERT_EQ(validate(types::boolean(), Value::mkBool(true)), Value::mkBool(true));

    ASSERT_THROW(validate(types::str(), Value::mkInt(3)), TypeMismatch);
    ASSERT_THROW(validate(types::integer(), Value::mkString("3")), TypeMismatch);
    ASSERT_THROW(validate(types::boolean(), Value::mkNull()), TypeMismatch);
}

TEST(validate, typeMismatchFields)
{
    auto e = catchError<TypeMismatch>([]() { validate(types::str(), Value::mkInt(3)); });
    ASSERT_EQ(e.path, "");
    ASSERT_EQ(e.expected, "string");
    ASSERT_EQ(e.got, "an integer");
}

/* ----------------------------------------------------------------------------
 * listOf
 * --------------------------------------------------------------------------*/

TEST(validate, listOfAcceptsList)
{
    auto v = mkStringList({"10.1.0.0/16", "10.3.0.0/16"});
    ASSERT_EQ(validate(types::listOf(types::str()), v), v);
}

TEST(validate, listOfAcceptsEmptyList)
{
    ASSERT_THAT(validate(types::listOf(types::str()), Value::mkList({})), IsListOfSize(0));
}

TEST(validate, listOfRejectsString)
{
    auto e = catchError<TypeMismatch>([]() { validate(types::listOf(types::str()), Value::mkString("not-a-list")); });
    ASSERT_EQ(e.expected, "list of string");
    ASSERT_EQ(e.got, "a string");
}

TEST(validate, listOfReportsElementPath)
{
    auto e = catchError<TypeMismatch>([]() {
        types::listOf(types::str())->validate(Value::mkList({Value::mkString("a"), Value::mkInt(1)}), {"addressSpace"});
    });
    ASSERT_EQ(e.path, "addressSpace.[1]");
    ASSERT_EQ(e.expected, "string");
}

/* ----------------------------------------------------------------------------
 * attrsOf
 * --------------------------------------------------------------------------*/

TEST(validate, attrsOf)
{
    auto t = types::attrsOf(types::str());
    auto v = Value::mkAttrs({{"environment", Value::mkString("production")}});
    ASSERT_EQ(validate(t, v), v);
    ASSERT_EQ(validate(t, Value::mkAttrs({})), Value::mkAttrs({}));
    ASSERT_THROW(validate(t, mkStringList({})), TypeMismatch);

    auto e = catchError<TypeMismatch>(
        [&]() { t->validate(Value::mkAttrs({{"environment", Value::mkInt(1)}}), {"tags"}); });
    ASSERT_EQ(e.path, "tags.environment");
}

/* ----------------------------------------------------------------------------
 * nullOr
 * --------------------------------------------------------------------------*/

TEST(validate, nullOr)
{
    auto t = types::nullOr(types::listOf(types::str()));
    ASSERT_THAT(validate(t, Value::mkNull()), IsNull());
    ASSERT_THAT(validate(t, mkStringList({"8.8.8.8"})), IsListOfSize(1));

    auto e = catchError<TypeMismatch>([&]() { validate(t, Value::mkString("8.8.8.8")); });
    ASSERT_EQ(e.expected, "null or (list of string)");
}

TEST(validate, nullOrReportsNestedMismatch)
{
    auto t = types::nullOr(types::listOf(types::str()));
    auto e = catchError<TypeMismatch>(
        [&]() { t->validate(Value::mkList({Value::mkNull()}), {"dnsServers"}); });
    ASSERT_EQ(e.path, "dnsServers.[0]");
    ASSERT_EQ(e.expected, "string");
}

/* ----------------------------------------------------------------------------
 * either
 * --------------------------------------------------------------------------*/

TEST(validate, either)
{
    auto t = types::either(types::str(), types::resource("azure-resource-group"));
    ASSERT_THAT(validate(t, Value::mkString("xxx-my-group")), IsStringEq("xxx-my-group"));
    ASSERT_THAT(
        validate(t, Value::mkResource({"azure-resource-group", "def-group"})),
        IsResource("azure-resource-group", "def-group"));
}

TEST(validate, eitherReportsErrorOfFirstAlternative)
{
    auto t = types::either(types::str(), types::resource("azure-resource-group"));
    auto e = catchError<TypeMismatch>([&]() { validate(t, Value::mkInt(1)); });
    ASSERT_EQ(e.expected, "string");
    ASSERT_EQ(e.got, "an integer");
}

TEST(validate, resourceKindMustMatch)
{
    auto t = types::resource("azure-resource-group");
    auto e = catchError<TypeMismatch>(
        [&]() { validate(t, Value::mkResource({"azure-network-security-group", "sg"})); });
    ASSERT_EQ(e.expected, "resource of type 'azure-resource-group'");
    ASSERT_EQ(e.got, "a handle to a resource of type 'azure-network-security-group'");
}

/* ----------------------------------------------------------------------------
 * optionSet
 * --------------------------------------------------------------------------*/

TEST(validate, optionSetAllowsMissingOptions)
{
    auto t = types::optionSet(subnetOptions());
    ASSERT_EQ(validate(t, Value::mkAttrs({})), Value::mkAttrs({}));

    auto v = Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/24")}});
    ASSERT_EQ(validate(t, v), v);
}

TEST(validate, optionSetChecksOptionTypes)
{
    auto t = types::optionSet(subnetOptions());
    auto e = catchError<TypeMismatch>([&]() {
        t->validate(Value::mkAttrs({{"securityGroup", Value::mkInt(1)}}), {"subnets", "default"});
    });
    ASSERT_EQ(e.path, "subnets.default.securityGroup");
    ASSERT_EQ(e.expected, "null or (string or resource of type 'azure-network-security-group')");
}

TEST(validate, optionSetRejectsUnknownOptions)
{
    auto t = types::optionSet(subnetOptions());
    auto e = catchError<UnknownOption>([&]() {
        t->validate(Value::mkAttrs({{"adressPrefix", Value::mkString("10.1.0.0/24")}}), {"subnets", "default"});
    });
    ASSERT_EQ(e.path, "subnets.default.adressPrefix");
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("the option 'subnets.default.adressPrefix' does not exist"));
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("Did you mean addressPrefix?"));
}

TEST(validate, unknownOptionIsATypeMismatch)
{
    auto t = types::optionSet(subnetOptions());
    ASSERT_THROW(validate(t, Value::mkAttrs({{"foo", Value::mkNull()}})), TypeMismatch);
}

TEST(validate, returnsInputUnchanged)
{
    auto t = types::attrsOf(types::optionSet(subnetOptions()));
    auto v = Value::mkAttrs({{"default", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/16")}})}});
    auto res = validate(t, v);
    ASSERT_EQ(res, v);
    ASSERT_EQ(&res.attrs(), &v.attrs());
}

} // namespace nixops

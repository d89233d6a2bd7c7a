#include <nlohmann/json.hpp>

#include "nixops/schema/tests/libschema.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/resolved-config.hh"
#include "nixops/schema/value-to-json.hh"

namespace nixops {

using nlohmann::json;

TEST(printValueAsJSON, scalars)
{
    ASSERT_EQ(printValueAsJSON(Value::mkNull()), json(nullptr));
    ASSERT_EQ(printValueAsJSON(Value::mkBool(true)), json(true));
    ASSERT_EQ(printValueAsJSON(Value::mkInt(-42)), json(-42));
    ASSERT_EQ(printValueAsJSON(Value::mkString("westus")), json("westus"));
}

TEST(printValueAsJSON, nested)
{
    auto v = Value::mkAttrs({
        {"addressSpace", mkStringList({"10.1.0.0/16"})},
        {"subnets", Value::mkAttrs({{"default", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/16")}})}})},
    });

    ASSERT_EQ(printValueAsJSON(v), json::parse(R"({
        "addressSpace": ["10.1.0.0/16"],
        "subnets": { "default": { "addressPrefix": "10.1.0.0/16" } }
    })"));
}

TEST(printValueAsJSON, resourceHandle)
{
    auto v = Value::mkResource(ResourceHandle{"azure-resource-group", "def-group"});
    ASSERT_EQ(
        printValueAsJSON(v),
        json::parse(R"({ "_type": "resource", "kind": "azure-resource-group", "name": "def-group" })"));
    ASSERT_EQ(valueFromJSON(printValueAsJSON(v)), v);
}

TEST(valueFromJSON, objectsAndLists)
{
    auto v = valueFromJSON(json::parse(R"({ "tags": { "owner": "ops" }, "dnsServers": [], "count": 3 })"));
    ASSERT_THAT(v, IsAttrsWithKeys(std::vector<std::string>{"count", "dnsServers", "tags"}));
    ASSERT_THAT(*v.get("count"), IsIntEq(3));
    ASSERT_THAT(*v.get("dnsServers"), IsListOfSize(0));
    ASSERT_THAT(*v.get("tags")->get("owner"), IsStringEq("ops"));
}

TEST(valueFromJSON, rejectsFloats)
{
    ASSERT_THAT(
        []() { valueFromJSON(json::parse("[1.5]")); },
        ::testing::ThrowsMessage<Error>(
            testing::HasSubstrIgnoreANSIMatcher("floating point numbers are not supported in configuration values")));
}

TEST(valueFromJSON, rejectsHugeIntegers)
{
    ASSERT_THROW(valueFromJSON(json::parse("18446744073709551615")), Error);
    ASSERT_THAT(valueFromJSON(json::parse("9223372036854775807")), IsIntEq(9223372036854775807LL));
}

TEST(valueFromJSON, malformedResourceHandle)
{
    ASSERT_THAT(
        []() { valueFromJSON(json::parse(R"({ "_type": "resource", "kind": "azure-resource-group" })")); },
        ::testing::ThrowsMessage<Error>(testing::HasSubstrIgnoreANSIMatcher("malformed resource handle in JSON")));
    ASSERT_THROW(
        valueFromJSON(json::parse(R"({ "_type": "resource", "kind": "a", "name": 1 })")), Error);
    ASSERT_THROW(
        valueFromJSON(json::parse(R"({ "_type": "resource", "kind": "a", "name": "b", "extra": null })")), Error);
}

TEST(valueFromJSON, otherTypeTagsAreAttributeSets)
{
    auto v = valueFromJSON(json::parse(R"({ "_type": "override" })"));
    ASSERT_THAT(v, IsAttrsWithKeys(std::vector<std::string>{"_type"}));
}

/* ----------------------------------------------------------------------------
 * ResolvedConfig
 * --------------------------------------------------------------------------*/

class ResolvedConfigTest : public ::testing::Test
{
protected:
    ResolvedConfig config{
        "azure-virtual-network",
        {
            {"location", Value::mkString("westus")},
            {"resourceGroup", Value::mkResource(ResourceHandle{"azure-resource-group", "def-group"})},
            {"subnets",
             Value::mkAttrs({{"default", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/16")}})}})},
        }};
};

TEST_F(ResolvedConfigTest, at)
{
    ASSERT_THAT(config.at("location"), IsStringEq("westus"));
    ASSERT_THAT(config.at("subnets.default.addressPrefix"), IsStringEq("10.1.0.0/16"));
    ASSERT_THAT(config.at("resourceGroup"), IsResource("azure-resource-group", "def-group"));
}

TEST_F(ResolvedConfigTest, missingPath)
{
    ASSERT_EQ(config.maybeGet("subnets.other"), nullptr);
    ASSERT_EQ(config.maybeGet("location.region"), nullptr);
    ASSERT_NE(config.maybeGet("subnets.default"), nullptr);

    auto e = catchError<MissingRequiredOption>([&]() { config.at("subnets.other.addressPrefix"); });
    ASSERT_EQ(e.path, "subnets.other.addressPrefix");
}

TEST_F(ResolvedConfigTest, toJSON)
{
    ASSERT_EQ(config.toJSON(), json::parse(R"({
        "_type": "azure-virtual-network",
        "location": "westus",
        "resourceGroup": { "_type": "resource", "kind": "azure-resource-group", "name": "def-group" },
        "subnets": { "default": { "addressPrefix": "10.1.0.0/16" } }
    })"));
}

TEST(ResolvedConfig, untaggedToJSON)
{
    ResolvedConfig config("", {{"name", Value::mkString("x")}});
    ASSERT_EQ(config.toJSON(), json::parse(R"({ "name": "x" })"));
}

} // namespace nixops

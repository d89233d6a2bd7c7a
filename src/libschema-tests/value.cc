#include "nixops/schema/tests/libschema.hh"
#include "nixops/util/error.hh"
#include "nixops/schema/value.hh"

namespace nixops {

TEST(Value, types)
{
    ASSERT_THAT(Value(), IsNull());
    ASSERT_THAT(Value::mkString("westus"), IsStringEq("westus"));
    ASSERT_THAT(Value::mkInt(42), IsIntEq(42));
    ASSERT_THAT(mkStringList({"10.1.0.0/16", "10.3.0.0/16"}), IsListOfSize(2));
    ASSERT_THAT(Value::mkAttrs({}), IsAttrs());
    ASSERT_THAT(Value::mkResource({"azure-resource-group", "def-group"}), IsResource("azure-resource-group", "def-group"));
}

TEST(Value, wrongTypeAccess)
{
    auto v = Value::mkString("westus");
    ASSERT_THAT(
        [&]() { v.list(); },
        ::testing::ThrowsMessage<Error>(testing::HasSubstrIgnoreANSIMatcher("expected a list but found a string: \"westus\"")));
    ASSERT_THROW(Value::mkNull().boolean(), Error);
}

TEST(Value, equalityIsStructural)
{
    auto a = Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/24")}});
    auto b = Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/24")}});
    auto c = Value::mkAttrs({{"addressPrefix", Value::mkString("10.2.0.0/24")}});

    ASSERT_EQ(a, b);
    ASSERT_NE(a, c);
    ASSERT_NE(Value::mkNull(), Value::mkAttrs({}));
    ASSERT_NE(Value::mkList({}), Value::mkAttrs({}));
    ASSERT_NE(Value::mkInt(1), Value::mkBool(true));
    ASSERT_EQ(mkStringList({"a"}), mkStringList({"a"}));
}

TEST(Value, copiesShareContents)
{
    auto a = mkStringList({"10.1.0.0/16"});
    auto b = a;
    ASSERT_EQ(&a.list(), &b.list());
}

TEST(Value, get)
{
    auto v = Value::mkAttrs({{"location", Value::mkString("westus")}});
    ASSERT_THAT(*v.get("location"), IsStringEq("westus"));
    ASSERT_EQ(v.get("tags"), nullptr);
    ASSERT_EQ(Value::mkString("x").get("location"), nullptr);
}

TEST(Value, print)
{
    auto v = Value::mkAttrs({
        {"addressPrefix", Value::mkString("10.1.0.0/16")},
        {"securityGroup", Value::mkNull()},
        {"with space", mkStringList({"a\"b"})},
        {"group", Value::mkResource({"azure-resource-group", "def-group"})},
        {"count", Value::mkInt(-3)},
        {"enabled", Value::mkBool(false)},
    });

    std::ostringstream out;
    out << v;
    ASSERT_EQ(
        out.str(),
        R"({ addressPrefix = "10.1.0.0/16"; count = -3; enabled = false; group = «resource azure-resource-group def-group»; securityGroup = null; "with space" = [ "a\"b" ]; })");
}

TEST(Value, showType)
{
    ASSERT_EQ(showType(Value()), "null");
    ASSERT_EQ(showType(Value::mkBool(true)), "a Boolean");
    ASSERT_EQ(showType(Value::mkInt(1)), "an integer");
    ASSERT_EQ(showType(Value::mkString("")), "a string");
    ASSERT_EQ(showType(Value::mkList({})), "a list");
    ASSERT_EQ(showType(Value::mkAttrs({})), "a set");
    ASSERT_EQ(showType(Value::mkResource({"azure-resource-group", "g"})), "a handle to a resource of type 'azure-resource-group'");
    ASSERT_EQ(showType(nList, false), "list");
}

} // namespace nixops

#include "nixops/schema/tests/libschema.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/resource-ref.hh"

namespace nixops {

class ResourceRefTest : public ::testing::Test
{
protected:
    ResourceRegistry registry;
    ResourceHandle defGroup{"azure-resource-group", "def-group"};
};

TEST_F(ResourceRefTest, literalNeedsNoLookup)
{
    auto ref = resolveReference(Value::mkString("my-existing-group"), registry);
    ASSERT_EQ(ref, ResourceRef(ResourceRef::Literal{"my-existing-group"}));
    ASSERT_EQ(ref.identifier(registry), "my-existing-group");
    ASSERT_EQ(ref.to_string(), "my-existing-group");
}

TEST_F(ResourceRefTest, handleIsLookedUpLazily)
{
    int forced = 0;
    registry.declare(defGroup.kind, defGroup.name, [&]() {
        forced++;
        return std::string("/subscriptions/1234/resourceGroups/def-group");
    });

    auto ref = resolveReference(Value::mkResource(defGroup), registry);
    ASSERT_EQ(forced, 0);
    ASSERT_EQ(ref.to_string(), "«resource azure-resource-group def-group»");

    ASSERT_EQ(ref.identifier(registry), "/subscriptions/1234/resourceGroups/def-group");
    ASSERT_EQ(forced, 1);
}

TEST_F(ResourceRefTest, declarationAfterReference)
{
    auto ref = ResourceRef::fromValue(Value::mkResource(defGroup));
    registry.declare(defGroup.kind, defGroup.name, "def-group-id");
    ASSERT_EQ(ref.identifier(registry), "def-group-id");
}

TEST_F(ResourceRefTest, unknownResource)
{
    registry.declare("azure-resource-group", "def-group", "a");
    registry.declare("azure-resource-group", "prod-group", "b");
    registry.declare("azure-network-security-group", "def-grp", "c");

    auto e = catchError<UnknownResource>([&]() {
        resolveReference(Value::mkResource(ResourceHandle{"azure-resource-group", "def-grup"}), registry);
    });
    ASSERT_EQ(e.kind, "azure-resource-group");
    ASSERT_EQ(e.name, "def-grup");
    ASSERT_THAT(
        e.what(),
        testing::HasSubstrIgnoreANSIMatcher("there is no resource of type 'azure-resource-group' named 'def-grup'"));
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("Did you mean def-group?"));
}

TEST_F(ResourceRefTest, handleOfOtherKindDoesNotMatch)
{
    registry.declare("azure-network-security-group", "def-group", "a");
    ASSERT_THROW(resolveReference(Value::mkResource(defGroup), registry), UnknownResource);
}

TEST_F(ResourceRefTest, duplicateDeclaration)
{
    registry.declare(defGroup.kind, defGroup.name, "a");
    ASSERT_THAT(
        [&]() { registry.declare(defGroup.kind, defGroup.name, "b"); },
        ::testing::ThrowsMessage<Error>(testing::HasSubstrIgnoreANSIMatcher(
            "the resource 'def-group' of type 'azure-resource-group' is declared more than once")));
}

TEST_F(ResourceRefTest, names)
{
    registry.declare("azure-resource-group", "b", "1");
    registry.declare("azure-resource-group", "a", "2");
    registry.declare("azure-virtual-network", "c", "3");
    ASSERT_EQ(registry.names("azure-resource-group"), (StringSet{"a", "b"}));
    ASSERT_EQ(registry.names("azure-storage"), StringSet{});
}

TEST_F(ResourceRefTest, fromValueRejectsOtherTypes)
{
    auto e = catchError<TypeMismatch>([&]() { ResourceRef::fromValue(Value::mkInt(3), {"resourceGroup"}); });
    ASSERT_EQ(e.path, "resourceGroup");
    ASSERT_EQ(e.expected, "string or resource");
    ASSERT_EQ(e.got, "an integer");
}

} // namespace nixops

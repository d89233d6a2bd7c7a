#include <nlohmann/json.hpp>

#include "nixops/schema/tests/libschema.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/resource-ref.hh"
#include "nixops/resources/azure-virtual-network.hh"

namespace nixops {

class AzureVirtualNetworkTest : public ::testing::Test
{
protected:
    ResourceSettings settings;

    ResourceModule module()
    {
        return azureVirtualNetwork(ModuleArgs{.uuid = "1234", .name = "net", .settings = settings});
    }

    std::vector<Override> minimal{
        mkOverride(Priority::Normal, "location", Value::mkString("westus")),
        mkOverride(Priority::Normal, "addressSpace", mkStringList({"10.1.0.0/16"})),
    };
};

TEST_F(AzureVirtualNetworkTest, minimalNetwork)
{
    auto config = evalResource(module(), minimal);

    ASSERT_EQ(config.kind(), "azure-virtual-network");
    ASSERT_THAT(config.at("name"), IsStringEq("nixops-1234-net"));
    ASSERT_THAT(config.at("location"), IsStringEq("westus"));
    ASSERT_THAT(config.at("resourceGroup"), IsResource("azure-resource-group", "def-group"));
    ASSERT_THAT(config.at("tags"), IsAttrsWithKeys(std::vector<std::string>{}));
    ASSERT_THAT(config.at("dnsServers"), IsListOfSize(0));

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"default"}));
    ASSERT_THAT(config.at("subnets.default.addressPrefix"), IsStringEq("10.1.0.0/16"));
    ASSERT_THAT(config.at("subnets.default.securityGroup"), IsNull());

    for (auto name : {"subscriptionId", "authority", "identifier", "secret"})
        ASSERT_THAT(config.at(name), IsStringEq(""));
}

TEST_F(AzureVirtualNetworkTest, toJSON)
{
    auto json = evalResource(module(), minimal).toJSON();

    ASSERT_EQ(json["_type"], "azure-virtual-network");
    ASSERT_EQ(json["resourceGroup"], nlohmann::json::parse(R"({
        "_type": "resource",
        "kind": "azure-resource-group",
        "name": "def-group"
    })"));
    ASSERT_EQ(json["subnets"], nlohmann::json::parse(R"({
        "default": { "addressPrefix": "10.1.0.0/16", "securityGroup": null }
    })"));
}

TEST_F(AzureVirtualNetworkTest, firstAddressBlockIsUsed)
{
    auto config = evalResource(
        module(),
        {
            mkOverride(Priority::Normal, "location", Value::mkString("westus")),
            mkOverride(Priority::Normal, "addressSpace", mkStringList({"10.3.0.0/16", "10.1.0.0/16"})),
        });
    ASSERT_THAT(config.at("subnets.default.addressPrefix"), IsStringEq("10.3.0.0/16"));
}

TEST_F(AzureVirtualNetworkTest, noSubnetsWithoutAddressSpace)
{
    auto config = evalResource(
        module(),
        {
            mkOverride(Priority::Normal, "location", Value::mkString("westus")),
            mkOverride(Priority::Normal, "addressSpace", mkStringList({})),
        });
    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{}));
}

TEST_F(AzureVirtualNetworkTest, userSubnetsReplaceDefaultSubnet)
{
    auto overrides = minimal;
    overrides.push_back(mkOverride(
        Priority::Normal,
        "subnets",
        Value::mkAttrs({
            {"frontend", Value::mkAttrs({{"addressPrefix", Value::mkString("10.1.0.0/24")}})},
            {"backend",
             Value::mkAttrs({
                 {"addressPrefix", Value::mkString("10.1.1.0/24")},
                 {"securityGroup",
                  Value::mkResource({"azure-network-security-group", "backend-nsg"})},
             })},
        })));

    auto config = evalResource(module(), overrides);

    ASSERT_THAT(config.at("subnets"), IsAttrsWithKeys(std::vector<std::string>{"backend", "frontend"}));
    ASSERT_THAT(config.at("subnets.frontend.securityGroup"), IsNull());
    ASSERT_THAT(
        config.at("subnets.backend.securityGroup"), IsResource("azure-network-security-group", "backend-nsg"));
}

TEST_F(AzureVirtualNetworkTest, resourceGroupLiteral)
{
    auto overrides = minimal;
    overrides.push_back(mkOverride(Priority::Normal, "resourceGroup", Value::mkString("xxx-my-group")));

    auto config = evalResource(module(), overrides);
    ASSERT_THAT(config.at("resourceGroup"), IsStringEq("xxx-my-group"));

    ResourceRegistry registry;
    ASSERT_EQ(resolveReference(config.at("resourceGroup"), registry).identifier(registry), "xxx-my-group");
}

TEST_F(AzureVirtualNetworkTest, resourceGroupOfWrongKind)
{
    auto overrides = minimal;
    overrides.push_back(mkOverride(
        Priority::Normal, "resourceGroup", Value::mkResource({"azure-network-security-group", "def-group"})));

    auto e = catchError<TypeMismatch>([&]() { evalResource(module(), overrides); });
    ASSERT_EQ(e.path, "resourceGroup");
    /* Neither alternative accepts the handle; the error of the first is reported. */
    ASSERT_EQ(e.expected, "string");
    ASSERT_EQ(e.got, "a handle to a resource of type 'azure-network-security-group'");
}

TEST_F(AzureVirtualNetworkTest, defaultResourceGroupIsResolvedLazily)
{
    auto config = evalResource(module(), minimal);

    ResourceRegistry registry;
    ASSERT_THROW(resolveReference(config.at("resourceGroup"), registry), UnknownResource);

    registry.declare("azure-resource-group", "def-group", "/subscriptions/1234/resourceGroups/nixops-1234-def-group");
    ASSERT_EQ(
        resolveReference(config.at("resourceGroup"), registry).identifier(registry),
        "/subscriptions/1234/resourceGroups/nixops-1234-def-group");
}

TEST_F(AzureVirtualNetworkTest, settings)
{
    ASSERT_TRUE(settings.set("resource-name-prefix", "prod"));
    ASSERT_TRUE(settings.set("default-resource-group", "shared-group"));

    auto config = evalResource(module(), minimal);
    ASSERT_THAT(config.at("name"), IsStringEq("prod-1234-net"));
    ASSERT_THAT(config.at("resourceGroup"), IsResource("azure-resource-group", "shared-group"));
}

TEST_F(AzureVirtualNetworkTest, settingsFromConfigFile)
{
    settings.applyConfig("resource-name-prefix = staging\n");

    auto config = evalResource(module(), minimal);
    ASSERT_THAT(config.at("name"), IsStringEq("staging-1234-net"));
}

TEST_F(AzureVirtualNetworkTest, nameCanBeOverridden)
{
    auto overrides = minimal;
    overrides.push_back(mkOverride(Priority::Normal, "name", Value::mkString("my-network")));
    ASSERT_THAT(evalResource(module(), overrides).at("name"), IsStringEq("my-network"));
}

TEST_F(AzureVirtualNetworkTest, missingLocation)
{
    auto e = catchError<MissingRequiredOption>([&]() {
        evalResource(module(), {mkOverride(Priority::Normal, "addressSpace", mkStringList({"10.1.0.0/16"}))});
    });
    ASSERT_EQ(e.path, "location");
}

TEST_F(AzureVirtualNetworkTest, conflictingLocations)
{
    auto overrides = minimal;
    overrides.push_back(mkOverride(Priority::Normal, "location", Value::mkString("eastus"), "network.nix"));

    auto e = catchError<ConflictingOverrides>([&]() { evalResource(module(), overrides); });
    ASSERT_EQ(e.path, "location");
    ASSERT_EQ(e.sources, (std::vector<std::string>{"user", "network.nix"}));
}

TEST_F(AzureVirtualNetworkTest, forcedLocationWins)
{
    auto overrides = minimal;
    overrides.push_back(mkForce("location", Value::mkString("northeurope")));
    ASSERT_THAT(evalResource(module(), overrides).at("location"), IsStringEq("northeurope"));
}

TEST_F(AzureVirtualNetworkTest, misspelledSubnetOption)
{
    auto overrides = minimal;
    overrides.push_back(mkOverride(Priority::Normal, "subnets.default.adressPrefix", Value::mkString("10.1.0.0/24")));

    auto e = catchError<UnknownOption>([&]() { evalResource(module(), overrides); });
    ASSERT_EQ(e.path, "subnets.default.adressPrefix");
    ASSERT_THAT(e.what(), testing::HasSubstrIgnoreANSIMatcher("Did you mean addressPrefix?"));
}

TEST_F(AzureVirtualNetworkTest, optionDocumentation)
{
    auto json = module().options->toJSON();

    ASSERT_EQ(json["location"]["type"], "string");
    ASSERT_EQ(json["location"]["mandatory"], true);
    ASSERT_EQ(json["dnsServers"]["type"], "null or (list of string)");
    ASSERT_EQ(json["dnsServers"]["default"], nlohmann::json::array());
    ASSERT_EQ(json["subnets"]["options"]["addressPrefix"]["example"], "10.1.0.0/24");
    ASSERT_EQ(
        json["subscriptionId"]["description"],
        "The Azure Subscription ID used to manage the virtual network. "
        "If left empty, it defaults to the contents of the environment variable AZURE_SUBSCRIPTION_ID.");
}

} // namespace nixops

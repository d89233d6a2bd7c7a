#include "nixops/resources/azure-virtual-network.hh"
#include "nixops/resources/azure-mgmt-credentials.hh"
#include "nixops/util/fmt.hh"

namespace nixops {

static const std::string moduleSource = "azure-virtual-network module";

ref<const OptionSet> azureSubnetOptions()
{
    static auto options = make_ref<const OptionSet>(OptionSet{
        OptionDecl{
            .name = "addressPrefix",
            .type = types::str(),
            .description = "Address prefix for the subnet in CIDR notation.",
            .example = Value::mkString("10.1.0.0/24"),
        },
        OptionDecl{
            .name = "securityGroup",
            .type = types::nullOr(types::either(types::str(), types::resource(std::string(kinds::azureNetworkSecurityGroup)))),
            .defaultValue = Value::mkNull(),
            .description = "The Azure Resource Id or NixOps resource of the Azure network security group to apply to all NICs in the subnet.",
            .example = Value::mkResource({std::string(kinds::azureNetworkSecurityGroup), "my-security-group"}),
        },
    });
    return options;
}

static OptionSet virtualNetworkOptions(const ModuleArgs & args)
{
    OptionSet options{
        OptionDecl{
            .name = "name",
            .type = types::str(),
            .defaultValue = Value::mkString(fmt("%s-%s-%s", args.settings.resourceNamePrefix.get(), args.uuid, args.name)),
            .description = "Name of the Azure virtual network.",
            .example = Value::mkString("my-network"),
        },
        OptionDecl{
            .name = "resourceGroup",
            .type = types::either(types::str(), types::resource(std::string(kinds::azureResourceGroup))),
            .description = "The name or resource of an Azure resource group to create the network in.",
            .example = Value::mkString("xxx-my-group"),
        },
        OptionDecl{
            .name = "location",
            .type = types::str(),
            .description = "The Azure data center location where the virtual network should be created.",
            .example = Value::mkString("westus"),
        },
        OptionDecl{
            .name = "addressSpace",
            .type = types::listOf(types::str()),
            .description = "The list of address blocks reserved for this virtual network in CIDR notation.",
            .example = mkStringList({"10.1.0.0/16", "10.3.0.0/16"}),
        },
        OptionDecl{
            .name = "tags",
            .type = types::attrsOf(types::str()),
            .defaultValue = Value::mkAttrs({}),
            .description = "Tag name/value pairs to associate with the virtual network.",
            .example = Value::mkAttrs({{"environment", Value::mkString("production")}}),
        },
        OptionDecl{
            .name = "dnsServers",
            .type = types::nullOr(types::listOf(types::str())),
            .defaultValue = Value::mkList({}),
            .description =
                "List of DNS servers IP addresses to provide via DHCP. "
                "Leave empty to provide the default Azure DNS servers.",
            .example = mkStringList({"8.8.8.8", "8.8.4.4"}),
        },
        OptionDecl{
            .name = "subnets",
            .type = types::attrsOf(types::optionSet(azureSubnetOptions())),
            .defaultValue = Value::mkAttrs({}),
            .description = "An attribute set of subnets.",
            .example = Value::mkAttrs({}),
        },
    };

    return azureMgmtCredentials("virtual network").merge(options);
}

ResourceModule azureVirtualNetwork(const ModuleArgs & args)
{
    std::vector<Override> config{
        mkDefault(
            "resourceGroup",
            Value::mkResource({std::string(kinds::azureResourceGroup), args.settings.defaultResourceGroup.get()}),
            moduleSource),

        mkIf(
            Condition{
                .inputs = {"addressSpace"},
                .predicate = [](const Inputs & inputs) { return !inputs["addressSpace"].list().empty(); },
            },
            mkDeferred(
                Priority::Default,
                "subnets",
                {"addressSpace"},
                [](const Inputs & inputs) {
                    return Value::mkAttrs({
                        {"default",
                         Value::mkAttrs({
                             {"addressPrefix", inputs["addressSpace"].list().front()},
                         })},
                    });
                },
                moduleSource)),
    };

    return ResourceModule{
        .kind = std::string(kinds::azureVirtualNetwork),
        .options = make_ref<const OptionSet>(virtualNetworkOptions(args)),
        .config = std::move(config),
    };
}

} // namespace nixops

#pragma once
///@file

#include "nixops/resources/resource-settings.hh"
#include "nixops/schema/resolve.hh"
#include "nixops/util/ref.hh"

namespace nixops {

namespace kinds {

constexpr std::string_view azureVirtualNetwork = "azure-virtual-network";
constexpr std::string_view azureResourceGroup = "azure-resource-group";
constexpr std::string_view azureNetworkSecurityGroup = "azure-network-security-group";

} // namespace kinds

/**
 * What a resource module knows about the resource it describes.
 */
struct ModuleArgs
{
    /**
     * Identifies the deployment.
     */
    std::string uuid;

    /**
     * The name of the resource in the deployment.
     */
    std::string name;

    const ResourceSettings & settings;
};

/**
 * The declarations of a resource type plus the definitions the module
 * itself contributes (its defaults).
 */
struct ResourceModule
{
    std::string kind;

    ref<const OptionSet> options;

    std::vector<Override> config;
};

/**
 * Resolve the user's definitions of a resource against `module`. The
 * user's definitions are labelled `user` unless they carry a source
 * already.
 */
ResolvedConfig evalResource(const ResourceModule & module, std::vector<Override> userOverrides);

} // namespace nixops

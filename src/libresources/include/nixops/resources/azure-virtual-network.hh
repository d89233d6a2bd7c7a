#pragma once
///@file

#include "nixops/resources/module.hh"

namespace nixops {

/**
 * The options of one subnet of a virtual network.
 */
ref<const OptionSet> azureSubnetOptions();

/**
 * An Azure virtual network and its subnets.
 *
 * Unless set, `resourceGroup` refers to the resource group named by
 * the `default-resource-group` setting, and `subnets` holds a single
 * subnet `default` covering the first block of `addressSpace`.
 */
ResourceModule azureVirtualNetwork(const ModuleArgs & args);

} // namespace nixops

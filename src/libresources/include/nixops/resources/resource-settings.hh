#pragma once
///@file

#include "nixops/util/configuration.hh"

namespace nixops {

/**
 * Deployment-wide settings the resource modules derive their defaults
 * from.
 */
struct ResourceSettings : Config
{
    Setting<std::string> defaultResourceGroup{
        this,
        "def-group",
        "default-resource-group",
        R"(
          The name of the `azure-resource-group` resource that Azure
          resources are created in unless their `resourceGroup` option is
          set.
        )"};

    Setting<std::string> resourceNamePrefix{
        this,
        "nixops",
        "resource-name-prefix",
        R"(
          The prefix of the default names of the created resources. The
          default name of a resource is `<prefix>-<uuid>-<name>`, where
          `<uuid>` identifies the deployment and `<name>` is the name of
          the resource in the deployment.
        )"};
};

} // namespace nixops

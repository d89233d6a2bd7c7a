#include "nixops/resources/azure-mgmt-credentials.hh"
#include "nixops/util/fmt.hh"

namespace nixops {

static OptionDecl credential(std::string name, std::string description, std::string envVar)
{
    return OptionDecl{
        .name = std::move(name),
        .type = types::str(),
        .defaultValue = Value::mkString(""),
        .description = fmt("%s. If left empty, it defaults to the contents of the environment variable %s.", description, envVar),
    };
}

OptionSet azureMgmtCredentials(std::string_view resourceDescription)
{
    return {
        credential(
            "subscriptionId",
            fmt("The Azure Subscription ID used to manage the %s", resourceDescription),
            "AZURE_SUBSCRIPTION_ID"),
        credential(
            "authority",
            fmt("The Azure Authority URL used to manage the %s", resourceDescription),
            "AZURE_AUTHORITY_URL"),
        credential(
            "identifier",
            fmt("The Azure Active Directory Application ID used to manage the %s", resourceDescription),
            "AZURE_ACTIVE_DIR_APP_ID"),
        credential(
            "secret",
            fmt("The Azure Active Directory Application Key used to manage the %s", resourceDescription),
            "AZURE_ACTIVE_DIR_APP_KEY"),
    };
}

} // namespace nixops

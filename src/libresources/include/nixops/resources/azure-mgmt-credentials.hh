#pragma once
///@file

#include "nixops/schema/option.hh"

namespace nixops {

/**
 * The options through which an Azure resource gets the credentials to
 * manage it. `resourceDescription` names the resource in the option
 * descriptions, e.g. `virtual network`.
 */
OptionSet azureMgmtCredentials(std::string_view resourceDescription);

} // namespace nixops

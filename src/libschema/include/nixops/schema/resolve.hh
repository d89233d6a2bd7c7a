#pragma once
///@file

#include "nixops/schema/option.hh"
#include "nixops/schema/override.hh"
#include "nixops/schema/resolved-config.hh"

#include <vector>

namespace nixops {

/**
 * Merge `overrides` into a value for every option of `options`.
 *
 * For each option, overrides whose guard is false are dropped; of the
 * rest, those at the highest priority must agree and their value
 * wins. Without overrides, the declared default is used. Nested
 * option sets (`optionSet` and `attrsOf (optionSet ...)`) are
 * resolved recursively, seeded with the winning value's attributes
 * at the winning priority and with any overrides addressed below the
 * option.
 *
 * Priorities compete per node: an override of a path below an option
 * counts as a `Normal` definition of each enclosing option, and only
 * its own priority at the path it names. A `mkForce` on
 * `subnets.a.securityGroup` wins over other definitions of that
 * subnet's `securityGroup` without dropping the rest of `subnets`.
 *
 * Options are resolved in dependency order, so that guards and
 * computed values see the final values of their inputs.
 *
 * @param kind The resource kind to tag the result with.
 *
 * @throws ResolutionError (a subclass of it) on the first error.
 */
ResolvedConfig resolve(const OptionSet & options, const std::vector<Override> & overrides, std::string kind = "");

} // namespace nixops

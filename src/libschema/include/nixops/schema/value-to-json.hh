#pragma once
///@file

#include "nixops/schema/value.hh"

#include <nlohmann/json_fwd.hpp>

namespace nixops {

/**
 * Resource handles are encoded as
 * `{ "_type": "resource", "kind": ..., "name": ... }`.
 */
nlohmann::json printValueAsJSON(const Value & v);

/**
 * The inverse of `printValueAsJSON`. Floating point numbers are
 * rejected.
 */
Value valueFromJSON(const nlohmann::json & json);

} // namespace nixops

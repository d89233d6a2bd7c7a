#pragma once
///@file

#include "nixops/schema/value.hh"

#include <nlohmann/json_fwd.hpp>

namespace nixops {

/**
 * The fully typed, fully defaulted values of one resource, as handed
 * to the deployment backend. Reference fields are left as they were
 * defined (string or resource handle).
 */
class ResolvedConfig
{
    std::string _kind;
    Value _values;

public:

    ResolvedConfig(std::string kind, Bindings values);

    /**
     * The resource kind, e.g. `azure-virtual-network`. Empty for
     * option sets resolved on their own.
     */
    const std::string & kind() const
    {
        return _kind;
    }

    const Bindings & values() const
    {
        return _values.attrs();
    }

    /**
     * The value at a dotted path such as `subnets.default.addressPrefix`.
     * Throws `MissingRequiredOption` if there is none.
     */
    const Value & at(std::string_view path) const;

    const Value * maybeGet(std::string_view path) const;

    /**
     * The values as JSON, with the kind recorded in `_type`.
     */
    nlohmann::json toJSON() const;

    bool operator==(const ResolvedConfig & other) const = default;
};

} // namespace nixops

#include "nixops/schema/resolved-config.hh"
#include "nixops/schema/attr-path.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/value-to-json.hh"

#include <nlohmann/json.hpp>

namespace nixops {

ResolvedConfig::ResolvedConfig(std::string kind, Bindings values)
    : _kind(std::move(kind))
    , _values(Value::mkAttrs(std::move(values)))
{
}

const Value * ResolvedConfig::maybeGet(std::string_view path) const
{
    const Value * v = &_values;
    for (auto & attr : parseAttrPath(path)) {
        v = v->get(attr);
        if (!v)
            return nullptr;
    }
    return v;
}

const Value & ResolvedConfig::at(std::string_view path) const
{
    if (auto v = maybeGet(path))
        return *v;
    throw MissingRequiredOption(parseAttrPath(path));
}

nlohmann::json ResolvedConfig::toJSON() const
{
    auto res = printValueAsJSON(_values);
    if (!_kind.empty())
        res["_type"] = _kind;
    return res;
}

} // namespace nixops

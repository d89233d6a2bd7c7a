#include "nixops/schema/value-to-json.hh"
#include "nixops/util/error.hh"

#include <nlohmann/json.hpp>

#include <limits>

namespace nixops {

nlohmann::json printValueAsJSON(const Value & v)
{
    switch (v.type()) {

    case nNull:
        return nullptr;

    case nBool:
        return v.boolean();

    case nInt:
        return v.integer();

    case nString:
        return v.string();

    case nList: {
        auto out = nlohmann::json::array();
        for (auto & elem : v.list())
            out.push_back(printValueAsJSON(elem));
        return out;
    }

    case nAttrs: {
        auto out = nlohmann::json::object();
        for (auto & [name, value] : v.attrs())
            out.emplace(name, printValueAsJSON(value));
        return out;
    }

    case nResource:
        return {
            {"_type", "resource"},
            {"kind", v.resource().kind},
            {"name", v.resource().name},
        };
    }

    panic("unknown value type");
}

Value valueFromJSON(const nlohmann::json & json)
{
    switch (json.type()) {

    case nlohmann::json::value_t::null:
        return Value::mkNull();

    case nlohmann::json::value_t::boolean:
        return Value::mkBool(json.get<bool>());

    case nlohmann::json::value_t::number_integer:
        return Value::mkInt(json.get<NixInt>());

    case nlohmann::json::value_t::number_unsigned: {
        auto n = json.get<uint64_t>();
        if (n > (uint64_t) std::numeric_limits<NixInt>::max())
            throw Error("JSON number %d is too large for an integer", n);
        return Value::mkInt((NixInt) n);
    }

    case nlohmann::json::value_t::string:
        return Value::mkString(json.get<std::string>());

    case nlohmann::json::value_t::array: {
        ValueList elems;
        for (auto & elem : json)
            elems.push_back(valueFromJSON(elem));
        return Value::mkList(std::move(elems));
    }

    case nlohmann::json::value_t::object: {
        if (auto type = json.find("_type"); type != json.end() && *type == "resource") {
            auto kind = json.find("kind");
            auto name = json.find("name");
            if (json.size() != 3 || kind == json.end() || !kind->is_string() || name == json.end()
                || !name->is_string())
                throw Error("malformed resource handle in JSON: %s", json.dump());
            return Value::mkResource(ResourceHandle{kind->get<std::string>(), name->get<std::string>()});
        }
        Bindings attrs;
        for (auto & [name, value] : json.items())
            attrs.emplace(name, valueFromJSON(value));
        return Value::mkAttrs(std::move(attrs));
    }

    case nlohmann::json::value_t::number_float:
        throw Error("floating point numbers are not supported in configuration values: %s", json.dump());

    default:
        throw Error("unsupported JSON value: %s", json.dump());
    }
}

} // namespace nixops

#include "nixops/schema/option.hh"
#include "nixops/schema/value-to-json.hh"
#include "nixops/util/error.hh"

#include <nlohmann/json.hpp>

namespace nixops {

OptionSet::OptionSet(std::initializer_list<OptionDecl> decls)
{
    for (auto & decl : decls)
        add(decl);
}

void OptionSet::add(OptionDecl decl)
{
    auto name = decl.name;
    if (!decls.emplace(name, std::move(decl)).second)
        throw Error("the option '%s' is declared more than once", name);
}

const OptionDecl * OptionSet::find(std::string_view name) const
{
    auto i = decls.find(name);
    return i == decls.end() ? nullptr : &i->second;
}

StringSet OptionSet::names() const
{
    StringSet res;
    for (auto & [name, _] : decls)
        res.insert(name);
    return res;
}

OptionSet OptionSet::merge(const OptionSet & other) const
{
    OptionSet res = *this;
    for (auto & [_, decl] : other.decls)
        res.add(decl);
    return res;
}

static nlohmann::json typeToJSON(const TypeSpec & type);

nlohmann::json OptionSet::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, decl] : decls) {
        auto & obj = res[name];
        obj = typeToJSON(*decl.type);
        obj["description"] = decl.description;
        obj["mandatory"] = decl.isMandatory();
        if (decl.defaultValue) {
            obj["default"] = printValueAsJSON(*decl.defaultValue);
            obj["defaultPriority"] = std::string(showPriority(decl.defaultPriority));
        }
        if (decl.example)
            obj["example"] = printValueAsJSON(*decl.example);
    }
    return res;
}

/**
 * The type of an option, plus the nested declarations if values of
 * the type contain option sets.
 */
static nlohmann::json typeToJSON(const TypeSpec & type)
{
    auto res = nlohmann::json::object();
    res["type"] = type.description();

    const TypeSpec * t = &type;
    while (t->elemType())
        t = t->elemType().get();
    if (auto options = t->optionSet())
        res["options"] = options->toJSON();

    return res;
}

} // namespace nixops

#include "nixops/schema/resolve.hh"
#include "nixops/schema/errors.hh"
#include "nixops/util/logging.hh"
#include "nixops/util/strings.hh"
#include "nixops/util/topo-sort.hh"

#include <algorithm>
#include <variant>

namespace nixops {

namespace {

/**
 * A definition of an option whose guard has been evaluated and whose
 * value has been computed. `path` is relative to the option being
 * resolved; an empty path defines the option as a whole.
 */
struct Definition
{
    AttrPath path;
    Value value;
    Priority priority;
    std::string source;
};

typedef std::vector<Definition> Definitions;

std::string showSource(const Definition & def)
{
    return def.source.empty() ? "«unknown»" : def.source;
}

AttrPath tail(const AttrPath & path)
{
    return AttrPath(path.begin() + 1, path.end());
}

Value resolveAt(const Type & type, const AttrPath & path, Definitions defs, std::optional<Definition> fallback);

/**
 * Split the definitions of an attribute set into the definitions of
 * its attributes. Whole definitions contribute each of their
 * attributes at their own priority.
 */
std::map<std::string, Definitions, std::less<>> splitDefinitions(const Definitions & defs)
{
    std::map<std::string, Definitions, std::less<>> res;
    for (auto & def : defs) {
        if (def.path.empty()) {
            for (auto & [name, value] : def.value.attrs())
                res[name].push_back(Definition{{}, value, def.priority, def.source});
        } else
            res[def.path.front()].push_back(Definition{tail(def.path), def.value, def.priority, def.source});
    }
    return res;
}

Bindings resolveOptionSet(const OptionSet & options, const AttrPath & path, const Definitions & defs)
{
    auto attrDefs = splitDefinitions(defs);

    for (auto & [name, _] : attrDefs)
        if (!options.find(name))
            throw UnknownOption(path + name, options.names());

    Bindings res;
    for (auto & [name, decl] : options.options()) {
        auto i = attrDefs.find(name);
        std::optional<Definition> fallback;
        if (decl.defaultValue)
            fallback = Definition{{}, *decl.defaultValue, decl.defaultPriority, "default value"};
        res.emplace(
            name, resolveAt(decl.type, path + name, i == attrDefs.end() ? Definitions{} : i->second, fallback));
    }
    return res;
}

/**
 * The priority with which `def` competes at the node it is split at.
 * A definition of a deeper path, such as `subnets.a.securityGroup` at
 * `subnets`, is an ordinary definition of the enclosing set; its own
 * priority only applies once it reaches its leaf.
 */
Priority priorityAt(const Definition & def)
{
    return def.path.empty() ? def.priority : Priority::Normal;
}

Value resolveAt(const Type & type, const AttrPath & path, Definitions defs, std::optional<Definition> fallback)
{
    /* Only the definitions at the highest priority count. */
    if (!defs.empty()) {
        auto top = priorityAt(*std::max_element(defs.begin(), defs.end(), [](const Definition & a, const Definition & b) {
            return priorityAt(a) < priorityAt(b);
        }));
        std::erase_if(defs, [&](const Definition & def) {
            if (priorityAt(def) == top)
                return false;
            vomit(
                "ignoring the definition of '%s' in %s at priority '%s'",
                showAttrPath(path + def.path),
                showSource(def),
                showPriority(def.priority));
            return true;
        });
    } else if (fallback)
        defs.push_back(std::move(*fallback));
    else
        throw MissingRequiredOption(path);

    debug("resolving the option '%s' at priority '%s'", showAttrPath(path), showPriority(priorityAt(defs.front())));

    for (auto & def : defs)
        if (def.path.empty())
            type->validate(def.value, path);

    auto options = type->optionSet();

    if (options)
        return type->validate(Value::mkAttrs(resolveOptionSet(*options, path, defs)), path);

    if (type->kind() == TypeKind::AttrsOf) {
        Bindings res;
        for (auto & [name, elemDefs] : splitDefinitions(defs))
            res.emplace(name, resolveAt(ref<const TypeSpec>(type->elemType()), path + name, elemDefs, std::nullopt));
        return type->validate(Value::mkAttrs(std::move(res)), path);
    }

    for (auto & def : defs)
        if (!def.path.empty())
            throw UnknownOption(path + def.path.front(), {});

    auto & winner = defs.front();
    for (auto & def : defs)
        if (!(def.value == winner.value)) {
            std::vector<std::string> sources;
            for (auto & d : defs)
                sources.push_back(showSource(d));
            throw ConflictingOverrides(path, winner.priority, std::move(sources));
        }

    return type->validate(winner.value, path);
}

/**
 * Evaluate the guard and the value of `override`, given the resolved
 * values of the top-level options it depends on.
 */
std::optional<Definition> evalOverride(const Override & override, const Bindings & resolved)
{
    Bindings inputValues;
    for (auto & name : override.inputs())
        inputValues.emplace(name, resolved.at(name));
    Inputs inputs(inputValues);

    if (override.guard) {
        auto active = std::visit(
            overloaded{
                [](bool b) { return b; },
                [&](const Condition & cond) { return cond.predicate(inputs); },
            },
            *override.guard);
        vomit("guard of the definition of '%s' in %s is %s", showAttrPath(override.path),
            override.source,
            active ? "true" : "false");
        if (!active)
            return std::nullopt;
    }

    auto value = std::visit(
        overloaded{
            [](const Value & v) { return v; },
            [&](const Deferred & deferred) { return deferred.compute(inputs); },
        },
        override.value);

    return Definition{tail(override.path), std::move(value), override.priority, override.source};
}

} // namespace

ResolvedConfig resolve(const OptionSet & options, const std::vector<Override> & overrides, std::string kind)
{
    auto declared = options.names();

    std::map<std::string, std::vector<const Override *>, std::less<>> byOption;
    std::map<std::string, StringSet, std::less<>> dependencies;

    for (auto & override : overrides) {
        if (override.path.empty())
            throw Error("a definition in %s does not name an option", override.source);
        auto & name = override.path.front();
        if (!declared.count(name))
            throw UnknownOption({name}, declared);
        for (auto & input : override.inputs())
            if (!declared.count(input))
                throw UnresolvableGuard(override.path, fmt("it depends on the undeclared option '%s'", input));
        byOption[name].push_back(&override);
        auto inputs = override.inputs();
        dependencies[name].insert(inputs.begin(), inputs.end());
    }

    auto result = topoSort(declared, {[&](const std::string & name) -> StringSet {
                               auto i = dependencies.find(name);
                               return i == dependencies.end() ? StringSet{} : i->second;
                           }});

    if (auto cycle = std::get_if<Cycle<std::string>>(&result))
        throw UnresolvableGuard(
            {cycle->parent},
            cycle->parent == cycle->path ? "it depends on itself"
                                         : fmt("it is part of a dependency cycle through the option '%s'", cycle->path));

    auto sorted = std::get<std::vector<std::string>>(std::move(result));

    /* `topoSort` puts options before their inputs. */
    std::reverse(sorted.begin(), sorted.end());

    Bindings resolved;

    for (auto & name : sorted) {
        auto & decl = *options.find(name);
        try {
            Definitions defs;
            if (auto i = byOption.find(name); i != byOption.end())
                for (auto override : i->second)
                    if (auto def = evalOverride(*override, resolved))
                        defs.push_back(std::move(*def));

            std::optional<Definition> fallback;
            if (decl.defaultValue)
                fallback = Definition{{}, *decl.defaultValue, decl.defaultPriority, "default value"};

            resolved.emplace(name, resolveAt(decl.type, {name}, std::move(defs), std::move(fallback)));
        } catch (Error & e) {
            e.addTrace(HintFmt("while resolving the option '%s'", name));
            throw;
        }
    }

    return ResolvedConfig(std::move(kind), std::move(resolved));
}

} // namespace nixops

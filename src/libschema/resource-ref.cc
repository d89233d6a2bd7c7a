#include "nixops/schema/resource-ref.hh"
#include "nixops/schema/errors.hh"
#include "nixops/util/logging.hh"

namespace nixops {

ResourceRef ResourceRef::fromValue(const Value & v, const AttrPath & path)
{
    switch (v.type()) {
    case nString:
        return Literal{v.string()};
    case nResource:
        return v.resource();
    default:
        throw TypeMismatch(path, "string or resource", showType(v));
    }
}

std::string ResourceRef::identifier(const ResourceRegistry & registry) const
{
    return std::visit(
        overloaded{
            [](const Literal & literal) { return literal.id; },
            [&](const ResourceHandle & handle) { return registry.lookup(handle); },
        },
        raw);
}

std::string ResourceRef::to_string() const
{
    return std::visit(
        overloaded{
            [](const Literal & literal) { return literal.id; },
            [](const ResourceHandle & handle) { return fmt("«resource %s %s»", handle.kind, handle.name); },
        },
        raw);
}

void ResourceRegistry::declare(const std::string & kind, const std::string & name, IdentifierThunk identifier)
{
    if (!resources.emplace(ResourceHandle{kind, name}, std::move(identifier)).second)
        throw Error("the resource '%s' of type '%s' is declared more than once", name, kind);
}

void ResourceRegistry::declare(const std::string & kind, const std::string & name, const std::string & identifier)
{
    declare(kind, name, [identifier]() { return identifier; });
}

bool ResourceRegistry::has(const ResourceHandle & handle) const
{
    return resources.count(handle);
}

std::string ResourceRegistry::lookup(const ResourceHandle & handle) const
{
    auto i = resources.find(handle);
    if (i == resources.end())
        throw UnknownResource(handle.kind, handle.name, names(handle.kind));
    debug("looking up the identifier of the resource '%s' of type '%s'", handle.name, handle.kind);
    return i->second();
}

StringSet ResourceRegistry::names(std::string_view kind) const
{
    StringSet res;
    for (auto & [handle, _] : resources)
        if (handle.kind == kind)
            res.insert(handle.name);
    return res;
}

ResourceRef resolveReference(const Value & v, const ResourceRegistry & registry)
{
    auto ref = ResourceRef::fromValue(v);
    if (auto handle = std::get_if<ResourceHandle>(&ref.raw)) {
        if (!registry.has(*handle))
            throw UnknownResource(handle->kind, handle->name, registry.names(handle->kind));
        debug("'%s' refers to a declared resource", ref.to_string());
    }
    return ref;
}

} // namespace nixops

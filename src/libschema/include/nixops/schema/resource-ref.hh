#pragma once
///@file

#include "nixops/schema/attr-path.hh"
#include "nixops/schema/value.hh"
#include "nixops/util/variant-wrapper.hh"

#include <functional>
#include <map>
#include <variant>

namespace nixops {

class ResourceRegistry;

/**
 * A field that is either an opaque external identifier or a handle to
 * another resource of the deployment.
 */
struct ResourceRef
{
    /**
     * An identifier passed through to the provider as is.
     */
    struct Literal
    {
        std::string id;

        bool operator==(const Literal &) const = default;
    };

    typedef std::variant<Literal, ResourceHandle> Raw;

    Raw raw;

    bool operator==(const ResourceRef &) const = default;

    MAKE_WRAPPER_CONSTRUCTOR(ResourceRef);

    /**
     * Interpret a resolved option value: strings become `Literal`,
     * resource handles become `ResourceHandle`. No lookup is done.
     */
    static ResourceRef fromValue(const Value & v, const AttrPath & path = {});

    /**
     * The concrete identifier: the literal itself, or the identifier
     * the registry has for the handle.
     */
    std::string identifier(const ResourceRegistry & registry) const;

    std::string to_string() const;
};

/**
 * The resources declared in a deployment, by kind and name.
 * Declarations may come in any order; handles are only looked up when
 * their identifier is needed.
 */
class ResourceRegistry
{
public:

    typedef std::function<std::string()> IdentifierThunk;

private:

    std::map<ResourceHandle, IdentifierThunk> resources;

public:

    /**
     * Declare a resource whose identifier is computed on demand (e.g.
     * once the resource has been resolved or created).
     */
    void declare(const std::string & kind, const std::string & name, IdentifierThunk identifier);

    void declare(const std::string & kind, const std::string & name, const std::string & identifier);

    bool has(const ResourceHandle & handle) const;

    /**
     * Force the identifier of `handle`. Throws `UnknownResource` if it
     * is not declared.
     */
    std::string lookup(const ResourceHandle & handle) const;

    /**
     * The names of the declared resources of `kind`.
     */
    StringSet names(std::string_view kind) const;
};

/**
 * Resolve a reference-or-literal field against `registry`. A string is
 * returned as a `Literal` without consulting the registry. A handle
 * must name a declared resource, otherwise `UnknownResource` is
 * thrown.
 */
ResourceRef resolveReference(const Value & v, const ResourceRegistry & registry);

} // namespace nixops

#pragma once
///@file

#include "nixops/util/ref.hh"
#include "nixops/schema/attr-path.hh"
#include "nixops/schema/value.hh"

#include <memory>
#include <string>

namespace nixops {

class OptionSet;

enum class TypeKind {
    String,
    Int,
    Bool,
    ListOf,
    AttrsOf,
    NullOr,
    Either,
    OptionSet,
    Resource,
};

/**
 * The type of an option: which values it accepts.
 *
 * Validation is a pure check. It either returns the value it was
 * given or throws `TypeMismatch` naming the path of the offending
 * (sub)value; it never returns a partially accepted value.
 */
class TypeSpec
{
public:

    virtual ~TypeSpec() = default;

    virtual TypeKind kind() const = 0;

    /**
     * A description of the type as shown in documentation and type
     * errors, e.g. `list of string`.
     */
    virtual std::string description() const = 0;

    /**
     * Check `v` against this type. `path` is the location of `v`,
     * used in error messages.
     */
    virtual Value validate(const Value & v, const AttrPath & path) const = 0;

    /**
     * The element type of `listOf`, `attrsOf` and `nullOr`.
     */
    virtual std::shared_ptr<const TypeSpec> elemType() const
    {
        return nullptr;
    }

    /**
     * The option set of `optionSet`.
     */
    virtual std::shared_ptr<const OptionSet> optionSet() const
    {
        return nullptr;
    }
};

typedef ref<const TypeSpec> Type;

/**
 * Check `v` against `type` at the root path.
 */
Value validate(const Type & type, const Value & v);

namespace types {

Type str();

Type integer();

Type boolean();

Type listOf(Type elemType);

Type attrsOf(Type elemType);

Type nullOr(Type elemType);

/**
 * A value of type `a` or, failing that, of type `b`. If neither
 * accepts the value, the error of `a` is reported.
 */
Type either(Type a, Type b);

/**
 * An attribute set whose attributes are options of `options`. Missing
 * options are not an error here; they are filled in from their
 * defaults during resolution.
 */
Type optionSet(ref<const OptionSet> options);

/**
 * A handle to a declared resource of the given kind.
 */
Type resource(const std::string & kind);

} // namespace types

} // namespace nixops

#include "nixops/schema/types.hh"
#include "nixops/schema/errors.hh"
#include "nixops/schema/option.hh"

#include <exception>

namespace nixops {

namespace {

[[noreturn]] void typeMismatch(const TypeSpec & type, const Value & v, const AttrPath & path)
{
    throw TypeMismatch(path, type.description(), showType(v));
}

struct StrType : TypeSpec
{
    TypeKind kind() const override
    {
        return TypeKind::String;
    }

    std::string description() const override
    {
        return "string";
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nString)
            typeMismatch(*this, v, path);
        return v;
    }
};

struct IntType : TypeSpec
{
    TypeKind kind() const override
    {
        return TypeKind::Int;
    }

    std::string description() const override
    {
        return "signed integer";
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nInt)
            typeMismatch(*this, v, path);
        return v;
    }
};

struct BoolType : TypeSpec
{
    TypeKind kind() const override
    {
        return TypeKind::Bool;
    }

    std::string description() const override
    {
        return "boolean";
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nBool)
            typeMismatch(*this, v, path);
        return v;
    }
};

/**
 * Parenthesize descriptions of compound types when they appear inside
 * another description, as in `null or (list of string)`.
 */
std::string nestedDescription(const TypeSpec & type)
{
    switch (type.kind()) {
    case TypeKind::String:
    case TypeKind::Int:
    case TypeKind::Bool:
    case TypeKind::OptionSet:
    case TypeKind::Resource:
        return type.description();
    default:
        return "(" + type.description() + ")";
    }
}

struct ListOfType : TypeSpec
{
    Type elem;

    ListOfType(Type elem)
        : elem(std::move(elem))
    {
    }

    TypeKind kind() const override
    {
        return TypeKind::ListOf;
    }

    std::string description() const override
    {
        return "list of " + nestedDescription(*elem);
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nList)
            typeMismatch(*this, v, path);
        size_t n = 0;
        for (auto & e : v.list())
            elem->validate(e, path + ("[" + std::to_string(n++) + "]"));
        return v;
    }

    std::shared_ptr<const TypeSpec> elemType() const override
    {
        return elem.get_ptr();
    }
};

struct AttrsOfType : TypeSpec
{
    Type elem;

    AttrsOfType(Type elem)
        : elem(std::move(elem))
    {
    }

    TypeKind kind() const override
    {
        return TypeKind::AttrsOf;
    }

    std::string description() const override
    {
        return "attribute set of " + nestedDescription(*elem);
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nAttrs)
            typeMismatch(*this, v, path);
        for (auto & [name, value] : v.attrs())
            elem->validate(value, path + name);
        return v;
    }

    std::shared_ptr<const TypeSpec> elemType() const override
    {
        return elem.get_ptr();
    }
};

struct NullOrType : TypeSpec
{
    Type elem;

    NullOrType(Type elem)
        : elem(std::move(elem))
    {
    }

    TypeKind kind() const override
    {
        return TypeKind::NullOr;
    }

    std::string description() const override
    {
        return "null or " + nestedDescription(*elem);
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.isNull())
            return v;
        try {
            return elem->validate(v, path);
        } catch (TypeMismatch & e) {
            /* A mismatch of a nested element is reported as is; a
               mismatch of the value itself names the nullable type. */
            if (e.path != showAttrPath(path))
                throw;
            typeMismatch(*this, v, path);
        }
    }

    std::shared_ptr<const TypeSpec> elemType() const override
    {
        return elem.get_ptr();
    }
};

struct EitherType : TypeSpec
{
    Type a, b;

    EitherType(Type a, Type b)
        : a(std::move(a))
        , b(std::move(b))
    {
    }

    TypeKind kind() const override
    {
        return TypeKind::Either;
    }

    std::string description() const override
    {
        return nestedDescription(*a) + " or " + nestedDescription(*b);
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        std::exception_ptr errA;
        try {
            return a->validate(v, path);
        } catch (TypeMismatch &) {
            errA = std::current_exception();
        }
        try {
            return b->validate(v, path);
        } catch (TypeMismatch &) {
            std::rethrow_exception(errA);
        }
    }
};

struct OptionSetType : TypeSpec
{
    ref<const OptionSet> options;

    OptionSetType(ref<const OptionSet> options)
        : options(std::move(options))
    {
    }

    TypeKind kind() const override
    {
        return TypeKind::OptionSet;
    }

    std::string description() const override
    {
        return "submodule";
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nAttrs)
            typeMismatch(*this, v, path);
        for (auto & [name, value] : v.attrs()) {
            auto decl = options->find(name);
            if (!decl)
                throw UnknownOption(path + name, options->names());
            decl->type->validate(value, path + name);
        }
        return v;
    }

    std::shared_ptr<const OptionSet> optionSet() const override
    {
        return options.get_ptr();
    }
};

struct ResourceType : TypeSpec
{
    std::string resourceKind;

    ResourceType(std::string resourceKind)
        : resourceKind(std::move(resourceKind))
    {
    }

    TypeKind kind() const override
    {
        return TypeKind::Resource;
    }

    std::string description() const override
    {
        return fmt("resource of type '%s'", resourceKind);
    }

    Value validate(const Value & v, const AttrPath & path) const override
    {
        if (v.type() != nResource || v.resource().kind != resourceKind)
            typeMismatch(*this, v, path);
        return v;
    }
};

} // namespace

Value validate(const Type & type, const Value & v)
{
    return type->validate(v, {});
}

namespace types {

Type str()
{
    static Type type = make_ref<StrType>();
    return type;
}

Type integer()
{
    static Type type = make_ref<IntType>();
    return type;
}

Type boolean()
{
    static Type type = make_ref<BoolType>();
    return type;
}

Type listOf(Type elemType)
{
    return make_ref<ListOfType>(std::move(elemType));
}

Type attrsOf(Type elemType)
{
    return make_ref<AttrsOfType>(std::move(elemType));
}

Type nullOr(Type elemType)
{
    return make_ref<NullOrType>(std::move(elemType));
}

Type either(Type a, Type b)
{
    return make_ref<EitherType>(std::move(a), std::move(b));
}

Type optionSet(ref<const OptionSet> options)
{
    return make_ref<OptionSetType>(std::move(options));
}

Type resource(const std::string & kind)
{
    return make_ref<ResourceType>(kind);
}

} // namespace types

} // namespace nixops

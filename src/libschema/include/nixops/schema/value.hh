#pragma once
///@file

#include <compare>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include "nixops/util/types.hh"

namespace nixops {

typedef enum {
    nNull,
    nBool,
    nInt,
    nString,
    nList,
    nAttrs,
    nResource,
} ValueType;

typedef int64_t NixInt;

/**
 * A handle to another resource declared in the same deployment, e.g.
 * `resources.azureResourceGroups.def-group`. Only the kind and the
 * name are recorded; what the handle refers to is looked up when the
 * deployment backend needs it.
 */
struct ResourceHandle
{
    std::string kind;
    std::string name;

    bool operator==(const ResourceHandle &) const = default;
    auto operator<=>(const ResourceHandle &) const = default;
};

class Value;

typedef std::vector<Value> ValueList;
typedef std::map<std::string, Value, std::less<>> Bindings;

/**
 * An immutable configuration value. Lists and attribute sets share
 * their contents between copies, so passing values around by value is
 * cheap.
 */
class Value
{
public:

    using Raw = std::variant<
        std::monostate,
        bool,
        NixInt,
        std::string,
        std::shared_ptr<const ValueList>,
        std::shared_ptr<const Bindings>,
        ResourceHandle>;

private:

    Raw raw;

    explicit Value(Raw raw)
        : raw(std::move(raw))
    {
    }

public:

    /**
     * The null value.
     */
    Value() = default;

    static Value mkNull()
    {
        return Value();
    }

    static Value mkBool(bool b)
    {
        return Value(Raw(b));
    }

    static Value mkInt(NixInt n)
    {
        return Value(Raw(n));
    }

    static Value mkString(std::string s)
    {
        return Value(Raw(std::move(s)));
    }

    static Value mkList(ValueList elems);

    static Value mkAttrs(Bindings attrs);

    static Value mkResource(ResourceHandle handle)
    {
        return Value(Raw(std::move(handle)));
    }

    ValueType type() const;

    bool isNull() const
    {
        return std::holds_alternative<std::monostate>(raw);
    }

    /**
     * Typed accessors. These throw an `Error` if the value has a
     * different type.
     */
    bool boolean() const;
    NixInt integer() const;
    const std::string & string() const;
    const ValueList & list() const;
    const Bindings & attrs() const;
    const ResourceHandle & resource() const;

    /**
     * @return the attribute `name` of this set, or `nullptr` if this
     * isn't a set or has no such attribute.
     */
    const Value * get(std::string_view name) const;

    /**
     * Structural equality.
     */
    bool operator==(const Value & other) const;

    /**
     * Print the value in Nix syntax, e.g. `{ addressPrefix = "10.1.0.0/16"; }`.
     */
    void print(std::ostream & str) const;
};

std::string_view showType(ValueType type, bool withArticle = true);
std::string showType(const Value & v);

std::ostream & operator<<(std::ostream & str, const Value & v);

/**
 * Convenience constructor for a list of strings.
 */
Value mkStringList(const std::vector<std::string> & ss);

} // namespace nixops

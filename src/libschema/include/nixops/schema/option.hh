#pragma once
///@file

#include "nixops/schema/priority.hh"
#include "nixops/schema/types.hh"
#include "nixops/schema/value.hh"

#include <initializer_list>
#include <map>
#include <optional>

#include <nlohmann/json_fwd.hpp>

namespace nixops {

/**
 * The declaration of one option.
 */
struct OptionDecl
{
    std::string name;

    Type type;

    /**
     * If absent, the option is mandatory.
     */
    std::optional<Value> defaultValue;

    Priority defaultPriority = Priority::Default;

    std::string description;

    std::optional<Value> example;

    bool isMandatory() const
    {
        return !defaultValue.has_value();
    }
};

/**
 * A set of uniquely named option declarations. Option sets are built
 * once when a module is loaded and only read afterwards; they are
 * shared through `ref<const OptionSet>`.
 */
class OptionSet
{
public:

    typedef std::map<std::string, OptionDecl, std::less<>> Decls;

private:

    Decls decls;

public:

    OptionSet() = default;

    OptionSet(std::initializer_list<OptionDecl> decls);

    /**
     * Add a declaration. Throws an `Error` if an option of that name
     * is already declared.
     */
    void add(OptionDecl decl);

    const OptionDecl * find(std::string_view name) const;

    const Decls & options() const
    {
        return decls;
    }

    StringSet names() const;

    /**
     * The union of the declarations of `this` and `other`. Declaring
     * the same option in both is an error.
     */
    OptionSet merge(const OptionSet & other) const;

    /**
     * Describe the declarations for documentation purposes.
     */
    nlohmann::json toJSON() const;
};

} // namespace nixops

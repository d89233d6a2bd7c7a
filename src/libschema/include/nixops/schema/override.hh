#pragma once
///@file

#include "nixops/schema/attr-path.hh"
#include "nixops/schema/priority.hh"
#include "nixops/schema/value.hh"

#include <functional>
#include <optional>
#include <variant>

namespace nixops {

/**
 * The already resolved options a condition or a computed value
 * declared as its inputs.
 */
class Inputs
{
    const Bindings & values;

public:

    Inputs(const Bindings & values)
        : values(values)
    {
    }

    /**
     * The resolved value of the input option `name`. Throws an `Error`
     * if `name` was not declared as an input.
     */
    const Value & operator[](std::string_view name) const;
};

/**
 * A predicate over other options of the same option set.
 */
struct Condition
{
    /**
     * Top-level options the predicate reads. They are resolved before
     * the option the condition is attached to.
     */
    StringSet inputs;

    std::function<bool(const Inputs &)> predicate;
};

/**
 * A value computed from other options of the same option set.
 */
struct Deferred
{
    StringSet inputs;

    std::function<Value(const Inputs &)> compute;
};

/**
 * A candidate value for an option.
 */
struct Override
{
    AttrPath path;

    std::variant<Value, Deferred> value;

    Priority priority = Priority::Normal;

    /**
     * If set and false, the override is ignored.
     */
    std::optional<std::variant<bool, Condition>> guard;

    /**
     * Where the override comes from, e.g. `user`. Used in error
     * messages only.
     */
    std::string source;

    /**
     * The options this override needs resolved before it can be
     * applied.
     */
    StringSet inputs() const;
};

Override mkOverride(Priority priority, std::string_view path, Value value, std::string source = "");

Override mkOverride(Priority priority, std::string_view path, Deferred value, std::string source = "");

inline Override mkDefault(std::string_view path, Value value, std::string source = "")
{
    return mkOverride(Priority::Default, path, std::move(value), std::move(source));
}

inline Override mkForce(std::string_view path, Value value, std::string source = "")
{
    return mkOverride(Priority::Force, path, std::move(value), std::move(source));
}

/**
 * A definition whose value is computed from the resolved values of
 * the top-level options `inputs`.
 */
inline Override mkDeferred(
    Priority priority,
    std::string_view path,
    StringSet inputs,
    std::function<Value(const Inputs &)> compute,
    std::string source = "")
{
    return mkOverride(priority, path, Deferred{std::move(inputs), std::move(compute)}, std::move(source));
}

/**
 * Attach a guard to `override`.
 */
Override mkIf(bool cond, Override override);

Override mkIf(Condition cond, Override override);

} // namespace nixops

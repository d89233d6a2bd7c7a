#include "nixops/schema/override.hh"
#include "nixops/util/error.hh"

namespace nixops {

std::string_view showPriority(Priority priority)
{
    switch (priority) {
    case Priority::Default:
        return "default";
    case Priority::Normal:
        return "normal";
    case Priority::Force:
        return "force";
    }
    panic("unknown priority");
}

std::optional<Priority> parsePriority(std::string_view s)
{
    if (s == "default")
        return Priority::Default;
    if (s == "normal")
        return Priority::Normal;
    if (s == "force")
        return Priority::Force;
    return std::nullopt;
}

const Value & Inputs::operator[](std::string_view name) const
{
    auto i = values.find(name);
    if (i == values.end())
        throw Error("the option '%s' is read but was not declared as an input", name);
    return i->second;
}

StringSet Override::inputs() const
{
    StringSet res;
    if (auto deferred = std::get_if<Deferred>(&value))
        res.insert(deferred->inputs.begin(), deferred->inputs.end());
    if (guard)
        if (auto cond = std::get_if<Condition>(&*guard))
            res.insert(cond->inputs.begin(), cond->inputs.end());
    return res;
}

Override mkOverride(Priority priority, std::string_view path, Value value, std::string source)
{
    return Override{
        .path = parseAttrPath(path),
        .value = std::move(value),
        .priority = priority,
        .source = std::move(source),
    };
}

Override mkOverride(Priority priority, std::string_view path, Deferred value, std::string source)
{
    return Override{
        .path = parseAttrPath(path),
        .value = std::move(value),
        .priority = priority,
        .source = std::move(source),
    };
}

Override mkIf(bool cond, Override override)
{
    override.guard = cond;
    return override;
}

Override mkIf(Condition cond, Override override)
{
    override.guard = std::move(cond);
    return override;
}

} // namespace nixops

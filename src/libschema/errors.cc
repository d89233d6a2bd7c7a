#include "nixops/schema/errors.hh"
#include "nixops/util/strings.hh"

namespace nixops {

TypeMismatch::TypeMismatch(const AttrPath & path, const std::string & expected, const std::string & got)
    : TypeMismatch(
          HintFmt("the option '%s' is not of type '%s'; it is set to %s", showAttrPath(path), expected, Uncolored(got)),
          path,
          expected,
          got)
{
}

TypeMismatch::TypeMismatch(
    HintFmt hint, const AttrPath & path, const std::string & expected, const std::string & got)
    : ResolutionError(std::move(hint))
    , path(showAttrPath(path))
    , expected(expected)
    , got(got)
{
}

UnknownOption::UnknownOption(const AttrPath & path, const StringSet & declared)
    : TypeMismatch(
          HintFmt("the option '%s' does not exist", showAttrPath(path)),
          path,
          "submodule",
          fmt("unknown option '%s'", path.empty() ? "" : path.back()))
{
    if (!path.empty())
        err.suggestions = Suggestions::bestMatches(declared, path.back());
}

MissingRequiredOption::MissingRequiredOption(const AttrPath & path)
    : ResolutionError("the option '%s' is used but not defined", showAttrPath(path))
    , path(showAttrPath(path))
{
}

ConflictingOverrides::ConflictingOverrides(const AttrPath & path, Priority priority, std::vector<std::string> sources)
    : ResolutionError(
          "the option '%s' has conflicting definitions at priority '%s', in %s",
          showAttrPath(path),
          showPriority(priority),
          concatMapStringsSep(", ", sources, [](const std::string & s) { return "'" + s + "'"; }))
    , path(showAttrPath(path))
    , priority(priority)
    , sources(std::move(sources))
{
}

UnresolvableGuard::UnresolvableGuard(const AttrPath & path, const std::string & reason)
    : ResolutionError("cannot decide whether to apply the definitions of the option '%s': %s", showAttrPath(path), Uncolored(reason))
    , path(showAttrPath(path))
{
}

UnknownResource::UnknownResource(const std::string & kind, const std::string & name, const StringSet & declared)
    : ResolutionError(
          Suggestions::bestMatches(declared, name),
          "there is no resource of type '%s' named '%s'",
          kind,
          name)
    , kind(kind)
    , name(name)
{
}

} // namespace nixops

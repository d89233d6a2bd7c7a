#pragma once
///@file

#include "nixops/util/error.hh"
#include "nixops/schema/attr-path.hh"
#include "nixops/schema/priority.hh"

#include <vector>

namespace nixops {

/**
 * Base class of all errors that abort the resolution of an option set.
 * Resolution never returns a partial result: the first error is thrown
 * with the full path of the offending option.
 */
MakeError(ResolutionError, Error);

/**
 * A value does not have the type declared for its option.
 */
class TypeMismatch : public ResolutionError
{
public:
    const std::string path;
    const std::string expected;
    const std::string got;

    TypeMismatch(const AttrPath & path, const std::string & expected, const std::string & got);

protected:
    TypeMismatch(HintFmt hint, const AttrPath & path, const std::string & expected, const std::string & got);
};

/**
 * A definition names an option that is not declared. This is a type
 * mismatch against the enclosing option set, so it can be caught as
 * one.
 */
class UnknownOption : public TypeMismatch
{
public:
    UnknownOption(const AttrPath & path, const StringSet & declared);
};

/**
 * A mandatory option has neither a definition nor a default.
 */
class MissingRequiredOption : public ResolutionError
{
public:
    const std::string path;

    MissingRequiredOption(const AttrPath & path);
};

/**
 * Several definitions at the same, highest priority disagree.
 */
class ConflictingOverrides : public ResolutionError
{
public:
    const std::string path;
    const Priority priority;
    const std::vector<std::string> sources;

    ConflictingOverrides(const AttrPath & path, Priority priority, std::vector<std::string> sources);
};

/**
 * A condition or computed value depends on an option that cannot be
 * resolved before it, either because the dependency is cyclic or
 * because it is not declared.
 */
class UnresolvableGuard : public ResolutionError
{
public:
    const std::string path;

    UnresolvableGuard(const AttrPath & path, const std::string & reason);
};

/**
 * A resource handle names a resource that is not declared.
 */
class UnknownResource : public ResolutionError
{
public:
    const std::string kind;
    const std::string name;

    UnknownResource(const std::string & kind, const std::string & name, const StringSet & declared = {});
};

} // namespace nixops

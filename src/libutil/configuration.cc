#include "nixops/util/configuration.hh"
#include "nixops/util/logging.hh"
#include "nixops/util/strings.hh"

namespace nixops {

AbstractSetting::AbstractSetting(Config * config, const std::string & name, const std::string & description)
    : name(name)
    , description(stripIndentation(description))
{
    if (!config->settings.emplace(name, this).second)
        panic(fmt("setting '%s' is registered twice", name));
}

bool Config::set(std::string_view name, const std::string & value)
{
    auto i = settings.find(name);
    if (i == settings.end())
        return false;
    i->second->set(value);
    return true;
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    size_t lineNo = 0;
    for (auto line : splitString(contents, "\n")) {
        lineNo++;

        if (auto hash = line.find('#'); hash != line.npos)
            line.resize(hash);

        auto tokens = tokenizeString(line);
        if (tokens.empty())
            continue;

        auto i = tokens.begin();
        auto name = *i++;
        if (i == tokens.end() || *i++ != "=")
            throw UsageError("syntax error in configuration line %d in '%s': '%s'", lineNo, path, chomp(line));

        if (!set(name, concatStringsSep(" ", Strings(i, tokens.end()))))
            warn("unknown setting '%s' in '%s'", name, path);
    }
}

template<>
std::string Setting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string Setting<std::string>::to_string() const
{
    return value;
}

template<>
bool Setting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<>
std::string Setting<bool>::to_string() const
{
    return value ? "true" : "false";
}

} // namespace nixops

#pragma once
///@file

#include <map>
#include <string>
#include <string_view>

#include "nixops/util/types.hh"

namespace nixops {

class AbstractSetting;

/**
 * A collection of uniquely named settings. The typical use is to
 * inherit `Config` and add `Setting<T>` members:
 *
 *   struct ResourceSettings : Config
 *   {
 *       Setting<std::string> resourceNamePrefix{this, "nixops", "resource-name-prefix", "..."};
 *   };
 *
 * Settings register themselves with the `Config` they are members of,
 * so a `Config` can be neither copied nor moved.
 */
class Config
{
    friend class AbstractSetting;

    std::map<std::string, AbstractSetting *, std::less<>> settings;

public:

    Config() = default;

    Config(const Config &) = delete;
    Config & operator=(const Config &) = delete;

    virtual ~Config() = default;

    /**
     * Parse `value` and assign it to the setting `name`.
     *
     * @return false if there is no such setting.
     *
     * @throws UsageError if `value` cannot be parsed.
     */
    bool set(std::string_view name, const std::string & value);

    /**
     * Apply `name = value` lines, as found in a configuration file.
     * Everything after a `#` is a comment. Unknown settings are
     * warned about and otherwise ignored.
     *
     * @param path Where `contents` comes from, for error messages.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");
};

class AbstractSetting
{
public:

    const std::string name;
    const std::string description;

    /**
     * Whether the setting was changed from its default.
     */
    bool overridden = false;

    virtual void set(const std::string & value) = 0;

    virtual std::string to_string() const = 0;

protected:

    AbstractSetting(Config * config, const std::string & name, const std::string & description);

    AbstractSetting(const AbstractSetting &) = delete;

    virtual ~AbstractSetting() = default;
};

/**
 * A setting of type `T`. Parsing and printing are defined for
 * `std::string` and `bool`.
 */
template<typename T>
class Setting : public AbstractSetting
{
    T value;

    T parse(const std::string & str) const;

public:

    const T defaultValue;

    Setting(Config * config, const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(config, name, description)
        , value(def)
        , defaultValue(def)
    {
    }

    const T & get() const
    {
        return value;
    }

    operator const T &() const
    {
        return value;
    }

    void operator=(const T & v)
    {
        value = v;
        overridden = true;
    }

    void set(const std::string & str) override
    {
        value = parse(str);
        overridden = true;
    }

    std::string to_string() const override;
};

template<>
std::string Setting<std::string>::parse(const std::string & str) const;
template<>
std::string Setting<std::string>::to_string() const;
template<>
bool Setting<bool>::parse(const std::string & str) const;
template<>
std::string Setting<bool>::to_string() const;

} // namespace nixops

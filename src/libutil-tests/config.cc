#include "nixops/util/configuration.hh"
#include "nixops/util/logging.hh"
#include "nixops/util/terminal.hh"

#include <gtest/gtest.h>

namespace nixops {

struct TestSettings : Config
{
    Setting<std::string> prefix{this, "nixops", "resource-name-prefix", "The prefix of resource names."};

    Setting<bool> verbose{
        this,
        false,
        "verbose",
        R"(
          Whether to log
          every step.
        )"};
};

/* ----------------------------------------------------------------------------
 * Config::set
 * --------------------------------------------------------------------------*/

TEST(Config, defaults)
{
    TestSettings settings;
    ASSERT_EQ(settings.prefix.get(), "nixops");
    ASSERT_FALSE(settings.verbose.get());
    ASSERT_FALSE(settings.prefix.overridden);
}

TEST(Config, setUnknownSetting)
{
    TestSettings settings;
    ASSERT_FALSE(settings.set("resource-prefix", "prod"));
    ASSERT_EQ(settings.prefix.get(), "nixops");
}

TEST(Config, setString)
{
    TestSettings settings;
    ASSERT_TRUE(settings.set("resource-name-prefix", "prod"));
    ASSERT_EQ(settings.prefix.get(), "prod");
    ASSERT_EQ(settings.prefix.defaultValue, "nixops");
    ASSERT_TRUE(settings.prefix.overridden);
    ASSERT_EQ(settings.prefix.to_string(), "prod");
}

TEST(Config, setBool)
{
    TestSettings settings;

    ASSERT_TRUE(settings.set("verbose", "yes"));
    ASSERT_TRUE(settings.verbose.get());
    ASSERT_EQ(settings.verbose.to_string(), "true");

    ASSERT_TRUE(settings.set("verbose", "0"));
    ASSERT_FALSE(settings.verbose.get());

    ASSERT_THROW(settings.set("verbose", "maybe"), UsageError);
}

TEST(Config, assign)
{
    TestSettings settings;
    settings.prefix = "staging";
    ASSERT_EQ(static_cast<const std::string &>(settings.prefix), "staging");
    ASSERT_TRUE(settings.prefix.overridden);
}

TEST(Config, descriptionIsUnindented)
{
    TestSettings settings;
    ASSERT_EQ(settings.verbose.description, "\nWhether to log\nevery step.\n\n");
}

/* ----------------------------------------------------------------------------
 * Config::applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigEmpty)
{
    TestSettings settings;
    settings.applyConfig("");
    settings.applyConfig("\n# only a comment\n\n");
    ASSERT_FALSE(settings.prefix.overridden);
}

TEST(Config, applyConfigAssignments)
{
    TestSettings settings;
    settings.applyConfig(
        "# deployment settings\n"
        "resource-name-prefix = prod   # trailing comment\n"
        "verbose = true\n"
        "resource-name-prefix = staging\n");

    ASSERT_EQ(settings.prefix.get(), "staging");
    ASSERT_TRUE(settings.verbose.get());
}

TEST(Config, applyConfigJoinsWords)
{
    TestSettings settings;
    settings.applyConfig("resource-name-prefix =  my   prefix\n");
    ASSERT_EQ(settings.prefix.get(), "my prefix");
}

TEST(Config, applyConfigWarnsAboutUnknownSettings)
{
    TestSettings settings;
    auto old = verbosity;
    verbosity = lvlWarn;

    ::testing::internal::CaptureStderr();
    settings.applyConfig("resource-prefix = prod\n", "/etc/nixops.conf");
    auto str = ::testing::internal::GetCapturedStderr();

    verbosity = old;

    ASSERT_EQ(filterANSIEscapes(str, true), "warning: unknown setting 'resource-prefix' in '/etc/nixops.conf'\n");
    ASSERT_EQ(settings.prefix.get(), "nixops");
}

TEST(Config, applyConfigSyntaxError)
{
    TestSettings settings;
    ASSERT_THROW(settings.applyConfig("verbose\n"), UsageError);
    ASSERT_THROW(settings.applyConfig("verbose true\n"), UsageError);

    try {
        settings.applyConfig("verbose = true\n\nverbose: false\n", "nixops.conf");
        FAIL() << "expected a syntax error";
    } catch (UsageError & e) {
        ASSERT_EQ(
            filterANSIEscapes(e.message(), true),
            "syntax error in configuration line 3 in 'nixops.conf': 'verbose: false'");
    }
}

TEST(Config, applyConfigInvalidValue)
{
    TestSettings settings;
    ASSERT_THROW(settings.applyConfig("verbose = maybe\n"), UsageError);
}

} // namespace nixops

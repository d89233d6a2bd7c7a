#include <gtest/gtest.h>

#include "nixops/util/strings.hh"

namespace nixops {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    ASSERT_EQ(concatStringsSep(",", Strings{}), "");
}

TEST(concatStringsSep, optionNames)
{
    Strings names{"location", "subnets", "tags"};

    ASSERT_EQ(concatStringsSep(", ", names), "location, subnets, tags");
}

TEST(concatMapStringsSep, quoted)
{
    std::vector<std::string> sources{"user", "azure-virtual-network module"};

    ASSERT_EQ(
        concatMapStringsSep(", ", sources, [](const std::string & s) { return "'" + s + "'"; }),
        "'user', 'azure-virtual-network module'");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, onlySeparators)
{
    ASSERT_EQ(tokenizeString(""), Strings{});
    ASSERT_EQ(tokenizeString(" \t\n"), Strings{});
}

TEST(tokenizeString, settingLine)
{
    Strings expected{"resource-name-prefix", "=", "prod"};

    ASSERT_EQ(tokenizeString("  resource-name-prefix\t= prod\r"), expected);
}

TEST(tokenizeString, customSeparator)
{
    Strings expected{"10.1.0.0/16", "10.3.0.0/16"};

    ASSERT_EQ(tokenizeString(",10.1.0.0/16,,10.3.0.0/16", ","), expected);
}

/* ----------------------------------------------------------------------------
 * splitString
 * --------------------------------------------------------------------------*/

TEST(splitString, empty)
{
    ASSERT_EQ(splitString("", "\n"), Strings{""});
}

TEST(splitString, keepsEmptyLines)
{
    Strings expected{"a = 1", "", "b = 2", ""};

    ASSERT_EQ(splitString("a = 1\n\nb = 2\n", "\n"), expected);
}

/* ----------------------------------------------------------------------------
 * chomp
 * --------------------------------------------------------------------------*/

TEST(chomp, emptyString)
{
    ASSERT_EQ(chomp(""), "");
}

TEST(chomp, removesTrailingWhitespaceOnly)
{
    ASSERT_EQ(chomp("  foo \n\t "), "  foo");
    ASSERT_EQ(chomp(" \n"), "");
}

/* ----------------------------------------------------------------------------
 * stripIndentation
 * --------------------------------------------------------------------------*/

TEST(stripIndentation, singleLine)
{
    ASSERT_EQ(stripIndentation("description"), "description\n");
}

TEST(stripIndentation, commonIndentationIsRemoved)
{
    ASSERT_EQ(
        stripIndentation(R"(
          Whether to print the full trace.
            Indented further.
        )"),
        "\nWhether to print the full trace.\n  Indented further.\n\n");
}

} // namespace nixops

#include "nixops/schema/tests/libschema.hh"
#include "nixops/util/error.hh"
#include "nixops/schema/option.hh"

#include <nlohmann/json.hpp>

namespace nixops {

static OptionSet networkOptions()
{
    return {
        OptionDecl{
            .name = "location",
            .type = types::str(),
            .description = "The Azure data center location.",
            .example = Value::mkString("westus"),
        },
        OptionDecl{
            .name = "tags",
            .type = types::attrsOf(types::str()),
            .defaultValue = Value::mkAttrs({}),
            .description = "Tags.",
        },
    };
}

TEST(OptionSet, find)
{
    auto options = networkOptions();
    ASSERT_NE(options.find("location"), nullptr);
    ASSERT_TRUE(options.find("location")->isMandatory());
    ASSERT_FALSE(options.find("tags")->isMandatory());
    ASSERT_EQ(options.find("subnets"), nullptr);
    ASSERT_EQ(options.names(), (StringSet{"location", "tags"}));
}

TEST(OptionSet, duplicateDeclaration)
{
    auto options = networkOptions();
    ASSERT_THROW(options.add(OptionDecl{.name = "location", .type = types::str()}), Error);
}

TEST(OptionSet, merge)
{
    OptionSet credentials{
        OptionDecl{.name = "subscriptionId", .type = types::str(), .defaultValue = Value::mkString("")},
    };

    auto merged = credentials.merge(networkOptions());
    ASSERT_EQ(merged.names(), (StringSet{"location", "subscriptionId", "tags"}));

    ASSERT_THAT(
        [&]() { merged.merge(credentials); },
        ::testing::ThrowsMessage<Error>(
            testing::HasSubstrIgnoreANSIMatcher("the option 'subscriptionId' is declared more than once")));
}

TEST(OptionSet, toJSON)
{
    auto subnet = make_ref<const OptionSet>(OptionSet{
        OptionDecl{.name = "addressPrefix", .type = types::str(), .description = "Address prefix."},
    });

    auto options = networkOptions();
    options.add(OptionDecl{
        .name = "subnets",
        .type = types::attrsOf(types::optionSet(subnet)),
        .defaultValue = Value::mkAttrs({}),
        .description = "Subnets.",
    });

    ASSERT_EQ(options.toJSON(), nlohmann::json::parse(R"({
        "location": {
            "type": "string",
            "description": "The Azure data center location.",
            "mandatory": true,
            "example": "westus"
        },
        "subnets": {
            "type": "attribute set of submodule",
            "description": "Subnets.",
            "mandatory": false,
            "default": {},
            "defaultPriority": "default",
            "options": {
                "addressPrefix": {
                    "type": "string",
                    "description": "Address prefix.",
                    "mandatory": true
                }
            }
        },
        "tags": {
            "type": "attribute set of string",
            "description": "Tags.",
            "mandatory": false,
            "default": {},
            "defaultPriority": "default"
        }
    })"));
}

} // namespace nixops

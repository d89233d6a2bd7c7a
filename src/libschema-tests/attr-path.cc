#include <gtest/gtest.h>

#include "nixops/schema/attr-path.hh"
#include "nixops/util/error.hh"

namespace nixops {

TEST(parseAttrPath, simple)
{
    ASSERT_EQ(parseAttrPath("location"), (AttrPath{"location"}));
    ASSERT_EQ(parseAttrPath("subnets.default.addressPrefix"), (AttrPath{"subnets", "default", "addressPrefix"}));
}

TEST(parseAttrPath, empty)
{
    ASSERT_EQ(parseAttrPath(""), AttrPath{});
}

TEST(parseAttrPath, quoted)
{
    ASSERT_EQ(parseAttrPath("subnets.\"10.1\".addressPrefix"), (AttrPath{"subnets", "10.1", "addressPrefix"}));
}

TEST(parseAttrPath, missingQuote)
{
    ASSERT_THROW(parseAttrPath("subnets.\"10.1"), Error);
}

TEST(parseAttrPath, emptyComponent)
{
    ASSERT_THROW(parseAttrPath("subnets..addressPrefix"), Error);
    ASSERT_THROW(parseAttrPath(".subnets"), Error);
}

TEST(showAttrPath, quotesDots)
{
    ASSERT_EQ(showAttrPath({"subnets", "10.1", "addressPrefix"}), "subnets.\"10.1\".addressPrefix");
    ASSERT_EQ(parseAttrPath(showAttrPath({"subnets", "10.1"})), (AttrPath{"subnets", "10.1"}));
}

TEST(AttrPath, append)
{
    ASSERT_EQ(AttrPath{"subnets"} + "default", (AttrPath{"subnets", "default"}));
}

TEST(AttrPath, concatenate)
{
    AttrPath prefix{"subnets", "default"};
    ASSERT_EQ(prefix + AttrPath{"securityGroup"}, (AttrPath{"subnets", "default", "securityGroup"}));
    ASSERT_EQ(prefix + AttrPath{}, prefix);
    ASSERT_EQ(AttrPath{} + prefix, prefix);
}

} // namespace nixops

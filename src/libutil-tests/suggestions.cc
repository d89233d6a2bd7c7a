#include "nixops/util/suggestions.hh"
#include "nixops/util/terminal.hh"

#include <gtest/gtest.h>

namespace nixops {

struct DistanceCase
{
    std::string a, b;
    int distance;
};

class LevenshteinDistanceTest : public ::testing::TestWithParam<DistanceCase>
{};

TEST_P(LevenshteinDistanceTest, isSymmetric)
{
    auto & c = GetParam();
    ASSERT_EQ(levenshteinDistance(c.a, c.b), c.distance);
    ASSERT_EQ(levenshteinDistance(c.b, c.a), c.distance);
}

INSTANTIATE_TEST_SUITE_P(
    Suggestions,
    LevenshteinDistanceTest,
    ::testing::Values(
        DistanceCase{"", "", 0},
        DistanceCase{"tags", "", 4},
        DistanceCase{"tags", "tags", 0},
        DistanceCase{"tags", "tag", 1},
        DistanceCase{"tags", "ags", 1},
        DistanceCase{"tags", "tabs", 1},
        DistanceCase{"name", "tags", 3},
        DistanceCase{"location", "lcoation", 2},
        DistanceCase{"addressSpace", "adressSpace", 1},
        DistanceCase{"resourceGroup", "resourceGroups", 1}));

TEST(Suggestions, closestComeFirst)
{
    auto all = Suggestions::bestMatches({"dnsServers", "subnets", "subnet", "tags"}, "subnetz");

    auto best = all.trim(1);
    ASSERT_EQ(best.suggestions.size(), 1);
    ASSERT_EQ(best.suggestions.begin()->suggestion, "subnet");
    ASSERT_EQ(best.suggestions.begin()->distance, 1);

    /* "tags" is 7 edits away, "dnsServers" 8. */
    ASSERT_EQ(all.trim(10, 8).suggestions.size(), 3);
    ASSERT_EQ(all.trim().suggestions.size(), 2);
}

TEST(Suggestions, toString)
{
    ASSERT_EQ(Suggestions{}.to_string(), "");

    auto one = Suggestions::bestMatches({"location", "locations", "tags"}, "locaton").trim();
    ASSERT_EQ(filterANSIEscapes(one.to_string(), true), "location");

    auto two = Suggestions::bestMatches({"subnet", "subnets", "tags"}, "subnetz").trim();
    ASSERT_EQ(filterANSIEscapes(two.to_string(), true), "one of subnet or subnets");

    auto three = Suggestions::bestMatches({"tag", "tags", "taps"}, "tabs").trim(5, 3);
    ASSERT_EQ(filterANSIEscapes(three.to_string(), true), "one of tags, taps or tag");
}

TEST(Suggestions, union)
{
    auto res = Suggestions::bestMatches({"name"}, "nam");
    res += Suggestions::bestMatches({"tags", "name"}, "nam");
    ASSERT_EQ(res.suggestions.size(), 2);
}

} // namespace nixops

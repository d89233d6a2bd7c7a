#include "nixops/util/topo-sort.hh"
#include "nixops/util/types.hh"

#include <gtest/gtest.h>

namespace nixops {

/* Edges point from an option to the options its definitions read. */
typedef std::map<std::string, StringSet> Graph;

static TopoSortResult<std::string> sortOptions(const StringSet & options, const Graph & reads)
{
    return topoSort(options, {[&](const std::string & name) {
                        auto i = reads.find(name);
                        return i == reads.end() ? StringSet{} : i->second;
                    }});
}

static std::vector<std::string> sorted(const TopoSortResult<std::string> & result)
{
    if (auto order = std::get_if<std::vector<std::string>>(&result))
        return *order;
    ADD_FAILURE() << "unexpected cycle";
    return {};
}

static size_t positionOf(const std::vector<std::string> & order, const std::string & name)
{
    return std::find(order.begin(), order.end(), name) - order.begin();
}

TEST(topoSort, empty)
{
    ASSERT_EQ(sorted(sortOptions({}, {})), std::vector<std::string>{});
}

TEST(topoSort, unrelatedOptionsAreAllReturned)
{
    auto order = sorted(sortOptions({"location", "name", "tags"}, {}));
    ASSERT_EQ(StringSet(order.begin(), order.end()), (StringSet{"location", "name", "tags"}));
}

TEST(topoSort, readerComesFirst)
{
    ASSERT_EQ(
        sorted(sortOptions({"addressSpace", "subnets"}, {{"subnets", {"addressSpace"}}})),
        (std::vector<std::string>{"subnets", "addressSpace"}));
}

TEST(topoSort, chain)
{
    ASSERT_EQ(
        sorted(sortOptions({"location", "name", "resourceGroup"}, {{"resourceGroup", {"name"}}, {"name", {"location"}}})),
        (std::vector<std::string>{"resourceGroup", "name", "location"}));
}

TEST(topoSort, diamond)
{
    Graph reads{
        {"subnets", {"addressSpace", "location"}},
        {"addressSpace", {"name"}},
        {"location", {"name"}},
    };
    auto order = sorted(sortOptions({"addressSpace", "location", "name", "subnets"}, reads));
    ASSERT_EQ(order.size(), 4);
    for (auto & [reader, inputs] : reads)
        for (auto & input : inputs)
            ASSERT_LT(positionOf(order, reader), positionOf(order, input)) << reader << " reads " << input;
}

TEST(topoSort, undeclaredInputsAreSkipped)
{
    ASSERT_EQ(
        sorted(sortOptions({"name", "tags"}, {{"tags", {"name", "owner"}}})),
        (std::vector<std::string>{"tags", "name"}));
}

TEST(topoSort, selfReference)
{
    auto result = sortOptions({"subnets"}, {{"subnets", {"subnets"}}});
    auto cycle = std::get_if<Cycle<std::string>>(&result);
    ASSERT_TRUE(cycle);
    ASSERT_EQ(cycle->path, "subnets");
    ASSERT_EQ(cycle->parent, "subnets");
}

TEST(topoSort, cycleReportsTheClosingEdge)
{
    Graph reads{
        {"a", {"b"}},
        {"b", {"c"}},
        {"c", {"a"}},
        {"d", {"a"}},
    };
    auto result = sortOptions({"a", "b", "c", "d"}, reads);
    auto cycle = std::get_if<Cycle<std::string>>(&result);
    ASSERT_TRUE(cycle);
    ASSERT_TRUE(reads[cycle->parent].count(cycle->path));
    ASSERT_TRUE(StringSet({"a", "b", "c"}).count(cycle->path));
}

} // namespace nixops

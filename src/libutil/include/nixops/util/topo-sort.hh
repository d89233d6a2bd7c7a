#pragma once
///@file

#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <variant>
#include <vector>

namespace nixops {

/**
 * The edge `parent -> path` that closes a cycle.
 */
template<typename T>
struct Cycle
{
    T path;
    T parent;
};

template<typename T>
using TopoSortResult = std::variant<std::vector<T>, Cycle<T>>;

/**
 * Order `items` so that every item precedes the items `getChildren`
 * returns for it. Children that are not in `items` are skipped.
 */
template<typename T, typename Compare>
TopoSortResult<T> topoSort(std::set<T, Compare> items, std::function<std::set<T, Compare>(const T &)> getChildren)
{
    enum class Mark { OnStack, Done };
    std::map<T, Mark, Compare> marks;
    std::vector<T> postOrder;

    std::function<std::optional<Cycle<T>>(const T &)> visit = [&](const T & node) -> std::optional<Cycle<T>> {
        marks.emplace(node, Mark::OnStack);
        for (auto & child : getChildren(node)) {
            if (!items.count(child))
                continue;
            auto m = marks.find(child);
            if (m == marks.end()) {
                if (auto cycle = visit(child))
                    return cycle;
            } else if (m->second == Mark::OnStack)
                return Cycle<T>{child, node};
        }
        marks[node] = Mark::Done;
        postOrder.push_back(node);
        return std::nullopt;
    };

    for (auto & item : items)
        if (!marks.count(item))
            if (auto cycle = visit(item))
                return *cycle;

    return std::vector<T>(postOrder.rbegin(), postOrder.rend());
}

} // namespace nixops

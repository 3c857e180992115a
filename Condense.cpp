// 算法模块：缩点图上的查询
#include "Condense.h"
#include "DepthOrder.h"
#include <algorithm>
#include <numeric>

const IndexSet* Condensation::successors(std::size_t i) const
{
    if (i >= succ.size()) return nullptr;
    return &succ[i];
}

std::optional<bool> Condensation::isCyclic(std::size_t i) const
{
    if (i >= succ.size()) return std::nullopt;
    return succ[i].count(i) > 0;
}

std::vector<IndexSet> Condensation::predecessors() const
{
    std::vector<IndexSet> pred(succ.size());
    for (std::size_t i = 0; i < succ.size(); ++i) {
        for (std::size_t j : succ[i]) pred[j].insert(i);
    }
    return pred;
}

std::optional<IndexSet> Condensation::directSuccessors(std::size_t i) const
{
    if (i >= succ.size()) return std::nullopt;

    IndexSet result = succ[i];
    result.erase(i);

    // 从每个后继 j 出发往下走，走到的分量都不是直接后继。
    // visited 跨 j 共享：已经走过的子图不用再走第二遍。
    IndexSet visited;
    visited.insert(i);
    std::vector<std::size_t> work;
    for (std::size_t j : succ[i]) {
        if (j == i) continue;
        for (std::size_t k : succ[j]) {
            if (k != j) work.push_back(k);
        }
        while (!work.empty()) {
            std::size_t k = work.back();
            work.pop_back();
            if (!visited.insert(k).second) continue;
            result.erase(k);
            for (std::size_t c : succ[k]) {
                if (c != k) work.push_back(c);
            }
        }
    }
    return result;
}

std::vector<std::size_t> Condensation::depths() const
{
    // 缩点图去掉自环后无环，松弛一定收敛
    return *::depths(succ);
}

std::vector<std::size_t> Condensation::orderByDepth() const
{
    const std::vector<std::size_t> depth = depths();
    std::vector<std::size_t> order(succ.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(),
              [&depth](std::size_t a, std::size_t b) { return depth[a] < depth[b]; });
    return order;
}

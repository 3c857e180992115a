// algo/Condense.h
#pragma once
#include "Steps.h"
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

using IndexSet = std::unordered_set<std::size_t>;

// 缩点图：分量下标之间的边。只由 Condense 构造，构造后只读。
// 不变式：去掉自环后无环，且每条边 i -> j 都满足 j <= i。
class Condensation {
public:
    Condensation() = default;

    std::size_t size() const { return succ.size(); }
    const std::vector<IndexSet>& edges() const { return succ; }

    // 越界返回 nullptr；集合里可能包含 i 自己
    const IndexSet* successors(std::size_t i) const;

    // i 是自己的后继 <=> 分量有环；越界返回 nullopt
    std::optional<bool> isCyclic(std::size_t i) const;

    std::vector<IndexSet> predecessors() const;

    // 直接后继：去掉还能经由另一个后继到达的分量。i 本身不算，每个分量最多走一次
    std::optional<IndexSet> directSuccessors(std::size_t i) const;

    // 没有入边的分量深度为 0，其余为 max(前驱深度) + 1
    std::vector<std::size_t> depths() const;
    std::vector<std::size_t> orderByDepth() const;

private:
    friend class Condense;
    explicit Condensation(std::vector<IndexSet> successors): succ(std::move(successors)) {}

    std::vector<IndexSet> succ;
};

struct CondenseResult {
    Condensation dag;
    StepList steps;
};

class Condense {
public:
    // list[i] 是第 i 个分量的顶点，sccId 把每个顶点映射到分量下标
    template <typename G, typename V>
    CondenseResult run(const G& g,
                       const std::vector<std::vector<V>>& list,
                       const std::unordered_map<V, std::size_t>& sccId,
                       bool recordSteps = false) const;
};

template <typename G, typename V>
CondenseResult Condense::run(const G& g,
                             const std::vector<std::vector<V>>& list,
                             const std::unordered_map<V, std::size_t>& sccId,
                             bool recordSteps) const
{
    std::vector<IndexSet> succ(list.size());
    StepList steps;

    for (std::size_t su = 0; su < list.size(); ++su) {
        for (const V& u : list[su]) {
            for (const auto& w : g.successors(u)) {
                auto it = sccId.find(w);
                if (it == sccId.end()) continue; // 图两次给出的后继不一致，忽略多出来的
                const std::size_t sv = it->second;
                if (succ[su].insert(sv).second && recordSteps) {
                    steps.push_back({StepType::BuildCondensedEdge,
                                     static_cast<long long>(su), static_cast<long long>(sv), -1, 0,
                                     su == sv ? QString("分量自环：SCC%1").arg(su)
                                              : QString("缩点边：SCC%1 -> SCC%2").arg(su).arg(sv)});
                }
            }
        }
    }

    return {Condensation(std::move(succ)), std::move(steps)};
}

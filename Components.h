// 结果结构：强连通分量 + 缩点图，构造后只读
#pragma once
#include "Condense.h"
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

template <typename V>
class Components {
public:
    using Component = std::vector<V>;
    using const_iterator = typename std::vector<Component>::const_iterator;

    Components() = default;
    Components(std::vector<Component> list,
               std::unordered_map<V, std::size_t> sccId,
               Condensation dag)
        : list(std::move(list)), sccId(std::move(sccId)), dag(std::move(dag)) {}

    std::size_t size() const { return list.size(); }
    bool empty() const { return list.empty(); }

    // 按完成顺序：被指向的分量总在指向它的分量之前
    const_iterator begin() const { return list.begin(); }
    const_iterator end() const { return list.end(); }

    std::optional<std::size_t> vertexComponentIndex(const V& v) const {
        auto it = sccId.find(v);
        if (it == sccId.end()) return std::nullopt;
        return it->second;
    }

    const Component* componentByIndex(std::size_t i) const {
        return i < list.size() ? &list[i] : nullptr;
    }

    const Component* componentOf(const V& v) const {
        auto i = vertexComponentIndex(v);
        return i ? componentByIndex(*i) : nullptr;
    }

    const IndexSet* successors(std::size_t i) const { return dag.successors(i); }
    std::optional<bool> isCyclic(std::size_t i) const { return dag.isCyclic(i); }
    std::optional<IndexSet> directSuccessors(std::size_t i) const { return dag.directSuccessors(i); }
    std::vector<IndexSet> predecessors() const { return dag.predecessors(); }
    std::vector<std::size_t> depths() const { return dag.depths(); }
    std::vector<std::size_t> orderByDepth() const { return dag.orderByDepth(); }

    const Condensation& condensation() const { return dag; }

private:
    std::vector<Component> list;
    std::unordered_map<V, std::size_t> sccId; // 顶点 -> 分量下标
    Condensation dag;
};

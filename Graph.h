// 数据结构：有向图（引擎只需要 vertices() / successors(v) 两个接口）
#pragma once
#include <vector>
#include <utility>
#include <unordered_map>
#include <unordered_set>

// 按下标的邻接表：顶点为 0..n-1
struct Graph {
    int n = 0;
    std::vector<std::unordered_set<int>> adj;
    std::vector<std::pair<int,int>> edges; // 保留加边顺序，方便输出/重建

    Graph() = default;
    explicit Graph(int n): n(n), adj(n) {}

    // 越界或重复边返回 false；自环允许（自环让单点 SCC 成为有环分量）
    bool addEdge(int u, int v){
        if(u < 0 || u >= n || v < 0 || v >= n) return false;
        if(!adj[u].insert(v).second) return false;
        edges.push_back({u,v});
        return true;
    }

    std::vector<int> vertices() const {
        std::vector<int> vs(n);
        for(int i=0;i<n;i++) vs[i] = i;
        return vs;
    }

    const std::unordered_set<int>& successors(int v) const { return adj[v]; }
};

// 按 key 的邻接表：任意可哈希的顶点类型
template <typename K>
struct KeyedGraph {
    std::unordered_map<K, std::unordered_set<K>> adj;
    std::vector<K> order; // 顶点登记顺序，保证枚举顺序稳定

    void addVertex(const K& k){
        if(adj.emplace(k, std::unordered_set<K>()).second) order.push_back(k);
    }

    bool addEdge(const K& u, const K& v){
        addVertex(u);
        addVertex(v);
        return adj[u].insert(v).second;
    }

    std::size_t size() const { return order.size(); }

    const std::vector<K>& vertices() const { return order; }

    // 未登记的 key 视为没有后继
    const std::unordered_set<K>& successors(const K& v) const {
        static const std::unordered_set<K> kEmpty;
        auto it = adj.find(v);
        return it == adj.end() ? kEmpty : it->second;
    }
};

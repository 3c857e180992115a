// 算法模块：按深度排序（最长路分层）
#include "DepthOrder.h"
#include "Condense.h"
#include <algorithm>
#include <numeric>

namespace {

bool relaxDepths(const std::vector<std::unordered_set<std::size_t>>& edges,
                 std::vector<std::size_t>& depth,
                 StepList* steps)
{
    const std::size_t n = edges.size();
    depth.assign(n, 0);

    // 栈顶先弹出下标大的点：引擎产出的分量下标越大越靠近源头
    std::vector<std::size_t> work(n);
    std::iota(work.begin(), work.end(), std::size_t{0});

    while (!work.empty()) {
        const std::size_t i = work.back();
        work.pop_back();

        for (std::size_t c : edges[i]) {
            if (c == i) continue;
            if (c >= n) return false;
            if (depth[i] + 1 <= depth[c]) continue;

            depth[c] = depth[i] + 1;
            // n 个点的无环图里最长路不超过 n-1 条边
            if (depth[c] >= n) return false;

            if (steps) {
                steps->push_back({StepType::DepthRelax,
                                  static_cast<long long>(i), static_cast<long long>(c), -1,
                                  static_cast<long long>(depth[c]),
                                  QString("depth[SCC%1] = %2 (来自 SCC%3)").arg(c).arg(depth[c]).arg(i)});
            }
            work.push_back(c);
        }
    }
    return true;
}

} // namespace

std::optional<std::vector<std::size_t>> depths(const std::vector<std::unordered_set<std::size_t>>& edges)
{
    std::vector<std::size_t> depth;
    if (!relaxDepths(edges, depth, nullptr)) return std::nullopt;
    return depth;
}

DepthResult DepthOrder::run(const Condensation& dag)
{
    const std::size_t n = dag.size();
    DepthResult res;

    for (std::size_t i = 0; i < n; ++i) {
        res.steps.push_back({StepType::DepthInit, static_cast<long long>(i), -1, -1, 0,
                             QString("初始化深度 depth[SCC%1]=0").arg(i)});
    }

    res.ok = relaxDepths(dag.edges(), res.depth, &res.steps);
    if (!res.ok) return res;

    res.order.resize(n);
    std::iota(res.order.begin(), res.order.end(), std::size_t{0});
    std::stable_sort(res.order.begin(), res.order.end(),
                     [&res](std::size_t a, std::size_t b) { return res.depth[a] < res.depth[b]; });

    for (std::size_t pos = 0; pos < n; ++pos) {
        const std::size_t c = res.order[pos];
        res.steps.push_back({StepType::DepthEmit, static_cast<long long>(c), -1, -1,
                             static_cast<long long>(res.depth[c]),
                             QString("输出 #%1: SCC%2 (depth=%3)").arg(pos + 1).arg(c).arg(res.depth[c])});
    }
    return res;
}

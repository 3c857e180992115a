// algo/DepthOrder.h
#pragma once
#include "Steps.h"
#include <cstddef>
#include <optional>
#include <unordered_set>
#include <vector>

class Condensation;

// 沿给定的边做最长路松弛，自环跳过。传后继集合得到深度，传前驱集合得到反向深度。
// 边里有经过不同点的环或下标越界时返回 nullopt
std::optional<std::vector<std::size_t>> depths(const std::vector<std::unordered_set<std::size_t>>& edges);

struct DepthResult {
    bool ok = false;
    std::vector<std::size_t> depth;
    std::vector<std::size_t> order;
    StepList steps;
};

// 缩点图上按深度分层，顺带记录回放步骤
class DepthOrder {
public:
    DepthResult run(const Condensation& dag);
};

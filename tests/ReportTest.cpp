#include "Report.h"
#include "TarjanSCC.h"
#include "TestGraphs.h"

#include <gtest/gtest.h>
#include <cstddef>
#include <functional>
#include <vector>

namespace {

struct Task {
    int id;
    bool operator==(const Task& other) const { return id == other.id; }
};

// 两个互相依赖的任务再加一个被依赖的任务
struct TaskGraph {
    std::vector<Task> vertices() const { return {{0}, {1}, {2}}; }
    std::vector<Task> successors(const Task& t) const {
        if (t.id == 0) return {{1}};
        if (t.id == 1) return {{0}, {2}};
        return {};
    }
};

} // namespace

namespace std {
template <>
struct hash<Task> {
    std::size_t operator()(const Task& t) const { return std::hash<int>()(t.id); }
};
} // namespace std

TEST(Report, IndexSetIsSorted)
{
    EXPECT_EQ(formatIndexSet(IndexSet{3, 0, 2}), QString("{SCC0, SCC2, SCC3}"));
    EXPECT_EQ(formatIndexSet(IndexSet{}), QString("{}"));
}

TEST(Report, ComponentsAndCondensation)
{
    Graph g = makeTwoComponents();
    TarjanSCC<Graph> algo;
    auto comps = algo.run(g);

    // 出栈顺序：1 后入栈，先弹出
    EXPECT_EQ(formatComponents(comps), QString("SCC0 (1): 2\nSCC1 (2) cyclic: 1 0"));
    EXPECT_EQ(formatCondensation(comps.condensation()), QString("SCC1 -> SCC0"));
    EXPECT_EQ(formatDirectSuccessors(comps.condensation()), QString("SCC0 => {}\nSCC1 => {SCC0}"));
}

TEST(Report, DepthOrder)
{
    Graph g = makeTwoComponents();
    TarjanSCC<Graph> algo;
    auto comps = algo.run(g);

    DepthOrder order;
    EXPECT_EQ(formatDepthOrder(order.run(comps.condensation())), QString("depth 0: SCC1\ndepth 1: SCC0"));

    DepthResult failed;
    EXPECT_EQ(formatDepthOrder(failed), QString("depth order unavailable: condensation has a cycle"));
}

TEST(Report, UnprintableVerticesUsePositionInComponent)
{
    TaskGraph g;
    TarjanSCC<TaskGraph> algo;
    auto comps = algo.run(g);

    EXPECT_EQ(formatComponents(comps), QString("SCC0 (1): #0\nSCC1 (2) cyclic: #0 #1"));
}

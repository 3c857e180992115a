#include "Graph.h"
#include "TestGraphs.h"

#include <gtest/gtest.h>
#include <string>

TEST(Graph, RejectsOutOfRangeAndDuplicateEdges)
{
    Graph g(3);
    EXPECT_TRUE(g.addEdge(0, 1));
    EXPECT_FALSE(g.addEdge(0, 1));
    EXPECT_FALSE(g.addEdge(-1, 1));
    EXPECT_FALSE(g.addEdge(0, 3));
    EXPECT_TRUE(g.addEdge(2, 2));
    EXPECT_EQ(g.edges.size(), 2u);
}

TEST(Graph, VerticesEnumerateAllIndices)
{
    Graph g = makeDiamond();
    EXPECT_EQ(g.vertices(), (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(g.successors(0).size(), 2u);
    EXPECT_TRUE(g.successors(3).empty());
}

TEST(KeyedGraph, EdgesRegisterBothEndpoints)
{
    KeyedGraph<std::string> g;
    g.addVertex("lonely");
    EXPECT_TRUE(g.addEdge("a", "b"));
    EXPECT_FALSE(g.addEdge("a", "b"));

    EXPECT_EQ(g.vertices(), (std::vector<std::string>{"lonely", "a", "b"}));
    EXPECT_EQ(g.successors("a").count("b"), 1u);
    EXPECT_TRUE(g.successors("b").empty());
    EXPECT_TRUE(g.successors("missing").empty());
}

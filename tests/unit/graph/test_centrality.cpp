//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include "cga/graph/centrality.hpp"

#include <ranges>
#include <vector>

using namespace cga;
using namespace cga::graph;

class CentralityTest : public ::testing::Test {
protected:
    // A -> B -> C
    static DirectedGraph create_path() {
        DirectedGraph graph;
        graph.add_edge(0, 1);
        graph.add_edge(1, 2);
        return graph;
    }

    // A -> B -> C -> A
    static DirectedGraph create_triangle() {
        DirectedGraph graph;
        graph.add_edge(0, 1);
        graph.add_edge(1, 2);
        graph.add_edge(2, 0);
        return graph;
    }

    // Four leaves pointing at node 0
    static DirectedGraph create_star() {
        DirectedGraph graph;
        for (NodeIndex leaf = 1; leaf <= 4; ++leaf) {
            graph.add_edge(leaf, 0);
        }
        return graph;
    }

    static double sum(const ScoreMap& scores) {
        double total = 0.0;
        for (const double score : scores | std::views::values) {
            total += score;
        }
        return total;
    }
};

TEST_F(CentralityTest, ShortestPathLength_IncludesSource) {
    const auto graph = create_path();
    const auto distances = single_source_shortest_path_length(graph, 0);

    ASSERT_EQ(distances.size(), 3u);
    EXPECT_EQ(distances.at(0), 0u);
    EXPECT_EQ(distances.at(1), 1u);
    EXPECT_EQ(distances.at(2), 2u);
}

TEST_F(CentralityTest, ShortestPathLength_FollowsDirection) {
    const auto graph = create_path();
    const auto distances = single_source_shortest_path_length(graph, 2);

    ASSERT_EQ(distances.size(), 1u);
    EXPECT_EQ(distances.at(2), 0u);
}

TEST_F(CentralityTest, EmptyAndSingleNodeGraphs_HaveNoScores) {
    const DirectedGraph empty;
    DirectedGraph single;
    single.add_node();

    const std::vector<const DirectedGraph*> graphs{&empty, &single};
    for (const auto* graph : graphs) {
        EXPECT_TRUE(degree_centrality(*graph).empty());
        EXPECT_TRUE(betweenness_centrality(*graph).empty());
        EXPECT_TRUE(closeness_centrality(*graph).empty());
        EXPECT_TRUE(pagerank_centrality(*graph).empty());

        const auto metrics = calculate_centrality(*graph);
        EXPECT_TRUE(metrics.eigenvector_centrality.empty());
    }
}

TEST_F(CentralityTest, Degree_Path) {
    const auto scores = degree_centrality(create_path());

    EXPECT_DOUBLE_EQ(scores.at(0), 0.5);
    EXPECT_DOUBLE_EQ(scores.at(1), 1.0);
    EXPECT_DOUBLE_EQ(scores.at(2), 0.5);
}

TEST_F(CentralityTest, Degree_CountsParallelEdges) {
    DirectedGraph graph;
    graph.add_edge(0, 1);
    graph.add_edge(0, 1);

    const auto scores = degree_centrality(graph);
    EXPECT_DOUBLE_EQ(scores.at(0), 2.0);
}

TEST_F(CentralityTest, Betweenness_MiddleOfPath) {
    const auto scores = betweenness_centrality(create_path());

    EXPECT_DOUBLE_EQ(scores.at(0), 0.0);
    EXPECT_DOUBLE_EQ(scores.at(1), 0.5);
    EXPECT_DOUBLE_EQ(scores.at(2), 0.0);
    EXPECT_GT(scores.at(1), scores.at(0));
    EXPECT_GT(scores.at(1), scores.at(2));
}

TEST_F(CentralityTest, Betweenness_TwoNodesIsUnscaled) {
    DirectedGraph graph;
    graph.add_edge(0, 1);

    const auto scores = betweenness_centrality(graph);
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_DOUBLE_EQ(scores.at(0), 0.0);
    EXPECT_DOUBLE_EQ(scores.at(1), 0.0);
}

TEST_F(CentralityTest, Betweenness_SplitAcrossShortestPaths) {
    // 0 -> 1 -> 3 and 0 -> 2 -> 3
    DirectedGraph graph;
    graph.add_edge(0, 1);
    graph.add_edge(0, 2);
    graph.add_edge(1, 3);
    graph.add_edge(2, 3);

    const auto scores = betweenness_centrality(graph);
    // Each middle node carries half of the single 0 -> 3 pair, scaled by 1/6
    EXPECT_NEAR(scores.at(1), 0.5 / 6.0, 1e-12);
    EXPECT_NEAR(scores.at(2), 0.5 / 6.0, 1e-12);
    EXPECT_DOUBLE_EQ(scores.at(0), 0.0);
    EXPECT_DOUBLE_EQ(scores.at(3), 0.0);
}

TEST_F(CentralityTest, Closeness_Path) {
    const auto scores = closeness_centrality(create_path());

    EXPECT_NEAR(scores.at(0), 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(scores.at(1), 1.0);
    EXPECT_DOUBLE_EQ(scores.at(2), 0.0);
}

TEST_F(CentralityTest, Closeness_IsolatedNodeIsZero) {
    DirectedGraph graph;
    graph.add_edge(0, 1);
    graph.add_node();

    EXPECT_DOUBLE_EQ(closeness_centrality(graph).at(2), 0.0);
}

TEST_F(CentralityTest, PageRank_CycleIsUniform) {
    const auto scores = pagerank_centrality(create_triangle());

    ASSERT_EQ(scores.size(), 3u);
    for (const double score : scores | std::views::values) {
        EXPECT_NEAR(score, 1.0 / 3.0, 1e-6);
    }
    EXPECT_NEAR(sum(scores), 1.0, 1e-6);
}

TEST_F(CentralityTest, PageRank_DanglingNodeLeaksRank) {
    const auto scores = pagerank_centrality(create_path());

    EXPECT_LT(sum(scores), 1.0);
    EXPECT_GT(scores.at(2), scores.at(1));
    EXPECT_GT(scores.at(1), scores.at(0));
}

TEST_F(CentralityTest, PageRank_HubRanksHighest) {
    const auto scores = pagerank_centrality(create_star());

    for (NodeIndex leaf = 1; leaf <= 4; ++leaf) {
        EXPECT_GT(scores.at(0), scores.at(leaf));
    }
}

TEST_F(CentralityTest, PageRank_ZeroIterationsKeepsUniformStart) {
    const auto scores = pagerank_centrality(create_path(), 0.85, 0, 1e-6);

    for (const double score : scores | std::views::values) {
        EXPECT_DOUBLE_EQ(score, 1.0 / 3.0);
    }
}

TEST_F(CentralityTest, PageRank_NoDampingIsTeleportOnly) {
    const auto scores = pagerank_centrality(create_star(), 0.0, 100, 1e-9);

    for (const double score : scores | std::views::values) {
        EXPECT_NEAR(score, 0.2, 1e-12);
    }
}

TEST_F(CentralityTest, CalculateCentrality_EigenvectorMirrorsPageRank) {
    PageRankOptions options;
    options.damping = 0.9;

    const auto metrics = calculate_centrality(create_star(), options);

    EXPECT_EQ(metrics.eigenvector_centrality, metrics.pagerank);
    EXPECT_EQ(metrics.degree_centrality.size(), 5u);
    EXPECT_EQ(metrics.betweenness_centrality.size(), 5u);
    EXPECT_EQ(metrics.closeness_centrality.size(), 5u);
    EXPECT_EQ(metrics.pagerank, pagerank_centrality(create_star(), 0.9, 100, 1e-6));
}

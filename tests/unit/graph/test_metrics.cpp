//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include "cga/graph/metrics.hpp"

using namespace cga;
using namespace cga::graph;

class CentralityMetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics_.degree_centrality = {{0, 0.5}, {1, 1.0}, {2, 1.0}};
        metrics_.betweenness_centrality = {{0, 0.0}, {1, 0.5}, {2, 0.0}};
        metrics_.closeness_centrality = {{0, 0.25}, {1, 0.75}, {2, 0.75}};
        metrics_.pagerank = {{0, 0.2}, {1, 0.3}, {2, 0.5}};
        metrics_.eigenvector_centrality = metrics_.pagerank;
    }

    CentralityMetrics metrics_;
};

TEST_F(CentralityMetricsTest, MostCentral) {
    ASSERT_TRUE(metrics_.most_central_betweenness().has_value());
    EXPECT_EQ(metrics_.most_central_betweenness()->node, 1u);
    EXPECT_DOUBLE_EQ(metrics_.most_central_betweenness()->score, 0.5);
}

TEST_F(CentralityMetricsTest, Ties_GoToLowestIndex) {
    EXPECT_EQ(metrics_.most_central_closeness()->node, 1u);
    EXPECT_EQ(metrics_.highest_degree()->node, 1u);
}

TEST_F(CentralityMetricsTest, TopPageRank_Ordered) {
    const auto top = metrics_.top_pagerank(2);

    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], (RankedNode{2, 0.5}));
    EXPECT_EQ(top[1], (RankedNode{1, 0.3}));
}

TEST_F(CentralityMetricsTest, TopPageRank_LargerThanGraph) {
    EXPECT_EQ(metrics_.top_pagerank(10).size(), 3u);
    EXPECT_TRUE(metrics_.top_pagerank(0).empty());
}

TEST_F(CentralityMetricsTest, Averages) {
    const auto averages = metrics_.average_centralities();

    EXPECT_NEAR(averages.degree, 2.5 / 3.0, 1e-12);
    EXPECT_NEAR(averages.betweenness, 0.5 / 3.0, 1e-12);
    EXPECT_NEAR(averages.closeness, 1.75 / 3.0, 1e-12);
    EXPECT_NEAR(averages.pagerank, 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(averages.eigenvector, averages.pagerank, 1e-12);
}

TEST(CentralityMetricsEmptyTest, NoNodes) {
    const CentralityMetrics metrics;

    EXPECT_FALSE(metrics.most_central_betweenness().has_value());
    EXPECT_FALSE(metrics.highest_degree().has_value());
    EXPECT_TRUE(metrics.top_pagerank(5).empty());
    EXPECT_DOUBLE_EQ(metrics.average_centralities().degree, 0.0);
}

TEST(NetworkMetricsTest, DensityClassification) {
    NetworkMetrics sparse;
    sparse.density = 0.05;
    EXPECT_TRUE(sparse.is_sparse());
    EXPECT_FALSE(sparse.is_dense());

    NetworkMetrics dense;
    dense.density = 0.6;
    EXPECT_TRUE(dense.is_dense());

    NetworkMetrics boundary;
    boundary.density = 0.5;
    EXPECT_FALSE(boundary.is_dense());
    boundary.density = 0.1;
    EXPECT_FALSE(boundary.is_sparse());
}

TEST(NetworkMetricsTest, ComplexityScore) {
    NetworkMetrics metrics;
    metrics.density = 0.3;
    metrics.clustering_coefficient = 0.2;
    metrics.average_path_length = 2.0;

    EXPECT_NEAR(metrics.complexity_score(), (0.3 + 0.2 + 0.5) / 3.0, 1e-12);

    metrics.average_path_length = 0.0;
    EXPECT_NEAR(metrics.complexity_score(), 0.5 / 3.0, 1e-12);
}

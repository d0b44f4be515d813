//
// Created by gregorian-rayne on 10/06/26.
//

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "cga/analysis/graph_builder.hpp"

#include <string>

using namespace cga;
using namespace cga::analysis;
using namespace cga::graph;
using ::testing::Contains;
using ::testing::HasSubstr;

class GraphAnalyzerTest : public ::testing::Test {
protected:
    static GraphAnalyzer create_sample(AnalyzerOptions options = {}) {
        GraphBuilder builder;
        builder.add_call("main", "helper", 5);
        builder.add_call("helper", "util", 3);
        builder.add_dependency("main_module", "helper_module");
        builder.add_inheritance("Child", "Parent");
        builder.set_options(options);
        return std::move(builder).build();
    }

    static GraphAnalyzer create_dependency_cycle() {
        GraphBuilder builder;
        builder.add_dependency("a", "b");
        builder.add_dependency("b", "c");
        builder.add_dependency("c", "a");
        return std::move(builder).build();
    }
};

TEST_F(GraphAnalyzerTest, Analyze_Statistics) {
    const auto analyzer = create_sample();
    const auto result = analyzer.analyze();

    EXPECT_EQ(result.statistics.call_graph.node_count, 3u);
    EXPECT_EQ(result.statistics.call_graph.edge_count, 2u);
    EXPECT_DOUBLE_EQ(result.statistics.call_graph.average_degree, 4.0 / 3.0);
    EXPECT_FALSE(result.statistics.call_graph.is_cyclic);

    EXPECT_EQ(result.statistics.dependency_graph.node_count, 2u);
    EXPECT_DOUBLE_EQ(result.statistics.dependency_graph.density, 0.5);
    EXPECT_EQ(result.statistics.inheritance_graph.edge_count, 1u);
}

TEST_F(GraphAnalyzerTest, Analyze_Centrality) {
    const auto analyzer = create_sample();
    const auto result = analyzer.analyze();

    const auto main_idx = *analyzer.call_graph().find_node("main");
    const auto helper_idx = *analyzer.call_graph().find_node("helper");

    const auto& degree = result.call_graph_centrality.degree_centrality;
    EXPECT_GT(degree.at(helper_idx), degree.at(main_idx));

    const auto most_between = result.call_graph_centrality.most_central_betweenness();
    ASSERT_TRUE(most_between.has_value());
    EXPECT_EQ(most_between->node, helper_idx);

    EXPECT_EQ(result.dependency_graph_centrality.pagerank.size(), 2u);
    EXPECT_EQ(result.call_graph_centrality.eigenvector_centrality,
              result.call_graph_centrality.pagerank);
}

TEST_F(GraphAnalyzerTest, Analyze_NoCyclesInAcyclicInput) {
    const auto result = create_sample().analyze();

    EXPECT_EQ(result.cycles.total_cycles, 0u);
    EXPECT_TRUE(result.cycles.call_cycles.empty());
}

TEST_F(GraphAnalyzerTest, Analyze_ComponentsAreStronglyConnected) {
    const auto result = create_sample().analyze();

    EXPECT_EQ(result.components.call_components.size(), 3u);
    EXPECT_EQ(result.components.dependency_components.size(), 2u);
    EXPECT_EQ(result.components.inheritance_components.size(), 2u);
    EXPECT_EQ(result.components.total_components, 7u);
}

TEST_F(GraphAnalyzerTest, Analyze_CouplingUsesDependencyGraph) {
    const auto analyzer = create_sample();
    const auto result = analyzer.analyze();

    const auto helper = *analyzer.dependency_graph().find_node("helper_module");
    EXPECT_EQ(result.coupling.afferent_coupling.at(helper), 1u);
    EXPECT_EQ(result.coupling.summary.total_nodes, 2u);
}

TEST_F(GraphAnalyzerTest, Analyze_DependencyCycle) {
    const auto result = create_dependency_cycle().analyze();

    ASSERT_EQ(result.cycles.dependency_cycles.size(), 1u);
    EXPECT_EQ(result.cycles.dependency_cycles[0], (NodePath{0, 1, 2, 0}));
    EXPECT_EQ(result.cycles.total_cycles, 1u);
    EXPECT_TRUE(result.statistics.dependency_graph.is_cyclic);
    ASSERT_EQ(result.components.dependency_components.size(), 1u);
}

TEST_F(GraphAnalyzerTest, Analyze_IsIdempotent) {
    const auto analyzer = create_sample();
    const auto first = analyzer.analyze();
    const auto second = analyzer.analyze();

    EXPECT_EQ(first.call_graph_centrality.pagerank, second.call_graph_centrality.pagerank);
    EXPECT_EQ(first.call_graph_centrality.betweenness_centrality,
              second.call_graph_centrality.betweenness_centrality);
    EXPECT_EQ(first.cycles.call_cycles, second.cycles.call_cycles);
    EXPECT_EQ(first.components.call_components, second.components.call_components);
    EXPECT_EQ(first.coupling.instability, second.coupling.instability);
}

TEST_F(GraphAnalyzerTest, Analyze_ParallelMatchesSequential) {
    AnalyzerOptions parallel_options;
    parallel_options.parallel = true;

    const auto sequential = create_sample().analyze();
    const auto parallel = create_sample(parallel_options).analyze();

    EXPECT_EQ(sequential.call_graph_centrality.pagerank, parallel.call_graph_centrality.pagerank);
    EXPECT_EQ(sequential.dependency_graph_centrality.degree_centrality,
              parallel.dependency_graph_centrality.degree_centrality);
    EXPECT_EQ(sequential.inheritance_graph_centrality.closeness_centrality,
              parallel.inheritance_graph_centrality.closeness_centrality);
}

TEST_F(GraphAnalyzerTest, Analyze_MaxCyclesCapsEachGraph) {
    GraphBuilder builder;
    builder.add_call("a", "b");
    builder.add_call("b", "a");
    builder.add_call("a", "c");
    builder.add_call("c", "a");

    AnalyzerOptions options;
    options.max_cycles = 1;
    builder.set_options(options);

    const auto result = std::move(builder).build().analyze();
    EXPECT_EQ(result.cycles.call_cycles.size(), 1u);
}

TEST_F(GraphAnalyzerTest, Analyze_EmptyGraphs) {
    const GraphAnalyzer analyzer(CallGraph{}, DependencyGraph{}, InheritanceGraph{});
    const auto result = analyzer.analyze();

    EXPECT_TRUE(result.call_graph_centrality.pagerank.empty());
    EXPECT_EQ(result.cycles.total_cycles, 0u);
    EXPECT_EQ(result.components.total_components, 0u);
    EXPECT_EQ(result.statistics.call_graph.node_count, 0u);
    EXPECT_DOUBLE_EQ(result.statistics.call_graph.average_degree, 0.0);
}

TEST_F(GraphAnalyzerTest, NetworkMetrics_HasAllGraphs) {
    const auto metrics = create_sample().calculate_network_metrics();

    ASSERT_EQ(metrics.size(), 3u);
    EXPECT_TRUE(metrics.contains(CALL_GRAPH_KEY));
    EXPECT_TRUE(metrics.contains(DEPENDENCY_GRAPH_KEY));
    EXPECT_TRUE(metrics.contains(INHERITANCE_GRAPH_KEY));

    const auto& calls = metrics.at(CALL_GRAPH_KEY);
    EXPECT_EQ(calls.connected_components, 1u);
    EXPECT_EQ(calls.largest_component_size, 3u);
    EXPECT_EQ(calls.diameter, 2u);
}

TEST_F(GraphAnalyzerTest, Patterns_CleanInput) {
    GraphBuilder builder;
    builder.add_dependency("a", "b");
    builder.add_dependency("c", "b");
    builder.add_dependency("d", "b");
    builder.add_dependency("e", "f");
    builder.add_dependency("g", "f");

    const auto report = std::move(builder).build().check_problematic_patterns();
    EXPECT_TRUE(report.empty());
}

TEST_F(GraphAnalyzerTest, Patterns_DependencyCycle) {
    const auto report = create_dependency_cycle().check_problematic_patterns();

    ASSERT_TRUE(report.contains("cycles"));
    EXPECT_THAT(report.at("cycles"),
                Contains("Found 1 dependency cycles which can cause circular imports"));
}

TEST_F(GraphAnalyzerTest, Patterns_InheritanceCycle) {
    GraphBuilder builder;
    builder.add_inheritance("A", "B");
    builder.add_inheritance("B", "A");

    const auto report = std::move(builder).build().check_problematic_patterns();

    ASSERT_TRUE(report.contains("cycles"));
    EXPECT_THAT(report.at("cycles"),
                Contains("Found 1 inheritance cycles which indicate design problems"));
}

TEST_F(GraphAnalyzerTest, Patterns_CallCyclesAboveThreshold) {
    GraphBuilder builder;
    builder.add_call("a", "b");
    builder.add_call("b", "a");
    builder.add_call("a", "c");
    builder.add_call("c", "a");

    AnalyzerOptions options;
    options.thresholds.max_call_cycles = 1;
    options.thresholds.max_call_density = 1.0;
    builder.set_options(options);

    const auto report = std::move(builder).build().check_problematic_patterns();

    ASSERT_TRUE(report.contains("cycles"));
    EXPECT_THAT(report.at("cycles"),
                Contains("Found 2 call cycles - consider refactoring recursive patterns"));
    EXPECT_FALSE(report.contains("density"));
}

TEST_F(GraphAnalyzerTest, Patterns_CountsIgnoreMaxCycles) {
    GraphBuilder builder;
    for (int i = 0; i < 12; ++i) {
        const auto spoke = "spoke" + std::to_string(i);
        builder.add_call("hub", spoke);
        builder.add_call(spoke, "hub");
    }
    builder.add_dependency("a", "b");
    builder.add_dependency("b", "a");
    builder.add_dependency("a", "c");
    builder.add_dependency("c", "a");

    AnalyzerOptions options;
    options.max_cycles = 1;
    options.thresholds.max_call_density = 1.0;
    options.thresholds.max_dependency_density = 1.0;
    builder.set_options(options);

    const auto analyzer = std::move(builder).build();
    EXPECT_EQ(analyzer.analyze().cycles.call_cycles.size(), 1u);

    const auto report = analyzer.check_problematic_patterns();
    ASSERT_TRUE(report.contains("cycles"));
    EXPECT_THAT(report.at("cycles"),
                Contains("Found 12 call cycles - consider refactoring recursive patterns"));
    EXPECT_THAT(report.at("cycles"),
                Contains("Found 2 dependency cycles which can cause circular imports"));
}

TEST_F(GraphAnalyzerTest, Patterns_CallCyclesWithinThreshold) {
    GraphBuilder builder;
    builder.add_call("a", "b");
    builder.add_call("b", "a");
    for (int i = 0; i < 10; ++i) {
        builder.add_call("a", "leaf" + std::to_string(i));
    }

    const auto report = std::move(builder).build().check_problematic_patterns();
    EXPECT_FALSE(report.contains("cycles"));
}

TEST_F(GraphAnalyzerTest, Patterns_HighInstability) {
    // Three importers of one module: average instability 3/4
    GraphBuilder builder;
    builder.add_dependency("a", "core");
    builder.add_dependency("b", "core");
    builder.add_dependency("c", "core");

    AnalyzerOptions options;
    options.thresholds.max_average_instability = 0.7;
    options.thresholds.max_dependency_density = 1.0;
    builder.set_options(options);

    const auto report = std::move(builder).build().check_problematic_patterns();

    ASSERT_TRUE(report.contains("coupling"));
    EXPECT_THAT(report.at("coupling"),
                Contains("High average instability detected - modules are too dependent on others"));
}

TEST_F(GraphAnalyzerTest, Patterns_CouplingHub) {
    GraphBuilder builder;
    for (int i = 0; i < 21; ++i) {
        builder.add_dependency("module" + std::to_string(i), "hub");
    }

    const auto report = std::move(builder).build().check_problematic_patterns();

    ASSERT_TRUE(report.contains("coupling"));
    EXPECT_THAT(report.at("coupling"),
                Contains("Modules with very high coupling detected - consider decomposition"));
}

TEST_F(GraphAnalyzerTest, Patterns_Density) {
    GraphBuilder builder;
    builder.add_dependency("a", "b");
    builder.add_call("f", "g");
    builder.add_call("g", "f");

    const auto report = std::move(builder).build().check_problematic_patterns();

    ASSERT_TRUE(report.contains("density"));
    const auto& density = report.at("density");
    EXPECT_THAT(density, Contains("Dependency graph is very dense - consider modularization"));
    EXPECT_THAT(density, Contains(HasSubstr("functions are tightly coupled")));
}

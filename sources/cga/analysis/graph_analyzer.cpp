//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/analysis/graph_analyzer.hpp"
#include "cga/graph/coupling.hpp"
#include "cga/graph/cycle_detection.hpp"
#include "cga/graph/network_analysis.hpp"
#include "cga/utils/parallel.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace cga::analysis {

    namespace {

        using Clock = std::chrono::steady_clock;

        double elapsed_ms(const Clock::time_point start) {
            return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
        }

        graph::GraphStats graph_stats(const graph::DirectedGraph& g) {
            graph::GraphStats stats;
            stats.node_count = g.node_count();
            stats.edge_count = g.edge_count();
            stats.density = graph::graph_density(g);
            if (stats.node_count > 0) {
                stats.average_degree = 2.0 * static_cast<double>(stats.edge_count)
                                     / static_cast<double>(stats.node_count);
            }
            stats.is_cyclic = graph::has_cycle(g);
            return stats;
        }

    }  // namespace

    GraphAnalyzer::GraphAnalyzer(
        graph::CallGraph call_graph,
        graph::DependencyGraph dependency_graph,
        graph::InheritanceGraph inheritance_graph,
        AnalyzerOptions options
    )
        : call_graph_(std::move(call_graph))
        , dependency_graph_(std::move(dependency_graph))
        , inheritance_graph_(std::move(inheritance_graph))
        , options_(std::move(options)) {}

    std::vector<graph::CentralityMetrics> GraphAnalyzer::compute_centralities() const {
        const std::vector<const graph::DirectedGraph*> graphs = {
            &call_graph_, &dependency_graph_, &inheritance_graph_
        };

        auto centrality_of = [this](const graph::DirectedGraph* g) {
            return graph::calculate_centrality(*g, options_.pagerank);
        };

        if (options_.parallel) {
            return parallel::map(graphs, centrality_of);
        }

        std::vector<graph::CentralityMetrics> results;
        results.reserve(graphs.size());
        for (const auto* g : graphs) {
            results.push_back(centrality_of(g));
        }
        return results;
    }

    graph::GraphAnalysisResult GraphAnalyzer::analyze() const {
        graph::GraphAnalysisResult result;

        spdlog::debug("Analyzing graphs: calls={}/{} dependencies={}/{} inheritance={}/{} (nodes/edges)",
                      call_graph_.node_count(), call_graph_.edge_count(),
                      dependency_graph_.node_count(), dependency_graph_.edge_count(),
                      inheritance_graph_.node_count(), inheritance_graph_.edge_count());

        auto start = Clock::now();
        auto centralities = compute_centralities();
        result.call_graph_centrality = std::move(centralities[0]);
        result.dependency_graph_centrality = std::move(centralities[1]);
        result.inheritance_graph_centrality = std::move(centralities[2]);
        spdlog::debug("Centrality computed in {:.2f} ms (parallel={})", elapsed_ms(start), options_.parallel);

        start = Clock::now();
        auto& cycles = result.cycles;
        cycles.call_cycles = graph::find_all_cycles(call_graph_, options_.max_cycles);
        cycles.dependency_cycles = graph::find_all_cycles(dependency_graph_, options_.max_cycles);
        cycles.inheritance_cycles = graph::find_all_cycles(inheritance_graph_, options_.max_cycles);
        cycles.total_cycles = cycles.call_cycles.size()
                            + cycles.dependency_cycles.size()
                            + cycles.inheritance_cycles.size();
        spdlog::debug("Cycle enumeration found {} cycles in {:.2f} ms", cycles.total_cycles, elapsed_ms(start));

        auto& components = result.components;
        components.call_components = graph::strongly_connected_components(call_graph_);
        components.dependency_components = graph::strongly_connected_components(dependency_graph_);
        components.inheritance_components = graph::strongly_connected_components(inheritance_graph_);
        components.total_components = components.call_components.size()
                                    + components.dependency_components.size()
                                    + components.inheritance_components.size();

        result.coupling = graph::calculate_coupling_metrics(dependency_graph_);

        result.statistics.call_graph = graph_stats(call_graph_);
        result.statistics.dependency_graph = graph_stats(dependency_graph_);
        result.statistics.inheritance_graph = graph_stats(inheritance_graph_);

        spdlog::info("Graph analysis complete: {} cycles, {} components, max coupling {}",
                     cycles.total_cycles, components.total_components, result.coupling.summary.max_coupling);

        return result;
    }

    NetworkMetricsMap GraphAnalyzer::calculate_network_metrics() const {
        NetworkMetricsMap metrics;
        metrics[CALL_GRAPH_KEY] = graph::calculate_network_metrics(call_graph_);
        metrics[DEPENDENCY_GRAPH_KEY] = graph::calculate_network_metrics(dependency_graph_);
        metrics[INHERITANCE_GRAPH_KEY] = graph::calculate_network_metrics(inheritance_graph_);
        return metrics;
    }

    PatternReport GraphAnalyzer::check_problematic_patterns() const {
        PatternReport report;
        const auto& limits = options_.thresholds;

        std::vector<std::string> cycle_issues;

        // Counts are exact: max_cycles only bounds the listing in analyze()
        const auto dependency_cycles = graph::find_all_cycles(dependency_graph_).size();
        if (dependency_cycles > 0) {
            cycle_issues.push_back("Found " + std::to_string(dependency_cycles) +
                                   " dependency cycles which can cause circular imports");
        }

        const auto inheritance_cycles = graph::find_all_cycles(inheritance_graph_).size();
        if (inheritance_cycles > 0) {
            cycle_issues.push_back("Found " + std::to_string(inheritance_cycles) +
                                   " inheritance cycles which indicate design problems");
        }

        const auto call_cycles = graph::find_all_cycles(call_graph_).size();
        if (call_cycles > limits.max_call_cycles) {
            cycle_issues.push_back("Found " + std::to_string(call_cycles) +
                                   " call cycles - consider refactoring recursive patterns");
        }

        if (!cycle_issues.empty()) {
            report["cycles"] = std::move(cycle_issues);
        }

        std::vector<std::string> coupling_issues;
        const auto coupling = graph::calculate_coupling_metrics(dependency_graph_);

        if (coupling.summary.avg_instability > limits.max_average_instability) {
            coupling_issues.emplace_back("High average instability detected - modules are too dependent on others");
        }
        if (coupling.summary.max_coupling > limits.max_coupling) {
            coupling_issues.emplace_back("Modules with very high coupling detected - consider decomposition");
        }

        if (!coupling_issues.empty()) {
            report["coupling"] = std::move(coupling_issues);
        }

        std::vector<std::string> density_issues;

        if (graph::graph_density(dependency_graph_) > limits.max_dependency_density) {
            density_issues.emplace_back("Dependency graph is very dense - consider modularization");
        }
        if (graph::graph_density(call_graph_) > limits.max_call_density) {
            density_issues.emplace_back("Call graph is very dense - functions are tightly coupled");
        }

        if (!density_issues.empty()) {
            report["density"] = std::move(density_issues);
        }

        for (const auto& [category, messages] : report) {
            for (const auto& message : messages) {
                spdlog::debug("[{}] {}", category, message);
            }
        }

        return report;
    }

}  // namespace cga::analysis

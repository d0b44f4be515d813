//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_ANALYSIS_GRAPH_ANALYZER_HPP
#define CGA_ANALYSIS_GRAPH_ANALYZER_HPP

/**
 * @file graph_analyzer.hpp
 * @brief Runs every graph algorithm over the call, dependency and
 *        inheritance graphs of one codebase.
 *
 * The analyzer owns its three graphs. All analysis methods are const and
 * produce fresh result values, so calling them repeatedly yields identical
 * results.
 *
 * @code
 *     GraphBuilder builder;
 *     builder.add_call("main", "helper", 5);
 *     builder.add_dependency("app", "util", "import");
 *
 *     const auto analyzer = std::move(builder).build();
 *     const auto result = analyzer.analyze();
 *     for (const auto& [category, messages] : analyzer.check_problematic_patterns()) {
 *         ...
 *     }
 * @endcode
 */

#include "cga/graph/centrality.hpp"
#include "cga/graph/graph_model.hpp"
#include "cga/graph/metrics.hpp"
#include "cga/heuristics/thresholds.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cga::analysis {

    /// Key of the call graph in per-graph maps.
    inline constexpr auto CALL_GRAPH_KEY = "call_graph";

    /// Key of the dependency graph in per-graph maps.
    inline constexpr auto DEPENDENCY_GRAPH_KEY = "dependency_graph";

    /// Key of the inheritance graph in per-graph maps.
    inline constexpr auto INHERITANCE_GRAPH_KEY = "inheritance_graph";

    /**
     * Tuning knobs for a GraphAnalyzer.
     *
     * Defaults reproduce the reference behavior exactly.
     */
    struct AnalyzerOptions {
        graph::PageRankOptions pagerank;

        /// Cap on enumerated cycles per graph (0 = unlimited)
        std::size_t max_cycles = 0;

        /// Compute per-graph centrality on the global thread pool
        bool parallel = false;

        heuristics::PatternThresholds thresholds;
    };

    using NetworkMetricsMap = std::map<std::string, graph::NetworkMetrics>;
    using PatternReport = std::map<std::string, std::vector<std::string>>;

    class GraphAnalyzer {
    public:
        GraphAnalyzer(
            graph::CallGraph call_graph,
            graph::DependencyGraph dependency_graph,
            graph::InheritanceGraph inheritance_graph,
            AnalyzerOptions options = {}
        );

        [[nodiscard]] const graph::CallGraph& call_graph() const noexcept {
            return call_graph_;
        }

        [[nodiscard]] const graph::DependencyGraph& dependency_graph() const noexcept {
            return dependency_graph_;
        }

        [[nodiscard]] const graph::InheritanceGraph& inheritance_graph() const noexcept {
            return inheritance_graph_;
        }

        [[nodiscard]] const AnalyzerOptions& options() const noexcept {
            return options_;
        }

        void set_options(AnalyzerOptions options) {
            options_ = std::move(options);
        }

        /**
         * Computes centrality, cycles, strongly connected components,
         * dependency coupling and statistics for all three graphs.
         */
        [[nodiscard]] graph::GraphAnalysisResult analyze() const;

        /**
         * Network metrics keyed "call_graph", "dependency_graph" and
         * "inheritance_graph".
         */
        [[nodiscard]] NetworkMetricsMap calculate_network_metrics() const;

        /**
         * Diagnoses problematic structures.
         *
         * Returns messages grouped under "cycles", "coupling" and
         * "density". Categories without findings are absent, so an empty
         * map means a clean bill of health.
         */
        [[nodiscard]] PatternReport check_problematic_patterns() const;

    private:
        [[nodiscard]] std::vector<graph::CentralityMetrics> compute_centralities() const;

        graph::CallGraph call_graph_;
        graph::DependencyGraph dependency_graph_;
        graph::InheritanceGraph inheritance_graph_;
        AnalyzerOptions options_;
    };

}  // namespace cga::analysis

#endif //CGA_ANALYSIS_GRAPH_ANALYZER_HPP

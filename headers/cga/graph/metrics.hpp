//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_METRICS_HPP
#define CGA_GRAPH_METRICS_HPP

/**
 * @file metrics.hpp
 * @brief Result records produced by the graph analysis passes.
 *
 * All records are plain values keyed by node index. Translating indices to
 * names is left to the reporting layer, which has access to the graphs.
 */

#include "cga/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cga::graph {

    /**
     * Averages over every centrality mapping. Zero for empty mappings.
     */
    struct CentralityAverages {
        double degree = 0.0;
        double betweenness = 0.0;
        double closeness = 0.0;
        double eigenvector = 0.0;
        double pagerank = 0.0;
    };

    /**
     * Centrality scores for one graph.
     *
     * Every mapping is empty for graphs with fewer than two nodes.
     * Eigenvector centrality is approximated by the PageRank scores.
     */
    struct CentralityMetrics {
        ScoreMap degree_centrality;
        ScoreMap betweenness_centrality;
        ScoreMap closeness_centrality;
        ScoreMap eigenvector_centrality;
        ScoreMap pagerank;

        /// Node with the highest betweenness, lowest index on ties.
        [[nodiscard]] std::optional<RankedNode> most_central_betweenness() const;

        /// Node with the highest closeness, lowest index on ties.
        [[nodiscard]] std::optional<RankedNode> most_central_closeness() const;

        /// Node with the highest degree centrality, lowest index on ties.
        [[nodiscard]] std::optional<RankedNode> highest_degree() const;

        /**
         * Returns up to @p n nodes ordered by descending PageRank.
         */
        [[nodiscard]] std::vector<RankedNode> top_pagerank(std::size_t n) const;

        [[nodiscard]] CentralityAverages average_centralities() const;
    };

    /**
     * Simple cycles of the three graphs.
     *
     * Each cycle starts at its smallest node index and repeats it at the
     * end, so a three-node cycle has four entries.
     */
    struct CycleAnalysis {
        std::vector<NodePath> call_cycles;
        std::vector<NodePath> dependency_cycles;
        std::vector<NodePath> inheritance_cycles;
        std::size_t total_cycles = 0;
    };

    /**
     * Strongly connected components of the three graphs.
     *
     * Singleton components are included, so every node belongs to exactly
     * one component of its graph.
     */
    struct ComponentAnalysis {
        std::vector<std::vector<NodeIndex>> call_components;
        std::vector<std::vector<NodeIndex>> dependency_components;
        std::vector<std::vector<NodeIndex>> inheritance_components;
        std::size_t total_components = 0;
    };

    /**
     * Martin's package metrics for one dependency graph node.
     */
    struct NodeCoupling {
        std::size_t afferent = 0;
        std::size_t efferent = 0;
        double instability = 0.0;
        double abstractness = 0.0;
        double distance_from_main = 0.0;

        [[nodiscard]] std::size_t total() const noexcept {
            return afferent + efferent;
        }
    };

    /**
     * Aggregate statistics over all dependency graph nodes.
     */
    struct CouplingSummary {
        std::size_t total_nodes = 0;
        double avg_afferent = 0.0;
        double avg_efferent = 0.0;
        double avg_instability = 0.0;
        double avg_distance_from_main = 0.0;
        std::size_t max_coupling = 0;
    };

    /**
     * Coupling metrics for the dependency graph.
     */
    struct CouplingMetrics {
        std::map<NodeIndex, std::size_t> afferent_coupling;
        std::map<NodeIndex, std::size_t> efferent_coupling;
        ScoreMap instability;
        ScoreMap abstractness;
        ScoreMap distance_from_main;
        CouplingSummary summary;

        /**
         * Returns the coupling record of one node, or nullopt if unknown.
         */
        [[nodiscard]] std::optional<NodeCoupling> at(NodeIndex node) const;

        /**
         * Up to @p n nodes by descending Ca + Ce, lowest index on ties.
         */
        [[nodiscard]] std::vector<RankedNode> most_coupled_nodes(std::size_t n) const;

        /**
         * Up to @p n nodes by descending instability, lowest index on ties.
         */
        [[nodiscard]] std::vector<RankedNode> most_unstable_nodes(std::size_t n) const;
    };

    /**
     * Size and shape of one graph.
     */
    struct GraphStats {
        std::size_t node_count = 0;
        std::size_t edge_count = 0;
        double density = 0.0;
        double average_degree = 0.0;
        bool is_cyclic = false;
    };

    struct GraphStatistics {
        GraphStats call_graph;
        GraphStats dependency_graph;
        GraphStats inheritance_graph;
    };

    /**
     * Network level metrics of one graph.
     *
     * Components are weakly connected components.
     */
    struct NetworkMetrics {
        double density = 0.0;
        double clustering_coefficient = 0.0;
        double average_path_length = 0.0;
        std::size_t diameter = 0;
        std::size_t connected_components = 0;
        std::size_t largest_component_size = 0;

        [[nodiscard]] bool is_sparse() const noexcept {
            return density < 0.1;
        }

        [[nodiscard]] bool is_dense() const noexcept {
            return density > 0.5;
        }

        /**
         * Mean of density, clustering and inverse path length.
         */
        [[nodiscard]] double complexity_score() const noexcept {
            const double path_term = average_path_length > 0.0 ? 1.0 / average_path_length : 0.0;
            return (density + clustering_coefficient + path_term) / 3.0;
        }
    };

    /**
     * Everything GraphAnalyzer::analyze() computes.
     */
    struct GraphAnalysisResult {
        CentralityMetrics call_graph_centrality;
        CentralityMetrics dependency_graph_centrality;
        CentralityMetrics inheritance_graph_centrality;
        CycleAnalysis cycles;
        ComponentAnalysis components;
        CouplingMetrics coupling;
        GraphStatistics statistics;
    };

}  // namespace cga::graph

#endif //CGA_GRAPH_METRICS_HPP

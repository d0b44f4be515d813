//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_NETWORK_ANALYSIS_HPP
#define CGA_GRAPH_NETWORK_ANALYSIS_HPP

/**
 * @file network_analysis.hpp
 * @brief Whole-graph structural statistics.
 *
 * Clustering, density, path length and diameter follow hop distances along
 * edge direction. The component helpers provide both the strong (directed)
 * and weak (undirected) notion of connectivity.
 */

#include "cga/graph/directed_graph.hpp"
#include "cga/graph/metrics.hpp"
#include "cga/types.hpp"

#include <cstddef>
#include <vector>

namespace cga::graph {

    /**
     * Local clustering coefficient of a node.
     *
     * Neighbors are predecessors and successors, excluding the node itself.
     * The coefficient is the number of ordered neighbor pairs (u, w), u != w,
     * joined by an edge u -> w, divided by k(k - 1). Nodes with fewer than
     * two neighbors score 0.
     */
    double clustering_coefficient(const DirectedGraph& graph, NodeIndex node);

    /**
     * Mean local clustering coefficient. 0 for an empty graph.
     */
    double average_clustering_coefficient(const DirectedGraph& graph);

    /**
     * edges / (n (n - 1)) for n > 1, else 0.
     *
     * Parallel edges and self-loops are counted, so the value may exceed 1.
     */
    double graph_density(const DirectedGraph& graph);

    /**
     * Mean hop distance over ordered pairs (u, v), u != v, where v is
     * reachable from u. 0 when no such pair exists.
     */
    double average_path_length(const DirectedGraph& graph);

    /**
     * Longest finite shortest-path distance. 0 for graphs without paths.
     */
    std::size_t graph_diameter(const DirectedGraph& graph);

    /**
     * Strongly connected components (Tarjan), singletons included.
     *
     * Components are emitted in reverse topological order of the
     * condensation; nodes within a component are sorted ascending.
     */
    std::vector<std::vector<NodeIndex>> strongly_connected_components(const DirectedGraph& graph);

    /**
     * Weakly connected components, ordered by their smallest node.
     */
    std::vector<std::vector<NodeIndex>> weakly_connected_components(const DirectedGraph& graph);

    /**
     * Computes every NetworkMetrics field for one graph.
     */
    NetworkMetrics calculate_network_metrics(const DirectedGraph& graph);

}  // namespace cga::graph

#endif //CGA_GRAPH_NETWORK_ANALYSIS_HPP

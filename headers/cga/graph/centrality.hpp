//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_CENTRALITY_HPP
#define CGA_GRAPH_CENTRALITY_HPP

/**
 * @file centrality.hpp
 * @brief Node centrality algorithms.
 *
 * All functions are read-only over the graph and return an empty mapping
 * for graphs with fewer than two nodes. Edges are followed in their stored
 * direction, and parallel edges are counted once per edge.
 */

#include "cga/graph/directed_graph.hpp"
#include "cga/graph/metrics.hpp"
#include "cga/types.hpp"

#include <cstddef>

namespace cga::graph {

    /**
     * Power iteration parameters for PageRank.
     */
    struct PageRankOptions {
        double damping = 0.85;
        std::size_t max_iterations = 100;
        double tolerance = 1e-6;
    };

    /**
     * Hop distances from @p source to every node it can reach.
     *
     * The source itself is included at distance 0. Unknown sources yield an
     * empty map.
     */
    DistanceMap single_source_shortest_path_length(const DirectedGraph& graph, NodeIndex source);

    /**
     * (in-degree + out-degree) / (n - 1) for every node.
     */
    ScoreMap degree_centrality(const DirectedGraph& graph);

    /**
     * Brandes betweenness centrality.
     *
     * Accumulates shortest-path dependencies from every source node. Scores
     * are normalized by (n - 1)(n - 2) when n > 2 and left raw otherwise.
     */
    ScoreMap betweenness_centrality(const DirectedGraph& graph);

    /**
     * Closeness centrality over outgoing edges.
     *
     * A node that reaches r other nodes with total distance s scores r / s.
     * Nodes that reach nothing score 0.
     */
    ScoreMap closeness_centrality(const DirectedGraph& graph);

    /**
     * PageRank by power iteration starting from the uniform distribution.
     *
     * Nodes without outgoing edges do not redistribute their rank, so the
     * scores of a graph with sinks sum to less than one.
     *
     * @param graph The graph.
     * @param damping Probability of following an edge.
     * @param max_iterations Iteration cap.
     * @param tolerance Convergence threshold on the largest per-node change.
     */
    ScoreMap pagerank_centrality(
        const DirectedGraph& graph,
        double damping = 0.85,
        std::size_t max_iterations = 100,
        double tolerance = 1e-6
    );

    /**
     * Computes every centrality mapping for one graph.
     *
     * The eigenvector mapping is a copy of the PageRank mapping.
     */
    CentralityMetrics calculate_centrality(const DirectedGraph& graph, const PageRankOptions& options = {});

}  // namespace cga::graph

#endif //CGA_GRAPH_CENTRALITY_HPP

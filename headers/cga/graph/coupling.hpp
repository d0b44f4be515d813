//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_COUPLING_HPP
#define CGA_GRAPH_COUPLING_HPP

/**
 * @file coupling.hpp
 * @brief Package coupling metrics for dependency graphs.
 *
 * For every module:
 * - afferent coupling Ca = number of incoming dependency edges
 * - efferent coupling Ce = number of outgoing dependency edges
 * - instability I = Ce / (Ca + Ce), 0 for isolated modules
 * - abstractness A = 0.5, since abstract/concrete information is not
 *   available from a dependency graph
 * - distance from the main sequence D = |A + I - 1|
 */

#include "cga/graph/directed_graph.hpp"
#include "cga/graph/metrics.hpp"

namespace cga::graph {

    /// Abstractness assigned to every module.
    inline constexpr double PLACEHOLDER_ABSTRACTNESS = 0.5;

    /**
     * Computes per-module coupling metrics and their summary.
     */
    CouplingMetrics calculate_coupling_metrics(const DirectedGraph& graph);

}  // namespace cga::graph

#endif //CGA_GRAPH_COUPLING_HPP

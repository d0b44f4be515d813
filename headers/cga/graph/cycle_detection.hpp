//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_CYCLE_DETECTION_HPP
#define CGA_GRAPH_CYCLE_DETECTION_HPP

#include "cga/graph/directed_graph.hpp"
#include "cga/types.hpp"

#include <cstddef>
#include <vector>

namespace cga::graph {

    /**
     * Enumerates the simple cycles of a graph.
     *
     * Every cycle is reported exactly once, rotated so that it starts at its
     * smallest node index, and closed by repeating that index: the triangle
     * 2 -> 0 -> 1 -> 2 is reported as {0, 1, 2, 0}. Self-loops are not
     * reported. Parallel edges do not produce duplicate cycles.
     *
     * Enumeration is exponential in the worst case.
     *
     * @param graph The graph to inspect.
     * @param max_cycles Stop after this many cycles (0 = unlimited).
     * @return Cycles ordered by start index, then by discovery order.
     */
    std::vector<NodePath> find_all_cycles(const DirectedGraph& graph, std::size_t max_cycles = 0);

    /**
     * Returns true if the graph contains any directed cycle.
     *
     * Unlike find_all_cycles(), a self-loop counts as a cycle here.
     */
    bool has_cycle(const DirectedGraph& graph);

}  // namespace cga::graph

#endif //CGA_GRAPH_CYCLE_DETECTION_HPP

//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_TYPES_HPP
#define CGA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Vocabulary types shared by every graph algorithm.
 *
 * Nodes are addressed by dense indices assigned in insertion order. All
 * per-node results are ordered maps keyed by index so that iteration and
 * serialization are deterministic.
 */

#include <cstddef>
#include <map>
#include <vector>
#include <string>

namespace cga {

    /**
     * Opaque, dense node index. Stable for the lifetime of a graph.
     */
    using NodeIndex = std::size_t;

    /**
     * Per-node real valued score (centrality, coupling, ...).
     */
    using ScoreMap = std::map<NodeIndex, double>;

    /**
     * Per-node hop distances produced by breadth-first search.
     */
    using DistanceMap = std::map<NodeIndex, std::size_t>;

    /**
     * A node path. Cycles repeat their first node at the end.
     */
    using NodePath = std::vector<NodeIndex>;

    /**
     * Ranked (node, score) pair used by the top-N helpers.
     */
    struct RankedNode {
        NodeIndex node = 0;
        double score = 0.0;

        bool operator==(const RankedNode& other) const = default;
    };

}  // namespace cga

#endif //CGA_TYPES_HPP

//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_DIRECTED_GRAPH_HPP
#define CGA_GRAPH_DIRECTED_GRAPH_HPP

/**
 * @file directed_graph.hpp
 * @brief Payload-free directed multigraph topology.
 *
 * Every analysis algorithm is written once against this class. Node
 * payloads live in the GraphModel template layered on top of it.
 */

#include "cga/graph/edge.hpp"
#include "cga/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cga::graph {

    /**
     * @class DirectedGraph
     * Directed graph with dense integer node indices and parallel edges.
     *
     * Forward and reverse adjacency are both kept so that predecessor
     * queries are as cheap as successor queries. Adjacency lists keep one
     * entry per edge, so a pair joined by two edges appears twice.
     */
    class DirectedGraph {
    public:
        DirectedGraph() = default;
        virtual ~DirectedGraph() = default;

        DirectedGraph(const DirectedGraph&) = default;
        DirectedGraph& operator=(const DirectedGraph&) = default;
        DirectedGraph(DirectedGraph&&) noexcept = default;
        DirectedGraph& operator=(DirectedGraph&&) noexcept = default;

        /**
         * Appends a node without payload.
         *
         * @return The index of the new node.
         */
        NodeIndex add_node();

        /**
         * Adds a directed edge.
         *
         * Indices that do not exist yet are created: the node table grows
         * until it covers the larger of the two indices.
         *
         * @param source Source node index.
         * @param target Target node index.
         * @param weight Edge weight (default 1.0).
         * @param kind Relationship label.
         * @throws std::length_error if an index cannot be represented as a
         *         node count.
         */
        void add_edge(NodeIndex source, NodeIndex target, double weight = 1.0, std::string kind = {});

        [[nodiscard]] bool has_node(NodeIndex node) const noexcept;

        /**
         * Returns true when at least one edge a -> b exists.
         */
        [[nodiscard]] bool find_edge(NodeIndex source, NodeIndex target) const;

        [[nodiscard]] std::size_t node_count() const noexcept;
        [[nodiscard]] std::size_t edge_count() const noexcept;

        /**
         * Returns all node indices in ascending order.
         */
        [[nodiscard]] std::vector<NodeIndex> nodes() const;

        /**
         * Outgoing edges of a node, one entry per parallel edge.
         */
        [[nodiscard]] std::vector<Edge> edges_from(NodeIndex node) const;

        /**
         * Incoming edges of a node, one entry per parallel edge.
         */
        [[nodiscard]] std::vector<Edge> edges_into(NodeIndex node) const;

        /**
         * Targets of outgoing edges, with multiplicity.
         *
         * Unknown indices yield an empty list.
         */
        [[nodiscard]] const std::vector<NodeIndex>& successors(NodeIndex node) const;

        /**
         * Sources of incoming edges, with multiplicity.
         */
        [[nodiscard]] const std::vector<NodeIndex>& predecessors(NodeIndex node) const;

        [[nodiscard]] std::size_t out_degree(NodeIndex node) const;
        [[nodiscard]] std::size_t in_degree(NodeIndex node) const;

        /**
         * All edges in insertion order.
         */
        [[nodiscard]] const std::vector<Edge>& edges() const noexcept {
            return edges_;
        }

        /**
         * Removes all nodes and edges.
         */
        void clear();

    protected:
        /**
         * Invoked after the node table grew to @p node_count entries.
         */
        virtual void nodes_appended(std::size_t node_count) {
            (void)node_count;
        }

    private:
        void grow_to(std::size_t node_count);

        std::vector<Edge> edges_;
        std::vector<std::vector<std::size_t>> out_edge_ids_;
        std::vector<std::vector<std::size_t>> in_edge_ids_;
        std::vector<std::vector<NodeIndex>> successors_;
        std::vector<std::vector<NodeIndex>> predecessors_;
    };

}  // namespace cga::graph

#endif //CGA_GRAPH_DIRECTED_GRAPH_HPP

//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/graph/directed_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cga::graph {

    namespace {
        const std::vector<NodeIndex> EMPTY_ADJACENCY;
    }

    NodeIndex DirectedGraph::add_node() {
        const NodeIndex index = out_edge_ids_.size();
        grow_to(index + 1);
        return index;
    }

    void DirectedGraph::add_edge(
        const NodeIndex source,
        const NodeIndex target,
        const double weight,
        std::string kind
    ) {
        const NodeIndex highest = std::max(source, target);
        if (highest >= out_edge_ids_.max_size()) {
            throw std::length_error("DirectedGraph::add_edge: node index out of range");
        }
        grow_to(highest + 1);

        const std::size_t edge_id = edges_.size();
        edges_.push_back(Edge{source, target, weight, std::move(kind)});

        out_edge_ids_[source].push_back(edge_id);
        in_edge_ids_[target].push_back(edge_id);
        successors_[source].push_back(target);
        predecessors_[target].push_back(source);
    }

    bool DirectedGraph::has_node(const NodeIndex node) const noexcept {
        return node < out_edge_ids_.size();
    }

    bool DirectedGraph::find_edge(const NodeIndex source, const NodeIndex target) const {
        if (!has_node(source) || !has_node(target)) {
            return false;
        }

        const auto& targets = successors_[source];
        return std::ranges::find(targets, target) != targets.end();
    }

    std::size_t DirectedGraph::node_count() const noexcept {
        return out_edge_ids_.size();
    }

    std::size_t DirectedGraph::edge_count() const noexcept {
        return edges_.size();
    }

    std::vector<NodeIndex> DirectedGraph::nodes() const {
        std::vector<NodeIndex> result(node_count());
        for (NodeIndex i = 0; i < result.size(); ++i) {
            result[i] = i;
        }
        return result;
    }

    std::vector<Edge> DirectedGraph::edges_from(const NodeIndex node) const {
        if (!has_node(node)) {
            return {};
        }

        std::vector<Edge> result;
        result.reserve(out_edge_ids_[node].size());
        for (const auto id : out_edge_ids_[node]) {
            result.push_back(edges_[id]);
        }
        return result;
    }

    std::vector<Edge> DirectedGraph::edges_into(const NodeIndex node) const {
        if (!has_node(node)) {
            return {};
        }

        std::vector<Edge> result;
        result.reserve(in_edge_ids_[node].size());
        for (const auto id : in_edge_ids_[node]) {
            result.push_back(edges_[id]);
        }
        return result;
    }

    const std::vector<NodeIndex>& DirectedGraph::successors(const NodeIndex node) const {
        if (!has_node(node)) {
            return EMPTY_ADJACENCY;
        }
        return successors_[node];
    }

    const std::vector<NodeIndex>& DirectedGraph::predecessors(const NodeIndex node) const {
        if (!has_node(node)) {
            return EMPTY_ADJACENCY;
        }
        return predecessors_[node];
    }

    std::size_t DirectedGraph::out_degree(const NodeIndex node) const {
        return successors(node).size();
    }

    std::size_t DirectedGraph::in_degree(const NodeIndex node) const {
        return predecessors(node).size();
    }

    void DirectedGraph::clear() {
        edges_.clear();
        out_edge_ids_.clear();
        in_edge_ids_.clear();
        successors_.clear();
        predecessors_.clear();
        nodes_appended(0);
    }

    void DirectedGraph::grow_to(const std::size_t node_count) {
        if (node_count <= out_edge_ids_.size()) {
            return;
        }

        out_edge_ids_.resize(node_count);
        in_edge_ids_.resize(node_count);
        successors_.resize(node_count);
        predecessors_.resize(node_count);

        nodes_appended(node_count);
    }

}  // namespace cga::graph

//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_GRAPH_MODEL_HPP
#define CGA_GRAPH_GRAPH_MODEL_HPP

/**
 * @file graph_model.hpp
 * @brief Directed multigraph carrying a payload per node.
 *
 * GraphModel<NodeT> adds node payloads and a name index on top of the
 * DirectedGraph topology. The three analyzed graphs are instantiations of
 * this one template:
 *
 * - CallGraph: functions, edges weighted by call count
 * - DependencyGraph: modules, edges labelled by import kind
 * - InheritanceGraph: classes, edges child -> parent
 *
 * Every GraphModel is a DirectedGraph, so it can be handed directly to any
 * analysis algorithm.
 */

#include "cga/graph/directed_graph.hpp"
#include "cga/graph/nodes.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cga::graph {

    template<typename NodeT>
    class GraphModel : public DirectedGraph {
    public:
        using node_type = NodeT;

        GraphModel() = default;

        using DirectedGraph::add_node;

        /**
         * Adds a node carrying @p payload.
         *
         * The first node registered under a display name is the one
         * find_node() returns for that name.
         *
         * @return The index of the new node.
         */
        NodeIndex add_node(NodeT payload) {
            const NodeIndex index = DirectedGraph::add_node();
            if (const auto& name = payload.display_name(); !name.empty()) {
                index_by_name_.try_emplace(name, index);
            }
            payloads_[index] = std::move(payload);
            return index;
        }

        /**
         * Returns the payload of a node.
         *
         * @throws std::out_of_range if the index does not exist.
         */
        [[nodiscard]] const NodeT& node(const NodeIndex index) const {
            return payloads_.at(index);
        }

        /**
         * Mutable payload access. Changing the display name does not
         * re-index the node.
         */
        NodeT& node(const NodeIndex index) {
            return payloads_.at(index);
        }

        /**
         * Human readable name of a node.
         *
         * Nodes created implicitly by add_edge() have an empty payload and
         * are labelled "node_<index>".
         */
        [[nodiscard]] std::string label(const NodeIndex index) const {
            if (index < payloads_.size()) {
                if (const auto& name = payloads_[index].display_name(); !name.empty()) {
                    return name;
                }
            }
            return "node_" + std::to_string(index);
        }

        /**
         * Looks up a node by display name.
         */
        [[nodiscard]] std::optional<NodeIndex> find_node(const std::string_view name) const {
            if (const auto it = index_by_name_.find(std::string(name)); it != index_by_name_.end()) {
                return it->second;
            }
            return std::nullopt;
        }

    protected:
        void nodes_appended(const std::size_t node_count) override {
            payloads_.resize(node_count);
            if (node_count == 0) {
                index_by_name_.clear();
            }
        }

    private:
        std::vector<NodeT> payloads_;
        std::unordered_map<std::string, NodeIndex> index_by_name_;
    };

    using CallGraph = GraphModel<CallNode>;
    using DependencyGraph = GraphModel<ModuleNode>;
    using InheritanceGraph = GraphModel<ClassNode>;

}  // namespace cga::graph

#endif //CGA_GRAPH_GRAPH_MODEL_HPP

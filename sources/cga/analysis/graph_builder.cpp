//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/analysis/graph_builder.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace cga::analysis {

    namespace {

        template<typename Graph, typename Payload>
        NodeIndex get_or_add(Graph& graph, Payload payload) {
            if (const auto existing = graph.find_node(payload.display_name())) {
                return *existing;
            }
            return graph.add_node(std::move(payload));
        }

        enum class Visit {
            New,
            Active,
            Finished
        };

        struct Frame {
            NodeIndex node;
            std::size_t next_parent;
        };

    }  // namespace

    NodeIndex GraphBuilder::add_function(graph::CallNode node) {
        return get_or_add(call_graph_, std::move(node));
    }

    NodeIndex GraphBuilder::add_module(graph::ModuleNode node) {
        return get_or_add(dependency_graph_, std::move(node));
    }

    NodeIndex GraphBuilder::add_class(graph::ClassNode node) {
        return get_or_add(inheritance_graph_, std::move(node));
    }

    NodeIndex GraphBuilder::function_node(const std::string_view name) {
        return add_function(graph::CallNode(std::string(name)));
    }

    NodeIndex GraphBuilder::module_node(const std::string_view name) {
        return add_module(graph::ModuleNode(std::string(name)));
    }

    NodeIndex GraphBuilder::class_node(const std::string_view name) {
        return add_class(graph::ClassNode(std::string(name)));
    }

    void GraphBuilder::add_call(const std::string_view caller, const std::string_view callee, const std::size_t call_count) {
        const NodeIndex from = function_node(caller);
        const NodeIndex to = function_node(callee);
        call_graph_.add_edge(from, to, static_cast<double>(call_count), graph::CALL_EDGE_KIND);
    }

    void GraphBuilder::add_dependency(
        const std::string_view importer,
        const std::string_view imported,
        const std::string_view relation_kind
    ) {
        const NodeIndex from = module_node(importer);
        const NodeIndex to = module_node(imported);
        dependency_graph_.add_edge(from, to, 1.0, std::string(relation_kind));
    }

    void GraphBuilder::add_inheritance(const std::string_view child, const std::string_view parent) {
        const NodeIndex from = class_node(child);
        const NodeIndex to = class_node(parent);
        inheritance_graph_.add_edge(from, to, 1.0, graph::INHERITANCE_EDGE_KIND);
    }

    void GraphBuilder::set_call_location(const std::string_view function, std::string file_path, const std::size_t line_number) {
        auto& node = call_graph_.node(function_node(function));
        node.file_path = std::move(file_path);
        node.line_number = line_number;
    }

    void GraphBuilder::set_module_path(const std::string_view module, std::string file_path) {
        dependency_graph_.node(module_node(module)).file_path = std::move(file_path);
    }

    void GraphBuilder::set_module_external(const std::string_view module, const bool is_external) {
        dependency_graph_.node(module_node(module)).is_external = is_external;
    }

    void GraphBuilder::set_class_location(const std::string_view class_name, std::string file_path, const std::size_t line_number) {
        auto& node = inheritance_graph_.node(class_node(class_name));
        node.file_path = std::move(file_path);
        node.line_number = line_number;
    }

    GraphAnalyzer GraphBuilder::build() && {
        assign_hierarchy_depths(inheritance_graph_);
        return GraphAnalyzer(
            std::move(call_graph_),
            std::move(dependency_graph_),
            std::move(inheritance_graph_),
            std::move(options_)
        );
    }

    GraphAnalyzer GraphBuilder::build() const& {
        GraphBuilder copy = *this;
        return std::move(copy).build();
    }

    void assign_hierarchy_depths(graph::InheritanceGraph& graph) {
        const std::size_t n = graph.node_count();
        std::vector<std::size_t> depth(n, 0);
        std::vector<Visit> state(n, Visit::New);
        std::vector<Frame> stack;

        for (NodeIndex root = 0; root < n; ++root) {
            if (state[root] != Visit::New) {
                continue;
            }

            state[root] = Visit::Active;
            stack.push_back(Frame{root, 0});

            while (!stack.empty()) {
                Frame& frame = stack.back();
                const auto& parents = graph.successors(frame.node);

                if (frame.next_parent < parents.size()) {
                    const NodeIndex parent = parents[frame.next_parent++];
                    if (state[parent] == Visit::New) {
                        state[parent] = Visit::Active;
                        stack.push_back(Frame{parent, 0});
                    }
                    continue;
                }

                const NodeIndex node = frame.node;
                for (const NodeIndex parent : parents) {
                    if (state[parent] == Visit::Finished) {
                        depth[node] = std::max(depth[node], depth[parent] + 1);
                    }
                }
                state[node] = Visit::Finished;
                stack.pop_back();
            }
        }

        for (NodeIndex node = 0; node < n; ++node) {
            graph.node(node).hierarchy_depth = depth[node];
        }
    }

}  // namespace cga::analysis

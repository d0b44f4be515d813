//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_ANALYSIS_GRAPH_BUILDER_HPP
#define CGA_ANALYSIS_GRAPH_BUILDER_HPP

#include "cga/analysis/graph_analyzer.hpp"
#include "cga/graph/graph_model.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace cga::analysis {

    /**
     * @class GraphBuilder
     * Assembles the three relationship graphs from named facts.
     *
     * Names are mapped to nodes on first use. Every add_call(),
     * add_dependency() and add_inheritance() appends exactly one edge, so
     * reporting the same relation twice yields two parallel edges.
     */
    class GraphBuilder {
    public:
        GraphBuilder() = default;

        /**
         * Registers a function, or returns the node already named so.
         */
        NodeIndex add_function(graph::CallNode node);

        /**
         * Registers a module, or returns the node already named so.
         */
        NodeIndex add_module(graph::ModuleNode node);

        /**
         * Registers a class, or returns the node already named so.
         */
        NodeIndex add_class(graph::ClassNode node);

        /**
         * Records that @p caller calls @p callee @p call_count times.
         *
         * The edge weight is the call count.
         */
        void add_call(std::string_view caller, std::string_view callee, std::size_t call_count = 1);

        /**
         * Records that @p importer depends on @p imported.
         *
         * @param relation_kind Import flavor, e.g. "import" or "from_import".
         */
        void add_dependency(
            std::string_view importer,
            std::string_view imported,
            std::string_view relation_kind = graph::IMPORT_EDGE_KIND
        );

        /**
         * Records that class @p child extends class @p parent.
         */
        void add_inheritance(std::string_view child, std::string_view parent);

        void set_call_location(std::string_view function, std::string file_path, std::size_t line_number);
        void set_module_path(std::string_view module, std::string file_path);
        void set_module_external(std::string_view module, bool is_external);
        void set_class_location(std::string_view class_name, std::string file_path, std::size_t line_number);

        void set_options(AnalyzerOptions options) {
            options_ = std::move(options);
        }

        [[nodiscard]] const graph::CallGraph& call_graph() const noexcept {
            return call_graph_;
        }

        [[nodiscard]] const graph::DependencyGraph& dependency_graph() const noexcept {
            return dependency_graph_;
        }

        [[nodiscard]] const graph::InheritanceGraph& inheritance_graph() const noexcept {
            return inheritance_graph_;
        }

        /**
         * Hands the graphs over to a new analyzer.
         *
         * Class hierarchy depths are filled in first: a class without
         * parents has depth 0, a subclass is one deeper than its deepest
         * parent.
         */
        [[nodiscard]] GraphAnalyzer build() &&;

        /**
         * Builds an analyzer over copies of the graphs.
         */
        [[nodiscard]] GraphAnalyzer build() const&;

    private:
        NodeIndex function_node(std::string_view name);
        NodeIndex module_node(std::string_view name);
        NodeIndex class_node(std::string_view name);

        graph::CallGraph call_graph_;
        graph::DependencyGraph dependency_graph_;
        graph::InheritanceGraph inheritance_graph_;
        AnalyzerOptions options_;
    };

    /**
     * Computes the depth of every class in an inheritance graph.
     *
     * Edges point from child to parent. Parents reached through a cycle are
     * ignored, so depths stay finite on malformed hierarchies.
     */
    void assign_hierarchy_depths(graph::InheritanceGraph& graph);

}  // namespace cga::analysis

#endif //CGA_ANALYSIS_GRAPH_BUILDER_HPP

//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_EDGE_HPP
#define CGA_GRAPH_EDGE_HPP

#include "cga/types.hpp"

#include <string>

namespace cga::graph {

    /// Edge kind used by the call graph.
    inline constexpr auto CALL_EDGE_KIND = "call";

    /// Default dependency relation kind.
    inline constexpr auto IMPORT_EDGE_KIND = "import";

    /// Edge kind used by the inheritance graph.
    inline constexpr auto INHERITANCE_EDGE_KIND = "extends";

    /**
     * A directed, weighted and labelled edge.
     *
     * Weight is the call count in the call graph and 1.0 for every import
     * and inheritance relation.
     */
    struct Edge {
        NodeIndex source = 0;
        NodeIndex target = 0;
        double weight = 1.0;
        std::string kind;

        [[nodiscard]] bool is_significant(const double threshold) const noexcept {
            return weight >= threshold;
        }

        [[nodiscard]] bool is_self_loop() const noexcept {
            return source == target;
        }

        bool operator==(const Edge& other) const = default;
    };

}  // namespace cga::graph

#endif //CGA_GRAPH_EDGE_HPP

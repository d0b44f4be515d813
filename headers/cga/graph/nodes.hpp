//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_GRAPH_NODES_HPP
#define CGA_GRAPH_NODES_HPP

/**
 * @file nodes.hpp
 * @brief Node payloads for the call, dependency and inheritance graphs.
 *
 * Payloads are plain values. A graph grows its node table with
 * default-constructed payloads when an edge references an index that was
 * never added, so every payload type must be default constructible and must
 * report a usable display name even when empty.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace cga::graph {

    /**
     * A function in the call graph.
     */
    struct CallNode {
        std::string function_name;
        std::string file_path;
        std::size_t line_number = 0;

        CallNode() = default;

        explicit CallNode(std::string name, std::string file = {}, std::size_t line = 0)
            : function_name(std::move(name))
            , file_path(std::move(file))
            , line_number(line) {}

        /**
         * Returns "file_path::function_name".
         */
        [[nodiscard]] std::string qualified_name() const {
            return file_path + "::" + function_name;
        }

        [[nodiscard]] const std::string& display_name() const noexcept {
            return function_name;
        }

        [[nodiscard]] std::optional<std::size_t> line() const noexcept {
            if (line_number == 0) {
                return std::nullopt;
            }
            return line_number;
        }
    };

    /**
     * A module in the dependency graph.
     */
    struct ModuleNode {
        std::string module_name;
        std::string file_path;
        bool is_external = false;

        ModuleNode() = default;

        explicit ModuleNode(std::string name, std::string file = {}, const bool external = false)
            : module_name(std::move(name))
            , file_path(std::move(file))
            , is_external(external) {}

        [[nodiscard]] bool is_internal() const noexcept {
            return !is_external;
        }

        [[nodiscard]] const char* module_type() const noexcept {
            return is_external ? "external" : "internal";
        }

        [[nodiscard]] const std::string& display_name() const noexcept {
            return module_name;
        }

        [[nodiscard]] std::optional<std::size_t> line() const noexcept {
            return std::nullopt;
        }
    };

    /**
     * A class in the inheritance graph.
     */
    struct ClassNode {
        std::string class_name;
        std::string file_path;
        std::size_t line_number = 0;
        std::size_t hierarchy_depth = 0;

        ClassNode() = default;

        explicit ClassNode(std::string name, std::string file = {}, std::size_t line = 0)
            : class_name(std::move(name))
            , file_path(std::move(file))
            , line_number(line) {}

        [[nodiscard]] std::string qualified_name() const {
            return file_path + "::" + class_name;
        }

        [[nodiscard]] const std::string& display_name() const noexcept {
            return class_name;
        }

        [[nodiscard]] std::optional<std::size_t> line() const noexcept {
            if (line_number == 0) {
                return std::nullopt;
            }
            return line_number;
        }
    };

}  // namespace cga::graph

#endif //CGA_GRAPH_NODES_HPP

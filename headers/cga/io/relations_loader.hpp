//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_RELATIONS_LOADER_HPP
#define CGA_RELATIONS_LOADER_HPP

/**
 * @file relations_loader.hpp
 * @brief Reads extracted code relationships into a GraphBuilder.
 *
 * A relations document is produced by the per-language extractors:
 *
 * @code
 *     {
 *       "calls":        [ { "caller": "main", "callee": "helper", "count": 5 } ],
 *       "dependencies": [ { "importer": "app", "imported": "util", "kind": "import" } ],
 *       "inheritance":  [ { "child": "Child", "parent": "Parent" } ],
 *       "functions":    [ { "name": "main", "file": "app.py", "line": 3 } ],
 *       "modules":      [ { "name": "os", "file": "", "external": true } ],
 *       "classes":      [ { "name": "Child", "file": "models.py", "line": 10 } ]
 *     }
 * @endcode
 *
 * Every section is optional. "count" defaults to 1 and "kind" to "import".
 * The three metadata sections fill in node payloads; a metadata entry for a
 * name no relation mentions adds an isolated node.
 */

#include "cga/analysis/graph_builder.hpp"
#include "cga/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>

namespace cga::io {

    /**
     * Builds graphs from an already parsed relations document.
     *
     * @return The populated builder, or a ParseError describing the first
     *         malformed entry.
     */
    [[nodiscard]] Result<analysis::GraphBuilder> relations_from_json(const nlohmann::json& document);

    /**
     * Parses relations from JSON text.
     *
     * @return ParseError for malformed JSON or a malformed document.
     */
    [[nodiscard]] Result<analysis::GraphBuilder> parse_relations(std::string_view content);

    /**
     * Reads relations from a JSON file.
     */
    [[nodiscard]] Result<analysis::GraphBuilder> load_relations(const std::filesystem::path& path);

}  // namespace cga::io

#endif //CGA_RELATIONS_LOADER_HPP

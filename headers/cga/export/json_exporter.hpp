//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_JSON_EXPORTER_HPP
#define CGA_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief JSON serialization of analysis results.
 *
 * Node indices are replaced by node labels so that reports are readable
 * without the graphs they were computed from. Output layout:
 *
 * @code
 *     {
 *       "statistics": { "call_graph": { "node_count": 3, ... }, ... },
 *       "centrality": { "call_graph": { "degree": { "main": 0.5 }, ... }, ... },
 *       "cycles": { "call_graph": [["a", "b", "a"]], ..., "total_cycles": 1 },
 *       "components": { "call_graph": [["a", "b"]], ..., "total_components": 1 },
 *       "coupling": { "nodes": { "app": { "afferent": 0, ... } }, "summary": { ... } }
 *     }
 * @endcode
 */

#include "cga/analysis/graph_analyzer.hpp"
#include "cga/graph/metrics.hpp"

#include <nlohmann/json.hpp>

namespace cga::exporters {

    using json = nlohmann::json;

    /**
     * Serializes a full analysis result, labelling nodes from @p analyzer.
     */
    [[nodiscard]] json to_json(const graph::GraphAnalysisResult& result, const analysis::GraphAnalyzer& analyzer);

    /**
     * Serializes per-graph network metrics, including the derived
     * is_sparse, is_dense and complexity_score values.
     */
    [[nodiscard]] json to_json(const analysis::NetworkMetricsMap& metrics);

    /**
     * Serializes pattern diagnostics as { "issues": {...}, "issue_count": n }.
     */
    [[nodiscard]] json to_json(const analysis::PatternReport& report);

    [[nodiscard]] json to_json(const graph::NetworkMetrics& metrics);
    [[nodiscard]] json to_json(const graph::GraphStats& stats);

}  // namespace cga::exporters

#endif //CGA_JSON_EXPORTER_HPP

//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/export/json_exporter.hpp"
#include "cga/version.hpp"

#include <ranges>
#include <string>
#include <utility>
#include <vector>

namespace cga::exporters {

    namespace {

        template<typename Graph>
        json scores_to_json(const ScoreMap& scores, const Graph& graph) {
            json out = json::object();
            for (const auto& [node, score] : scores) {
                out[graph.label(node)] = score;
            }
            return out;
        }

        template<typename Graph>
        json centrality_to_json(const graph::CentralityMetrics& metrics, const Graph& graph) {
            json out;
            out["degree"] = scores_to_json(metrics.degree_centrality, graph);
            out["betweenness"] = scores_to_json(metrics.betweenness_centrality, graph);
            out["closeness"] = scores_to_json(metrics.closeness_centrality, graph);
            out["eigenvector"] = scores_to_json(metrics.eigenvector_centrality, graph);
            out["pagerank"] = scores_to_json(metrics.pagerank, graph);
            return out;
        }

        template<typename Graph>
        json paths_to_json(const std::vector<std::vector<NodeIndex>>& paths, const Graph& graph) {
            json out = json::array();
            for (const auto& path : paths) {
                json labels = json::array();
                for (const NodeIndex node : path) {
                    labels.push_back(graph.label(node));
                }
                out.push_back(std::move(labels));
            }
            return out;
        }

        json coupling_to_json(const graph::CouplingMetrics& coupling, const graph::DependencyGraph& graph) {
            json nodes = json::object();
            for (const auto& node : coupling.afferent_coupling | std::views::keys) {
                const auto record = coupling.at(node);
                if (!record) {
                    continue;
                }
                nodes[graph.label(node)] = {
                    {"afferent", record->afferent},
                    {"efferent", record->efferent},
                    {"instability", record->instability},
                    {"abstractness", record->abstractness},
                    {"distance_from_main", record->distance_from_main}
                };
            }

            const auto& summary = coupling.summary;
            return {
                {"nodes", std::move(nodes)},
                {"summary", {
                    {"total_nodes", summary.total_nodes},
                    {"avg_afferent", summary.avg_afferent},
                    {"avg_efferent", summary.avg_efferent},
                    {"avg_instability", summary.avg_instability},
                    {"avg_distance_from_main", summary.avg_distance_from_main},
                    {"max_coupling", summary.max_coupling}
                }}
            };
        }

    }  // namespace

    json to_json(const graph::GraphStats& stats) {
        return {
            {"node_count", stats.node_count},
            {"edge_count", stats.edge_count},
            {"density", stats.density},
            {"average_degree", stats.average_degree},
            {"is_cyclic", stats.is_cyclic}
        };
    }

    json to_json(const graph::NetworkMetrics& metrics) {
        return {
            {"density", metrics.density},
            {"clustering_coefficient", metrics.clustering_coefficient},
            {"average_path_length", metrics.average_path_length},
            {"diameter", metrics.diameter},
            {"connected_components", metrics.connected_components},
            {"largest_component_size", metrics.largest_component_size},
            {"is_sparse", metrics.is_sparse()},
            {"is_dense", metrics.is_dense()},
            {"complexity_score", metrics.complexity_score()}
        };
    }

    json to_json(const graph::GraphAnalysisResult& result, const analysis::GraphAnalyzer& analyzer) {
        using analysis::CALL_GRAPH_KEY;
        using analysis::DEPENDENCY_GRAPH_KEY;
        using analysis::INHERITANCE_GRAPH_KEY;

        const auto& calls = analyzer.call_graph();
        const auto& dependencies = analyzer.dependency_graph();
        const auto& inheritance = analyzer.inheritance_graph();

        json output;
        output["version"] = VERSION_STRING;

        output["statistics"] = {
            {CALL_GRAPH_KEY, to_json(result.statistics.call_graph)},
            {DEPENDENCY_GRAPH_KEY, to_json(result.statistics.dependency_graph)},
            {INHERITANCE_GRAPH_KEY, to_json(result.statistics.inheritance_graph)}
        };

        output["centrality"] = {
            {CALL_GRAPH_KEY, centrality_to_json(result.call_graph_centrality, calls)},
            {DEPENDENCY_GRAPH_KEY, centrality_to_json(result.dependency_graph_centrality, dependencies)},
            {INHERITANCE_GRAPH_KEY, centrality_to_json(result.inheritance_graph_centrality, inheritance)}
        };

        output["cycles"] = {
            {CALL_GRAPH_KEY, paths_to_json(result.cycles.call_cycles, calls)},
            {DEPENDENCY_GRAPH_KEY, paths_to_json(result.cycles.dependency_cycles, dependencies)},
            {INHERITANCE_GRAPH_KEY, paths_to_json(result.cycles.inheritance_cycles, inheritance)},
            {"total_cycles", result.cycles.total_cycles}
        };

        output["components"] = {
            {CALL_GRAPH_KEY, paths_to_json(result.components.call_components, calls)},
            {DEPENDENCY_GRAPH_KEY, paths_to_json(result.components.dependency_components, dependencies)},
            {INHERITANCE_GRAPH_KEY, paths_to_json(result.components.inheritance_components, inheritance)},
            {"total_components", result.components.total_components}
        };

        output["coupling"] = coupling_to_json(result.coupling, dependencies);

        return output;
    }

    json to_json(const analysis::NetworkMetricsMap& metrics) {
        json output = json::object();
        for (const auto& [key, value] : metrics) {
            output[key] = to_json(value);
        }
        return output;
    }

    json to_json(const analysis::PatternReport& report) {
        json issues = json::object();
        std::size_t count = 0;
        for (const auto& [category, messages] : report) {
            issues[category] = messages;
            count += messages.size();
        }
        return {
            {"issues", std::move(issues)},
            {"issue_count", count}
        };
    }

}  // namespace cga::exporters

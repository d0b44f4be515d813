//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/graph/centrality.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <vector>

namespace cga::graph {

    DistanceMap single_source_shortest_path_length(const DirectedGraph& graph, const NodeIndex source) {
        DistanceMap distances;
        if (!graph.has_node(source)) {
            return distances;
        }

        std::queue<NodeIndex> queue;
        distances[source] = 0;
        queue.push(source);

        while (!queue.empty()) {
            const NodeIndex current = queue.front();
            queue.pop();
            const std::size_t next_distance = distances[current] + 1;

            for (const NodeIndex next : graph.successors(current)) {
                if (!distances.contains(next)) {
                    distances[next] = next_distance;
                    queue.push(next);
                }
            }
        }

        return distances;
    }

    ScoreMap degree_centrality(const DirectedGraph& graph) {
        ScoreMap result;
        const std::size_t n = graph.node_count();
        if (n <= 1) {
            return result;
        }

        const auto denominator = static_cast<double>(n - 1);
        for (NodeIndex node = 0; node < n; ++node) {
            const auto degree = static_cast<double>(graph.in_degree(node) + graph.out_degree(node));
            result[node] = degree / denominator;
        }

        return result;
    }

    ScoreMap betweenness_centrality(const DirectedGraph& graph) {
        ScoreMap result;
        const std::size_t n = graph.node_count();
        if (n <= 1) {
            return result;
        }

        std::vector<double> centrality(n, 0.0);

        std::vector<std::vector<NodeIndex>> predecessors(n);
        std::vector<double> sigma(n);
        std::vector<long long> distance(n);
        std::vector<double> delta(n);
        std::vector<NodeIndex> order;
        order.reserve(n);

        for (NodeIndex source = 0; source < n; ++source) {
            for (auto& preds : predecessors) {
                preds.clear();
            }
            std::ranges::fill(sigma, 0.0);
            std::ranges::fill(distance, -1);
            std::ranges::fill(delta, 0.0);
            order.clear();

            sigma[source] = 1.0;
            distance[source] = 0;

            std::queue<NodeIndex> queue;
            queue.push(source);

            while (!queue.empty()) {
                const NodeIndex v = queue.front();
                queue.pop();
                order.push_back(v);

                for (const NodeIndex w : graph.successors(v)) {
                    if (distance[w] < 0) {
                        distance[w] = distance[v] + 1;
                        queue.push(w);
                    }
                    if (distance[w] == distance[v] + 1) {
                        sigma[w] += sigma[v];
                        predecessors[w].push_back(v);
                    }
                }
            }

            // Nodes are popped in order of non-increasing distance from the source.
            for (auto it = order.rbegin(); it != order.rend(); ++it) {
                const NodeIndex w = *it;
                for (const NodeIndex v : predecessors[w]) {
                    delta[v] += sigma[v] / sigma[w] * (1.0 + delta[w]);
                }
                if (w != source) {
                    centrality[w] += delta[w];
                }
            }
        }

        double scale = 1.0;
        if (n > 2) {
            scale = 1.0 / (static_cast<double>(n - 1) * static_cast<double>(n - 2));
        }

        for (NodeIndex node = 0; node < n; ++node) {
            result[node] = centrality[node] * scale;
        }

        return result;
    }

    ScoreMap closeness_centrality(const DirectedGraph& graph) {
        ScoreMap result;
        const std::size_t n = graph.node_count();
        if (n <= 1) {
            return result;
        }

        for (NodeIndex node = 0; node < n; ++node) {
            const auto distances = single_source_shortest_path_length(graph, node);

            std::size_t total = 0;
            for (const auto& [target, hops] : distances) {
                total += hops;
            }

            const std::size_t reachable = distances.size();
            if (reachable > 1 && total > 0) {
                result[node] = static_cast<double>(reachable - 1) / static_cast<double>(total);
            } else {
                result[node] = 0.0;
            }
        }

        return result;
    }

    ScoreMap pagerank_centrality(
        const DirectedGraph& graph,
        const double damping,
        const std::size_t max_iterations,
        const double tolerance
    ) {
        ScoreMap result;
        const std::size_t n = graph.node_count();
        if (n <= 1) {
            return result;
        }

        const double node_count = static_cast<double>(n);
        const double teleport = (1.0 - damping) / node_count;

        std::vector<double> rank(n, 1.0 / node_count);
        std::vector<double> next(n, 0.0);

        for (std::size_t iteration = 0; iteration < max_iterations; ++iteration) {
            for (NodeIndex v = 0; v < n; ++v) {
                double incoming = 0.0;
                for (const NodeIndex u : graph.predecessors(v)) {
                    incoming += rank[u] / static_cast<double>(graph.out_degree(u));
                }
                next[v] = teleport + damping * incoming;
            }

            double max_change = 0.0;
            for (NodeIndex v = 0; v < n; ++v) {
                max_change = std::max(max_change, std::abs(next[v] - rank[v]));
            }

            rank.swap(next);
            if (max_change < tolerance) {
                break;
            }
        }

        for (NodeIndex node = 0; node < n; ++node) {
            result[node] = rank[node];
        }

        return result;
    }

    CentralityMetrics calculate_centrality(const DirectedGraph& graph, const PageRankOptions& options) {
        CentralityMetrics metrics;
        metrics.degree_centrality = degree_centrality(graph);
        metrics.betweenness_centrality = betweenness_centrality(graph);
        metrics.closeness_centrality = closeness_centrality(graph);
        metrics.pagerank = pagerank_centrality(
            graph, options.damping, options.max_iterations, options.tolerance
        );
        metrics.eigenvector_centrality = metrics.pagerank;
        return metrics;
    }

}  // namespace cga::graph

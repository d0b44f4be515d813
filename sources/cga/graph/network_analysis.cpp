//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/graph/network_analysis.hpp"
#include "cga/graph/centrality.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <ranges>
#include <set>
#include <utility>

namespace cga::graph {

    namespace {

        constexpr std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();

        std::set<NodeIndex> undirected_neighbors(const DirectedGraph& graph, const NodeIndex node) {
            std::set<NodeIndex> neighbors;
            for (const NodeIndex succ : graph.successors(node)) {
                neighbors.insert(succ);
            }
            for (const NodeIndex pred : graph.predecessors(node)) {
                neighbors.insert(pred);
            }
            neighbors.erase(node);
            return neighbors;
        }

        struct TarjanFrame {
            NodeIndex node;
            std::size_t next_child;
        };

    }  // namespace

    double clustering_coefficient(const DirectedGraph& graph, const NodeIndex node) {
        if (!graph.has_node(node)) {
            return 0.0;
        }

        const auto neighbors = undirected_neighbors(graph, node);
        const std::size_t k = neighbors.size();
        if (k < 2) {
            return 0.0;
        }

        std::size_t links = 0;
        for (const NodeIndex u : neighbors) {
            for (const NodeIndex w : neighbors) {
                if (u != w && graph.find_edge(u, w)) {
                    ++links;
                }
            }
        }

        return static_cast<double>(links) / static_cast<double>(k * (k - 1));
    }

    double average_clustering_coefficient(const DirectedGraph& graph) {
        const std::size_t n = graph.node_count();
        if (n == 0) {
            return 0.0;
        }

        double total = 0.0;
        for (NodeIndex node = 0; node < n; ++node) {
            total += clustering_coefficient(graph, node);
        }
        return total / static_cast<double>(n);
    }

    double graph_density(const DirectedGraph& graph) {
        const std::size_t n = graph.node_count();
        if (n <= 1) {
            return 0.0;
        }

        const double possible = static_cast<double>(n) * static_cast<double>(n - 1);
        return static_cast<double>(graph.edge_count()) / possible;
    }

    double average_path_length(const DirectedGraph& graph) {
        const std::size_t n = graph.node_count();
        if (n < 2) {
            return 0.0;
        }

        std::size_t total = 0;
        std::size_t pairs = 0;
        for (NodeIndex source = 0; source < n; ++source) {
            for (const auto& [target, hops] : single_source_shortest_path_length(graph, source)) {
                if (target != source) {
                    total += hops;
                    ++pairs;
                }
            }
        }

        if (pairs == 0) {
            return 0.0;
        }
        return static_cast<double>(total) / static_cast<double>(pairs);
    }

    std::size_t graph_diameter(const DirectedGraph& graph) {
        std::size_t diameter = 0;
        for (NodeIndex source = 0; source < graph.node_count(); ++source) {
            for (const auto& hops : single_source_shortest_path_length(graph, source) | std::views::values) {
                diameter = std::max(diameter, hops);
            }
        }
        return diameter;
    }

    std::vector<std::vector<NodeIndex>> strongly_connected_components(const DirectedGraph& graph) {
        const std::size_t n = graph.node_count();
        std::vector<std::vector<NodeIndex>> components;

        std::vector<std::size_t> index(n, UNVISITED);
        std::vector<std::size_t> lowlink(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<NodeIndex> scc_stack;
        std::vector<TarjanFrame> call_stack;
        std::size_t counter = 0;

        auto visit = [&](const NodeIndex node) {
            index[node] = counter;
            lowlink[node] = counter;
            ++counter;
            scc_stack.push_back(node);
            on_stack[node] = true;
            call_stack.push_back(TarjanFrame{node, 0});
        };

        for (NodeIndex root = 0; root < n; ++root) {
            if (index[root] != UNVISITED) {
                continue;
            }

            visit(root);

            while (!call_stack.empty()) {
                TarjanFrame& frame = call_stack.back();
                const NodeIndex v = frame.node;
                const auto& children = graph.successors(v);

                if (frame.next_child < children.size()) {
                    const NodeIndex w = children[frame.next_child++];
                    if (index[w] == UNVISITED) {
                        visit(w);
                    } else if (on_stack[w]) {
                        lowlink[v] = std::min(lowlink[v], index[w]);
                    }
                    continue;
                }

                call_stack.pop_back();

                if (lowlink[v] == index[v]) {
                    std::vector<NodeIndex> component;
                    NodeIndex w;
                    do {
                        w = scc_stack.back();
                        scc_stack.pop_back();
                        on_stack[w] = false;
                        component.push_back(w);
                    } while (w != v);

                    std::ranges::sort(component);
                    components.push_back(std::move(component));
                }

                if (!call_stack.empty()) {
                    const NodeIndex parent = call_stack.back().node;
                    lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
                }
            }
        }

        return components;
    }

    std::vector<std::vector<NodeIndex>> weakly_connected_components(const DirectedGraph& graph) {
        const std::size_t n = graph.node_count();
        std::vector<std::vector<NodeIndex>> components;
        std::vector<bool> seen(n, false);

        for (NodeIndex root = 0; root < n; ++root) {
            if (seen[root]) {
                continue;
            }

            std::vector<NodeIndex> component;
            std::queue<NodeIndex> queue;
            seen[root] = true;
            queue.push(root);

            while (!queue.empty()) {
                const NodeIndex current = queue.front();
                queue.pop();
                component.push_back(current);

                auto enqueue = [&](const NodeIndex next) {
                    if (!seen[next]) {
                        seen[next] = true;
                        queue.push(next);
                    }
                };

                for (const NodeIndex next : graph.successors(current)) {
                    enqueue(next);
                }
                for (const NodeIndex next : graph.predecessors(current)) {
                    enqueue(next);
                }
            }

            std::ranges::sort(component);
            components.push_back(std::move(component));
        }

        return components;
    }

    NetworkMetrics calculate_network_metrics(const DirectedGraph& graph) {
        NetworkMetrics metrics;
        metrics.density = graph_density(graph);
        metrics.clustering_coefficient = average_clustering_coefficient(graph);
        metrics.average_path_length = average_path_length(graph);
        metrics.diameter = graph_diameter(graph);

        const auto components = weakly_connected_components(graph);
        metrics.connected_components = components.size();
        for (const auto& component : components) {
            metrics.largest_component_size = std::max(metrics.largest_component_size, component.size());
        }

        return metrics;
    }

}  // namespace cga::graph

//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/graph/cycle_detection.hpp"

#include <algorithm>
#include <utility>

namespace cga::graph {

    namespace {

        /**
         * Successor lists sorted and stripped of parallel duplicates.
         */
        std::vector<std::vector<NodeIndex>> unique_successors(const DirectedGraph& graph) {
            std::vector<std::vector<NodeIndex>> adjacency(graph.node_count());
            for (NodeIndex node = 0; node < adjacency.size(); ++node) {
                auto targets = graph.successors(node);
                std::ranges::sort(targets);
                const auto [first, last] = std::ranges::unique(targets);
                targets.erase(first, last);
                adjacency[node] = std::move(targets);
            }
            return adjacency;
        }

        struct Frame {
            NodeIndex node;
            std::size_t next_child;
        };

        enum class Mark {
            Unvisited,
            OnStack,
            Done
        };

    }  // namespace

    std::vector<NodePath> find_all_cycles(const DirectedGraph& graph, const std::size_t max_cycles) {
        std::vector<NodePath> cycles;
        const std::size_t n = graph.node_count();
        if (n == 0) {
            return cycles;
        }

        const auto adjacency = unique_successors(graph);
        std::vector<bool> on_path(n, false);
        NodePath path;
        std::vector<Frame> stack;

        auto limit_reached = [&] {
            return max_cycles != 0 && cycles.size() >= max_cycles;
        };

        for (NodeIndex start = 0; start < n && !limit_reached(); ++start) {
            path.assign(1, start);
            on_path[start] = true;
            stack.assign(1, Frame{start, 0});

            while (!stack.empty() && !limit_reached()) {
                Frame& frame = stack.back();
                const auto& children = adjacency[frame.node];

                if (frame.next_child >= children.size()) {
                    on_path[frame.node] = false;
                    path.pop_back();
                    stack.pop_back();
                    continue;
                }

                const NodeIndex child = children[frame.next_child++];

                if (child == start) {
                    if (path.size() >= 2) {
                        NodePath cycle = path;
                        cycle.push_back(start);
                        cycles.push_back(std::move(cycle));
                    }
                    continue;
                }

                // Cycles through smaller indices were already reported from their own start.
                if (child < start || on_path[child]) {
                    continue;
                }

                on_path[child] = true;
                path.push_back(child);
                stack.push_back(Frame{child, 0});
            }

            for (const NodeIndex node : path) {
                on_path[node] = false;
            }
        }

        return cycles;
    }

    bool has_cycle(const DirectedGraph& graph) {
        const std::size_t n = graph.node_count();
        std::vector<Mark> marks(n, Mark::Unvisited);
        std::vector<Frame> stack;

        for (NodeIndex root = 0; root < n; ++root) {
            if (marks[root] != Mark::Unvisited) {
                continue;
            }

            marks[root] = Mark::OnStack;
            stack.push_back(Frame{root, 0});

            while (!stack.empty()) {
                Frame& frame = stack.back();
                const auto& children = graph.successors(frame.node);

                if (frame.next_child >= children.size()) {
                    marks[frame.node] = Mark::Done;
                    stack.pop_back();
                    continue;
                }

                const NodeIndex child = children[frame.next_child++];
                if (marks[child] == Mark::OnStack) {
                    return true;
                }
                if (marks[child] == Mark::Unvisited) {
                    marks[child] = Mark::OnStack;
                    stack.push_back(Frame{child, 0});
                }
            }
        }

        return false;
    }

}  // namespace cga::graph

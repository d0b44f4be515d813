//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/graph/metrics.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace cga::graph {

    namespace {

        std::optional<RankedNode> max_entry(const ScoreMap& scores) {
            std::optional<RankedNode> best;
            for (const auto& [node, score] : scores) {
                if (!best || score > best->score) {
                    best = RankedNode{node, score};
                }
            }
            return best;
        }

        /**
         * Orders by descending score, then ascending index.
         */
        std::vector<RankedNode> top_n(std::vector<RankedNode> ranked, const std::size_t n) {
            std::ranges::stable_sort(ranked, [](const RankedNode& a, const RankedNode& b) {
                if (a.score != b.score) {
                    return a.score > b.score;
                }
                return a.node < b.node;
            });

            if (ranked.size() > n) {
                ranked.resize(n);
            }
            return ranked;
        }

        double mean(const ScoreMap& scores) {
            if (scores.empty()) {
                return 0.0;
            }

            double sum = 0.0;
            for (const auto& score : scores | std::views::values) {
                sum += score;
            }
            return sum / static_cast<double>(scores.size());
        }

    }  // namespace

    std::optional<RankedNode> CentralityMetrics::most_central_betweenness() const {
        return max_entry(betweenness_centrality);
    }

    std::optional<RankedNode> CentralityMetrics::most_central_closeness() const {
        return max_entry(closeness_centrality);
    }

    std::optional<RankedNode> CentralityMetrics::highest_degree() const {
        return max_entry(degree_centrality);
    }

    std::vector<RankedNode> CentralityMetrics::top_pagerank(const std::size_t n) const {
        std::vector<RankedNode> ranked;
        ranked.reserve(pagerank.size());
        for (const auto& [node, score] : pagerank) {
            ranked.push_back({node, score});
        }
        return top_n(std::move(ranked), n);
    }

    CentralityAverages CentralityMetrics::average_centralities() const {
        CentralityAverages averages;
        averages.degree = mean(degree_centrality);
        averages.betweenness = mean(betweenness_centrality);
        averages.closeness = mean(closeness_centrality);
        averages.eigenvector = mean(eigenvector_centrality);
        averages.pagerank = mean(pagerank);
        return averages;
    }

    std::optional<NodeCoupling> CouplingMetrics::at(const NodeIndex node) const {
        const auto ca = afferent_coupling.find(node);
        const auto ce = efferent_coupling.find(node);
        if (ca == afferent_coupling.end() || ce == efferent_coupling.end()) {
            return std::nullopt;
        }

        NodeCoupling coupling;
        coupling.afferent = ca->second;
        coupling.efferent = ce->second;
        if (const auto it = instability.find(node); it != instability.end()) {
            coupling.instability = it->second;
        }
        if (const auto it = abstractness.find(node); it != abstractness.end()) {
            coupling.abstractness = it->second;
        }
        if (const auto it = distance_from_main.find(node); it != distance_from_main.end()) {
            coupling.distance_from_main = it->second;
        }
        return coupling;
    }

    std::vector<RankedNode> CouplingMetrics::most_coupled_nodes(const std::size_t n) const {
        std::vector<RankedNode> ranked;
        ranked.reserve(afferent_coupling.size());
        for (const auto& [node, ca] : afferent_coupling) {
            std::size_t ce = 0;
            if (const auto it = efferent_coupling.find(node); it != efferent_coupling.end()) {
                ce = it->second;
            }
            ranked.push_back({node, static_cast<double>(ca + ce)});
        }
        return top_n(std::move(ranked), n);
    }

    std::vector<RankedNode> CouplingMetrics::most_unstable_nodes(const std::size_t n) const {
        std::vector<RankedNode> ranked;
        ranked.reserve(instability.size());
        for (const auto& [node, score] : instability) {
            ranked.push_back({node, score});
        }
        return top_n(std::move(ranked), n);
    }

}  // namespace cga::graph

//
// Created by gregorian-rayne on 10/06/26.
//

#include "cga/graph/coupling.hpp"

#include <algorithm>
#include <cmath>

namespace cga::graph {

    CouplingMetrics calculate_coupling_metrics(const DirectedGraph& graph) {
        CouplingMetrics metrics;
        const std::size_t n = graph.node_count();

        double total_afferent = 0.0;
        double total_efferent = 0.0;
        double total_instability = 0.0;
        double total_distance = 0.0;

        for (NodeIndex node = 0; node < n; ++node) {
            const std::size_t ca = graph.in_degree(node);
            const std::size_t ce = graph.out_degree(node);
            const std::size_t total = ca + ce;

            const double instability = total > 0
                ? static_cast<double>(ce) / static_cast<double>(total)
                : 0.0;
            const double distance = std::abs(PLACEHOLDER_ABSTRACTNESS + instability - 1.0);

            metrics.afferent_coupling[node] = ca;
            metrics.efferent_coupling[node] = ce;
            metrics.instability[node] = instability;
            metrics.abstractness[node] = PLACEHOLDER_ABSTRACTNESS;
            metrics.distance_from_main[node] = distance;

            total_afferent += static_cast<double>(ca);
            total_efferent += static_cast<double>(ce);
            total_instability += instability;
            total_distance += distance;
            metrics.summary.max_coupling = std::max(metrics.summary.max_coupling, total);
        }

        metrics.summary.total_nodes = n;
        if (n > 0) {
            const auto count = static_cast<double>(n);
            metrics.summary.avg_afferent = total_afferent / count;
            metrics.summary.avg_efferent = total_efferent / count;
            metrics.summary.avg_instability = total_instability / count;
            metrics.summary.avg_distance_from_main = total_distance / count;
        }

        return metrics;
    }

}  // namespace cga::graph

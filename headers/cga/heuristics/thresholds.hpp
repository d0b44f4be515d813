//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_HEURISTICS_THRESHOLDS_HPP
#define CGA_HEURISTICS_THRESHOLDS_HPP

/**
 * @file thresholds.hpp
 * @brief Limits above which a graph shape is reported as problematic.
 *
 * Every limit is exclusive: a value equal to the limit is not reported.
 */

#include <cstddef>

namespace cga::heuristics
{
    /**
     * @brief Diagnostic thresholds for GraphAnalyzer::check_problematic_patterns().
     *
     * Any dependency or inheritance cycle is reported. Call graphs routinely
     * contain recursion, so only a larger number of call cycles is flagged.
     */
    struct PatternThresholds {
        /// Call cycles tolerated before recursion is flagged
        std::size_t max_call_cycles = 10;

        /// Highest acceptable mean instability over all modules
        double max_average_instability = 0.8;

        /// Highest acceptable Ca + Ce of a single module
        std::size_t max_coupling = 20;

        /// Highest acceptable dependency graph density
        double max_dependency_density = 0.3;

        /// Highest acceptable call graph density
        double max_call_density = 0.5;
    };

}  // namespace cga::heuristics

#endif //CGA_HEURISTICS_THRESHOLDS_HPP

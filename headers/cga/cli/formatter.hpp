//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_FORMATTER_HPP
#define CGA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Scores and counts
 * - Colors and styles
 */

#include "cga/analysis/graph_analyzer.hpp"
#include "cga/graph/metrics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cga::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {
        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * Returns true if stdout is a terminal.
     */
    [[nodiscard]] bool is_tty();

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
        std::optional<std::string> color;
    };

    /**
     * Table row data.
     */
    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        /**
         * Adds a row to the table. Short rows are padded with empty cells.
         */
        void add_row(Row row);

        /**
         * Adds a separator after the last row.
         */
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        void clear();

        [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

        void set_show_headers(bool show) { show_headers_ = show; }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
        bool show_headers_ = true;
    };

    /**
     * Formats a score with a fixed number of decimals.
     */
    [[nodiscard]] std::string format_score(double value, int precision = 4);

    /**
     * Formats a ratio in [0, 1] as a percentage.
     */
    [[nodiscard]] std::string format_percent(double ratio);

    /**
     * Formats a count with comma separators.
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    /**
     * Formats a node path as "a -> b -> a".
     */
    [[nodiscard]] std::string format_path(const std::vector<std::string>& labels);

    /**
     * Creates a bar graph, colored when colors are enabled.
     */
    [[nodiscard]] std::string bar_graph(double value, double max_value, std::size_t width = 20);

    /**
     * Summary printer for analysis results.
     */
    class SummaryPrinter {
    public:
        explicit SummaryPrinter(std::ostream& out);

        /**
         * Prints node, edge and density figures for the three graphs.
         */
        void print_statistics(const graph::GraphStatistics& stats) const;

        /**
         * Prints the top PageRank and betweenness nodes of each graph.
         */
        void print_centrality(
            const graph::GraphAnalysisResult& result,
            const analysis::GraphAnalyzer& analyzer,
            std::size_t limit = 10
        ) const;

        /**
         * Prints detected cycles. @p limit caps the cycles listed per graph (0 = all).
         */
        void print_cycles(
            const graph::CycleAnalysis& cycles,
            const analysis::GraphAnalyzer& analyzer,
            std::size_t limit = 10
        ) const;

        void print_coupling(
            const graph::CouplingMetrics& coupling,
            const graph::DependencyGraph& graph,
            std::size_t limit = 10
        ) const;

        void print_network_metrics(const analysis::NetworkMetricsMap& metrics) const;

        /**
         * Prints pattern diagnostics grouped by category.
         */
        void print_patterns(const analysis::PatternReport& report) const;

    private:
        void print_heading(std::string_view title, char underline) const;

        std::ostream& out_;
    };

}  // namespace cga::cli

#endif //CGA_FORMATTER_HPP
